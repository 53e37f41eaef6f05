// motif - Composable backtracking pattern matcher combinators in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef MOTIF_INCLUDE_MOTIF_ERROR_HPP
#define MOTIF_INCLUDE_MOTIF_ERROR_HPP

#include <stdexcept>
#include <string>

namespace motif {

class motif_error : public std::runtime_error { using std::runtime_error::runtime_error; };
class bad_pattern : public motif_error { public: explicit bad_pattern(std::string const& s = "invalid pattern expression") : motif_error{s} {} };
class bad_repetition_bounds : public bad_pattern { public: bad_repetition_bounds() : bad_pattern{"repetition bounds are negative or reversed"} {} };
class bad_sequence : public bad_pattern { public: bad_sequence() : bad_pattern{"sequence requires at least one element"} {} };
class bad_alternation : public bad_pattern { public: bad_alternation() : bad_pattern{"alternation requires at least one alternative"} {} };
class bad_character_range : public bad_pattern { public: bad_character_range() : bad_pattern{"character range is reversed"} {} };
class bad_predicate : public bad_pattern { public: bad_predicate() : bad_pattern{"character predicate is empty"} {} };
class bad_match_position : public motif_error { public: bad_match_position() : motif_error{"match position is past the end of input"} {} };
class resource_limit_error : public motif_error { public: explicit resource_limit_error(std::string const& s = "match exceeded resource limit") : motif_error{s} {} };
class step_limit_error : public resource_limit_error { public: step_limit_error() : resource_limit_error{"match exceeded step limit"} {} };
class depth_limit_error : public resource_limit_error { public: depth_limit_error() : resource_limit_error{"match exceeded recursion depth limit"} {} };

} // namespace motif

#endif
