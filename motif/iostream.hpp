// motif - Composable backtracking pattern matcher combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef MOTIF_INCLUDE_MOTIF_IOSTREAM_HPP
#define MOTIF_INCLUDE_MOTIF_IOSTREAM_HPP

#include <motif/motif.hpp>

#include <iostream>
#include <string>

namespace motif {

template <class CharT, class Traits, class Allocator>
std::basic_istream<CharT, Traits>& readline(std::basic_istream<CharT, Traits>& input, std::basic_string<CharT, Traits, Allocator>& line)
{
	if (std::getline(input, line) && !line.empty() && Traits::eq(line.back(), input.widen('\r')))
		line.pop_back();
	return input;
}

// Calls fn(line_number, line, spans) for every line with at least one match
// and returns the number of such lines. Limits in options apply per line.
template <class Fn>
inline std::size_t search_lines(std::istream& input, pattern const& p, Fn&& fn, match_options const& options = match_options{}) // NOLINT(cppcoreguidelines-missing-std-forward)
{
	static_assert(std::is_invocable_v<Fn&, std::size_t, std::string_view, std::vector<span> const&>, "invalid line callback type");
	std::string line;
	std::vector<span> spans;
	std::size_t line_number = 0;
	std::size_t matched_lines = 0;
	while (motif::readline(input, line)) {
		++line_number;
		spans.clear();
		for_each_match(p, line, [&spans](span const& s) { spans.push_back(s); }, options);
		if (!spans.empty()) {
			++matched_lines;
			fn(line_number, std::string_view{line}, std::as_const(spans));
		}
	}
	return matched_lines;
}

template <class Fn>
inline std::size_t search_lines(pattern const& p, Fn&& fn, match_options const& options = match_options{})
{
	return search_lines(std::cin, p, std::forward<Fn>(fn), options);
}

} // namespace motif

#endif
