// motif - Composable backtracking pattern matcher combinators in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef MOTIF_INCLUDE_MOTIF_MOTIF_HPP
#define MOTIF_INCLUDE_MOTIF_MOTIF_HPP

#include <motif/detail.hpp>
#include <motif/error.hpp>

#include <cstddef>
#include <functional>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

// Patterns are immutable once built and may be shared freely between threads.
// All evaluation state lives in match_context, which must never be shared
// between concurrent evaluations. The free functions matches, search, find
// and for_each_match each create their own context and are safe to call
// concurrently on the same pattern.

namespace motif {

class expression;
class interpreter;
class match_context;
class pattern;
struct span;
struct match_options;
using char_predicate_function = std::function<bool(char)>;

inline constexpr std::ptrdiff_t unbounded = (std::numeric_limits<std::ptrdiff_t>::max)();

template <class E> inline constexpr bool is_char_operand_v = std::is_same_v<std::decay_t<E>, char>;
template <class E> inline constexpr bool is_literal_operand_v = !std::is_same_v<std::decay_t<E>, pattern> && !std::is_same_v<std::decay_t<E>, std::nullptr_t> && std::is_convertible_v<E const&, std::string_view>;
template <class E> inline constexpr bool is_predicate_operand_v = !std::is_same_v<std::decay_t<E>, pattern> && !is_char_operand_v<E> && !is_literal_operand_v<E> && std::is_invocable_r_v<bool, E const&, char>;
template <class E> inline constexpr bool is_pattern_operand_v = is_char_operand_v<E> || is_literal_operand_v<E> || is_predicate_operand_v<E>;

[[nodiscard]] bool attempt(pattern const& p, match_context& context);
[[nodiscard]] bool matches(pattern const& p, match_context& context);

struct span
{
	std::size_t start{0};
	std::size_t end{0};
	[[nodiscard]] constexpr std::size_t size() const noexcept { return end - start; }
	[[nodiscard]] constexpr bool empty() const noexcept { return start == end; }
	[[nodiscard]] constexpr std::string_view str(std::string_view input) const { return input.substr(start, end - start); }
	[[nodiscard]] constexpr bool operator==(span const& other) const noexcept { return start == other.start && end == other.end; }
	[[nodiscard]] constexpr bool operator!=(span const& other) const noexcept { return !(*this == other); }
	[[nodiscard]] constexpr bool operator<(span const& other) const noexcept { return start < other.start || (start == other.start && end < other.end); }
	[[nodiscard]] constexpr bool operator<=(span const& other) const noexcept { return !(other < *this); }
	[[nodiscard]] constexpr bool operator>(span const& other) const noexcept { return other < *this; }
	[[nodiscard]] constexpr bool operator>=(span const& other) const noexcept { return !(*this < other); }
};

struct match_options
{
	static constexpr std::size_t unlimited = (std::numeric_limits<std::size_t>::max)();
	std::size_t step_limit{unlimited};
	std::size_t depth_limit{unlimited};
};

class pattern
{
	std::shared_ptr<expression const> expr_;
public:
	explicit pattern(std::shared_ptr<expression const> e) : expr_{std::move(e)} { if (!expr_) throw bad_pattern{}; }
	template <class E, class = std::enable_if_t<is_pattern_operand_v<E>>> pattern(E const& e); // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	pattern(std::nullptr_t) = delete; // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	[[nodiscard]] expression const& get() const noexcept;
	[[nodiscard]] expression const* identity() const noexcept { return expr_.get(); }
};

struct literal_node { std::string text; bool caseless{false}; };
struct predicate_node { char_predicate_function test; };
struct start_anchor_node {};
struct end_anchor_node {};
struct sequence_node { std::vector<pattern> elements; };
struct alternation_node { pattern left; pattern right; };
struct repetition_node { pattern element; std::size_t min{0}; std::size_t max{0}; };
struct group_node { pattern element; };

using node = std::variant<literal_node, predicate_node, start_anchor_node, end_anchor_node, sequence_node, alternation_node, repetition_node, group_node>;

class expression
{
	motif::node node_;
public:
	explicit expression(motif::node n) noexcept(std::is_nothrow_move_constructible_v<motif::node>) : node_{std::move(n)} {}
	[[nodiscard]] motif::node const& value() const noexcept { return node_; }
};

[[nodiscard]] inline expression const& pattern::get() const noexcept { return *expr_; }

class match_context
{
	friend class interpreter;
	friend bool matches(pattern const& p, match_context& context);

	std::string_view input_;
	std::size_t position_{0};
	std::optional<span> last_group_span_;
	std::unordered_map<expression const*, span> group_spans_;
	match_options options_;
	std::size_t steps_{0};
	std::size_t depth_{0};

	[[nodiscard]] auto enter()
	{
		if (steps_ >= options_.step_limit)
			throw step_limit_error{};
		if (depth_ >= options_.depth_limit)
			throw depth_limit_error{};
		++steps_;
		++depth_;
		return detail::scope_exit{[this]() noexcept { --depth_; }};
	}

	void record_group(expression const* g, span s)
	{
		last_group_span_ = s;
		group_spans_[g] = s;
	}

public:
	explicit match_context(std::string_view in, std::size_t pos = 0, match_options const& opt = match_options{})
		: input_{in}, position_{pos}, options_{opt}
	{
		if (position_ > input_.size())
			throw bad_match_position{};
	}

	match_context(match_context const&) = delete;
	match_context(match_context&&) = default;
	match_context& operator=(match_context const&) = delete;
	match_context& operator=(match_context&&) = default;
	~match_context() = default;

	[[nodiscard]] std::string_view input() const noexcept { return input_; }
	[[nodiscard]] std::size_t position() const noexcept { return position_; }
	[[nodiscard]] std::string_view remaining() const noexcept { return input_.substr(position_); }
	[[nodiscard]] bool at_end() const noexcept { return position_ == input_.size(); }
	[[nodiscard]] match_options const& options() const noexcept { return options_; }
	[[nodiscard]] std::size_t steps() const noexcept { return steps_; }
	[[nodiscard]] std::optional<span> last_group_span() const noexcept { return last_group_span_; }

	[[nodiscard]] std::optional<span> group_span(pattern const& g) const
	{
		if (auto const it = group_spans_.find(g.identity()); it != group_spans_.end())
			return it->second;
		return std::nullopt;
	}

	// Moves the cursor and forgets recorded groups; the step count is kept.
	void reset(std::size_t pos)
	{
		if (pos > input_.size())
			throw bad_match_position{};
		position_ = pos;
		last_group_span_.reset();
		group_spans_.clear();
	}
};

class interpreter
{
	match_context& context_;

	[[nodiscard]] bool backtrack(std::size_t origin) noexcept
	{
		context_.position_ = origin;
		return false;
	}

	[[nodiscard]] bool match_literal(literal_node const& n) const noexcept
	{
		auto const subject = context_.input_.substr(context_.position_);
		if (subject.size() < n.text.size())
			return false;
		auto const prefix = subject.substr(0, n.text.size());
		if (n.caseless ? !detail::ascii_iequals(prefix, n.text) : (prefix != n.text))
			return false;
		context_.position_ += n.text.size();
		return true;
	}

	[[nodiscard]] bool match_predicate(predicate_node const& n) const
	{
		if (context_.position_ >= context_.input_.size())
			return false;
		if (!n.test(context_.input_[context_.position_]))
			return false;
		++context_.position_;
		return true;
	}

	[[nodiscard]] bool match_sequence(sequence_node const& n)
	{
		std::size_t const origin = context_.position_;
		for (auto const& e : n.elements)
			if (!evaluate(e))
				return backtrack(origin);
		return true;
	}

	[[nodiscard]] bool match_alternation(alternation_node const& n)
	{
		std::size_t const origin = context_.position_;
		if (evaluate(n.left))
			return true;
		context_.position_ = origin;
		if (evaluate(n.right))
			return true;
		return backtrack(origin);
	}

	[[nodiscard]] bool match_repetition(repetition_node const& n)
	{
		std::size_t const origin = context_.position_;
		std::size_t count = 0;
		while (count < n.max) {
			std::size_t const before = context_.position_;
			if (!evaluate(n.element))
				break;
			++count;
			if (context_.position_ == before) // zero-width, repeating it would not progress
				break;
		}
		if (count >= n.min)
			return true;
		return backtrack(origin);
	}

	[[nodiscard]] bool match_group(pattern const& self, group_node const& n)
	{
		std::size_t const origin = context_.position_;
		if (!evaluate(n.element))
			return false;
		context_.record_group(self.identity(), span{origin, context_.position_});
		return true;
	}

public:
	explicit interpreter(match_context& c) noexcept : context_{c} {}

	[[nodiscard]] bool evaluate(pattern const& p)
	{
		auto const guard = context_.enter();
		return std::visit([this, &p](auto const& n) -> bool {
			using T = std::decay_t<decltype(n)>;
			if constexpr (std::is_same_v<T, literal_node>)
				return match_literal(n);
			else if constexpr (std::is_same_v<T, predicate_node>)
				return match_predicate(n);
			else if constexpr (std::is_same_v<T, start_anchor_node>)
				return context_.position_ == 0;
			else if constexpr (std::is_same_v<T, end_anchor_node>)
				return context_.position_ == context_.input_.size();
			else if constexpr (std::is_same_v<T, sequence_node>)
				return match_sequence(n);
			else if constexpr (std::is_same_v<T, alternation_node>)
				return match_alternation(n);
			else if constexpr (std::is_same_v<T, repetition_node>)
				return match_repetition(n);
			else if constexpr (std::is_same_v<T, group_node>)
				return match_group(p, n);
			else
				static_assert(detail::always_false_v<T>, "unhandled expression node");
		}, p.get().value());
	}
};

template <class Node>
[[nodiscard]] inline pattern make_pattern(Node&& n)
{
	return pattern{std::make_shared<expression>(motif::node{std::forward<Node>(n)})};
}

[[nodiscard]] inline pattern literal(std::string_view text) { return make_pattern(literal_node{std::string{text}, false}); }
[[nodiscard]] inline pattern caseless(std::string_view text) { return make_pattern(literal_node{std::string{text}, true}); }
[[nodiscard]] inline pattern chr(char c) { return make_pattern(literal_node{std::string(1, c), false}); }
[[nodiscard]] inline pattern start() { return make_pattern(start_anchor_node{}); }
[[nodiscard]] inline pattern end() { return make_pattern(end_anchor_node{}); }

[[nodiscard]] inline pattern char_predicate(char_predicate_function fn)
{
	if (!fn)
		throw bad_predicate{};
	return make_pattern(predicate_node{std::move(fn)});
}

[[nodiscard]] inline pattern char_class(ctype c) { return char_predicate([c](char ch) { return detail::is_ctype(c, ch); }); }
[[nodiscard]] inline pattern any_char() { return char_predicate([](char) { return true; }); }
[[nodiscard]] inline pattern digit() { return char_class(ctype::digit); }
[[nodiscard]] inline pattern alpha() { return char_class(ctype::alpha); }
[[nodiscard]] inline pattern alnum() { return char_class(ctype::alnum); }
[[nodiscard]] inline pattern whitespace() { return char_class(ctype::space); }
[[nodiscard]] inline pattern blank() { return char_class(ctype::blank); }
[[nodiscard]] inline pattern upper() { return char_class(ctype::upper); }
[[nodiscard]] inline pattern lower() { return char_class(ctype::lower); }
[[nodiscard]] inline pattern xdigit() { return char_class(ctype::xdigit); }
[[nodiscard]] inline pattern punct() { return char_class(ctype::punct); }

[[nodiscard]] inline pattern char_range(char first, char last)
{
	auto const lo = static_cast<unsigned char>(first);
	auto const hi = static_cast<unsigned char>(last);
	if (lo > hi)
		throw bad_character_range{};
	return char_predicate([lo, hi](char ch) { auto const uch = static_cast<unsigned char>(ch); return lo <= uch && uch <= hi; });
}

[[nodiscard]] inline pattern one_of(std::string_view set)
{
	return char_predicate([s = std::string{set}](char ch) { return s.find(ch) != std::string::npos; });
}

[[nodiscard]] inline pattern none_of(std::string_view set)
{
	return char_predicate([s = std::string{set}](char ch) { return s.find(ch) == std::string::npos; });
}

[[nodiscard]] inline pattern sequence(std::vector<pattern> elements)
{
	if (elements.empty())
		throw bad_sequence{};
	return make_pattern(sequence_node{std::move(elements)});
}

template <class... Es, class = std::enable_if_t<(std::is_convertible_v<Es const&, pattern> && ...)>>
[[nodiscard]] inline pattern sequence(Es const&... es)
{
	std::vector<pattern> elements;
	elements.reserve(sizeof...(Es));
	(elements.push_back(es), ...);
	return sequence(std::move(elements));
}

[[nodiscard]] inline pattern alternation(pattern const& e1, pattern const& e2)
{
	return make_pattern(alternation_node{e1, e2});
}

[[nodiscard]] inline pattern alternation(std::vector<pattern> const& alternatives)
{
	if (alternatives.empty())
		throw bad_alternation{};
	pattern result{alternatives.back()};
	for (auto it = std::next(alternatives.rbegin()); it != alternatives.rend(); ++it)
		result = alternation(*it, result);
	return result;
}

template <class E1, class E2, class E3, class... Es, class = std::enable_if_t<std::is_convertible_v<E1 const&, pattern> && std::is_convertible_v<E2 const&, pattern> && std::is_convertible_v<E3 const&, pattern> && (std::is_convertible_v<Es const&, pattern> && ...)>>
[[nodiscard]] inline pattern alternation(E1 const& e1, E2 const& e2, E3 const& e3, Es const&... es)
{
	std::vector<pattern> alternatives;
	alternatives.reserve(3 + sizeof...(Es));
	alternatives.push_back(e1);
	alternatives.push_back(e2);
	alternatives.push_back(e3);
	(alternatives.push_back(es), ...);
	return alternation(alternatives);
}

[[nodiscard]] inline pattern repeat(pattern const& e, std::ptrdiff_t min, std::ptrdiff_t max)
{
	detail::assure_in_range<bad_repetition_bounds>(min, std::ptrdiff_t{0}, max);
	auto const bounded_max = (max == unbounded) ? (std::numeric_limits<std::size_t>::max)() : static_cast<std::size_t>(max);
	return make_pattern(repetition_node{e, static_cast<std::size_t>(min), bounded_max});
}

[[nodiscard]] inline pattern repeat(pattern const& e, std::ptrdiff_t count) { return repeat(e, count, count); }
[[nodiscard]] inline pattern optional(pattern const& e) { return repeat(e, 0, 1); }
[[nodiscard]] inline pattern zero_or_more(pattern const& e) { return repeat(e, 0, unbounded); }
[[nodiscard]] inline pattern one_or_more(pattern const& e) { return repeat(e, 1, unbounded); }
[[nodiscard]] inline pattern group(pattern const& e) { return make_pattern(group_node{e}); }

template <class E, class>
inline pattern::pattern(E const& e)
	: pattern{[&e] {
		if constexpr (is_char_operand_v<E>) {
			return chr(e);
		} else if constexpr (is_literal_operand_v<E>) {
			if constexpr (std::is_pointer_v<E>) {
				if (e == nullptr)
					throw bad_pattern{"null string literal operand"};
			}
			return literal(std::string_view{e});
		} else {
			return char_predicate(char_predicate_function{e});
		}
	}()}
{}

[[nodiscard]] inline bool attempt(pattern const& p, match_context& context)
{
	return interpreter{context}.evaluate(p);
}

// Whole-input match from the context's current position. On a partial
// match the position is put back where it was.
[[nodiscard]] inline bool matches(pattern const& p, match_context& context)
{
	std::size_t const origin = context.position_;
	if (attempt(p, context)) {
		if (context.position_ == context.input_.size())
			return true;
		context.position_ = origin;
	}
	return false;
}

[[nodiscard]] inline bool matches(pattern const& p, std::string_view text, match_options const& options = match_options{})
{
	match_context context{text, 0, options};
	return matches(p, context);
}

template <class Fn>
inline std::size_t for_each_match(pattern const& p, std::string_view text, Fn&& fn, match_options const& options = match_options{}) // NOLINT(cppcoreguidelines-missing-std-forward)
{
	static_assert(std::is_invocable_v<Fn&, span const&, match_context const&> || std::is_invocable_v<Fn&, span const&>, "invalid match callback type");
	match_context context{text, 0, options};
	std::size_t count = 0;
	for (std::size_t i = 0; i <= text.size(); ) {
		context.reset(i);
		if (!attempt(p, context)) {
			++i;
			continue;
		}
		span const s{i, context.position()};
		if constexpr (std::is_invocable_v<Fn&, span const&, match_context const&>)
			fn(s, std::as_const(context));
		else
			fn(s);
		++count;
		i = s.empty() ? (i + 1) : s.end;
	}
	return count;
}

[[nodiscard]] inline std::vector<span> search(pattern const& p, std::string_view text, match_options const& options = match_options{})
{
	std::vector<span> spans;
	for_each_match(p, text, [&spans](span const& s) { spans.push_back(s); }, options);
	return spans;
}

[[nodiscard]] inline std::optional<span> find(pattern const& p, std::string_view text, std::size_t from = 0, match_options const& options = match_options{})
{
	match_context context{text, from, options};
	for (std::size_t i = from; i <= text.size(); ++i) {
		context.reset(i);
		if (attempt(p, context))
			return span{i, context.position()};
	}
	return std::nullopt;
}

namespace language {

using pattern = motif::pattern; using span = motif::span; using match_context = motif::match_context;
using match_options = motif::match_options; using motif::ctype; using motif::unbounded;
using motif::literal; using motif::caseless; using motif::chr; using motif::char_range; using motif::one_of; using motif::none_of;
using motif::char_predicate; using motif::sequence; using motif::alternation; using motif::repeat;
using motif::optional; using motif::zero_or_more; using motif::one_or_more; using motif::group;

template <pattern (*Make)()>
struct terminal_expression
{
	[[nodiscard]] operator pattern() const { return Make(); } // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
};

template <ctype Property>
struct ctype_expression
{
	[[nodiscard]] operator pattern() const { return char_class(Property); } // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
};

template <std::ptrdiff_t Min, std::ptrdiff_t Max>
struct repetition_modifier
{
	[[nodiscard]] pattern operator[](pattern const& e) const { return motif::repeat(e, Min, Max); }
};

inline constexpr terminal_expression<&motif::any_char> any{}; inline constexpr terminal_expression<&motif::start> bol{}; inline constexpr terminal_expression<&motif::end> eoi{};
inline constexpr ctype_expression<ctype::alpha> alpha{}; inline constexpr ctype_expression<ctype::alnum> alnum{}; inline constexpr ctype_expression<ctype::lower> lower{};
inline constexpr ctype_expression<ctype::upper> upper{}; inline constexpr ctype_expression<ctype::digit> digit{}; inline constexpr ctype_expression<ctype::xdigit> xdigit{};
inline constexpr ctype_expression<ctype::space> space{}; inline constexpr ctype_expression<ctype::blank> blank{}; inline constexpr ctype_expression<ctype::punct> punct{};
inline constexpr ctype_expression<ctype::graph> graph{}; inline constexpr ctype_expression<ctype::print> print{}; inline constexpr ctype_expression<ctype::cntrl> cntrl{};
template <std::ptrdiff_t N> inline constexpr repetition_modifier<N, N> exactly{};
template <std::ptrdiff_t N> inline constexpr repetition_modifier<N, unbounded> at_least{};
template <std::ptrdiff_t N> inline constexpr repetition_modifier<0, N> at_most{};

inline namespace operators {

[[nodiscard]] inline pattern operator ""_sx(char const* s, std::size_t n) { return motif::literal(std::string_view{s, n}); }
[[nodiscard]] inline pattern operator ""_isx(char const* s, std::size_t n) { return motif::caseless(std::string_view{s, n}); }
[[nodiscard]] inline pattern operator ""_cx(char c) { return motif::chr(c); }

[[nodiscard]] inline pattern operator*(pattern const& e) { return motif::zero_or_more(e); }
[[nodiscard]] inline pattern operator+(pattern const& e) { return motif::one_or_more(e); }
[[nodiscard]] inline pattern operator~(pattern const& e) { return motif::optional(e); }
[[nodiscard]] inline pattern operator|(pattern const& e1, pattern const& e2) { return motif::alternation(e1, e2); }

[[nodiscard]] inline pattern operator>(pattern const& e1, pattern const& e2)
{
	std::vector<pattern> elements;
	if (auto const* const seq = std::get_if<sequence_node>(&e1.get().value()); seq != nullptr)
		elements = seq->elements;
	else
		elements.push_back(e1);
	elements.push_back(e2);
	return motif::sequence(std::move(elements));
}

} // namespace operators

} // namespace language

} // namespace motif

#endif
