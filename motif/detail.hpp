// motif - Composable backtracking pattern matcher combinators in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef MOTIF_INCLUDE_MOTIF_DETAIL_HPP
#define MOTIF_INCLUDE_MOTIF_DETAIL_HPP

#include <cctype>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>

namespace motif {

enum class ctype : std::uint_least8_t { alpha, alnum, blank, cntrl, digit, graph, lower, print, punct, space, upper, xdigit };

namespace detail {

template <class T> inline constexpr bool always_false_v = false;

[[nodiscard]] inline bool is_ctype(ctype c, char ch) noexcept
{
	auto const uch = static_cast<int>(static_cast<unsigned char>(ch));
	switch (c) {
		case ctype::alpha: return std::isalpha(uch) != 0;
		case ctype::alnum: return std::isalnum(uch) != 0;
		case ctype::blank: return std::isblank(uch) != 0;
		case ctype::cntrl: return std::iscntrl(uch) != 0;
		case ctype::digit: return std::isdigit(uch) != 0;
		case ctype::graph: return std::isgraph(uch) != 0;
		case ctype::lower: return std::islower(uch) != 0;
		case ctype::print: return std::isprint(uch) != 0;
		case ctype::punct: return std::ispunct(uch) != 0;
		case ctype::space: return std::isspace(uch) != 0;
		case ctype::upper: return std::isupper(uch) != 0;
		case ctype::xdigit: return std::isxdigit(uch) != 0;
	}
	return false;
}

[[nodiscard]] constexpr char ascii_tolower(char c) noexcept
{
	return ((c >= 'A') && (c <= 'Z')) ? static_cast<char>(c - 'A' + 'a') : c;
}

[[nodiscard]] constexpr bool ascii_iequals(std::string_view x, std::string_view y) noexcept
{
	if (x.size() != y.size())
		return false;
	for (std::size_t i = 0, n = x.size(); i < n; ++i)
		if (ascii_tolower(x[i]) != ascii_tolower(y[i]))
			return false;
	return true;
}

template <class EF>
class scope_exit
{
	static_assert(std::is_invocable_v<EF>);

	EF destructor_;

public:
	template <class Fn, class = std::enable_if_t<std::is_constructible_v<EF, Fn&&>>>
	constexpr explicit scope_exit( Fn&& fn ) noexcept(std::is_nothrow_constructible_v<EF, Fn&&>)
		: destructor_{std::forward<Fn>(fn)}
	{}

	~scope_exit()
	{
		destructor_();
	}

	scope_exit(scope_exit const&) = delete;
	scope_exit(scope_exit&&) = delete;
	scope_exit& operator=(scope_exit const&) = delete;
	scope_exit& operator=(scope_exit&&) = delete;
};

template <class Fn, class = std::enable_if_t<std::is_invocable_v<Fn>>>
scope_exit(Fn) -> scope_exit<std::decay_t<Fn>>;

template <class Error, class T, class U, class V, class = std::enable_if_t<std::is_integral_v<T> && std::is_integral_v<U> && std::is_integral_v<V>>>
constexpr void assure_in_range(T x, U minval, V maxval)
{
	if (!((minval <= x) && (x <= maxval)))
		throw Error();
}

} // namespace detail

} // namespace motif

#endif
