// motif - Composable backtracking pattern matcher combinators in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#include <motif/motif.hpp>

#include <iostream>

#undef NDEBUG
#include <cassert>

void test_literal()
{
	auto const P = motif::literal("abc");
	assert(motif::matches(P, "abc"));
	assert(!motif::matches(P, "ab"));
	assert(!motif::matches(P, "abcd"));
	assert(!motif::matches(P, "xabc"));
	assert(!motif::matches(P, "ABC"));
	assert(!motif::matches(P, ""));
}

void test_literal_equality()
{
	char const* const literals[] = {"", "a", "ab", "aba", "hello world", "\t\n"};
	char const* const texts[] = {"", "a", "b", "ab", "aba", "abab", "hello world", "hello  world", "\t\n"};
	for (std::string_view const l : literals)
		for (std::string_view const t : texts)
			assert(motif::matches(motif::literal(l), t) == (l == t));
}

void test_empty_literal()
{
	auto const P = motif::literal("");
	assert(motif::matches(P, ""));
	assert(!motif::matches(P, "a"));
	motif::match_context context{"abc", 1};
	assert(motif::attempt(P, context));
	assert(context.position() == 1);
}

void test_literal_prefix_attempt()
{
	motif::match_context context{"abcdef"};
	assert(motif::attempt(motif::literal("abc"), context));
	assert(context.position() == 3);
	assert(context.remaining() == "def");
	assert(!motif::attempt(motif::literal("abc"), context));
	assert(context.position() == 3);
	assert(motif::attempt(motif::literal("def"), context));
	assert(context.at_end());
}

void test_caseless_literal()
{
	auto const P = motif::caseless("Hello");
	assert(motif::matches(P, "hello"));
	assert(motif::matches(P, "HELLO"));
	assert(motif::matches(P, "hElLo"));
	assert(!motif::matches(P, "hell"));
	assert(!motif::matches(P, "hellos"));
}

void test_chr()
{
	auto const P = motif::chr('x');
	assert(motif::matches(P, "x"));
	assert(!motif::matches(P, "X"));
	assert(!motif::matches(P, "xx"));
	assert(!motif::matches(P, ""));
}

void test_any_char()
{
	auto const P = motif::any_char();
	assert(motif::matches(P, "a"));
	assert(motif::matches(P, "2"));
	assert(motif::matches(P, " "));
	assert(motif::matches(P, std::string_view{"\0", 1}));
	assert(!motif::matches(P, "aa"));
	assert(!motif::matches(P, ""));
}

void test_character_classes()
{
	assert(motif::matches(motif::digit(), "7"));
	assert(!motif::matches(motif::digit(), "a"));
	assert(motif::matches(motif::alpha(), "q"));
	assert(motif::matches(motif::alpha(), "Q"));
	assert(!motif::matches(motif::alpha(), "1"));
	assert(motif::matches(motif::alnum(), "Z"));
	assert(motif::matches(motif::alnum(), "5"));
	assert(!motif::matches(motif::alnum(), "_"));
	assert(motif::matches(motif::whitespace(), " "));
	assert(motif::matches(motif::whitespace(), "\t"));
	assert(motif::matches(motif::whitespace(), "\n"));
	assert(!motif::matches(motif::whitespace(), "x"));
	assert(motif::matches(motif::blank(), "\t"));
	assert(!motif::matches(motif::blank(), "\n"));
	assert(motif::matches(motif::upper(), "A"));
	assert(!motif::matches(motif::upper(), "a"));
	assert(motif::matches(motif::lower(), "a"));
	assert(!motif::matches(motif::lower(), "A"));
	assert(motif::matches(motif::xdigit(), "f"));
	assert(motif::matches(motif::xdigit(), "B"));
	assert(!motif::matches(motif::xdigit(), "g"));
	assert(motif::matches(motif::punct(), "!"));
	assert(!motif::matches(motif::punct(), "a"));
	assert(!motif::matches(motif::alpha(), "\xE9"));
}

void test_char_range()
{
	auto const P = motif::char_range('a', 'f');
	assert(motif::matches(P, "a"));
	assert(motif::matches(P, "c"));
	assert(motif::matches(P, "f"));
	assert(!motif::matches(P, "g"));
	assert(!motif::matches(P, "A"));
	auto const H = motif::char_range('\x80', '\xFF');
	assert(motif::matches(H, "\xC3"));
	assert(!motif::matches(H, "z"));
}

void test_one_of_none_of()
{
	auto const Sign = motif::one_of("+-");
	assert(motif::matches(Sign, "+"));
	assert(motif::matches(Sign, "-"));
	assert(!motif::matches(Sign, "*"));
	auto const NotQuote = motif::none_of("\"\\");
	assert(motif::matches(NotQuote, "a"));
	assert(!motif::matches(NotQuote, "\""));
	assert(!motif::matches(NotQuote, "\\"));
	assert(!motif::matches(NotQuote, ""));
}

void test_char_predicate()
{
	auto const Vowel = motif::char_predicate([](char c) { return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u'; });
	assert(motif::matches(Vowel, "e"));
	assert(!motif::matches(Vowel, "z"));
	assert(!motif::matches(Vowel, ""));
	motif::match_context context{"ex"};
	assert(motif::attempt(Vowel, context));
	assert(context.position() == 1);
	assert(!motif::attempt(Vowel, context));
	assert(context.position() == 1);
}

void test_implicit_operands()
{
	motif::pattern const L = "xyz";
	motif::pattern const C = 'q';
	motif::pattern const F = [](char c) { return c == '#'; };
	assert(motif::matches(L, "xyz"));
	assert(motif::matches(C, "q"));
	assert(motif::matches(F, "#"));
	assert(!motif::matches(F, "x"));
	assert(motif::matches(motif::sequence("ab", 'c', motif::digit()), "abc5"));
}

int main()
{
	try {
		test_literal();
		test_literal_equality();
		test_empty_literal();
		test_literal_prefix_attempt();
		test_caseless_literal();
		test_chr();
		test_any_char();
		test_character_classes();
		test_char_range();
		test_one_of_none_of();
		test_char_predicate();
		test_implicit_operands();
	} catch (std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return -1;
	}
	return 0;
}
