// motif - Composable backtracking pattern matcher combinators in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#include <motif/motif.hpp>

#include <iostream>

#undef NDEBUG
#include <cassert>

[[nodiscard]] motif::pattern make_pathological(int depth)
{
	// every level retries its whole subtree after the first alternative fails
	motif::pattern p = motif::one_or_more(motif::chr('a'));
	for (int i = 0; i < depth; ++i)
		p = motif::alternation(motif::sequence(p, motif::chr('x')), p);
	return p;
}

[[nodiscard]] motif::pattern make_nested(int depth)
{
	motif::pattern p = motif::chr('x');
	for (int i = 0; i < depth; ++i)
		p = motif::group(p);
	return p;
}

void test_step_counting()
{
	motif::match_context context{"ab"};
	assert(context.steps() == 0);
	assert(motif::attempt(motif::sequence(motif::chr('a'), motif::chr('b')), context));
	assert(context.steps() == 3);
	assert(!motif::attempt(motif::chr('z'), context));
	assert(context.steps() == 4);
}

void test_step_limit()
{
	motif::match_options options;
	options.step_limit = 3;
	auto const P = motif::sequence(motif::chr('a'), motif::chr('b'));
	assert(motif::matches(P, "ab", options));
	auto const Q = motif::sequence(motif::chr('a'), motif::chr('b'), motif::chr('c'));
	bool limited = false;
	try {
		(void)motif::matches(Q, "abc", options);
	} catch (motif::step_limit_error const&) {
		limited = true;
	}
	assert(limited);
}

void test_step_limit_applies_across_search()
{
	motif::match_options options;
	options.step_limit = 10;
	bool limited = false;
	try {
		(void)motif::search(motif::chr('a'), std::string(100, 'b'), options);
	} catch (motif::resource_limit_error const&) {
		limited = true;
	}
	assert(limited);
	options.step_limit = 101;
	assert(motif::search(motif::chr('a'), std::string(100, 'b'), options).empty());
}

void test_step_limit_distinct_from_no_match()
{
	auto const P = make_pathological(20);
	std::string const text = std::string(24, 'a');
	motif::match_options options;
	options.step_limit = 1000;
	bool limited = false;
	try {
		(void)motif::search(P, text, options);
	} catch (motif::step_limit_error const& e) {
		limited = true;
		assert(std::string_view{e.what()} == "match exceeded step limit");
	}
	assert(limited);
	assert(motif::matches(make_pathological(3), "aaaa"));
	assert(!motif::matches(motif::literal("abc"), "abd", options));
}

void test_depth_limit()
{
	auto const P = make_nested(50);
	assert(motif::matches(P, "x"));
	motif::match_options options;
	options.depth_limit = 51;
	assert(motif::matches(P, "x", options));
	options.depth_limit = 20;
	bool limited = false;
	try {
		(void)motif::matches(P, "x", options);
	} catch (motif::depth_limit_error const&) {
		limited = true;
	}
	assert(limited);
}

void test_depth_restored_after_error()
{
	motif::match_options options;
	options.depth_limit = 3;
	motif::match_context context{"x", 0, options};
	bool limited = false;
	try {
		(void)motif::attempt(make_nested(5), context);
	} catch (motif::depth_limit_error const&) {
		limited = true;
	}
	assert(limited);
	assert(motif::attempt(make_nested(2), context));
	assert(context.at_end());
}

void test_unlimited_by_default()
{
	motif::match_options const options;
	assert(options.step_limit == motif::match_options::unlimited);
	assert(options.depth_limit == motif::match_options::unlimited);
	assert(motif::matches(motif::one_or_more(motif::any_char()), std::string(50000, 'q')));
}

int main()
{
	try {
		test_step_counting();
		test_step_limit();
		test_step_limit_applies_across_search();
		test_step_limit_distinct_from_no_match();
		test_depth_limit();
		test_depth_restored_after_error();
		test_unlimited_by_default();
	} catch (std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return -1;
	}
	return 0;
}
