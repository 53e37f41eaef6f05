// motif - Composable backtracking pattern matcher combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef MOTIF_SAMPLES_DATES_DATE_MATCHER_HPP
#define MOTIF_SAMPLES_DATES_DATE_MATCHER_HPP

#include <motif/motif.hpp>

#include <optional>
#include <string_view>
#include <vector>

struct date
{
	int year{0};
	int month{0};
	int day{0};
	motif::span where;
};

// Matcher for calendar dates in ISO-8601 extended format (YYYY-MM-DD)
class date_matcher
{
public:
	date_matcher()
		: year_{motif::group(motif::language::exactly<4>[motif::language::digit])}
		, month_{motif::group(motif::alternation(motif::sequence('0', motif::char_range('1', '9')), motif::sequence('1', motif::one_of("012"))))}
		, day_{motif::group(motif::alternation(motif::sequence(motif::one_of("012"), motif::char_range('0', '9')), motif::sequence('3', motif::one_of("01"))))}
		, date_{make_date(year_, month_, day_)}
	{}

	[[nodiscard]] bool match(std::string_view text) const
	{
		return motif::matches(date_, text);
	}

	[[nodiscard]] std::vector<date> find_all(std::string_view text, motif::match_options const& options = motif::match_options{}) const
	{
		std::vector<date> dates;
		motif::for_each_match(date_, text, [this, text, &dates](motif::span const& s, motif::match_context const& context) {
			if (auto d = make_result(text, context); d) {
				d->where = s;
				dates.push_back(*d);
			}
		}, options);
		return dates;
	}

private:
	[[nodiscard]] static motif::pattern make_date(motif::pattern const& year, motif::pattern const& month, motif::pattern const& day)
	{
		using namespace motif::language;
		return year > '-' > month > '-' > day;
	}

	[[nodiscard]] static int to_int(std::string_view digits) noexcept
	{
		int value = 0;
		for (char const c : digits)
			value = (value * 10) + (c - '0');
		return value;
	}

	[[nodiscard]] std::optional<date> make_result(std::string_view text, motif::match_context const& context) const
	{
		auto const y = context.group_span(year_);
		auto const m = context.group_span(month_);
		auto const d = context.group_span(day_);
		if (!y || !m || !d)
			return std::nullopt;
		date result;
		result.year = to_int(y->str(text));
		result.month = to_int(m->str(text));
		result.day = to_int(d->str(text));
		static constexpr int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
		bool const leap = ((result.year % 4) == 0) && (((result.year % 100) != 0) || ((result.year % 400) == 0));
		int const last_day = days_in_month[result.month - 1] + ((leap && (result.month == 2)) ? 1 : 0);
		if ((result.day < 1) || (result.day > last_day))
			return std::nullopt;
		return result;
	}

	motif::pattern year_;
	motif::pattern month_;
	motif::pattern day_;
	motif::pattern date_;
};

#endif // MOTIF_SAMPLES_DATES_DATE_MATCHER_HPP
