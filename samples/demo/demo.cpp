// motif - Composable backtracking pattern matcher combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

// This sample demonstrates how to build a pattern with the motif operators and search text with it.

// Include the motif library header file
#include <motif/motif.hpp>

// Needed for std::cout
#include <iostream>

int main()
{
    // Import the namespace containing the combinator operators and character classes
    using namespace motif::language;

    // Define a group that captures the integral part of a price
    pattern const Units = group(+digit);

    // Define a group that captures the optional two digit fraction
    pattern const Cents = group(exactly<2>[digit]);

    // Define a price as a currency sign, the units and an optional fraction
    pattern const Price = '$'_cx > Units > ~('.'_cx > Cents);

    // Sample input string to search
    std::string const input = "Coffee $3.50, bagel $2, juice $4.25 and a $.99 mistake";

    // Visit every non-overlapping match and print the captured parts
    auto const count = motif::for_each_match(Price, input, [&](span const& s, match_context const& context) {
        std::cout << s.str(input) << " -> units " << context.group_span(Units)->str(input);
        if (auto const cents = context.group_span(Cents); cents)
            std::cout << ", cents " << cents->str(input);
        std::cout << "\n";
    });

    // Outputs 3 matches: $3.50, $2 and $4.25
    std::cout << count << " prices found\n";
    return 0;
}
