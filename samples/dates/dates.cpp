// motif - Composable backtracking pattern matcher combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include "date_matcher.hpp"

#include <motif/iostream.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>

// Command line options
struct options
{
	std::string filename{"-"};
	bool check{false};
};

// Prints usage information
void print_usage()
{
	std::cout << "Usage: dates [options] [file|-]\n"
	          << "Options:\n"
	          << "  -c, --check       Exit with 0 only if every line is exactly one valid date\n"
	          << "  -h, --help        Show this help\n"
	          << "If no file is specified, reads from stdin.\n";
}

// Parses command line arguments
options parse_args(int argc, char* argv[]) {
	options opts;
	for (int i = 1; i < argc; ++i) {
		std::string_view const arg{argv[i]};
		if (arg == "-h" || arg == "--help") {
			print_usage();
			std::exit(EXIT_SUCCESS);
		} else if (arg == "-c" || arg == "--check") {
			opts.check = true;
		} else if ((arg.size() > 1) && (arg.front() == '-')) {
			throw std::runtime_error("Unknown option: " + std::string{arg});
		} else {
			opts.filename = arg;
		}
	}
	return opts;
}

// Prints every valid date found in the input, or checks that each line is a date
int run(std::istream& input, options const& opts)
{
	date_matcher const matcher;
	std::string line;
	std::size_t line_number = 0;
	bool all_valid = true;
	while (motif::readline(input, line)) {
		++line_number;
		if (opts.check) {
			if (!matcher.match(line)) {
				std::cout << line_number << ": not a date: " << line << "\n";
				all_valid = false;
			}
			continue;
		}
		for (auto const& d : matcher.find_all(line))
			std::cout << line_number << ":" << d.where.start << ": " << d.year << "/" << d.month << "/" << d.day << "\n";
	}
	return all_valid ? 0 : 1;
}

int main(int argc, char* argv[])
try {
	auto const opts = parse_args(argc, argv);
	if (opts.filename == "-")
		return run(std::cin, opts);
	std::ifstream input_file;
	input_file.open(opts.filename);
	if (!input_file.is_open())
		throw std::runtime_error("Failed to open file: " + opts.filename);
	return run(input_file, opts);
} catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "UNKNOWN ERROR\n";
	return 1;
}
