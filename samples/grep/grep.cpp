// motif - Composable backtracking pattern matcher combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <motif/iostream.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

// Command line options
struct options
{
	std::string pattern_name{"digits"};
	std::vector<std::string> filenames;
	motif::match_options limits;
	bool count_only{false};
	bool line_numbers{false};
	bool only_matching{false};
	bool quiet{false};
};

// Output stream that stays silent in quiet mode
struct verbose_cout
{
	options const& opts;

	template <typename T>
	friend verbose_cout&& operator<<(verbose_cout&& os, T&& v)
	{
		if (!os.opts.quiet)
			std::cout << std::forward<T>(v);
		return static_cast<verbose_cout&&>(os);
	}
};

// Builds the table of named patterns
std::map<std::string, motif::pattern> make_builtin_patterns()
{
	using namespace motif::language;
	pattern const label = +(alnum | '-'_cx);
	return {
		{"digits", +digit},
		{"words", +alpha},
		{"dates", exactly<4>[digit] > '-' > exactly<2>[digit] > '-' > exactly<2>[digit]},
		{"emails", +(alnum | one_of("._%+-")) > '@' > label > +('.'_cx > label)},
		{"hex", "0x"_isx > +xdigit}
	};
}

// Prints usage information
void print_usage()
{
	std::cout << "Usage: grep [options] [file...]\n"
	          << "Options:\n"
	          << "  -p NAME           Pattern to search for: digits, words, dates, emails, hex (default: digits)\n"
	          << "  -c                Print only the number of matching lines\n"
	          << "  -n                Prefix each output line with its line number\n"
	          << "  -o                Print only the matched parts of each line\n"
	          << "  -q                Print nothing, exit with 0 if any line matched\n"
	          << "  --max-steps N     Abort a line's search after N matching steps\n"
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
		} else if (arg == "-p") {
			if (++i >= argc)
				throw std::runtime_error("Missing pattern name after -p");
			opts.pattern_name = argv[i];
		} else if (arg == "--max-steps") {
			if (++i >= argc)
				throw std::runtime_error("Missing step count after --max-steps");
			opts.limits.step_limit = std::stoull(argv[i]);
		} else if (arg == "-c") {
			opts.count_only = true;
		} else if (arg == "-n") {
			opts.line_numbers = true;
		} else if (arg == "-o") {
			opts.only_matching = true;
		} else if (arg == "-q") {
			opts.quiet = true;
		} else if ((arg.size() > 1) && (arg.front() == '-')) {
			throw std::runtime_error("Unknown option: " + std::string{arg});
		} else {
			opts.filenames.emplace_back(arg);
		}
	}
	return opts;
}

// Searches a single stream, returning the number of matching lines
std::size_t grep_stream(std::istream& input, std::string_view prefix, motif::pattern const& p, options const& opts)
{
	return motif::search_lines(input, p, [&prefix, &opts](std::size_t line_number, std::string_view line, std::vector<motif::span> const& spans) {
		if (opts.count_only)
			return;
		auto const print_prefix = [&] {
			if (!prefix.empty())
				verbose_cout{opts} << prefix << ":";
			if (opts.line_numbers)
				verbose_cout{opts} << line_number << ":";
		};
		if (opts.only_matching) {
			for (auto const& s : spans) {
				if (s.empty())
					continue;
				print_prefix();
				verbose_cout{opts} << s.str(line) << "\n";
			}
		} else {
			print_prefix();
			verbose_cout{opts} << line << "\n";
		}
	}, opts.limits);
}

int main(int argc, char* argv[])
try {
	auto const opts = parse_args(argc, argv);
	auto const patterns = make_builtin_patterns();
	auto const p = patterns.find(opts.pattern_name);
	if (p == patterns.end())
		throw std::runtime_error("Unknown pattern name: " + opts.pattern_name);
	std::size_t matched = 0;
	if (opts.filenames.empty()) {
		matched = grep_stream(std::cin, {}, p->second, opts);
	} else {
		bool const show_names = opts.filenames.size() > 1;
		for (auto const& filename : opts.filenames) {
			std::ifstream input_file{filename};
			if (!input_file.is_open())
				throw std::runtime_error("Failed to open file: " + filename);
			std::size_t const count = grep_stream(input_file, show_names ? std::string_view{filename} : std::string_view{}, p->second, opts);
			if (opts.count_only) {
				if (show_names)
					verbose_cout{opts} << filename << ":";
				verbose_cout{opts} << count << "\n";
			}
			matched += count;
		}
	}
	if (opts.count_only && opts.filenames.empty())
		verbose_cout{opts} << matched << "\n";
	return (matched > 0) ? 0 : 1;
} catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 2;
}
