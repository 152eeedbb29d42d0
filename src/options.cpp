#include "options.hpp"

#include <getopt.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace sieve {

Options parse_args(int argc, char* argv[]) {
	Options opts {};

	int modes = 0;
	for (int c = 0; (c = getopt(argc, argv, "rdcts:uV")) != -1;)
		switch (c) {
			case 'r': opts.mode = Mode::RUN; modes++; break;
			case 'd': opts.mode = Mode::DISASSEMBLE; modes++; break;
			case 'c': opts.mode = Mode::CHECK; modes++; break;
			case 't': opts.format = Format::TEXT; break;
			case 'u': opts.verify = false; break;
			case 'V': opts.verbosity += 1; break;
			case 's': {
				char* endptr = nullptr;
				errno = 0;
				unsigned long long steps = strtoull(optarg, &endptr, 10);
				if (endptr == optarg || *endptr != '\0' || errno == ERANGE
				    || steps == 0 || optarg[0] == '-') {
					std::cerr << "Invalid step budget: " << optarg << '\n';
					opts.is_invalid = true;
					return opts;
				}
				opts.max_steps = static_cast<size_t>(steps);
				break;
			}
			default: {
				opts.is_invalid = true;
				return opts;
			}
		}

	if (modes != 1) {
		opts.is_invalid = true;
		return opts;
	}

	if (optind >= argc) {
		opts.is_invalid = true;
		return opts;
	}

	opts.program_path = argv[optind];
	opts.packet_paths = &argv[optind + 1];
	opts.packet_count = argc - optind - 1;

	if (opts.mode != Mode::RUN && opts.packet_count > 0) opts.is_invalid = true;

	// the program can't share stdin with the packets
	if (strcmp(opts.program_path, "-") == 0) opts.is_invalid = true;

	return opts;
}

} // namespace sieve
