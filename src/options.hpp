#ifndef SIEVE_OPTIONS_HPP
#define SIEVE_OPTIONS_HPP

#include <cstddef>

#include "machine.hpp"

namespace sieve {

enum class Mode {
	RUN,
	DISASSEMBLE,
	CHECK,
};

enum class Format {
	BINARY,
	TEXT,
};

struct Options {
	Mode mode {Mode::RUN};
	Format format {Format::BINARY};
	bool is_invalid {false};
	unsigned int verbosity {0};
	bool verify {true};
	size_t max_steps {DEFAULT_MAX_STEPS};
	char* program_path {nullptr};
	char** packet_paths {nullptr};
	int packet_count {0};
};

Options parse_args(int argc, char* argv[]);

} // namespace sieve

#endif
