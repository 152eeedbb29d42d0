#include <cstdio>
#include <cstring>
#include <expected>
#include <iostream>
#include <stdexcept>
#include <string>

#include "evaluator.hpp"
#include "file_reader.hpp"
#include "line_reader.hpp"
#include "logger.hpp"
#include "machine.hpp"
#include "options.hpp"
#include "program.hpp"

using namespace sieve;

namespace {

void usage() {
	printf(
		"Usage:\n"
		"\tsieve <mode> [<options> ...] <program> [<packet> ...]\n"
		"\n"
		"Packets:\n"
		"\teach <packet> is a file holding one raw packet. if <packet> is \"-\"\n"
		"\tor no packet is given, packets are read from stdin as hex lines\n"
		"\n"
		"Options:\n"
		"\t-V          verbose output. use multiple times to increase verbosity\n"
		"\t-t          program is a `tcpdump -ddd' listing instead of binary\n"
		"\t-s <steps>  maximum instructions executed per packet\n"
		"\t-u          skip verification of the program before running it\n"
		"\n"
		"Modes:\n"
		"\t-r          run packets through the program\n"
		"\t-d          disassemble\n"
		"\t-c          verify only\n"
	);
}

void print_phase(const Options& opts, std::string phase) {
	if (opts.verbosity >= 1)
		std::cerr << ANSI_COLOR_YELLOW << "INFO" << ANSI_COLOR_RESET << ": "
							<< phase << "..." << '\n';
}

std::expected<Program, LoadError> load(const Options& opts) {
	FileReader input {opts.program_path};
	auto bytes = read_all(input);

	if (opts.format == Format::TEXT) {
		std::string text(bytes.begin(), bytes.end());
		auto program = parse_text(text);
		if (!program.has_value()) {
			// text errors point at lines, which are counted from one
			Logger logger {"LOADER", opts.program_path};
			const auto& error = program.error();
			logger.err(error.index + 1, "%s", load_error_repr(error.kind));
		}
		return program;
	}

	auto program = parse_binary(bytes);
	if (!program.has_value()) {
		Logger logger {"LOADER", opts.program_path};
		const auto& error = program.error();
		logger.err(error.index, "%s", load_error_repr(error.kind));
	}
	return program;
}

int check(const Options& opts, const Program& program) {
	print_phase(opts, "verifying");
	auto verified = verify(program);
	if (!verified.has_value()) {
		Logger logger {"VERIFIER", opts.program_path, &program};
		const auto& error = verified.error();
		logger.err(error.index, "%s", load_error_repr(error.kind));
		return 1;
	}
	return 0;
}

int run(const Options& opts) {
	print_phase(opts, "loading program");
	auto program = load(opts);
	if (!program.has_value()) return 1;

	if (opts.verbosity >= 2) {
		print_program(stderr, *program);
		fprintf(stderr, "\n");
	}

	if (opts.mode == Mode::CHECK) {
		if (check(opts, *program) != 0) return 1;
		std::cout << opts.program_path << ": ok, " << program->size()
							<< " instructions" << '\n';
		return 0;
	}

	if (opts.mode == Mode::DISASSEMBLE) {
		if (opts.verify && check(opts, *program) != 0) return 1;
		print_program(stdout, *program);
		return 0;
	}

	if (opts.verify && check(opts, *program) != 0) return 1;
	if (!opts.verify)
		Logger {"VERIFIER", opts.program_path}.log(
			WARN, {}, "running an unverified program"
		);

	print_phase(opts, "running packets");
	Evaluator evaluator {
		*program, opts.program_path, Limits {opts.max_steps}, std::cout,
		opts.verbosity
	};
	if (opts.packet_count == 0) {
		LineReader input {};
		evaluator.evaluate_lines(input);
	}
	for (int i = 0; i < opts.packet_count; i++) {
		if (strcmp(opts.packet_paths[i], "-") == 0) {
			LineReader input {};
			evaluator.evaluate_lines(input);
		} else {
			evaluator.evaluate_file(opts.packet_paths[i]);
		}
	}

	return (evaluator.failures() > 0) ? 2 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
	Options opts = parse_args(argc, argv);
	if (opts.is_invalid) {
		usage();
		return 1;
	}

	try {
		return run(opts);
	} catch (const std::domain_error& e) {
		std::cerr << ANSI_COLOR_RED << "ERROR" << ANSI_COLOR_RESET << ": "
							<< e.what() << '\n';
		return 1;
	}
}
