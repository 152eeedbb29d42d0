#ifndef SIEVE_EVALUATOR_HPP
#define SIEVE_EVALUATOR_HPP

#include <cstdint>
#include <ostream>
#include <span>
#include <string>

#include "line_reader.hpp"
#include "logger.hpp"
#include "machine.hpp"
#include "program.hpp"

namespace sieve {

// Runs packets through one program and prints a `name: verdict` line for
// each of them. Packets that fail to evaluate are printed as rejected and
// counted.
struct Evaluator {
	Evaluator(
		const Program& program, std::string program_path, Limits limits,
		std::ostream& out, unsigned int verbosity = 0
	);

	void evaluate(const std::string& name, std::span<const uint8_t> packet);

	// whole file is one raw packet
	void evaluate_file(const char* path);

	// every non-blank line is one packet written in hex
	void evaluate_lines(LineReader& input);

	int failures() const { return m_failures; }

 private:
	const Program& m_program;
	Machine m_machine;
	Logger m_logger;
	std::ostream& m_out;
	unsigned int m_verbosity;
	int m_failures {0};
};

} // namespace sieve

#endif
