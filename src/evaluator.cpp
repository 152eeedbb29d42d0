#include "evaluator.hpp"

#include <string_view>
#include <utility>

#include "file_reader.hpp"
#include "packet.hpp"

namespace sieve {

Evaluator::Evaluator(
	const Program& program, std::string program_path, Limits limits,
	std::ostream& out, unsigned int verbosity
)
: m_program {program}, m_machine {limits},
	m_logger {"MACHINE", std::move(program_path), &program}, m_out {out},
	m_verbosity {verbosity} {}

void Evaluator::evaluate(
	const std::string& name, std::span<const uint8_t> packet
) {
	m_machine.reset();
	auto verdict = m_machine.run(m_program, packet);
	if (!verdict.has_value()) {
		const auto& error = verdict.error();
		m_logger.err(
			error.frame, "packet %s rejected: %s", name.c_str(),
			error_repr(error.kind)
		);
		m_out << name << ": rejected" << '\n';
		m_failures++;
		return;
	}
	if (m_verbosity >= 2)
		m_logger.log(
			INFO, {}, "packet %s: %zu bytes, %zu steps", name.c_str(),
			packet.size(), m_machine.steps()
		);
	m_out << name << ": " << *verdict << '\n';
}

void Evaluator::evaluate_file(const char* path) {
	FileReader input {path};
	auto packet = read_all(input);
	evaluate(input.get_path(), packet);
}

void Evaluator::evaluate_lines(LineReader& input) {
	size_t line_no = 0;
	for (auto line = input.read_line(); line.has_value();
	     line = input.read_line()) {
		line_no++;
		std::string_view text {*line};
		if (text.find_first_not_of(" \t\r") == std::string_view::npos) continue;

		std::string name = input.get_path() + ":" + std::to_string(line_no);
		auto packet = parse_hex(text);
		if (!packet.has_value()) {
			Logger {"INPUT", input.get_path()}.err(line_no, "malformed hex packet");
			m_out << name << ": rejected" << '\n';
			m_failures++;
			continue;
		}
		evaluate(name, *packet);
	}
}

} // namespace sieve
