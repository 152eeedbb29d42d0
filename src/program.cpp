#include "program.hpp"

#include <cassert>
#include <charconv>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "instruction.hpp"
#include "machine.hpp"

namespace sieve {

Program& Program::emit(Op op, uint32_t k, uint8_t jt, uint8_t jf) {
	m_vec.push_back(Instruction {op, k, jt, jf});
	return *this;
}

Program& Program::emit(Instruction inst) {
	m_vec.push_back(inst);
	return *this;
}

bool operator==(const LoadError& a, const LoadError& b) {
	return a.kind == b.kind && a.index == b.index;
}

const char* load_error_repr(LoadErrorKind kind) {
	switch (kind) {
		case LoadErrorKind::TRUNCATED: return "truncated instruction record";
		case LoadErrorKind::MALFORMED: return "malformed instruction line";
		case LoadErrorKind::COUNT_MISMATCH:
			return "instruction count does not match header";
		case LoadErrorKind::EMPTY: return "program is empty";
		case LoadErrorKind::TOO_LONG: return "program is too long";
		case LoadErrorKind::UNKNOWN_OPCODE: return "unknown opcode";
		case LoadErrorKind::JUMP_OUT_OF_RANGE: return "jump out of range";
		case LoadErrorKind::JUMP_LOOP: return "jump does not advance";
		case LoadErrorKind::BAD_SCRATCH_SLOT: return "invalid scratch memory slot";
		case LoadErrorKind::BAD_SHIFT: return "shift count of 32 or more";
		case LoadErrorKind::NO_RETURN: return "program does not end with ret";
	}
	assert(false && "unreachable");
}

static uint32_t read_le(std::span<const uint8_t> bytes, size_t width) {
	uint32_t val = 0;
	for (size_t i = width; i > 0; i--) val = (val << 8) | bytes[i - 1];
	return val;
}

auto parse_binary(std::span<const uint8_t> bytes)
	-> std::expected<Program, LoadError> {
	if (bytes.size() % INSTRUCTION_SIZE != 0)
		return std::unexpected(LoadError {
			LoadErrorKind::TRUNCATED, bytes.size() / INSTRUCTION_SIZE
		});

	Program program {};
	for (size_t off = 0; off < bytes.size(); off += INSTRUCTION_SIZE) {
		auto record = bytes.subspan(off, INSTRUCTION_SIZE);
		program.emit(Instruction {
			static_cast<uint16_t>(read_le(record.subspan(0, 2), 2)),
			record[2],
			record[3],
			read_le(record.subspan(4, 4), 4),
		});
	}
	return program;
}

void write_binary(std::vector<uint8_t>& out, const Program& program) {
	auto put_le = [&](uint32_t val, size_t width) {
		for (size_t i = 0; i < width; i++) out.push_back((val >> (8 * i)) & 0xff);
	};
	for (const auto& inst : program.m_vec) {
		put_le(inst.opcode, 2);
		put_le(inst.jt, 1);
		put_le(inst.jf, 1);
		put_le(inst.k, 4);
	}
}

namespace {

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r'; }

// split `line` into unsigned decimal numbers. returns nothing if anything
// else is found
std::optional<std::vector<uint64_t>> parse_numbers(std::string_view line) {
	std::vector<uint64_t> numbers {};
	size_t i = 0;
	while (i < line.size()) {
		if (is_space(line[i])) {
			i++;
			continue;
		}
		uint64_t num = 0;
		const char* first = line.data() + i;
		auto [ptr, ec] = std::from_chars(first, line.data() + line.size(), num);
		if (ec != std::errc {}) return {};
		i += static_cast<size_t>(ptr - first);
		if (i < line.size() && !is_space(line[i])) return {};
		numbers.push_back(num);
	}
	return numbers;
}

// blank lines and lines starting with '#' carry no instruction
bool is_comment(std::string_view line) {
	auto first = line.find_first_not_of(" \t\r");
	return first == std::string_view::npos || line[first] == '#';
}

} // namespace

auto parse_text(std::string_view text) -> std::expected<Program, LoadError> {
	Program program {};
	std::optional<uint64_t> count {};
	size_t header_line = 0;

	size_t line_no = 0;
	for (size_t start = 0; start < text.size(); line_no++) {
		size_t end = text.find('\n', start);
		if (end == std::string_view::npos) end = text.size();
		auto line = text.substr(start, end - start);
		start = end + 1;

		if (is_comment(line)) continue;

		auto numbers = parse_numbers(line);
		if (!numbers.has_value())
			return std::unexpected(LoadError {LoadErrorKind::MALFORMED, line_no});

		if (!count.has_value()) {
			if (numbers->size() != 1)
				return std::unexpected(LoadError {LoadErrorKind::MALFORMED, line_no});
			count = numbers->front();
			header_line = line_no;
			continue;
		}

		const auto& nums = *numbers;
		if (nums.size() != 4 || nums[0] > UINT16_MAX || nums[1] > UINT8_MAX
		    || nums[2] > UINT8_MAX || nums[3] > UINT32_MAX)
			return std::unexpected(LoadError {LoadErrorKind::MALFORMED, line_no});

		program.emit(Instruction {
			static_cast<uint16_t>(nums[0]),
			static_cast<uint8_t>(nums[1]),
			static_cast<uint8_t>(nums[2]),
			static_cast<uint32_t>(nums[3]),
		});
	}

	if (!count.has_value())
		return std::unexpected(LoadError {LoadErrorKind::EMPTY, 0});
	if (*count != program.size())
		return std::unexpected(
			LoadError {LoadErrorKind::COUNT_MISMATCH, header_line}
		);
	return program;
}

auto verify(const Program& program) -> std::expected<void, LoadError> {
	if (program.empty())
		return std::unexpected(LoadError {LoadErrorKind::EMPTY, 0});
	if (program.size() > MAX_PROGRAM_LEN)
		return std::unexpected(LoadError {LoadErrorKind::TOO_LONG, MAX_PROGRAM_LEN});

	for (size_t i = 0; i < program.size(); i++) {
		const auto& inst = program[i];
		auto fail = [&](LoadErrorKind kind) {
			return std::unexpected(LoadError {kind, i});
		};

		auto op = decode(inst.opcode);
		if (!op.has_value()) return fail(LoadErrorKind::UNKNOWN_OPCODE);

		if (uses_scratch(*op) && inst.k >= SCRATCH_MEM_SLOTS)
			return fail(LoadErrorKind::BAD_SCRATCH_SLOT);

		if ((*op == Op::ALU_LSH_K || *op == Op::ALU_RSH_K) && inst.k >= 32)
			return fail(LoadErrorKind::BAD_SHIFT);

		if (inst.category() == Class::JUMP) {
			if (inst.jt == 0 || inst.jf == 0) return fail(LoadErrorKind::JUMP_LOOP);
			if (i + inst.jt >= program.size() || i + inst.jf >= program.size())
				return fail(LoadErrorKind::JUMP_OUT_OF_RANGE);
		}
	}

	if (program.m_vec.back().category() != Class::RETURN)
		return std::unexpected(
			LoadError {LoadErrorKind::NO_RETURN, program.size() - 1}
		);

	return {};
}

void print_program(FILE* fd, const Program& program) {
	constexpr int comment_column = 24;
	for (size_t i = 0; i < program.size(); i++) {
		const auto& inst = program[i];
		fprintf(fd, "%04zu:", i);
		int printed = print_inst(fd, inst);
		if (inst.category() == Class::JUMP && decode(inst.opcode).has_value()) {
			for (int j = printed; j < comment_column; j++) fputc(' ', fd);
			fprintf(fd, "  ; %04zu, %04zu", i + inst.jt, i + inst.jf);
		}
		fprintf(fd, "\n");
	}
}

} // namespace sieve
