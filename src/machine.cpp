#include "machine.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>

#include "instruction.hpp"
#include "program.hpp"

namespace sieve {

bool operator==(const Error& a, const Error& b) {
	return a.kind == b.kind && a.frame == b.frame;
}

const char* error_repr(ErrorKind kind) {
	switch (kind) {
		case ErrorKind::DECODE: return "unknown opcode";
		case ErrorKind::PACKET_BOUNDS: return "packet read out of bounds";
		case ErrorKind::PROGRAM_BOUNDS: return "frame out of program bounds";
		case ErrorKind::MEMORY_BOUNDS: return "scratch memory slot out of bounds";
		case ErrorKind::STEP_BUDGET: return "step budget exceeded";
	}
	assert(false && "unreachable");
}

void Machine::reset() {
	m_frame = 0;
	m_accumulator = 0;
	m_index = 0;
	m_memory.fill(0);
	m_steps = 0;
}

auto Machine::fail(ErrorKind kind) const -> std::unexpected<Error> {
	return std::unexpected(Error {kind, m_frame});
}

auto Machine::mem(size_t slot) const -> std::expected<uint32_t, Error> {
	if (slot >= SCRATCH_MEM_SLOTS) return fail(ErrorKind::MEMORY_BOUNDS);
	return m_memory[slot];
}

auto Machine::set_mem(size_t slot, uint32_t value)
	-> std::expected<void, Error> {
	if (slot >= SCRATCH_MEM_SLOTS) return fail(ErrorKind::MEMORY_BOUNDS);
	m_memory[slot] = value;
	return {};
}

// read `width` big-endian bytes at `offset`. the whole range is checked
// before any byte is touched
auto Machine::load(
	uint32_t offset, size_t width, std::span<const uint8_t> packet
) -> std::expected<uint32_t, Error> {
	if (offset >= packet.size() || packet.size() - offset < width)
		return fail(ErrorKind::PACKET_BOUNDS);

	uint32_t val = 0;
	for (size_t i = 0; i < width; i++) val = (val << 8) | packet[offset + i];
	return val;
}

auto Machine::load_indexed(
	uint32_t k, size_t width, std::span<const uint8_t> packet
) -> std::expected<uint32_t, Error> {
	if (k > UINT32_MAX - m_index) return fail(ErrorKind::PACKET_BOUNDS);
	return load(m_index + k, width, packet);
}

static uint32_t shift_left(uint32_t val, uint32_t count) {
	return (count >= 32) ? 0 : val << count;
}

static uint32_t shift_right(uint32_t val, uint32_t count) {
	return (count >= 32) ? 0 : val >> count;
}

static uint32_t packet_length(std::span<const uint8_t> packet) {
	return static_cast<uint32_t>(
		std::min<size_t>(packet.size(), UINT32_MAX)
	);
}

#define TRY_ASSIGN(DEST, EXPR)                                 \
	{                                                            \
		auto val = (EXPR);                                         \
		if (!val.has_value()) return std::unexpected(val.error()); \
		DEST = *val;                                               \
	}

#define ALU_OP(OP, SRC) m_accumulator = m_accumulator OP(SRC)

auto Machine::perform(
	Op op, const Instruction& inst, std::span<const uint8_t> packet
) -> std::expected<std::optional<Verdict>, Error> {
	switch (op) {
		case Op::LD_IMM: m_accumulator = inst.k; break;
		case Op::LD_W_ABS:
		case Op::LD_H_ABS:
		case Op::LD_B_ABS:
			TRY_ASSIGN(m_accumulator, load(inst.k, load_width(op), packet));
			break;
		case Op::LD_W_IND:
		case Op::LD_H_IND:
		case Op::LD_B_IND:
			TRY_ASSIGN(m_accumulator, load_indexed(inst.k, load_width(op), packet));
			break;
		case Op::LD_MEM: TRY_ASSIGN(m_accumulator, mem(inst.k)); break;
		case Op::LD_LEN: m_accumulator = packet_length(packet); break;

		case Op::LDX_IMM: m_index = inst.k; break;
		case Op::LDX_MEM: TRY_ASSIGN(m_index, mem(inst.k)); break;
		case Op::LDX_LEN: m_index = packet_length(packet); break;
		case Op::LDX_MSH: {
			uint32_t byte = 0;
			TRY_ASSIGN(byte, load(inst.k, 1, packet));
			m_index = 4 * (byte & 0x0f);
			break;
		}

		case Op::ST: {
			auto res = set_mem(inst.k, m_accumulator);
			if (!res.has_value()) return std::unexpected(res.error());
			break;
		}
		case Op::STX: {
			auto res = set_mem(inst.k, m_index);
			if (!res.has_value()) return std::unexpected(res.error());
			break;
		}

		case Op::ALU_ADD_K: ALU_OP(+, inst.k); break;
		case Op::ALU_ADD_X: ALU_OP(+, m_index); break;
		case Op::ALU_SUB_K: ALU_OP(-, inst.k); break;
		case Op::ALU_SUB_X: ALU_OP(-, m_index); break;
		case Op::ALU_MUL_K: ALU_OP(*, inst.k); break;
		case Op::ALU_MUL_X: ALU_OP(*, m_index); break;
		case Op::ALU_OR_K: ALU_OP(|, inst.k); break;
		case Op::ALU_OR_X: ALU_OP(|, m_index); break;
		case Op::ALU_AND_K: ALU_OP(&, inst.k); break;
		case Op::ALU_AND_X: ALU_OP(&, m_index); break;
		case Op::ALU_XOR_K: ALU_OP(^, inst.k); break;
		case Op::ALU_XOR_X: ALU_OP(^, m_index); break;
		case Op::ALU_LSH_K: m_accumulator = shift_left(m_accumulator, inst.k); break;
		case Op::ALU_LSH_X: m_accumulator = shift_left(m_accumulator, m_index); break;
		case Op::ALU_RSH_K: m_accumulator = shift_right(m_accumulator, inst.k); break;
		case Op::ALU_RSH_X:
			m_accumulator = shift_right(m_accumulator, m_index);
			break;
		case Op::ALU_NEG: m_accumulator = 0u - m_accumulator; break;

		// the test against zero happens in execute
		case Op::JMP_JZ: break;

		case Op::RET_K: return std::optional<Verdict> {inst.k};
		case Op::RET_A: return std::optional<Verdict> {m_accumulator};

		case Op::MISC_TAX: m_index = m_accumulator; break;
		case Op::MISC_TXA: m_accumulator = m_index; break;
	}
	return std::optional<Verdict> {};
}

#undef TRY_ASSIGN
#undef ALU_OP

auto Machine::execute(const Instruction& inst, std::span<const uint8_t> packet)
	-> std::expected<std::optional<Verdict>, Error> {
	auto op = decode(inst.opcode);
	if (!op.has_value()) return fail(ErrorKind::DECODE);

	// jump operations never write the accumulator, so the displacement can be
	// picked before the operation runs
	uint32_t displacement = 1;
	if (inst.category() == Class::JUMP)
		displacement = (m_accumulator == 0) ? inst.jt : inst.jf;
	if (displacement > UINT32_MAX - m_frame)
		return fail(ErrorKind::PROGRAM_BOUNDS);

	auto ret = perform(*op, inst, packet);
	if (!ret.has_value()) return ret;

	m_frame += displacement;
	return ret;
}

auto Machine::run(
	std::span<const Instruction> program, std::span<const uint8_t> packet
) -> std::expected<Verdict, Error> {
	m_steps = 0;
	while (true) {
		if (m_frame >= program.size()) return fail(ErrorKind::PROGRAM_BOUNDS);
		if (m_steps >= m_limits.max_steps) return fail(ErrorKind::STEP_BUDGET);

		auto ret = execute(program[m_frame], packet);
		if (!ret.has_value()) return std::unexpected(ret.error());
		m_steps++;

		if (ret->has_value()) return ret->value();
	}
}

auto Machine::run(const Program& program, std::span<const uint8_t> packet)
	-> std::expected<Verdict, Error> {
	return run(std::span<const Instruction> {program.m_vec}, packet);
}

} // namespace sieve
