// Packet filter virtual machine

#ifndef SIEVE_MACHINE_HPP
#define SIEVE_MACHINE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>

#include "instruction.hpp"
#include "program.hpp"

namespace sieve {

constexpr size_t SCRATCH_MEM_SLOTS = 16;

// arbitrary choice, well above what any verified program can execute
constexpr size_t DEFAULT_MAX_STEPS = 65536;

using Verdict = uint32_t;

enum class ErrorKind {
	DECODE,         // opcode not recognized
	PACKET_BOUNDS,  // load reached outside of the packet
	PROGRAM_BOUNDS, // frame points outside of the program
	MEMORY_BOUNDS,  // scratch slot outside of the scratch memory
	STEP_BUDGET,    // run executed more than Limits::max_steps instructions
};

struct Error {
	ErrorKind kind;
	uint32_t frame; // frame of the instruction that failed
};

bool operator==(const Error& a, const Error& b);

const char* error_repr(ErrorKind kind);

struct Limits {
	size_t max_steps {DEFAULT_MAX_STEPS};
};

struct Machine {
	Machine() = default;
	explicit Machine(Limits limits) : m_limits {limits} {}

	// zero every register, the scratch memory and the step counter
	void reset();

	// Executes `inst` and advances the frame. Returns a verdict if `inst` is a
	// return instruction and nothing otherwise. On error nothing is modified.
	auto execute(const Instruction& inst, std::span<const uint8_t> packet)
		-> std::expected<std::optional<Verdict>, Error>;

	// Executes instructions starting at the current frame until one of them
	// returns a verdict or fails.
	auto run(std::span<const Instruction> program, std::span<const uint8_t> packet)
		-> std::expected<Verdict, Error>;
	auto run(const Program& program, std::span<const uint8_t> packet)
		-> std::expected<Verdict, Error>;

	uint32_t frame() const { return m_frame; }
	uint32_t accumulator() const { return m_accumulator; }
	uint32_t index() const { return m_index; }
	std::span<const uint32_t> memory() const { return m_memory; }
	size_t steps() const { return m_steps; }
	const Limits& limits() const { return m_limits; }

	void set_frame(uint32_t frame) { m_frame = frame; }
	void set_accumulator(uint32_t acc) { m_accumulator = acc; }
	void set_index(uint32_t index) { m_index = index; }

	auto mem(size_t slot) const -> std::expected<uint32_t, Error>;
	auto set_mem(size_t slot, uint32_t value) -> std::expected<void, Error>;

 private:
	auto perform(Op op, const Instruction& inst, std::span<const uint8_t> packet)
		-> std::expected<std::optional<Verdict>, Error>;

	auto load(uint32_t offset, size_t width, std::span<const uint8_t> packet)
		-> std::expected<uint32_t, Error>;
	auto load_indexed(uint32_t k, size_t width, std::span<const uint8_t> packet)
		-> std::expected<uint32_t, Error>;

	auto fail(ErrorKind kind) const -> std::unexpected<Error>;

	uint32_t m_frame {0};
	uint32_t m_accumulator {0};
	uint32_t m_index {0};
	std::array<uint32_t, SCRATCH_MEM_SLOTS> m_memory {};

	size_t m_steps {0};
	Limits m_limits {};
};

} // namespace sieve

#endif
