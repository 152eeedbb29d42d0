#ifndef SIEVE_PROGRAM_HPP
#define SIEVE_PROGRAM_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

#include "instruction.hpp"

namespace sieve {

// same limit as the kernel's classic BPF
constexpr size_t MAX_PROGRAM_LEN = 4096;

// size of one record of the binary program format
constexpr size_t INSTRUCTION_SIZE = 8;

struct Program {
	Program& emit(Op op, uint32_t k = 0, uint8_t jt = 0, uint8_t jf = 0);
	Program& emit(Instruction inst);

	size_t size() const { return m_vec.size(); }
	bool empty() const { return m_vec.empty(); }
	const Instruction& operator[](size_t i) const { return m_vec[i]; }

	std::vector<Instruction> m_vec;
};

enum class LoadErrorKind {
	TRUNCATED,         // binary input is not a whole number of records
	MALFORMED,         // text input is not a list of numbers in range
	COUNT_MISMATCH,    // text header disagrees with the instruction count
	EMPTY,             // program has no instructions
	TOO_LONG,          // program has more than MAX_PROGRAM_LEN instructions
	UNKNOWN_OPCODE,    // instruction does not decode
	JUMP_OUT_OF_RANGE, // jump lands past the last instruction
	JUMP_LOOP,         // jump with a zero displacement
	BAD_SCRATCH_SLOT,  // scratch memory slot out of bounds
	BAD_SHIFT,         // constant shift of 32 or more
	NO_RETURN,         // last instruction is not a return
};

struct LoadError {
	LoadErrorKind kind;
	size_t index; // instruction (or text line) the error refers to
};

bool operator==(const LoadError& a, const LoadError& b);

const char* load_error_repr(LoadErrorKind kind);

// parse consecutive little-endian {u16 code, u8 jt, u8 jf, u32 k} records
auto parse_binary(std::span<const uint8_t> bytes)
	-> std::expected<Program, LoadError>;

// parse the decimal listing printed by `tcpdump -ddd`
auto parse_text(std::string_view text) -> std::expected<Program, LoadError>;

void write_binary(std::vector<uint8_t>& out, const Program& program);

// Checks that running `program` can neither decode an unknown opcode, fetch
// outside of the program, touch a scratch slot out of bounds nor loop. A
// verified program always returns within `program.size()` steps.
auto verify(const Program& program) -> std::expected<void, LoadError>;

void print_program(FILE*, const Program&);

} // namespace sieve

#endif
