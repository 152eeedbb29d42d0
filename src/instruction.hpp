#ifndef SIEVE_INSTRUCTION_HPP
#define SIEVE_INSTRUCTION_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>

namespace sieve {

// opcode bit fields, laid out like classic BPF
namespace bits {

constexpr uint16_t CLASS_LD = 0x00;
constexpr uint16_t CLASS_LDX = 0x01;
constexpr uint16_t CLASS_ST = 0x02;
constexpr uint16_t CLASS_STX = 0x03;
constexpr uint16_t CLASS_ALU = 0x04;
constexpr uint16_t CLASS_JMP = 0x05;
constexpr uint16_t CLASS_RET = 0x06;
constexpr uint16_t CLASS_MISC = 0x07;

constexpr uint16_t SIZE_W = 0x00;
constexpr uint16_t SIZE_H = 0x08;
constexpr uint16_t SIZE_B = 0x10;

constexpr uint16_t MODE_IMM = 0x00;
constexpr uint16_t MODE_ABS = 0x20;
constexpr uint16_t MODE_IND = 0x40;
constexpr uint16_t MODE_MEM = 0x60;
constexpr uint16_t MODE_LEN = 0x80;
constexpr uint16_t MODE_MSH = 0xa0;

constexpr uint16_t ALU_ADD = 0x00;
constexpr uint16_t ALU_SUB = 0x10;
constexpr uint16_t ALU_MUL = 0x20;
constexpr uint16_t ALU_OR = 0x40;
constexpr uint16_t ALU_AND = 0x50;
constexpr uint16_t ALU_LSH = 0x60;
constexpr uint16_t ALU_RSH = 0x70;
constexpr uint16_t ALU_NEG = 0x80;
constexpr uint16_t ALU_XOR = 0xa0;

constexpr uint16_t SRC_K = 0x00;
constexpr uint16_t SRC_X = 0x08;

constexpr uint16_t RVAL_K = 0x00;
constexpr uint16_t RVAL_A = 0x10;

constexpr uint16_t MISC_TAX = 0x00;
constexpr uint16_t MISC_TXA = 0x80;

constexpr uint16_t JMP_JZ = 0x00;

} // namespace bits

// every operation the machine knows how to execute, tagged by its opcode
enum class Op : uint16_t {
	LD_IMM = bits::CLASS_LD | bits::SIZE_W | bits::MODE_IMM,
	LD_W_ABS = bits::CLASS_LD | bits::SIZE_W | bits::MODE_ABS,
	LD_H_ABS = bits::CLASS_LD | bits::SIZE_H | bits::MODE_ABS,
	LD_B_ABS = bits::CLASS_LD | bits::SIZE_B | bits::MODE_ABS,
	LD_W_IND = bits::CLASS_LD | bits::SIZE_W | bits::MODE_IND,
	LD_H_IND = bits::CLASS_LD | bits::SIZE_H | bits::MODE_IND,
	LD_B_IND = bits::CLASS_LD | bits::SIZE_B | bits::MODE_IND,
	LD_MEM = bits::CLASS_LD | bits::SIZE_W | bits::MODE_MEM,
	LD_LEN = bits::CLASS_LD | bits::SIZE_W | bits::MODE_LEN,

	LDX_IMM = bits::CLASS_LDX | bits::SIZE_W | bits::MODE_IMM,
	LDX_MEM = bits::CLASS_LDX | bits::SIZE_W | bits::MODE_MEM,
	LDX_LEN = bits::CLASS_LDX | bits::SIZE_W | bits::MODE_LEN,
	LDX_MSH = bits::CLASS_LDX | bits::SIZE_B | bits::MODE_MSH,

	ST = bits::CLASS_ST,
	STX = bits::CLASS_STX,

	ALU_ADD_K = bits::CLASS_ALU | bits::ALU_ADD | bits::SRC_K,
	ALU_ADD_X = bits::CLASS_ALU | bits::ALU_ADD | bits::SRC_X,
	ALU_SUB_K = bits::CLASS_ALU | bits::ALU_SUB | bits::SRC_K,
	ALU_SUB_X = bits::CLASS_ALU | bits::ALU_SUB | bits::SRC_X,
	ALU_MUL_K = bits::CLASS_ALU | bits::ALU_MUL | bits::SRC_K,
	ALU_MUL_X = bits::CLASS_ALU | bits::ALU_MUL | bits::SRC_X,
	ALU_OR_K = bits::CLASS_ALU | bits::ALU_OR | bits::SRC_K,
	ALU_OR_X = bits::CLASS_ALU | bits::ALU_OR | bits::SRC_X,
	ALU_AND_K = bits::CLASS_ALU | bits::ALU_AND | bits::SRC_K,
	ALU_AND_X = bits::CLASS_ALU | bits::ALU_AND | bits::SRC_X,
	ALU_LSH_K = bits::CLASS_ALU | bits::ALU_LSH | bits::SRC_K,
	ALU_LSH_X = bits::CLASS_ALU | bits::ALU_LSH | bits::SRC_X,
	ALU_RSH_K = bits::CLASS_ALU | bits::ALU_RSH | bits::SRC_K,
	ALU_RSH_X = bits::CLASS_ALU | bits::ALU_RSH | bits::SRC_X,
	ALU_XOR_K = bits::CLASS_ALU | bits::ALU_XOR | bits::SRC_K,
	ALU_XOR_X = bits::CLASS_ALU | bits::ALU_XOR | bits::SRC_X,
	ALU_NEG = bits::CLASS_ALU | bits::ALU_NEG,

	JMP_JZ = bits::CLASS_JMP | bits::JMP_JZ,

	RET_K = bits::CLASS_RET | bits::RVAL_K,
	RET_A = bits::CLASS_RET | bits::RVAL_A,

	MISC_TAX = bits::CLASS_MISC | bits::MISC_TAX,
	MISC_TXA = bits::CLASS_MISC | bits::MISC_TXA,
};

// coarse grouping used to pick the frame advancement rule
enum class Class {
	LOAD,
	STORE,
	ALU,
	JUMP,
	RETURN,
	MISC,
};

struct Instruction {
	uint16_t opcode;
	uint8_t jt;
	uint8_t jf;
	uint32_t k;

	constexpr Instruction(uint16_t opcode, uint8_t jt, uint8_t jf, uint32_t k)
	: opcode {opcode}, jt {jt}, jf {jf}, k {k} {}
	constexpr Instruction(Op op, uint32_t k = 0, uint8_t jt = 0, uint8_t jf = 0)
	: opcode {static_cast<uint16_t>(op)}, jt {jt}, jf {jf}, k {k} {}

	Class category() const;
};

bool operator==(const Instruction& a, const Instruction& b);

// returns the operation encoded by `opcode`, or nothing if it is unknown
std::optional<Op> decode(uint16_t opcode);

Class category(uint16_t opcode);

// returns the number of packet bytes read by a load, 0 if it reads none
size_t load_width(Op op);

// whether `op` addresses scratch memory through k
bool uses_scratch(Op op);

const char* class_repr(Class cls);

// return textual representation of opcode
const char* opcode_repr(Op op);

int print_inst(FILE*, const Instruction& inst);

} // namespace sieve

#endif
