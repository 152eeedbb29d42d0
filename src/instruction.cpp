#include "instruction.hpp"

#include <cassert>

namespace sieve {

Class Instruction::category() const { return sieve::category(opcode); }

bool operator==(const Instruction& a, const Instruction& b) {
	return a.opcode == b.opcode && a.jt == b.jt && a.jf == b.jf && a.k == b.k;
}

std::optional<Op> decode(uint16_t opcode) {
	switch (static_cast<Op>(opcode)) {
		case Op::LD_IMM:
		case Op::LD_W_ABS:
		case Op::LD_H_ABS:
		case Op::LD_B_ABS:
		case Op::LD_W_IND:
		case Op::LD_H_IND:
		case Op::LD_B_IND:
		case Op::LD_MEM:
		case Op::LD_LEN:
		case Op::LDX_IMM:
		case Op::LDX_MEM:
		case Op::LDX_LEN:
		case Op::LDX_MSH:
		case Op::ST:
		case Op::STX:
		case Op::ALU_ADD_K:
		case Op::ALU_ADD_X:
		case Op::ALU_SUB_K:
		case Op::ALU_SUB_X:
		case Op::ALU_MUL_K:
		case Op::ALU_MUL_X:
		case Op::ALU_OR_K:
		case Op::ALU_OR_X:
		case Op::ALU_AND_K:
		case Op::ALU_AND_X:
		case Op::ALU_LSH_K:
		case Op::ALU_LSH_X:
		case Op::ALU_RSH_K:
		case Op::ALU_RSH_X:
		case Op::ALU_XOR_K:
		case Op::ALU_XOR_X:
		case Op::ALU_NEG:
		case Op::JMP_JZ:
		case Op::RET_K:
		case Op::RET_A:
		case Op::MISC_TAX:
		case Op::MISC_TXA: return static_cast<Op>(opcode);
	}
	return {};
}

Class category(uint16_t opcode) {
	switch (opcode & 0x07) {
		case bits::CLASS_LD:
		case bits::CLASS_LDX: return Class::LOAD;
		case bits::CLASS_ST:
		case bits::CLASS_STX: return Class::STORE;
		case bits::CLASS_ALU: return Class::ALU;
		case bits::CLASS_JMP: return Class::JUMP;
		case bits::CLASS_RET: return Class::RETURN;
		case bits::CLASS_MISC: return Class::MISC;
	}
	assert(false && "unreachable");
}

size_t load_width(Op op) {
	switch (op) {
		case Op::LD_W_ABS:
		case Op::LD_W_IND: return 4;
		case Op::LD_H_ABS:
		case Op::LD_H_IND: return 2;
		case Op::LD_B_ABS:
		case Op::LD_B_IND:
		case Op::LDX_MSH: return 1;
		default: return 0;
	}
}

bool uses_scratch(Op op) {
	switch (op) {
		case Op::LD_MEM:
		case Op::LDX_MEM:
		case Op::ST:
		case Op::STX: return true;
		default: return false;
	}
}

const char* class_repr(Class cls) {
	switch (cls) {
		case Class::LOAD: return "load";
		case Class::STORE: return "store";
		case Class::ALU: return "alu";
		case Class::JUMP: return "jump";
		case Class::RETURN: return "return";
		case Class::MISC: return "misc";
	}
	assert(false && "unreachable");
}

const char* opcode_repr(Op op) {
	switch (op) {
		case Op::LD_IMM: return "ld";
		case Op::LD_W_ABS: return "ld";
		case Op::LD_H_ABS: return "ldh";
		case Op::LD_B_ABS: return "ldb";
		case Op::LD_W_IND: return "ld";
		case Op::LD_H_IND: return "ldh";
		case Op::LD_B_IND: return "ldb";
		case Op::LD_MEM: return "ld";
		case Op::LD_LEN: return "ld";
		case Op::LDX_IMM: return "ldx";
		case Op::LDX_MEM: return "ldx";
		case Op::LDX_LEN: return "ldx";
		case Op::LDX_MSH: return "ldxb";
		case Op::ST: return "st";
		case Op::STX: return "stx";
		case Op::ALU_ADD_K:
		case Op::ALU_ADD_X: return "add";
		case Op::ALU_SUB_K:
		case Op::ALU_SUB_X: return "sub";
		case Op::ALU_MUL_K:
		case Op::ALU_MUL_X: return "mul";
		case Op::ALU_OR_K:
		case Op::ALU_OR_X: return "or";
		case Op::ALU_AND_K:
		case Op::ALU_AND_X: return "and";
		case Op::ALU_LSH_K:
		case Op::ALU_LSH_X: return "lsh";
		case Op::ALU_RSH_K:
		case Op::ALU_RSH_X: return "rsh";
		case Op::ALU_XOR_K:
		case Op::ALU_XOR_X: return "xor";
		case Op::ALU_NEG: return "neg";
		case Op::JMP_JZ: return "jz";
		case Op::RET_K:
		case Op::RET_A: return "ret";
		case Op::MISC_TAX: return "tax";
		case Op::MISC_TXA: return "txa";
	}
	assert(false && "unreachable");
}

// print the operand part of an instruction, whose shape depends on the
// addressing mode or source of the operation
static int print_operand(FILE* fd, Op op, const Instruction& inst) {
	switch (op) {
		case Op::LD_IMM:
		case Op::LDX_IMM: return fprintf(fd, " #0x%x", inst.k);
		case Op::LD_W_ABS:
		case Op::LD_H_ABS:
		case Op::LD_B_ABS: return fprintf(fd, " [%u]", inst.k);
		case Op::LD_W_IND:
		case Op::LD_H_IND:
		case Op::LD_B_IND: return fprintf(fd, " [x + %u]", inst.k);
		case Op::LD_MEM:
		case Op::LDX_MEM:
		case Op::ST:
		case Op::STX: return fprintf(fd, " M[%u]", inst.k);
		case Op::LD_LEN:
		case Op::LDX_LEN: return fprintf(fd, " #len");
		case Op::LDX_MSH: return fprintf(fd, " 4*([%u]&0xf)", inst.k);
		case Op::ALU_ADD_K:
		case Op::ALU_SUB_K:
		case Op::ALU_MUL_K:
		case Op::ALU_OR_K:
		case Op::ALU_AND_K:
		case Op::ALU_LSH_K:
		case Op::ALU_RSH_K:
		case Op::ALU_XOR_K:
		case Op::RET_K: return fprintf(fd, " #%u", inst.k);
		case Op::ALU_ADD_X:
		case Op::ALU_SUB_X:
		case Op::ALU_MUL_X:
		case Op::ALU_OR_X:
		case Op::ALU_AND_X:
		case Op::ALU_LSH_X:
		case Op::ALU_RSH_X:
		case Op::ALU_XOR_X: return fprintf(fd, " x");
		case Op::RET_A: return fprintf(fd, " a");
		case Op::JMP_JZ: return fprintf(fd, " +%u, +%u", inst.jt, inst.jf);
		case Op::ALU_NEG:
		case Op::MISC_TAX:
		case Op::MISC_TXA: return 0;
	}
	assert(false && "unreachable");
}

int print_inst(FILE* fd, const Instruction& inst) {
	int printed = 0;
	printed += fprintf(fd, "    ");
	auto op = decode(inst.opcode);
	if (!op.has_value()) {
		printed += fprintf(
			fd, ".word 0x%04x, %u, %u, 0x%x", inst.opcode, inst.jt, inst.jf, inst.k
		);
		return printed;
	}
	printed += fprintf(fd, "%s", opcode_repr(*op));
	printed += print_operand(fd, *op, inst);
	return printed;
}

} // namespace sieve
