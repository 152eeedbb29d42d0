#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "instruction.hpp"
#include "program.hpp"

using sieve::Instruction;
using sieve::LoadError;
using sieve::LoadErrorKind;
using sieve::Op;
using sieve::Program;

namespace {

Program ipv4_filter() {
	Program program {};
	program.emit(Op::LD_H_ABS, 12)
		.emit(Op::ALU_SUB_K, 0x0800)
		.emit(Op::JMP_JZ, 0, 1, 2)
		.emit(Op::RET_K, 0xFFFF)
		.emit(Op::RET_K, 0);
	return program;
}

LoadErrorKind verify_error(const Program& program) {
	auto verified = sieve::verify(program);
	EXPECT_FALSE(verified.has_value());
	return verified.error().kind;
}

std::string disassemble(const Program& program) {
	FILE* fd = tmpfile();
	sieve::print_program(fd, program);
	fflush(fd);
	rewind(fd);
	std::string out {};
	for (int c = 0; (c = fgetc(fd)) != EOF;) out.push_back((char)c);
	fclose(fd);
	return out;
}

} // namespace

TEST(ProgramTest, emit_appends_in_order) {
	auto program = ipv4_filter();
	ASSERT_EQ(program.size(), 5);
	EXPECT_EQ(program[0], (Instruction {0x28, 0, 0, 12}));
	EXPECT_EQ(program[2], (Instruction {0x05, 1, 2, 0}));
	EXPECT_EQ(program[3], (Instruction {0x06, 0, 0, 0xFFFF}));
}

TEST(ProgramTest, parse_binary_records) {
	std::vector<uint8_t> bytes {
		0x28, 0x00, 0x00, 0x00, 0x0c, 0x00, 0x00, 0x00, // ldh [12]
		0x05, 0x00, 0x01, 0x02, 0x00, 0x00, 0x00, 0x00, // jz +1, +2
		0x06, 0x00, 0x00, 0x00, 0xff, 0xff, 0x00, 0x00, // ret #65535
	};
	auto program = sieve::parse_binary(bytes);
	ASSERT_TRUE(program.has_value());
	ASSERT_EQ(program->size(), 3);
	EXPECT_EQ((*program)[0], (Instruction {Op::LD_H_ABS, 12}));
	EXPECT_EQ((*program)[1], (Instruction {Op::JMP_JZ, 0, 1, 2}));
	EXPECT_EQ((*program)[2], (Instruction {Op::RET_K, 0xFFFF}));
}

TEST(ProgramTest, write_binary_is_read_back) {
	auto program = ipv4_filter();
	std::vector<uint8_t> bytes {};
	sieve::write_binary(bytes, program);
	EXPECT_EQ(bytes.size(), program.size() * sieve::INSTRUCTION_SIZE);

	auto parsed = sieve::parse_binary(bytes);
	ASSERT_TRUE(parsed.has_value());
	EXPECT_EQ(parsed->m_vec, program.m_vec);
}

TEST(ProgramTest, parse_binary_truncated) {
	std::vector<uint8_t> bytes(9, 0);
	auto program = sieve::parse_binary(bytes);
	ASSERT_FALSE(program.has_value());
	EXPECT_EQ(program.error(), (LoadError {LoadErrorKind::TRUNCATED, 1}));
}

TEST(ProgramTest, parse_binary_empty) {
	auto program = sieve::parse_binary({});
	ASSERT_TRUE(program.has_value());
	EXPECT_TRUE(program->empty());
}

TEST(ProgramTest, parse_text_listing) {
	std::string text =
		"5\n"
		"40 0 0 12\n"
		"20 0 0 2048\n"
		"5 1 2 0\n"
		"6 0 0 65535\n"
		"6 0 0 0\n";
	auto program = sieve::parse_text(text);
	ASSERT_TRUE(program.has_value());
	EXPECT_EQ(program->m_vec, ipv4_filter().m_vec);
}

TEST(ProgramTest, parse_text_skips_comments_and_blanks) {
	std::string text =
		"# accept everything\n"
		"\n"
		"1\r\n"
		"   # return a constant\n"
		"  6\t0 0   96  \n";
	auto program = sieve::parse_text(text);
	ASSERT_TRUE(program.has_value());
	ASSERT_EQ(program->size(), 1);
	EXPECT_EQ((*program)[0], (Instruction {Op::RET_K, 96}));
}

TEST(ProgramTest, parse_text_count_mismatch) {
	auto program = sieve::parse_text("2\n6 0 0 0\n");
	ASSERT_FALSE(program.has_value());
	EXPECT_EQ(program.error(), (LoadError {LoadErrorKind::COUNT_MISMATCH, 0}));

	// the error points at the header line, after any leading comments
	program = sieve::parse_text("# ipv4\n\n1\n6 0 0 0\n6 0 0 1\n");
	ASSERT_FALSE(program.has_value());
	EXPECT_EQ(program.error(), (LoadError {LoadErrorKind::COUNT_MISMATCH, 2}));
}

TEST(ProgramTest, parse_text_malformed) {
	auto program = sieve::parse_text("1\n40 0 zero 12\n");
	ASSERT_FALSE(program.has_value());
	EXPECT_EQ(program.error(), (LoadError {LoadErrorKind::MALFORMED, 1}));

	program = sieve::parse_text("1\n40 0 0\n");
	ASSERT_FALSE(program.has_value());
	EXPECT_EQ(program.error().kind, LoadErrorKind::MALFORMED);

	program = sieve::parse_text("1\n6 0 0 -1\n");
	ASSERT_FALSE(program.has_value());
	EXPECT_EQ(program.error().kind, LoadErrorKind::MALFORMED);

	program = sieve::parse_text("1 2\n6 0 0 0\n");
	ASSERT_FALSE(program.has_value());
	EXPECT_EQ(program.error(), (LoadError {LoadErrorKind::MALFORMED, 0}));
}

TEST(ProgramTest, parse_text_out_of_range_fields) {
	auto program = sieve::parse_text("1\n65536 0 0 0\n");
	ASSERT_FALSE(program.has_value());
	EXPECT_EQ(program.error().kind, LoadErrorKind::MALFORMED);

	program = sieve::parse_text("1\n5 256 1 0\n");
	ASSERT_FALSE(program.has_value());
	EXPECT_EQ(program.error().kind, LoadErrorKind::MALFORMED);

	program = sieve::parse_text("1\n6 0 0 4294967296\n");
	ASSERT_FALSE(program.has_value());
	EXPECT_EQ(program.error().kind, LoadErrorKind::MALFORMED);

	program = sieve::parse_text("1\n6 0 0 4294967295\n");
	ASSERT_TRUE(program.has_value());
	EXPECT_EQ((*program)[0].k, UINT32_MAX);
}

TEST(ProgramTest, parse_text_empty) {
	auto program = sieve::parse_text("# nothing here\n");
	ASSERT_FALSE(program.has_value());
	EXPECT_EQ(program.error().kind, LoadErrorKind::EMPTY);
}

TEST(VerifierTest, accepts_well_formed_program) {
	EXPECT_TRUE(sieve::verify(ipv4_filter()).has_value());

	Program program {};
	program.emit(Op::LD_IMM, 1)
		.emit(Op::ST, 15)
		.emit(Op::LDX_MEM, 15)
		.emit(Op::ALU_LSH_K, 31)
		.emit(Op::RET_A);
	EXPECT_TRUE(sieve::verify(program).has_value());
}

TEST(VerifierTest, rejects_empty_program) {
	EXPECT_EQ(verify_error(Program {}), LoadErrorKind::EMPTY);
}

TEST(VerifierTest, rejects_long_program) {
	Program program {};
	for (size_t i = 0; i <= sieve::MAX_PROGRAM_LEN; i++) program.emit(Op::RET_K);
	EXPECT_EQ(verify_error(program), LoadErrorKind::TOO_LONG);

	program.m_vec.pop_back();
	EXPECT_TRUE(sieve::verify(program).has_value());
}

TEST(VerifierTest, rejects_unknown_opcode) {
	Program program {};
	program.emit(Op::LD_IMM).emit(Instruction {0x3d, 0, 0, 0}).emit(Op::RET_A);
	auto verified = sieve::verify(program);
	ASSERT_FALSE(verified.has_value());
	EXPECT_EQ(verified.error(), (LoadError {LoadErrorKind::UNKNOWN_OPCODE, 1}));
}

TEST(VerifierTest, rejects_jump_out_of_range) {
	Program program {};
	program.emit(Op::JMP_JZ, 0, 1, 2).emit(Op::RET_K, 1);
	auto verified = sieve::verify(program);
	ASSERT_FALSE(verified.has_value());
	EXPECT_EQ(
		verified.error(), (LoadError {LoadErrorKind::JUMP_OUT_OF_RANGE, 0})
	);
}

TEST(VerifierTest, rejects_jump_loop) {
	Program program {};
	program.emit(Op::LD_IMM).emit(Op::JMP_JZ, 0, 1, 0).emit(Op::RET_K, 1);
	auto verified = sieve::verify(program);
	ASSERT_FALSE(verified.has_value());
	EXPECT_EQ(verified.error(), (LoadError {LoadErrorKind::JUMP_LOOP, 1}));
}

TEST(VerifierTest, rejects_bad_scratch_slot) {
	Program program {};
	program.emit(Op::STX, 16).emit(Op::RET_K);
	EXPECT_EQ(verify_error(program), LoadErrorKind::BAD_SCRATCH_SLOT);

	program = Program {};
	program.emit(Op::LD_MEM, 100).emit(Op::RET_A);
	EXPECT_EQ(verify_error(program), LoadErrorKind::BAD_SCRATCH_SLOT);
}

TEST(VerifierTest, rejects_bad_shift) {
	Program program {};
	program.emit(Op::ALU_RSH_K, 32).emit(Op::RET_A);
	EXPECT_EQ(verify_error(program), LoadErrorKind::BAD_SHIFT);
}

TEST(VerifierTest, rejects_missing_return) {
	Program program {};
	program.emit(Op::RET_K).emit(Op::LD_IMM, 1);
	auto verified = sieve::verify(program);
	ASSERT_FALSE(verified.has_value());
	EXPECT_EQ(verified.error(), (LoadError {LoadErrorKind::NO_RETURN, 1}));
}

TEST(ProgramTest, disassembly) {
	std::string expected =
		"0000:    ldh [12]\n"
		"0001:    sub #2048\n"
		"0002:    jz +1, +2             ; 0003, 0004\n"
		"0003:    ret #65535\n"
		"0004:    ret #0\n";
	EXPECT_EQ(disassemble(ipv4_filter()), expected);
}
