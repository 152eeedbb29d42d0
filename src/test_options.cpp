#include <gtest/gtest.h>

#include <getopt.h>

#include <string>
#include <utility>
#include <vector>

#include "options.hpp"

using sieve::Format;
using sieve::Mode;
using sieve::Options;

namespace {

// getopt keeps global state, so every call starts a fresh scan
Options parse(std::vector<std::string> args) {
	std::vector<char*> argv {};
	static std::vector<std::string> storage {};
	storage = std::move(args);
	for (auto& arg : storage) argv.push_back(arg.data());
	argv.push_back(nullptr);
	optind = 0;
	opterr = 0;
	return sieve::parse_args((int)storage.size(), argv.data());
}

} // namespace

TEST(OptionsTest, run_mode_with_packets) {
	auto opts = parse({"sieve", "-r", "-t", "filter.txt", "a.bin", "b.bin"});
	ASSERT_FALSE(opts.is_invalid);
	EXPECT_EQ(opts.mode, Mode::RUN);
	EXPECT_EQ(opts.format, Format::TEXT);
	EXPECT_TRUE(opts.verify);
	EXPECT_STREQ(opts.program_path, "filter.txt");
	ASSERT_EQ(opts.packet_count, 2);
	EXPECT_STREQ(opts.packet_paths[0], "a.bin");
	EXPECT_STREQ(opts.packet_paths[1], "b.bin");
}

TEST(OptionsTest, step_budget_and_flags) {
	auto opts = parse({"sieve", "-r", "-u", "-VV", "-s", "100", "filter.bin"});
	ASSERT_FALSE(opts.is_invalid);
	EXPECT_EQ(opts.max_steps, 100);
	EXPECT_FALSE(opts.verify);
	EXPECT_EQ(opts.verbosity, 2);
	EXPECT_EQ(opts.format, Format::BINARY);
	EXPECT_EQ(opts.packet_count, 0);
}

TEST(OptionsTest, one_mode_required) {
	EXPECT_TRUE(parse({"sieve", "filter.bin"}).is_invalid);
	EXPECT_TRUE(parse({"sieve", "-r", "-d", "filter.bin"}).is_invalid);
	EXPECT_FALSE(parse({"sieve", "-c", "filter.bin"}).is_invalid);
}

TEST(OptionsTest, program_path_required) {
	EXPECT_TRUE(parse({"sieve", "-d"}).is_invalid);
	EXPECT_TRUE(parse({"sieve", "-r", "-"}).is_invalid);
}

TEST(OptionsTest, packets_only_when_running) {
	EXPECT_TRUE(parse({"sieve", "-d", "filter.bin", "a.bin"}).is_invalid);
	EXPECT_TRUE(parse({"sieve", "-c", "filter.bin", "-"}).is_invalid);
}

TEST(OptionsTest, invalid_step_budget) {
	EXPECT_TRUE(parse({"sieve", "-r", "-s", "0", "filter.bin"}).is_invalid);
	EXPECT_TRUE(parse({"sieve", "-r", "-s", "-5", "filter.bin"}).is_invalid);
	EXPECT_TRUE(parse({"sieve", "-r", "-s", "12x", "filter.bin"}).is_invalid);
	EXPECT_TRUE(parse({"sieve", "-r", "-x", "filter.bin"}).is_invalid);
}
