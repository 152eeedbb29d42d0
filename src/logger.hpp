#ifndef SIEVE_LOGGER_HPP
#define SIEVE_LOGGER_HPP

#include <cstdio>
#include <optional>
#include <string>

#include "instruction.hpp"
#include "program.hpp"

#define ANSI_STYLE_BOLD "\x1b[1m"
#define ANSI_COLOR_RED "\x1b[31m"
#define ANSI_COLOR_YELLOW "\x1b[33m"
#define ANSI_COLOR_RESET "\x1b[0m"

namespace sieve {

enum LogLevel {
	WARN,
	ERROR,
	INFO,
};

struct Logger {
	Logger(std::string domain, std::string path, const Program* program = nullptr)
	: domain {domain}, path {path}, program {program} {}

 private:
	int print_line(size_t index, bool current) {
		if (current)
			fprintf(stderr, " %4zu |\t" ANSI_STYLE_BOLD, index);
		else
			fprintf(stderr, "      |\t");
		int printed = print_inst(stderr, (*program)[index]);
		if (current) fprintf(stderr, ANSI_COLOR_RESET);
		fprintf(stderr, "\n");
		return printed;
	}

	// show the instruction at `index` between its neighbours
	void print_window(size_t index) {
		if (index > 0) print_line(index - 1, false);

		int printed = print_line(index, true);
		fprintf(stderr, "      |\t    ^");
		for (int i = 5; i < printed; i++) fputc('~', stderr);
		fprintf(stderr, "\n");

		if (index + 1 < program->size()) print_line(index + 1, false);
	}

	void print_header(LogLevel level, std::optional<size_t> index) {
		const char* color = (level == ERROR) ? ANSI_COLOR_RED : ANSI_COLOR_YELLOW;
		const char* name = (level == ERROR) ? "ERROR"
		                 : (level == WARN)  ? "WARN"
		                                    : "INFO";
		if (index.has_value())
			fprintf(stderr, ANSI_STYLE_BOLD "%s:%zu: ", path.c_str(), *index);
		else
			fprintf(stderr, ANSI_STYLE_BOLD "%s: ", path.c_str());
		fprintf(
			stderr, "%s%s %s" ANSI_COLOR_RESET ": ", color, domain.c_str(), name
		);
	}

	void print_footer(LogLevel level, std::optional<size_t> index) {
		fprintf(stderr, "\n");
		if (level != INFO && index.has_value() && program != nullptr
		    && *index < program->size())
			print_window(*index);
	}

 public:
	template<typename... Args>
	void log(
		LogLevel level, std::optional<size_t> index, std::string format,
		Args... args
	) {
		print_header(level, index);
		fprintf(stderr, format.c_str(), args...);
		print_footer(level, index);
	}

	void log(LogLevel level, std::optional<size_t> index, std::string format) {
		print_header(level, index);
		fprintf(stderr, "%s", format.c_str());
		print_footer(level, index);
	}

	template<typename... Args>
	void err(std::optional<size_t> index, std::string format, Args... args) {
		log(ERROR, index, format, args...);
	}

 private:
	std::string domain;
	std::string path;
	const Program* program;
};

} // namespace sieve

#endif
