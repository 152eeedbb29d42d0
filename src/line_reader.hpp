#ifndef SIEVE_LINE_READER_HPP
#define SIEVE_LINE_READER_HPP

#include <stdio.h>

#include <optional>
#include <string>

#include "reader.hpp"

namespace sieve {

// reads a stream one whole line at a time, prompting when it is a terminal
struct LineReader : Reader {
	LineReader(FILE* fd = stdin, std::string name = "<stdin>");

	std::string get_path() const override;
	bool at_eof() const override;

	size_t read_at_most(char* buffer, size_t limit) override;

	// Returns the next line without its newline, however long it is, or
	// nothing at end of file. Bytes already handed out line by line through
	// read_at_most are not seen again.
	std::optional<std::string> read_line();

 private:
	FILE* m_fd;
	std::string m_name;
	bool m_tty;
	bool m_eof {false};
	std::string m_pending {};
	size_t m_cursor {0};
};

} // namespace sieve

#endif
