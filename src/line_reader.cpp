#include "line_reader.hpp"

#ifdef WITH_READLINE
#	include <readline/history.h>
#	include <readline/readline.h>
#endif

#include <unistd.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <utility>

namespace sieve {

LineReader::LineReader(FILE* fd, std::string name)
: m_fd {fd}, m_name {std::move(name)}, m_tty {isatty(fileno(fd)) != 0} {}

std::string LineReader::get_path() const { return m_name; }

bool LineReader::at_eof() const {
	return m_cursor >= m_pending.size() && (m_eof || feof(m_fd));
}

std::optional<std::string> LineReader::read_line() {
	if (m_eof) return {};
#ifdef WITH_READLINE
	if (m_tty) {
		rl_instream = m_fd;
		char* line = readline("sieve> ");
		if (line == nullptr) {
			m_eof = true;
			return {};
		}
		if (*line != '\0') add_history(line);
		std::string out {line};
		free(line);
		return out;
	}
#endif
	if (m_tty) std::cerr << "sieve> " << std::flush;

	// fgets stops at the end of the chunk, keep going until the newline
	std::string out {};
	std::array<char, 4096> chunk {};
	while (fgets(chunk.data(), (int)chunk.size(), m_fd) != nullptr) {
		out += chunk.data();
		if (!out.empty() && out.back() == '\n') {
			out.pop_back();
			return out;
		}
	}
	m_eof = true;
	if (out.empty()) return {};
	return out;
}

size_t LineReader::read_at_most(char* buffer, size_t limit) {
	if (m_cursor >= m_pending.size()) {
		auto line = read_line();
		if (!line.has_value()) return 0;
		m_pending = std::move(*line);
		m_pending.push_back('\n');
		m_cursor = 0;
	}
	size_t read = std::min(limit, m_pending.size() - m_cursor);
	std::memcpy(buffer, m_pending.data() + m_cursor, read);
	m_cursor += read;
	return read;
}

} // namespace sieve
