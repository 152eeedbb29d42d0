#include "file_reader.hpp"

#include <stdexcept>
#include <utility>

namespace sieve {

FileReader::FileReader(const char* path)
: m_fd {fopen(path, "rb")}, name {path} {
	if (m_fd == nullptr)
		throw std::domain_error("Could not open file " + std::string(path));
}

FileReader::~FileReader() {
	if (m_fd != nullptr) fclose(m_fd);
}

FileReader::FileReader(FileReader&& other)
: m_fd {other.m_fd}, name {std::move(other.name)} {
	other.m_fd = nullptr;
}

std::string FileReader::get_path() const { return name; }
bool FileReader::at_eof() const { return feof(m_fd) || ferror(m_fd); }

size_t FileReader::read_at_most(char* buffer, size_t limit) {
	return fread(buffer, sizeof(char), limit, m_fd);
}

} // namespace sieve
