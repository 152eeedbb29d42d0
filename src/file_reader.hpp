#ifndef SIEVE_FILE_READER_HPP
#define SIEVE_FILE_READER_HPP

#include <stdio.h>

#include <string>

#include "reader.hpp"

namespace sieve {

struct FileReader : Reader {
	FileReader(const char* path);

	~FileReader() override;
	FileReader& operator=(const FileReader& other) = delete;
	FileReader& operator=(FileReader&& other) = delete;
	FileReader(const FileReader& other) = delete;
	FileReader(FileReader&& other);

	std::string get_path() const override;
	bool at_eof() const override;

	size_t read_at_most(char* buffer, size_t limit) override;

 private:
	FILE* m_fd;
	std::string name {};
};

} // namespace sieve

#endif
