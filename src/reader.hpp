#ifndef SIEVE_READER_HPP
#define SIEVE_READER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sieve {

// source of program or packet bytes
struct Reader {
	virtual ~Reader() {};

	virtual std::string get_path() const = 0;
	virtual bool at_eof() const = 0;

	virtual size_t read_at_most(char* buffer, size_t limit) = 0;
};

// drain `reader` until it reaches end of file
std::vector<uint8_t> read_all(Reader& reader);

} // namespace sieve

#endif
