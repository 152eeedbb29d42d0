#include "packet.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "reader.hpp"

namespace sieve {

std::vector<uint8_t> read_all(Reader& reader) {
	std::vector<uint8_t> bytes {};
	std::array<char, 4096> buffer {};
	while (!reader.at_eof()) {
		size_t read = reader.read_at_most(buffer.data(), buffer.size());
		if (read == 0) break;
		bytes.insert(bytes.end(), buffer.begin(), buffer.begin() + read);
	}
	return bytes;
}

static int hex_digit(char c) {
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}

std::optional<std::vector<uint8_t>> parse_hex(std::string_view line) {
	auto first = line.find_first_not_of(" \t");
	if (first != std::string_view::npos) line.remove_prefix(first);
	if (line.starts_with("0x") || line.starts_with("0X")) line.remove_prefix(2);

	std::vector<uint8_t> bytes {};
	int high = -1;
	for (char c : line) {
		if (c == ' ' || c == '\t' || c == ':' || c == '\r' || c == '\n') {
			if (high != -1) return {};
			continue;
		}
		int digit = hex_digit(c);
		if (digit == -1) return {};
		if (high == -1) {
			high = digit;
		} else {
			bytes.push_back(static_cast<uint8_t>((high << 4) | digit));
			high = -1;
		}
	}
	if (high != -1) return {};
	return bytes;
}

} // namespace sieve
