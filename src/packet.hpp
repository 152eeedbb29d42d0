#ifndef SIEVE_PACKET_HPP
#define SIEVE_PACKET_HPP

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace sieve {

// Parses one packet written as hex digits, as printed by `xxd -p` or copied
// out of a packet dump. Whitespace and ':' between bytes are ignored and the
// line may start with "0x". Returns nothing on any other character or on an
// odd number of digits.
std::optional<std::vector<uint8_t>> parse_hex(std::string_view line);

} // namespace sieve

#endif
