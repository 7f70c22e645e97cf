#pragma once

#include <cuuid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace cuuid {

// 128-bit payload in standard UUID byte order (byte 0 most significant)
using Bytes = std::array<uint8_t, 16>;

namespace crockford {

// Symbol value is its index. I, L, O and U are excluded.
inline constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

inline constexpr size_t byte_length = 16;
inline constexpr size_t encoded_length = 26;

// Canonical form: the 16 bytes read as one big-endian integer, left-padded
// with two zero bits to 130 bits, then 26 five-bit groups from the most
// significant end. Uppercase, no hyphens. The first symbol is always 0-7.
std::string encode(const Bytes& bytes);

// Same as above for an unsized buffer. Fails with InvalidLength unless
// `len` is exactly 16.
Result<std::string> encode(const uint8_t* data, size_t len);

// Accepts either case, ignores '-', reads I/L as 1 and O as 0.
//   - any other non-alphabet character (U and the checksum symbols
//     included) -> InvalidCharacter
//   - symbol count != 26, or a first symbol above 7 -> InvalidLength
// Characters are validated before the count is checked.
Result<Bytes> decode(const std::string& s);

// Value of a single input character after case folding and ambiguity
// mapping; empty for anything decode() would reject. '-' is not a symbol.
std::optional<uint8_t> decode_symbol(char c);

bool is_valid(const std::string& s);

// decode() followed by encode()
Result<std::string> canonicalize(const std::string& s);

} // namespace crockford
} // namespace cuuid
