#pragma once

#include <cuuid/crockford.hpp>
#include <cuuid/random.hpp>
#include <cuuid/result.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cuuid {

// Immutable 128-bit identifier rendered as Crockford Base32.
// Ordering is byte-wise, so version 7 values sort by creation time.
class Uuid {
public:
    // The nil UUID (all zero)
    Uuid() : bytes_{} {}

    // ---- Construction ----

    static Result<Uuid> from_string(const std::string& s);
    static Result<Uuid> from_bytes(const uint8_t* data, size_t len);
    static Result<Uuid> from_bytes(const std::vector<uint8_t>& data);
    static Result<Uuid> from_bytes(std::string_view data);
    static Uuid from_generic_uuid(const Bytes& bytes);

    // Standard hex form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx (either case)
    static Result<Uuid> from_uuid_string(const std::string& s);

    // ---- Generation ----

    // Version 4: 122 random bits
    static Uuid generate_random();
    static Uuid generate_random(RandomSource& rng);

    // Version 7: 48-bit big-endian Unix milliseconds, then 74 random bits.
    // Values created within the same millisecond are not ordered.
    static Uuid generate_ordered();
    static Uuid generate_ordered(RandomSource& rng);
    static Uuid generate_ordered(RandomSource& rng, uint64_t unix_ms);

    // ---- Rendering ----

    // Canonical 26-character Crockford string
    std::string to_string() const;

    // Display only: canonical string with '-' every `group` symbols.
    // group == 0 yields the canonical string.
    std::string format_grouped(size_t group) const;

    std::string to_uuid_string() const;
    std::string repr() const;

    // ---- Accessors ----

    const Bytes& bytes() const { return bytes_; }
    Bytes to_generic_uuid_bytes() const { return bytes_; }

    int version() const { return bytes_[6] >> 4; }
    // Top two bits of byte 8; 0b10 for RFC 9562 UUIDs
    int variant_bits() const { return bytes_[8] >> 6; }
    bool is_nil() const;

    // Embedded timestamp of a version 7 value
    std::optional<uint64_t> timestamp_ms() const;

    size_t hash() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
    bool operator<(const Uuid& other) const;
    bool operator<=(const Uuid& other) const;
    bool operator>(const Uuid& other) const;
    bool operator>=(const Uuid& other) const;

private:
    explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    Bytes bytes_;
};

} // namespace cuuid

namespace std {
template<>
struct hash<cuuid::Uuid> {
    size_t operator()(const cuuid::Uuid& u) const { return u.hash(); }
};
} // namespace std
