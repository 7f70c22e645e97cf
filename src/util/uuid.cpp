#include <cuuid/uuid.hpp>
#include <cstring>

namespace cuuid {

// ---- Construction ----

Result<Uuid> Uuid::from_string(const std::string& s) {
    auto decoded = crockford::decode(s);
    CUUID_TRY(decoded);
    return Result<Uuid>::ok(Uuid(decoded.value()));
}

Result<Uuid> Uuid::from_bytes(const uint8_t* data, size_t len) {
    if (len != crockford::byte_length || data == nullptr) {
        return CuuidError::invalid_length(len,
            "expected 16 bytes, got " + std::to_string(len));
    }
    Bytes b;
    std::memcpy(b.data(), data, b.size());
    return Result<Uuid>::ok(Uuid(b));
}

Result<Uuid> Uuid::from_bytes(const std::vector<uint8_t>& data) {
    return from_bytes(data.data(), data.size());
}

Result<Uuid> Uuid::from_bytes(std::string_view data) {
    return from_bytes(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Uuid Uuid::from_generic_uuid(const Bytes& bytes) {
    return Uuid(bytes);
}

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_dash_position(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

Result<Uuid> Uuid::from_uuid_string(const std::string& s) {
    if (s.size() != 36) {
        auto e = CuuidError::invalid_length(s.size(),
            "UUID string must be 36 characters, got " + std::to_string(s.size()));
        e.hint = "expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx";
        return e;
    }

    Bytes b{};
    size_t byte_idx = 0;
    for (size_t i = 0; i < s.size(); ) {
        if (is_dash_position(i)) {
            if (s[i] != '-') {
                return CuuidError::invalid_character(s[i], i);
            }
            ++i;
            continue;
        }
        int hi = hex_val(s[i]);
        if (hi < 0) return CuuidError::invalid_character(s[i], i);
        int lo = hex_val(s[i + 1]);
        if (lo < 0) return CuuidError::invalid_character(s[i + 1], i + 1);
        b[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(Uuid(b));
}

// ---- Generation ----

static inline void set_version(Bytes& b, uint8_t version) {
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | (version << 4));
    // RFC 9562 variant: top two bits of byte 8 = 10
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);
}

Uuid Uuid::generate_random() {
    return generate_random(system_random());
}

Uuid Uuid::generate_random(RandomSource& rng) {
    Bytes b;
    rng.fill(b.data(), b.size());
    set_version(b, 4);
    return Uuid(b);
}

Uuid Uuid::generate_ordered() {
    return generate_ordered(system_random(), unix_time_ms());
}

Uuid Uuid::generate_ordered(RandomSource& rng) {
    return generate_ordered(rng, unix_time_ms());
}

Uuid Uuid::generate_ordered(RandomSource& rng, uint64_t unix_ms) {
    Bytes b;
    rng.fill(b.data() + 6, b.size() - 6);
    // 48-bit big-endian timestamp; higher bits are dropped
    for (int i = 0; i < 6; ++i) {
        b[i] = static_cast<uint8_t>(unix_ms >> (8 * (5 - i)));
    }
    set_version(b, 7);
    return Uuid(b);
}

// ---- Rendering ----

std::string Uuid::to_string() const {
    return crockford::encode(bytes_);
}

std::string Uuid::format_grouped(size_t group) const {
    std::string canonical = to_string();
    if (group == 0 || group >= canonical.size()) return canonical;

    std::string out;
    out.reserve(canonical.size() + canonical.size() / group);
    for (size_t i = 0; i < canonical.size(); ++i) {
        if (i > 0 && i % group == 0) out += '-';
        out += canonical[i];
    }
    return out;
}

std::string Uuid::to_uuid_string() const {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        out += hex_chars[bytes_[i] >> 4];
        out += hex_chars[bytes_[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

std::string Uuid::repr() const {
    return "CrockfordUUID('" + to_string() + "')";
}

// ---- Accessors ----

bool Uuid::is_nil() const {
    for (uint8_t b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

std::optional<uint64_t> Uuid::timestamp_ms() const {
    if (version() != 7) return std::nullopt;
    uint64_t ms = 0;
    for (int i = 0; i < 6; ++i) {
        ms = (ms << 8) | bytes_[i];
    }
    return ms;
}

// FNV-1a, 64-bit
size_t Uuid::hash() const {
    uint64_t h = 0xcbf29ce484222325ull;
    for (uint8_t b : bytes_) {
        h ^= b;
        h *= 0x100000001b3ull;
    }
    return static_cast<size_t>(h);
}

// ---- Comparison ----

bool Uuid::operator==(const Uuid& other) const {
    return bytes_ == other.bytes_;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes_ != other.bytes_;
}

// std::array compares lexicographically, i.e. as unsigned big-endian integers
bool Uuid::operator<(const Uuid& other) const {
    return bytes_ < other.bytes_;
}

bool Uuid::operator<=(const Uuid& other) const {
    return !(other < *this);
}

bool Uuid::operator>(const Uuid& other) const {
    return other < *this;
}

bool Uuid::operator>=(const Uuid& other) const {
    return !(*this < other);
}

} // namespace cuuid
