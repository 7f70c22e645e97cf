#include <cuuid/crockford.hpp>

namespace cuuid::crockford {

// 2 leading pad bits + 128 payload bits = 26 groups of 5
static constexpr int pad_bits = static_cast<int>(encoded_length * 5 - byte_length * 8);

// ---- Decode table ----

struct DecodeTable {
    int8_t value[256];
};

static constexpr DecodeTable make_decode_table() {
    DecodeTable t{};
    for (int i = 0; i < 256; ++i) {
        t.value[i] = -1;
    }
    for (int i = 0; i < 32; ++i) {
        char c = alphabet[i];
        t.value[static_cast<unsigned char>(c)] = static_cast<int8_t>(i);
        if (c >= 'A' && c <= 'Z') {
            t.value[static_cast<unsigned char>(c - 'A' + 'a')] = static_cast<int8_t>(i);
        }
    }
    t.value['O'] = 0;
    t.value['o'] = 0;
    t.value['I'] = 1;
    t.value['i'] = 1;
    t.value['L'] = 1;
    t.value['l'] = 1;
    return t;
}

static constexpr DecodeTable decode_table = make_decode_table();

static_assert(decode_table.value['U'] == -1 && decode_table.value['u'] == -1,
              "U is reserved for checksums");
static_assert(decode_table.value['Z'] == 31 && decode_table.value['z'] == 31);

std::optional<uint8_t> decode_symbol(char c) {
    int8_t v = decode_table.value[static_cast<unsigned char>(c)];
    if (v < 0) return std::nullopt;
    return static_cast<uint8_t>(v);
}

// ---- Bit helpers ----
// Bit offsets count from the most significant bit of byte 0. Offsets below
// zero address the pad bits, which read as zero and are never written.

static inline unsigned read_bit(const Bytes& b, int offset) {
    if (offset < 0) return 0;
    return (b[offset / 8] >> (7 - offset % 8)) & 1u;
}

static inline void write_bit(Bytes& b, int offset, unsigned bit) {
    if (offset < 0 || !bit) return;
    b[offset / 8] = static_cast<uint8_t>(b[offset / 8] | (0x80u >> (offset % 8)));
}

// ---- Encode ----

std::string encode(const Bytes& bytes) {
    std::string out(encoded_length, '0');
    for (size_t i = 0; i < encoded_length; ++i) {
        int first = static_cast<int>(i) * 5 - pad_bits;
        unsigned group = 0;
        for (int k = 0; k < 5; ++k) {
            group = (group << 1) | read_bit(bytes, first + k);
        }
        out[i] = alphabet[group];
    }
    return out;
}

Result<std::string> encode(const uint8_t* data, size_t len) {
    if (len != byte_length || data == nullptr) {
        return CuuidError::invalid_length(len,
            "expected 16 bytes, got " + std::to_string(len));
    }
    Bytes b;
    for (size_t i = 0; i < byte_length; ++i) {
        b[i] = data[i];
    }
    return Result<std::string>::ok(encode(b));
}

// ---- Decode ----

Result<Bytes> decode(const std::string& s) {
    std::array<uint8_t, encoded_length> symbols{};
    size_t count = 0;

    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '-') continue;
        auto v = decode_symbol(c);
        if (!v) {
            return CuuidError::invalid_character(c, i);
        }
        if (count < encoded_length) {
            symbols[count] = *v;
        }
        ++count;
    }

    if (count != encoded_length) {
        return CuuidError::invalid_length(count,
            "expected 26 Crockford symbols, got " + std::to_string(count));
    }

    // The pad bits of the first symbol must be clear
    if (symbols[0] >> (5 - pad_bits)) {
        auto e = CuuidError::invalid_length(count,
            "value overflows 128 bits: first symbol '" +
            std::string(1, alphabet[symbols[0]]) + "' is above '7'");
        e.hint = "a canonical identifier always starts with 0-7";
        return e;
    }

    Bytes out{};
    for (size_t i = 0; i < encoded_length; ++i) {
        int first = static_cast<int>(i) * 5 - pad_bits;
        for (int k = 0; k < 5; ++k) {
            write_bit(out, first + k, (symbols[i] >> (4 - k)) & 1u);
        }
    }
    return Result<Bytes>::ok(out);
}

bool is_valid(const std::string& s) {
    return decode(s).is_ok();
}

Result<std::string> canonicalize(const std::string& s) {
    auto bytes = decode(s);
    CUUID_TRY(bytes);
    return Result<std::string>::ok(encode(bytes.value()));
}

} // namespace cuuid::crockford
