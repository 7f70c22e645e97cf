#include <cuuid/error.hpp>

namespace cuuid {

const char* CuuidError::code_name(Code c) {
    switch (c) {
        case InvalidCharacter: return "InvalidCharacter";
        case InvalidLength:    return "InvalidLength";
        case Validation:       return "Validation";
        case IO:               return "IO";
        case Parse:            return "Parse";
        case Config:           return "Config";
        case InvalidArg:       return "InvalidArg";
    }
    return "Unknown";
}

static std::string printable(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u >= 0x20 && u < 0x7F) return std::string(1, c);
    static const char hex[] = "0123456789abcdef";
    std::string out = "\\x";
    out += hex[u >> 4];
    out += hex[u & 0x0F];
    return out;
}

CuuidError CuuidError::invalid_character(char c, size_t pos) {
    CuuidError e{InvalidCharacter,
        "invalid Crockford character '" + printable(c) +
        "' at position " + std::to_string(pos),
        "allowed: 0-9 A-H J K M N P-T V-Z (case-insensitive), '-' is ignored"};
    e.character = c;
    e.position = pos;
    return e;
}

CuuidError CuuidError::invalid_length(size_t count, std::string msg) {
    CuuidError e{InvalidLength, std::move(msg)};
    e.length = count;
    return e;
}

std::string CuuidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace cuuid
