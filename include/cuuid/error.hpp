#pragma once

#include <cstddef>
#include <string>

namespace cuuid {

struct CuuidError {
    enum Code {
        InvalidCharacter,
        InvalidLength,
        Validation,
        IO,
        Parse,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    // Decode detail: offending character and its offset in the raw input
    // (InvalidCharacter), or the symbol/byte count found (InvalidLength).
    char character = '\0';
    size_t position = 0;
    size_t length = 0;

    CuuidError() = default;
    CuuidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    CuuidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    CuuidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    static CuuidError invalid_character(char c, size_t pos);
    static CuuidError invalid_length(size_t count, std::string msg);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace cuuid
