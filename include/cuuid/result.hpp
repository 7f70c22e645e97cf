#pragma once

#include <cuuid/error.hpp>
#include <variant>
#include <functional>

namespace cuuid {

template<typename T>
class Result {
    std::variant<T, CuuidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from CuuidError so CUUID_TRY can return errors across Result<T> types
    Result(CuuidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(CuuidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<CuuidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    CuuidError& error() & { return std::get<CuuidError>(data_); }
    const CuuidError& error() const& { return std::get<CuuidError>(data_); }
    CuuidError&& error() && { return std::get<CuuidError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Value on success, `fallback` otherwise
    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }

    // Rewrite the error (if any), leaving an Ok value untouched
    template<typename F>
    Result map_err(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return Result::err(f(error()));
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define CUUID_TRY(expr) \
    do { \
        auto _cuuid_result = (expr); \
        if (_cuuid_result.is_err()) return std::move(_cuuid_result).error(); \
    } while(0)

} // namespace cuuid
