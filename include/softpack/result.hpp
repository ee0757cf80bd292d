#pragma once

#include <softpack/error.hpp>
#include <variant>
#include <functional>

namespace softpack {

template<typename T>
class Result {
    std::variant<T, SoftpackError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SoftpackError so SOFTPACK_TRY can return errors across Result<T> types
    Result(SoftpackError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SoftpackError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SoftpackError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SoftpackError& error() & { return std::get<SoftpackError>(data_); }
    const SoftpackError& error() const& { return std::get<SoftpackError>(data_); }
    SoftpackError&& error() && { return std::get<SoftpackError>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    // True when this is an error carrying the given code
    bool is_err(SoftpackError::Code c) const {
        return is_err() && error().code == c;
    }

    explicit operator bool() const { return is_ok(); }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SOFTPACK_TRY(expr) \
    do { \
        auto _softpack_result = (expr); \
        if (_softpack_result.is_err()) return std::move(_softpack_result).error(); \
    } while(0)

} // namespace softpack
