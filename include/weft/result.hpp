#pragma once

#include <weft/error.hpp>
#include <variant>

namespace weft {

template<typename T>
class Result {
    std::variant<T, WeftError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from WeftError so WEFT_TRY can return errors across Result<T> types
    Result(WeftError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(WeftError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<WeftError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    WeftError& error() & { return std::get<WeftError>(data_); }
    const WeftError& error() const& { return std::get<WeftError>(data_); }
    WeftError&& error() && { return std::get<WeftError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define WEFT_TRY(expr) \
    do { \
        auto _weft_result = (expr); \
        if (_weft_result.is_err()) return std::move(_weft_result).error(); \
    } while(0)

} // namespace weft
