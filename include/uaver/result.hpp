#pragma once

#include <uaver/error.hpp>
#include <variant>
#include <utility>

namespace uaver {

template<typename T>
class Result {
    std::variant<T, UaverError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from UaverError so UAVER_TRY can return errors across Result<T> types
    Result(UaverError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(UaverError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<UaverError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    UaverError& error() & { return std::get<UaverError>(data_); }
    const UaverError& error() const& { return std::get<UaverError>(data_); }
    UaverError&& error() && { return std::get<UaverError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define UAVER_TRY(expr) \
    do { \
        auto _uaver_result = (expr); \
        if (_uaver_result.is_err()) return std::move(_uaver_result).error(); \
    } while(0)

} // namespace uaver
