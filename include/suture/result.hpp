#pragma once

#include <suture/error.hpp>
#include <variant>

namespace suture {

template<typename T>
class Result {
    std::variant<T, SutureError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SutureError so SUTURE_TRY can forward errors between Result types
    Result(SutureError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SutureError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SutureError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SutureError& error() & { return std::get<SutureError>(data_); }
    const SutureError& error() const& { return std::get<SutureError>(data_); }
    SutureError&& error() && { return std::get<SutureError>(std::move(data_)); }

    // True when the result is an error carrying the given code
    bool is_err(SutureError::Code code) const {
        return is_err() && error().code == code;
    }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SUTURE_TRY(expr) \
    do { \
        auto _suture_result = (expr); \
        if (_suture_result.is_err()) return std::move(_suture_result).error(); \
    } while(0)

} // namespace suture
