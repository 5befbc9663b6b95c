#pragma once

#include <scribe/error.hpp>
#include <variant>

namespace scribe {

template<typename T>
class Result {
    std::variant<T, ScribeError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ScribeError so SCRIBE_TRY can forward errors across Result<T> types
    Result(ScribeError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ScribeError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ScribeError& error() & { return std::get<ScribeError>(data_); }
    const ScribeError& error() const& { return std::get<ScribeError>(data_); }
    ScribeError&& error() && { return std::get<ScribeError>(std::move(data_)); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SCRIBE_TRY(expr) \
    do { \
        auto _scribe_result = (expr); \
        if (_scribe_result.is_err()) return std::move(_scribe_result).error(); \
    } while(0)

} // namespace scribe
