#pragma once

#include <cnbkit/error.hpp>
#include <variant>
#include <functional>

namespace cnbkit {

template<typename T>
class Result {
    std::variant<T, CnbError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from CnbError so CNBKIT_TRY can return errors across Result<T> types
    Result(CnbError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(CnbError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<CnbError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    CnbError& error() & { return std::get<CnbError>(data_); }
    const CnbError& error() const& { return std::get<CnbError>(data_); }
    CnbError&& error() && { return std::get<CnbError>(std::move(data_)); }

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

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }

    // Rewrite the error (e.g. to prepend context); Ok passes through untouched
    template<typename F>
    Result map_err(F&& f) && {
        if (is_ok()) {
            return std::move(*this);
        }
        return Result(f(std::move(*this).error()));
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define CNBKIT_TRY(expr) \
    do { \
        auto _cnbkit_result = (expr); \
        if (_cnbkit_result.is_err()) return std::move(_cnbkit_result).error(); \
    } while(0)

} // namespace cnbkit
