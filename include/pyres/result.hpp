#pragma once

#include <pyres/error.hpp>
#include <variant>
#include <functional>

namespace pyres {

template<typename T>
class Result {
    std::variant<T, PyresError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PyresError, so a function can `return PyresError{...}` and
    // PYRES_TRY can forward an error into any Result<U>
    Result(PyresError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PyresError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PyresError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PyresError& error() & { return std::get<PyresError>(data_); }
    const PyresError& error() const& { return std::get<PyresError>(data_); }
    PyresError&& error() && { return std::get<PyresError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
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

    // Rewrites the error, leaving a value untouched. Used to turn a low-level
    // failure into the code the caller reports.
    template<typename F>
    Result map_err(F&& f) && {
        if (is_ok()) return std::move(*this);
        return Result(f(std::move(std::get<PyresError>(data_))));
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PYRES_TRY(expr) \
    do { \
        auto _pyres_result = (expr); \
        if (_pyres_result.is_err()) return std::move(_pyres_result).error(); \
    } while(0)

} // namespace pyres
