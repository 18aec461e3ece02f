#pragma once

#include <string>
#include <utility>
#include <variant>

namespace sentinel {

struct ResultError {
    std::string message;
};

// Value-or-error return used by validation and collaborator plumbing.
// The error alternative is tagged so Result<std::string> stays unambiguous.
template<typename T>
class Result {
private:
    std::variant<T, ResultError> value_;

    explicit Result(ResultError error) : value_(std::move(error)) {}

public:
    explicit Result(T value) : value_(std::move(value)) {}

    static Result<T> success(T value) {
        return Result<T>(std::move(value));
    }

    static Result<T> error(std::string message) {
        return Result<T>(ResultError{std::move(message)});
    }

    bool is_success() const {
        return std::holds_alternative<T>(value_);
    }

    bool is_error() const {
        return std::holds_alternative<ResultError>(value_);
    }

    explicit operator bool() const {
        return is_success();
    }

    const T& value() const {
        return std::get<T>(value_);
    }

    T& value() {
        return std::get<T>(value_);
    }

    const std::string& error() const {
        return std::get<ResultError>(value_).message;
    }

    T value_or(T default_value) const {
        if (is_success()) {
            return value();
        }
        return default_value;
    }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_success()) {
            return Result<U>::success(f(value()));
        }
        return Result<U>::error(error());
    }
};

} // namespace sentinel
