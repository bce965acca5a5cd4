#pragma once

#include <string>
#include <utility>
#include <variant>

namespace fits_inspect {

enum class ErrorKind {
    Structural,  // file cannot be opened or iterated
    Unit,        // one unit's metadata or classification failed
    Render,      // one unit's preview failed
    Usage        // bad arguments at the process boundary
};

struct Failure {
    ErrorKind kind = ErrorKind::Unit;
    std::string message;
};

// Value-or-failure return used at unit-scoped boundaries.
template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(Failure failure) : state_(std::move(failure)) {}

    static Result fail(ErrorKind kind, std::string message) {
        return Result(Failure{kind, std::move(message)});
    }

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(state_); }
    T& value() { return std::get<T>(state_); }
    T take() { return std::move(std::get<T>(state_)); }

    const Failure& failure() const { return std::get<Failure>(state_); }

    T value_or(T fallback) const {
        return ok() ? value() : std::move(fallback);
    }

private:
    std::variant<T, Failure> state_;
};

} // namespace fits_inspect
