#pragma once

#include "types/Error.hpp"

#include <stdexcept>
#include <utility>
#include <variant>

namespace mg::types {

struct Cancelled {};

// Success(T) | Error | Cancelled. Returned by every client, cache, throttle and transfer call
// so callers never inspect protocol-specific failures.
template <typename T>
class Result {
public:
    using value_type = T;

    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}
    Result(Cancelled) : state_(std::in_place_index<2>, Cancelled{}) {}

    static Result failure(ErrorKind kind, std::string message, std::string cause = {}) {
        return Result(Error(kind, std::move(message), std::move(cause)));
    }

    [[nodiscard]] bool ok() const { return state_.index() == 0; }
    [[nodiscard]] bool isError() const { return state_.index() == 1; }
    [[nodiscard]] bool isCancelled() const { return state_.index() == 2; }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::logic_error("Result has no value: " + describe());
        return std::get<0>(state_);
    }

    [[nodiscard]] const T& value() const & {
        if (!ok()) throw std::logic_error("Result has no value: " + describe());
        return std::get<0>(state_);
    }

    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::logic_error("Result has no value: " + describe());
        return std::get<0>(std::move(state_));
    }

    [[nodiscard]] const Error& error() const {
        if (!isError()) throw std::logic_error("Result holds no error");
        return std::get<1>(state_);
    }

    [[nodiscard]] bool is(const ErrorKind kind) const { return isError() && error().kind == kind; }

    [[nodiscard]] bool isAuthError() const { return isError() && error().isAuthError(); }

    [[nodiscard]] std::string describe() const {
        if (ok()) return "Success";
        if (isCancelled()) return "Cancelled";
        return error().describe();
    }

    // Re-types a non-success result, e.g. Result<Foo> error -> Result<Bar> error.
    template <typename U>
    [[nodiscard]] Result<U> propagate() const {
        if (isCancelled()) return Cancelled{};
        return error();
    }

    template <typename Fn>
    auto map(Fn&& fn) const -> Result<decltype(fn(std::declval<const T&>()))> {
        using U = decltype(fn(std::declval<const T&>()));
        if (ok()) return Result<U>(fn(std::get<0>(state_)));
        return propagate<U>();
    }

private:
    std::variant<T, Error, Cancelled> state_;
};

using Unit = std::monostate;
using VoidResult = Result<Unit>;

inline VoidResult success() { return Unit{}; }

}
