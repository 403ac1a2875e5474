#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <variant>

namespace pakey {

/// Ok payload of operations that only report success or failure.
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};

inline constexpr Unit unit{};

/**
 * @brief Value-or-failure return type used by every fallible operation
 *
 * Failures are plain values (CryptoFailure, ParseFailure, ...). Unwrap() on
 * a failure throws std::runtime_error; the non-Try controller entry points
 * rely on that.
 */
template<typename T, typename E>
class Result {
public:
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;

    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<0>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<0>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<0>(std::move(value_));
    }

    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<1>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<1>(std::move(value_));
    }

    using value_type = T;
    using error_type = E;

private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
    }

    void RequireErr() const {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
    }

    std::variant<T, E> value_;
};

} // namespace pakey
