/**
 * @file result.hpp
 * @brief Monadic error handling type for U-RAS.
 *
 * Result<T, E> is the error channel of every fallible operation. Algorithm
 * code never throws; failures travel as an Error carrying an ErrorKind.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace uras {

// ─────────────────────────────────────────────
// Error
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    InvalidSpec,            ///< Malformed input data
    Infeasible,             ///< Hard constraints cannot all be satisfied
    BudgetExceeded,         ///< Search budget ran out with nothing to return
    InconsistentSchedule,   ///< Schedule refers to unknown entities
    Config                  ///< Configuration or request file problem
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidSpec:          return "invalid_spec";
        case ErrorKind::Infeasible:           return "infeasible";
        case ErrorKind::BudgetExceeded:       return "budget_exceeded";
        case ErrorKind::InconsistentSchedule: return "inconsistent_schedule";
        case ErrorKind::Config:               return "config";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a kind and a descriptive message.
 */
struct Error {
    ErrorKind kind;
    std::string message;

    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

// ─────────────────────────────────────────────
// Result
// ─────────────────────────────────────────────

/**
 * @brief Result<T, E>: holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations with no success payload (validation passes).
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T>
Result<T> make_error(ErrorKind kind, std::string message) {
    return Result<T>(Error{kind, std::move(message)});
}

}  // namespace uras
