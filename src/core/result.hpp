/**
 * @file result.hpp
 * @brief Monadic error handling type for the TCO scheduler.
 *
 * Result<T, E> is the primary error channel for every registry, optimizer and
 * service operation. Exceptions are reserved for bookkeeping invariant
 * violations and for misuse of Result itself.
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

namespace tco_scheduler {

// ─────────────────────────────────────────────
// Error codes
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    InvalidArgument,     ///< Malformed request field
    InvalidCostInput,    ///< Negative or non-finite cost model input
    CapacityExceeded,    ///< reserve() lost against total capacity
    NodeUnavailable,     ///< Node exists but is not Active
    UnknownNode,         ///< Node id was never registered
    NotFound,            ///< Job id unknown, or value not yet defined
    AlreadyExists,       ///< Duplicate job id
    InvalidTransition,   ///< Lifecycle state machine rejected the move
    Infeasible,          ///< No placement satisfies the constraints
    Transport,           ///< Socket-level failure
    Protocol,            ///< Malformed wire message
    Config               ///< Configuration file missing or invalid
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidArgument:   return "invalid_argument";
        case ErrorCode::InvalidCostInput:  return "invalid_cost_input";
        case ErrorCode::CapacityExceeded:  return "capacity_exceeded";
        case ErrorCode::NodeUnavailable:   return "node_unavailable";
        case ErrorCode::UnknownNode:       return "unknown_node";
        case ErrorCode::NotFound:          return "not_found";
        case ErrorCode::AlreadyExists:     return "already_exists";
        case ErrorCode::InvalidTransition: return "invalid_transition";
        case ErrorCode::Infeasible:        return "infeasible";
        case ErrorCode::Transport:         return "transport";
        case ErrorCode::Protocol:          return "protocol";
        case ErrorCode::Config:            return "config";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a classification code and a descriptive message.
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }
};

/**
 * @brief Result<T, E>: holds either a success value of type T or an error E.
 *
 * @note When C++23 std::expected becomes widely available on target
 *       compilers, this can be replaced with a type alias.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

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

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
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
 * @brief Specialization of Result for operations with no success payload.
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
Result<T> make_error(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

}  // namespace tco_scheduler
