/**
 * @file result.hpp
 * @brief Monadic error handling type for SandboxOrchestrator.
 *
 * Provides Result<T, E> as the error channel between modules. Errors carry
 * an ErrorCode so that the API layer can map them onto status codes without
 * string matching.
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

namespace sandbox_orchestrator {

/**
 * @brief Error taxonomy shared by every service.
 */
enum class ErrorCode : uint8_t {
    CapacityExceeded,   ///< Queue or pool full; retriable after backoff
    RateLimited,        ///< Caller must wait retryAfter seconds
    Timeout,            ///< Attempt exceeded its budget
    ExecutionFailed,    ///< Sandboxed code errored or returned malformed output
    RetryExhausted,     ///< No retries left; resubmit as a new execution
    NotFound,           ///< Unknown execution id
    PoolInitFailure,    ///< Instance initialization failed (internal only)
    InvalidArgument,    ///< Malformed request
    Internal            ///< Configuration, I/O, or unexpected failure
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::CapacityExceeded: return "CapacityExceeded";
        case ErrorCode::RateLimited:      return "RateLimited";
        case ErrorCode::Timeout:          return "Timeout";
        case ErrorCode::ExecutionFailed:  return "ExecutionFailed";
        case ErrorCode::RetryExhausted:   return "RetryExhausted";
        case ErrorCode::NotFound:         return "NotFound";
        case ErrorCode::PoolInitFailure:  return "PoolInitFailure";
        case ErrorCode::InvalidArgument:  return "InvalidArgument";
        case ErrorCode::Internal:         return "Internal";
    }
    return "Unknown";
}

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    ErrorCode code{ErrorCode::Internal};
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E>: holds either a success value of type T or an error.
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
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().message);
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
 * @brief Result for operations that can fail but return nothing.
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

/// Convenience factory for coded error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace sandbox_orchestrator
