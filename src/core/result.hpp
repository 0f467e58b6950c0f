/**
 * @file result.hpp
 * @brief Monadic error handling type for TreeScheduler.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Loading,
 * validation, and scheduling report failures through it instead of throwing.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace tree_scheduler {

/**
 * @brief Failure categories surfaced to callers.
 */
enum class ErrorKind : uint8_t {
    Parse,                 ///< Edge or directive line cannot be parsed
    MalformedTree,         ///< Missing/ambiguous root, multi-parent edge, cycle
    InvalidConfiguration,  ///< Processor count < 1, unknown mode or level
    Deadlock,              ///< Simulation ended without completing every task
    Io                     ///< File cannot be opened or read
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Parse:                return "parse_error";
        case ErrorKind::MalformedTree:        return "malformed_tree";
        case ErrorKind::InvalidConfiguration: return "invalid_configuration";
        case ErrorKind::Deadlock:             return "deadlock";
        case ErrorKind::Io:                   return "io_error";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a kind, a descriptive message and, for input
 *        errors, the 1-based line it came from.
 */
struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;
    std::optional<std::size_t> line;

    Error(ErrorKind k, std::string msg, std::optional<std::size_t> line_no = std::nullopt)
        : kind(k), message(std::move(msg)), line(line_no) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// "malformed_tree (line 3): ..." style rendering for logs.
    [[nodiscard]] std::string describe() const {
        std::string out{to_string(kind)};
        if (line) out += " (line " + std::to_string(*line) + ")";
        out += ": ";
        out += message;
        return out;
    }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
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

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 *
 * Used when an operation can fail but has no return value on success.
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
Result<T> make_error(ErrorKind kind, std::string message,
                     std::optional<std::size_t> line = std::nullopt) {
    return Result<T>(Error{kind, std::move(message), line});
}

}  // namespace tree_scheduler
