/**
 * @file result.hpp
 * @brief Monadic error handling type for the TaskGraph engine.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Every
 * fallible graph mutation and query returns a Result instead of throwing,
 * and carries an ErrorCode so callers can react to a specific failure
 * (e.g. a builder skipping an edge rejected with ErrorCode::Cycle).
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <optional>
#include <type_traits>
#include <utility>
#include <stdexcept>

namespace taskgraph {

/**
 * @brief Failure taxonomy shared by all modules.
 */
enum class ErrorCode : uint8_t {
    Unknown,
    DuplicateNode,   ///< Node id already present on add
    NotFound,        ///< Operation references a missing node or edge
    SelfLoop,        ///< Edge source equals target
    Cycle,           ///< Cycle-checked edge insertion would close a cycle
    Validation,      ///< Structural inconsistency or incomplete topological sort
    Config,          ///< Configuration missing or invalid
    Parse,           ///< Malformed serialized input
    Io               ///< File system failure
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown:       return "unknown";
        case ErrorCode::DuplicateNode: return "duplicate_node";
        case ErrorCode::NotFound:      return "not_found";
        case ErrorCode::SelfLoop:      return "self_loop";
        case ErrorCode::Cycle:         return "cycle";
        case ErrorCode::Validation:    return "validation";
        case ErrorCode::Config:        return "config";
        case ErrorCode::Parse:         return "parse";
        case ErrorCode::Io:            return "io";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a failure code and a descriptive message.
 */
struct Error {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E>: either a value or an error.
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
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }
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
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace taskgraph
