/**
 * @file result.hpp
 * @brief Result type and error taxonomy for LanBeacon.
 *
 * Every fallible discovery operation returns Result<T>. The ErrorKind tag
 * lets callers tell a usage error (identity missing) from a startup failure
 * (bind/join) or a per-datagram problem without string matching.
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

namespace lan_beacon {

enum class ErrorKind : uint8_t {
    Precondition,   ///< Operation invoked before its inputs were set up
    Startup,        ///< Socket bind / multicast join / address parse failure
    Io,             ///< Send or HTTP transport failure
    Decode,         ///< Malformed payload
    Closed,         ///< Receive handle released by stop()
    Config          ///< Invalid configuration file or value
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Precondition: return "precondition";
        case ErrorKind::Startup:      return "startup";
        case ErrorKind::Io:           return "io";
        case ErrorKind::Decode:       return "decode";
        case ErrorKind::Closed:       return "closed";
        case ErrorKind::Config:       return "config";
    }
    return "unknown";
}

/**
 * @brief Error carrying a category and a descriptive message.
 */
struct Error {
    ErrorKind kind{ErrorKind::Io};
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }
};

/**
 * @brief Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

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

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Transform the success value, passing errors through.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) return func(value());
        return error();
    }

    [[nodiscard]] T value_or(T fallback) const& {
        if (has_value()) return value();
        return fallback;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations with no value on success.
 */
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
};

/// Shorthand for building an error of a given kind.
template <typename T = void>
Result<T> make_error(ErrorKind kind, std::string message) {
    return Result<T>(Error{kind, std::move(message)});
}

}  // namespace lan_beacon
