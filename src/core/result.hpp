/**
 * @file result.hpp
 * @brief Value-based error handling for the fabric controller.
 *
 * Result<T, E> carries either a value or an Error tagged with an ErrorKind.
 * The kind drives retry decisions: Conflict is retried, NotFound means the
 * record is gone, Unavailable is skipped until the next natural trigger.
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

namespace fabric_controller {

enum class ErrorKind : uint8_t {
    Internal,
    Conflict,          ///< Identity already claimed, or write raced another writer
    NotFound,
    Unavailable,       ///< Transient I/O against a collaborator
    InvalidArgument,   ///< Malformed payload
    NotReady           ///< Caches not synced yet
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Internal:        return "internal";
        case ErrorKind::Conflict:        return "conflict";
        case ErrorKind::NotFound:        return "not_found";
        case ErrorKind::Unavailable:     return "unavailable";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::NotReady:        return "not_ready";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    [[nodiscard]] bool is_conflict() const noexcept { return kind == ErrorKind::Conflict; }
    [[nodiscard]] bool is_not_found() const noexcept { return kind == ErrorKind::NotFound; }

    /// "conflict: uuid u1 is held by cluster-a"
    [[nodiscard]] std::string describe() const {
        return std::string{to_string(kind)} + ": " + message;
    }
};

/**
 * @brief Either a success value of type T or an error of type E.
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
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
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

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that only report success or failure.
 */
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
};

template <typename T, typename E = Error>
Result<T, E> make_error(ErrorKind kind, std::string message) {
    return Result<T, E>(E{kind, std::move(message)});
}

}  // namespace fabric_controller
