/**
 * @file Result.hpp
 * @brief Value-or-error return type.
 *
 * Functions that can fail return Result<T> instead of throwing. The error
 * carries a category so callers (mainly the session orchestrator) can pick a
 * recovery strategy without parsing messages.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace vb {

enum class ErrorCode {
    Unknown,
    InvalidSelection,
    EngineNotFound,
    AlreadyRunning,
    ProcessStartFailure,
    DeviceContentionFailure,
    StopTimeout,
    UnexpectedProcessExit,
    DeviceError,
    InvalidState,
    ConfigError,
};

inline const char* toString(ErrorCode code);

struct Error {
    ErrorCode code{ErrorCode::Unknown};
    std::string message;
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }
    static Result err(std::string message) {
        return Result(Error{ErrorCode::Unknown, std::move(message)});
    }
    static Result err(ErrorCode code, std::string message) {
        return Result(Error{code, std::move(message)});
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const {
        return std::holds_alternative<T>(data_);
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return std::get<T>(data_);
    }
    const T& value() const& {
        return std::get<T>(data_);
    }
    T&& value() && {
        return std::get<T>(std::move(data_));
    }
    T valueOr(T fallback) const {
        return isOk() ? std::get<T>(data_) : std::move(fallback);
    }

    T& operator*() & {
        return value();
    }
    T&& operator*() && {
        return std::move(*this).value();
    }
    T* operator->() {
        return &value();
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Error error) : data_(std::move(error)) {}

    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message) {
        return Result(Error{ErrorCode::Unknown, std::move(message)});
    }
    static Result err(ErrorCode code, std::string message) {
        return Result(Error{code, std::move(message)});
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const {
        return !error_.has_value();
    }
    bool isErr() const {
        return error_.has_value();
    }
    explicit operator bool() const {
        return isOk();
    }

    const Error& error() const {
        return *error_;
    }

private:
    Result() = default;
    explicit Result(Error error) : error_(std::move(error)) {}

    std::optional<Error> error_;
};

inline const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::Unknown:
        return "Unknown";
    case ErrorCode::InvalidSelection:
        return "InvalidSelection";
    case ErrorCode::EngineNotFound:
        return "EngineNotFound";
    case ErrorCode::AlreadyRunning:
        return "AlreadyRunning";
    case ErrorCode::ProcessStartFailure:
        return "ProcessStartFailure";
    case ErrorCode::DeviceContentionFailure:
        return "DeviceContentionFailure";
    case ErrorCode::StopTimeout:
        return "StopTimeout";
    case ErrorCode::UnexpectedProcessExit:
        return "UnexpectedProcessExit";
    case ErrorCode::DeviceError:
        return "DeviceError";
    case ErrorCode::InvalidState:
        return "InvalidState";
    case ErrorCode::ConfigError:
        return "ConfigError";
    }
    return "Unknown";
}

} // namespace vb
