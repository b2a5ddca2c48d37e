#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by every cork component
 *
 * Every fallible operation that crosses a component boundary returns a
 * Result<T>. Errors carry the kind of failure, the installation stage at
 * which it happened and the underlying cause.
 */

#include <optional>
#include <string>
#include <utility>

namespace cork {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    CLASSIFICATION,
    ENVIRONMENT,
    STAGING,
    DISCOVERY,
    DEPENDENCY_INSTALL,
    EXECUTION,
    SHORTCUT_CONFLICT,  // Non-fatal; logged, never surfaced as a failed install
    CANCELLED,
    IO_ERROR,
    CONFIG_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::CLASSIFICATION: return "ClassificationError";
        case ErrorCode::ENVIRONMENT: return "EnvironmentError";
        case ErrorCode::STAGING: return "StagingError";
        case ErrorCode::DISCOVERY: return "DiscoveryError";
        case ErrorCode::DEPENDENCY_INSTALL: return "DependencyInstallError";
        case ErrorCode::EXECUTION: return "ExecutionError";
        case ErrorCode::SHORTCUT_CONFLICT: return "ShortcutConflictError";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::IO_ERROR: return "IoError";
        case ErrorCode::CONFIG_ERROR: return "ConfigError";
        default: return "UnknownError";
    }
}

// ============================================================================
// Stage Names
// ============================================================================

namespace stage {
constexpr const char* REQUEST = "request";
constexpr const char* CLASSIFICATION = "classification";
constexpr const char* ENVIRONMENT = "environment";
constexpr const char* STAGING = "staging";
constexpr const char* COPY = "copy";
constexpr const char* DISCOVERY = "discovery";
constexpr const char* DEPENDENCIES = "dependencies";
constexpr const char* EXECUTION = "execution";
constexpr const char* SHORTCUT = "shortcut";
} // namespace stage

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Typed failure with the stage it occurred at
 */
class Error {
public:
    Error(ErrorCode code, std::string stage, std::string message)
        : code_(code), stage_(std::move(stage)), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& stage() const { return stage_; }
    const std::string& message() const { return message_; }

    /// "<stage>: <message>"
    std::string toString() const {
        if (stage_.empty()) return message_;
        return stage_ + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string stage_;
    std::string message_;
};

using InstallError = Error;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace cork
