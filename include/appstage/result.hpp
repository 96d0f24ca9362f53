#pragma once

/**
 * @file result.hpp
 * @brief Error and Result value types shared by the staging library
 *
 * Every fallible public operation returns a Result. Exceptions raised by
 * the standard library (std::filesystem in particular) are caught at the
 * call site and converted into an Error carrying one of the codes below.
 */

#include <optional>
#include <string>
#include <utility>

namespace appstage {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for staging operations
 */
enum class ErrorCode {
    // Pipeline phases
    STAGING_MOVE_FAILED,
    COPY_FAILED,
    HOOK_FAILED,
    STALE_CLEANUP_FAILED,
    PRUNE_FAILED,
    ARCHIVE_FAILED,
    RELOCATE_FAILED,
    RENAME_FAILED,
    INVALID_STATE,

    // Configuration / system
    CONFIG_INVALID,
    IO_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::STAGING_MOVE_FAILED: return "StagingMoveFailed";
        case ErrorCode::COPY_FAILED: return "CopyFailed";
        case ErrorCode::HOOK_FAILED: return "HookFailed";
        case ErrorCode::STALE_CLEANUP_FAILED: return "StaleCleanupFailed";
        case ErrorCode::PRUNE_FAILED: return "PruneFailed";
        case ErrorCode::ARCHIVE_FAILED: return "ArchiveFailed";
        case ErrorCode::RELOCATE_FAILED: return "RelocateFailed";
        case ErrorCode::RENAME_FAILED: return "RenameFailed";
        case ErrorCode::INVALID_STATE: return "InvalidState";
        case ErrorCode::CONFIG_INVALID: return "ConfigInvalid";
        case ErrorCode::IO_ERROR: return "IoError";
    }
    return "Unknown";
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Exactly one of value() and error() is populated.
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_.emplace(std::move(value));
        return r;
    }
    static Result err(E error) {
        Result r;
        r.error_.emplace(std::move(error));
        return r;
    }

    bool isOk() const { return value_.has_value(); }
    bool isErr() const { return error_.has_value(); }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<E> error_;
};

// Success carries no value
template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) {
        Result r;
        r.error_.emplace(std::move(error));
        return r;
    }

    bool isOk() const { return !error_.has_value(); }
    bool isErr() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    Result() = default;

    std::optional<E> error_;
};

} // namespace appstage
