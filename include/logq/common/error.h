// =============================================================================
// logq - Error Handling Framework
// =============================================================================
// Error handling for the logq library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - LogqException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success (per-file errors do not change the exit code)
// - 1: Usage/argument error
// - 2: I/O error
// - 3: Configuration error
// - 4: Enumeration error (log root missing or unreadable)
// - 10: Run cancelled
//
// Error kinds isolated to a single file or record (decompression, read,
// schema mismatch, field coercion) are reported in the run's error list and
// never become the process exit code.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef LOGQ_COMMON_ERROR_H
#define LOGQ_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace logq {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief Generic I/O error.
    kIOError = 2,

    /// @brief Invalid engine configuration (schema, query, delimiters).
    kConfigError = 3,

    /// @brief Log root is missing, unreadable or not a directory.
    /// @note Fatal: aborts the run before any task starts.
    kEnumerationError = 4,

    /// @brief Compressed stream is malformed or truncated.
    /// @note Isolated to one file.
    kDecompressionError = 5,

    /// @brief I/O failure while opening or reading a file.
    /// @note Isolated to one file.
    kReadError = 6,

    /// @brief Record violates a required schema field.
    /// @note Isolated to one record.
    kSchemaMismatch = 7,

    /// @brief A single field failed to coerce into its declared type.
    /// @note Isolated to one field.
    kFieldCoercionFailure = 8,

    /// @brief Compression format recognised but not decodable.
    kUnsupportedFormat = 9,

    /// @brief Run was cancelled before completion.
    kCancelled = 10,

    /// @brief Invalid argument value.
    kInvalidArgument = 11
};

/// @brief Convert ErrorCode to its integer exit code value.
/// @param code The error code.
/// @return Integer exit code suitable for process exit.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kConfigError:
            return "configuration error";
        case ErrorCode::kEnumerationError:
            return "enumeration error";
        case ErrorCode::kDecompressionError:
            return "decompression error";
        case ErrorCode::kReadError:
            return "read error";
        case ErrorCode::kSchemaMismatch:
            return "schema mismatch";
        case ErrorCode::kFieldCoercionFailure:
            return "field coercion failure";
        case ErrorCode::kUnsupportedFormat:
            return "unsupported format";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
    }
    return "unknown error";
}

/// @brief Short machine-friendly name for an error kind (used in reports).
[[nodiscard]] constexpr std::string_view errorKindName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kEnumerationError:
            return "EnumerationError";
        case ErrorCode::kDecompressionError:
            return "DecompressionError";
        case ErrorCode::kReadError:
            return "ReadError";
        case ErrorCode::kSchemaMismatch:
            return "SchemaMismatch";
        case ErrorCode::kFieldCoercionFailure:
            return "FieldCoercionFailure";
        case ErrorCode::kUnsupportedFormat:
            return "UnsupportedFormat";
        case ErrorCode::kConfigError:
            return "ConfigError";
        case ErrorCode::kCancelled:
            return "Cancelled";
        default:
            return "Error";
    }
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Decoded byte offset of the record involved (if applicable).
    std::optional<std::uint64_t> recordOffset;

    /// @brief Schema field involved (if applicable).
    std::optional<std::string> fieldName;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the record offset.
    ErrorContext& withOffset(std::uint64_t offset) {
        recordOffset = offset;
        return *this;
    }

    /// @brief Set the field name.
    ErrorContext& withField(std::string name) {
        fieldName = std::move(name);
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all logq errors.
class LogqException : public std::exception {
public:
    /// @brief Construct with error code and message.
    LogqException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    LogqException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~LogqException() override = default;

    LogqException(const LogqException&) = default;
    LogqException(LogqException&&) noexcept = default;
    LogqException& operator=(const LogqException&) = default;
    LogqException& operator=(LogqException&&) noexcept = default;

    /// @brief Get the full error message including context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public LogqException {
public:
    explicit UsageError(std::string message)
        : LogqException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : LogqException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for invalid engine configuration (exit code 3).
/// @note Thrown for bad schema declarations, unknown field references,
///       malformed conditions and invalid delimiters.
class ConfigError : public LogqException {
public:
    explicit ConfigError(std::string message)
        : LogqException(ErrorCode::kConfigError, std::move(message)) {}

    ConfigError(std::string message, ErrorContext context)
        : LogqException(ErrorCode::kConfigError, std::move(message), std::move(context)) {}
};

/// @brief Exception for generic I/O errors (exit code 2).
class IOError : public LogqException {
public:
    explicit IOError(std::string message)
        : LogqException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

protected:
    IOError(ErrorCode code, std::string message, std::optional<std::error_code> ec,
            ErrorContext context)
        : LogqException(code, std::move(message), std::move(context)), systemError_(ec) {}

    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

private:
    std::optional<std::error_code> systemError_;
};

/// @brief Log root cannot be listed (fatal, exit code 4).
class EnumerationError : public IOError {
public:
    explicit EnumerationError(std::string message, ErrorContext context = {})
        : IOError(ErrorCode::kEnumerationError, std::move(message), std::nullopt,
                  std::move(context)) {}
};

/// @brief Failure while opening or reading a file's bytes.
class ReadError : public IOError {
public:
    explicit ReadError(std::string message, ErrorContext context = {})
        : IOError(ErrorCode::kReadError, std::move(message), std::nullopt, std::move(context)) {}

    ReadError(std::string message, std::error_code ec, ErrorContext context = {})
        : IOError(ErrorCode::kReadError, formatWithSystemError(message, ec), ec,
                  std::move(context)) {}
};

/// @brief Malformed, truncated or mislabelled compressed stream.
class DecompressionError : public LogqException {
public:
    explicit DecompressionError(std::string message)
        : LogqException(ErrorCode::kDecompressionError, std::move(message)) {}

    DecompressionError(std::string message, ErrorContext context)
        : LogqException(ErrorCode::kDecompressionError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a LogqException.
    explicit Error(const LogqException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const LogqException& ex) {
    return std::unexpected(Error{ex});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Return the value of a Result or throw the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw the matching exception if a VoidResult holds an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

}  // namespace logq

#endif  // LOGQ_COMMON_ERROR_H
