// =============================================================================
// logq - Error Handling Framework Implementation
// =============================================================================

#include "logq/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace logq {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (recordOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: " << *recordOffset;
        hasContent = true;
    }

    if (fieldName.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "field: " << *fieldName;
        hasContent = true;
    }

    // Add source location in debug builds
#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// LogqException Implementation
// =============================================================================

void LogqException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kConfigError:
            throw ConfigError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kEnumerationError:
            throw EnumerationError(message_);
        case ErrorCode::kReadError:
            throw ReadError(message_);
        case ErrorCode::kDecompressionError:
            throw DecompressionError(message_);
        default:
            break;
    }
    throw LogqException(code_, message_);
}

}  // namespace logq
