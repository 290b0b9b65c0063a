// =============================================================================
// geotime - Error Handling Framework Implementation
// =============================================================================
// Implementation of error handling utilities and exception classes.
// =============================================================================

#include "geotime/common/error.h"

#include <sstream>

namespace geotime {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!codec.empty()) {
        oss << "codec: " << codec;
        hasContent = true;
    }

    if (!input.empty()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "input: \"" << input << "\"";
        hasContent = true;
    }

    if (position.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "position: " << *position;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// GeotimeException Implementation
// =============================================================================

void GeotimeException::formatWhat() {
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
// Error Implementation
// =============================================================================

GeotimeException Error::toException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            return UsageError(message_);
        case ErrorCode::kDecodeError:
            return DecodeError(message_);
        case ErrorCode::kOutOfRange:
            return OutOfRangeError(message_);
        case ErrorCode::kInvalidArgument:
            return InvalidArgumentError(message_);
        case ErrorCode::kInvalidPattern:
        case ErrorCode::kUnsafeMagnitude:
        case ErrorCode::kSuccess:
            break;
    }
    return GeotimeException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kDecodeError:
            throw DecodeError(message_);
        case ErrorCode::kOutOfRange:
            throw OutOfRangeError(message_);
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        case ErrorCode::kInvalidPattern:
        case ErrorCode::kUnsafeMagnitude:
        case ErrorCode::kSuccess:
            break;
    }
    throw GeotimeException(code_, message_);
}

}  // namespace geotime
