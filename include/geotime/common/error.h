// =============================================================================
// geotime - Error Handling Framework
// =============================================================================
// Error handling for the geotime library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - GeotimeException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: Decode error (malformed lexical string)
// - 3: Value out of range (calendar backend, 64-bit conversion)
// - 4: Invalid calendar pattern
// - 5: Magnitude approximation numerically unsafe
// - 6: Invalid argument value
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef GEOTIME_COMMON_ERROR_H
#define GEOTIME_COMMON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace geotime {

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

    /// @brief Malformed input to a lexical decoder.
    /// @note Wrong length, a symbol outside the alphabet, or non-zero pad bits.
    kDecodeError = 2,

    /// @brief Value lies outside a representable range.
    /// @note Raised by the calendar backend and by 64-bit conversions.
    kOutOfRange = 3,

    /// @brief Calendar pattern rejected by the backend.
    kInvalidPattern = 4,

    /// @brief Magnitude approximation cannot be trusted numerically.
    kUnsafeMagnitude = 5,

    /// @brief Invalid argument value.
    kInvalidArgument = 6
};

/// @brief Convert ErrorCode to its integer exit code value.
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
        case ErrorCode::kDecodeError:
            return "decode error";
        case ErrorCode::kOutOfRange:
            return "out of range";
        case ErrorCode::kInvalidPattern:
            return "invalid pattern";
        case ErrorCode::kUnsafeMagnitude:
            return "unsafe magnitude";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Describes which codec and which part of the input caused the error.
struct ErrorContext {
    /// @brief Name of the codec involved (if applicable).
    std::string codec;

    /// @brief Offending input text (if applicable).
    std::string input;

    /// @brief Character position in the input (if applicable).
    std::optional<std::size_t> position;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with codec name.
    explicit ErrorContext(std::string codecName,
                          std::source_location loc = std::source_location::current())
        : codec(std::move(codecName)), location(loc) {}

    /// @brief Set the codec name.
    /// @return Reference to this for method chaining.
    ErrorContext& withCodec(std::string name) {
        codec = std::move(name);
        return *this;
    }

    /// @brief Set the offending input.
    /// @return Reference to this for method chaining.
    ErrorContext& withInput(std::string text) {
        input = std::move(text);
        return *this;
    }

    /// @brief Set the character position.
    /// @return Reference to this for method chaining.
    ErrorContext& withPosition(std::size_t pos) {
        position = pos;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all geotime errors.
/// @note Provides error code, message, and optional context.
class GeotimeException : public std::exception {
public:
    /// @brief Construct with error code and message.
    GeotimeException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    GeotimeException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~GeotimeException() override = default;

    GeotimeException(const GeotimeException&) = default;
    GeotimeException(GeotimeException&&) noexcept = default;
    GeotimeException& operator=(const GeotimeException&) = default;
    GeotimeException& operator=(GeotimeException&&) noexcept = default;

    /// @brief Get the formatted error message.
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
class UsageError : public GeotimeException {
public:
    explicit UsageError(std::string message)
        : GeotimeException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : GeotimeException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for malformed lexical strings (exit code 2).
/// @note Thrown when a decoder meets a string of the wrong width, a symbol
///       outside the alphabet, or non-zero trailing pad bits.
class DecodeError : public GeotimeException {
public:
    /// @brief Construct with message.
    explicit DecodeError(std::string message)
        : GeotimeException(ErrorCode::kDecodeError, std::move(message)) {}

    /// @brief Construct with message and context.
    DecodeError(std::string message, ErrorContext context)
        : GeotimeException(ErrorCode::kDecodeError, std::move(message), std::move(context)) {}
};

/// @brief Exception for out-of-range values (exit code 3).
class OutOfRangeError : public GeotimeException {
public:
    explicit OutOfRangeError(std::string message)
        : GeotimeException(ErrorCode::kOutOfRange, std::move(message)) {}

    OutOfRangeError(std::string message, ErrorContext context)
        : GeotimeException(ErrorCode::kOutOfRange, std::move(message), std::move(context)) {}
};

/// @brief Exception for invalid argument values (exit code 6).
class InvalidArgumentError : public GeotimeException {
public:
    explicit InvalidArgumentError(std::string message)
        : GeotimeException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : GeotimeException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a GeotimeException.
    explicit Error(const GeotimeException& ex) : code_(ex.code()), message_(ex.message()) {}

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the exit code.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Convert to the appropriate exception type.
    [[nodiscard]] GeotimeException toException() const;

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
/// @tparam T The success value type.
/// @tparam E The error type (defaults to Error).
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create a success result.
template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const GeotimeException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Void Result Type
// =============================================================================

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

/// @brief Convert a Result to an exception if it contains an error.
/// @throws GeotimeException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Try to execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const GeotimeException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kInvalidArgument, ex.what()});
    }
}

}  // namespace geotime

#endif  // GEOTIME_COMMON_ERROR_H
