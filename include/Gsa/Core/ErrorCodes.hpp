/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for GsaConf
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * This file defines all error codes used throughout GsaConf, along with
 * a Result type for error handling without exceptions.
 */

#pragma once

#ifndef GSA_CORE_ERROR_CODES_HPP
#define GSA_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <type_traits>

namespace Gsa {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,  ///< No error
    System      = 0x01,  ///< Operating system errors
    Crypto      = 0x03,  ///< Cryptographic errors
    Config      = 0x08,  ///< Configuration errors
    IO          = 0x09,  ///< File I/O errors
    Parse       = 0x0A,  ///< Parsing errors
    Document    = 0x0D,  ///< Appliance document structure errors
    Internal    = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all GsaConf operations
 *
 * Error codes are structured as:
 * - 0x0000: Success
 * - 0x0100-0x01FF: System errors
 * - 0x0300-0x03FF: Crypto errors
 * - 0x0800-0x08FF: Config errors
 * - 0x0900-0x09FF: I/O errors
 * - 0x0A00-0x0AFF: Parse errors
 * - 0x0D00-0x0DFF: Document errors
 * - 0xFF00-0xFFFF: Internal errors
 */
enum class ErrorCode : uint16_t {
    // ========================================================================
    // Success (0x0000)
    // ========================================================================

    /// Operation completed successfully
    Success = 0x0000,

    // ========================================================================
    // System Errors (0x0100-0x01FF)
    // ========================================================================

    /// Generic system error
    SystemError = 0x0100,

    /// Failed to allocate memory
    AllocationFailed = 0x0102,

    // ========================================================================
    // Cryptographic Errors (0x0300-0x03FF)
    // ========================================================================

    /// Generic cryptographic error
    CryptoError = 0x0300,

    /// Hash computation failed
    HashFailed = 0x0303,

    /// Invalid key format or size
    InvalidKey = 0x0306,

    // ========================================================================
    // Configuration Errors (0x0800-0x08FF)
    // ========================================================================

    /// Generic configuration error
    ConfigError = 0x0800,

    /// Missing required configuration
    ConfigMissing = 0x0801,

    /// Invalid configuration value
    ConfigInvalid = 0x0802,

    /// Configuration file not found
    ConfigFileNotFound = 0x0803,

    /// Configuration parse error
    ConfigParseFailed = 0x0804,

    // ========================================================================
    // I/O Errors (0x0900-0x09FF)
    // ========================================================================

    /// Generic I/O error
    IOError = 0x0900,

    /// File not found
    FileNotFound = 0x0901,

    /// File access denied
    FileAccessDenied = 0x0902,

    /// File already exists
    FileAlreadyExists = 0x0903,

    /// File read error
    FileReadError = 0x0906,

    /// File write error
    FileWriteError = 0x0907,

    /// File too large
    FileTooLarge = 0x0909,

    /// Invalid file path
    InvalidPath = 0x090A,

    /// Access denied
    AccessDenied = 0x090B,

    // ========================================================================
    // Parse Errors (0x0A00-0x0AFF)
    // ========================================================================

    /// Generic parse error
    ParseError = 0x0A00,

    /// Input is not well-formed XML
    XmlParseFailed = 0x0A07,

    // ========================================================================
    // Document Errors (0x0D00-0x0DFF)
    // ========================================================================

    /// Generic document structure error
    DocumentError = 0x0D00,

    /// A required element is missing
    ElementNotFound = 0x0D01,

    /// A required element occurs more than once
    DuplicateElement = 0x0D02,

    /// A node has an unexpected type (e.g. element where text is required)
    UnexpectedNodeType = 0x0D03,

    /// Document could not be serialized
    SerializationFailed = 0x0D04,

    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================

    /// Unknown internal error
    InternalError = 0xFF00,

    /// Invalid state
    InvalidState = 0xFF03,

    /// Null pointer
    NullPointer = 0xFF04,

    /// Invalid argument
    InvalidArgument = 0xFF05
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Check if an error code represents success
 */
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

/**
 * @brief Check if an error code represents failure
 */
[[nodiscard]] constexpr bool isFailure(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

/**
 * @brief Check whether an error means "not a valid appliance document"
 *
 * Covers the structural failures as well as malformed XML.
 */
[[nodiscard]] constexpr bool isDocumentError(ErrorCode code) noexcept {
    return getErrorCategory(code) == ErrorCategory::Document ||
           code == ErrorCode::XmlParseFailed;
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for operations that can fail
 *
 * This is a discriminated union that holds either a value of type T
 * or an ErrorCode. Use this for error handling without exceptions.
 *
 * @tparam T The success value type
 *
 * @example
 * ```cpp
 * auto digest = Appliance::computeSignature(xml, password);
 * if (digest.isSuccess()) {
 *     std::cout << digest.value() << std::endl;
 * } else {
 *     std::cout << "Error: " << getErrorMessage(digest.error()) << std::endl;
 * }
 * ```
 */
template<typename T>
class Result {
public:
    /// Default constructor creates a failed result
    Result() : m_data(ErrorCode::InternalError) {}

    /// Construct from success value
    Result(const T& value) : m_data(value) {}

    /// Construct from success value (move)
    Result(T&& value) : m_data(std::move(value)) {}

    /// Construct from error code
    Result(ErrorCode error) : m_data(error) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }

    /// Explicit conversion to bool (true if success)
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the success value (throws if failure)
    [[nodiscard]] T& value() & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (const, throws if failure)
    [[nodiscard]] const T& value() const & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (rvalue, throws if failure)
    [[nodiscard]] T&& value() && {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(std::move(m_data));
    }

    /// Get the error code (throws if success)
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorCode>(m_data);
    }

    /// Get value or default if failure
    [[nodiscard]] T valueOr(const T& defaultValue) const & {
        return isSuccess() ? std::get<T>(m_data) : defaultValue;
    }

    /// Get error or Success if no error
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? std::get<ErrorCode>(m_data) : defaultError;
    }

private:
    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Specialization of Result for void (no return value)
 *
 * Used for operations that can fail but don't return a value.
 */
template<>
class Result<void> {
public:
    /// Construct success result
    Result() : m_error(ErrorCode::Success) {}

    /// Construct from error code
    Result(ErrorCode error) : m_error(error) {}

    [[nodiscard]] static Result Success() {
        return Result();
    }

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return m_error != ErrorCode::Success;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the error code
    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }

private:
    ErrorCode m_error;
};

/// Alias for Result<void>
using VoidResult = Result<void>;

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 *
 * Usage:
 * ```cpp
 * GSA_TRY(someOperation());
 * ```
 */
#define GSA_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

/**
 * @brief Assign value or return early on failure
 *
 * Usage:
 * ```cpp
 * GSA_TRY_ASSIGN(value, someOperation());
 * ```
 */
#define GSA_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (_result_##var.isFailure()) return _result_##var.error(); \
    var = std::move(_result_##var.value())

} // namespace Gsa

#endif // GSA_CORE_ERROR_CODES_HPP
