/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for the Vigil trace analysis engine
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * This file defines all error codes used throughout Vigil, along with
 * a Result type for error handling without exceptions.
 */

#pragma once

#ifndef VIGIL_CORE_ERROR_CODES_HPP
#define VIGIL_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace Vigil {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,  ///< No error
    Trace       = 0x01,  ///< Trace event stream errors
    Concolic    = 0x02,  ///< Symbolic formula construction errors
    Oracle      = 0x03,  ///< Oracle evaluation errors
    Config      = 0x04,  ///< Configuration errors
    Parse       = 0x05,  ///< Parsing errors
    IO          = 0x06,  ///< File I/O errors
    Internal    = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all Vigil operations
 *
 * Error codes are structured as:
 * - 0x0000: Success
 * - 0x0100-0x01FF: Trace errors
 * - 0x0200-0x02FF: Concolic errors
 * - 0x0300-0x03FF: Oracle errors
 * - 0x0400-0x04FF: Config errors
 * - 0x0500-0x05FF: Parse errors
 * - 0x0600-0x06FF: I/O errors
 * - 0xFF00-0xFFFF: Internal errors
 */
enum class ErrorCode : uint16_t {
    // ========================================================================
    // Success (0x0000)
    // ========================================================================

    /// Operation completed successfully
    Success = 0x0000,

    // ========================================================================
    // Trace Errors (0x0100-0x01FF)
    // ========================================================================

    /// Event data does not match the instruction it describes
    MalformedTrace = 0x0100,

    /// Pop from an empty operand stack
    StackUnderflow = 0x0101,

    /// Frame closed without a matching open
    UnbalancedFrames = 0x0102,

    /// Effect names a frame or local that does not exist
    UnknownLocation = 0x0103,

    /// Trace analysis was stopped by an earlier failure
    TraceAborted = 0x0104,

    // ========================================================================
    // Concolic Errors (0x0200-0x02FF)
    // ========================================================================

    /// Solver library rejected a formula
    SymbolicError = 0x0200,

    /// Value has no bit width (not a primitive)
    NotPrimitive = 0x0201,

    // ========================================================================
    // Oracle Errors (0x0300-0x03FF)
    // ========================================================================

    /// Oracle could not evaluate an event
    OracleFailed = 0x0300,

    // ========================================================================
    // Configuration Errors (0x0400-0x04FF)
    // ========================================================================

    /// Invalid configuration value
    ConfigInvalid = 0x0401,

    /// Field value out of its allowed range
    InvalidFieldValue = 0x0402,

    // ========================================================================
    // Parse Errors (0x0500-0x05FF)
    // ========================================================================

    /// JSON parse error
    JsonParseFailed = 0x0500,

    /// Invalid field type
    InvalidFieldType = 0x0502,

    // ========================================================================
    // I/O Errors (0x0600-0x06FF)
    // ========================================================================

    /// Generic I/O error
    IOError = 0x0600,

    /// File not found
    FileNotFound = 0x0601,

    /// File too large
    FileTooLarge = 0x0602,

    /// Invalid file path
    InvalidPath = 0x0603,

    /// Access denied
    AccessDenied = 0x0604,

    /// File write error
    FileWriteError = 0x0605,

    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================

    /// Unknown internal error
    InternalError = 0xFF00,

    /// Invalid state
    InvalidState = 0xFF01,

    /// Invalid argument
    InvalidArgument = 0xFF02
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
 * Result<TraceValue> top(const TraceState& state) {
 *     if (state.operandStack().empty()) return ErrorCode::StackUnderflow;
 *     return state.operandStack().back();
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

    /// Conversion to bool (true if success)
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
 * VIGIL_TRY(state.apply(event));
 * ```
 */
#define VIGIL_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

/**
 * @brief Assign value or return early on failure
 *
 * Usage:
 * ```cpp
 * VIGIL_TRY_ASSIGN(width, value.bitWidth());
 * ```
 */
#define VIGIL_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (_result_##var.isFailure()) return _result_##var.error(); \
    var = std::move(_result_##var.value())

} // namespace Vigil

#endif // VIGIL_CORE_ERROR_CODES_HPP
