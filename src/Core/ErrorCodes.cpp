/**
 * @file ErrorCodes.cpp
 * @brief Human-readable descriptions for Vigil error codes
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Core/ErrorCodes.hpp>

namespace Vigil {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:           return "Success";

        case ErrorCode::MalformedTrace:    return "Malformed trace event";
        case ErrorCode::StackUnderflow:    return "Operand stack underflow";
        case ErrorCode::UnbalancedFrames:  return "Frame closed without matching open";
        case ErrorCode::UnknownLocation:   return "Effect references an unknown frame or local";
        case ErrorCode::TraceAborted:      return "Trace analysis aborted by an earlier failure";

        case ErrorCode::SymbolicError:     return "Symbolic formula construction failed";
        case ErrorCode::NotPrimitive:      return "Value is not a primitive integer";

        case ErrorCode::OracleFailed:      return "Oracle evaluation failed";

        case ErrorCode::ConfigInvalid:     return "Invalid configuration";
        case ErrorCode::InvalidFieldValue: return "Configuration value out of range";

        case ErrorCode::JsonParseFailed:   return "JSON parse error";
        case ErrorCode::InvalidFieldType:  return "Invalid field type";

        case ErrorCode::IOError:           return "I/O error";
        case ErrorCode::FileNotFound:      return "File not found";
        case ErrorCode::FileTooLarge:      return "File too large";
        case ErrorCode::InvalidPath:       return "Invalid file path";
        case ErrorCode::AccessDenied:      return "Access denied";
        case ErrorCode::FileWriteError:    return "File write error";

        case ErrorCode::InternalError:     return "Internal error";
        case ErrorCode::InvalidState:      return "Invalid state";
        case ErrorCode::InvalidArgument:   return "Invalid argument";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:     return "None";
        case ErrorCategory::Trace:    return "Trace";
        case ErrorCategory::Concolic: return "Concolic";
        case ErrorCategory::Oracle:   return "Oracle";
        case ErrorCategory::Config:   return "Config";
        case ErrorCategory::Parse:    return "Parse";
        case ErrorCategory::IO:       return "IO";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace Vigil
