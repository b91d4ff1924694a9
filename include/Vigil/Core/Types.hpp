/**
 * @file Types.hpp
 * @brief Core type definitions for the Vigil trace analysis engine
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the Vigil codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef VIGIL_CORE_TYPES_HPP
#define VIGIL_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

#include <boost/multiprecision/cpp_int.hpp>

namespace Vigil {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Widest unsigned integer the VM operates on
using U256 = boost::multiprecision::uint256_t;

/// Program counter within a function body
using ProgramCounter = uint16_t;

/// VM-assigned identifier of a call frame
using FrameId = uint64_t;

// ============================================================================
// Engine Constants
// ============================================================================

/// Identical branch conditions at one location before a loop is reported
constexpr size_t DEFAULT_LOOP_THRESHOLD = 1000;

/// Visited-node cap for every formula walk
constexpr size_t DEFAULT_FORMULA_NODE_CAP = 10000;

/// Abort code a contract under test raises to signal an injected bug
constexpr uint64_t DEFAULT_SENTINEL_ABORT_CODE = 0xDEADBEEF;

/// External marker that opens a new top-level command
constexpr const char* MOVE_CALL_START_MARKER = "MoveCallStart";

} // namespace Vigil

#endif // VIGIL_CORE_TYPES_HPP
