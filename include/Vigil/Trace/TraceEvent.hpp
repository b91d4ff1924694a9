/**
 * @file TraceEvent.hpp
 * @brief Event vocabulary emitted by the VM while executing a transaction
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * A trace is an ordered stream of frame openings, decoded instructions,
 * stack/local effects, frame closings and external markers. The final
 * ExecutionEffects are reported once the top-level execution completes.
 */

#pragma once

#ifndef VIGIL_TRACE_TRACE_EVENT_HPP
#define VIGIL_TRACE_TRACE_EVENT_HPP

#include <Vigil/Core/Types.hpp>
#include <Vigil/Trace/Bytecode.hpp>
#include <Vigil/Trace/TraceValue.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Vigil::Trace {

// ============================================================================
// Function Identity
// ============================================================================

/**
 * @brief Identity of an executing function
 *
 * `module` is itself qualified with its package address, e.g. `0x2::coin`.
 */
struct FunctionIdent {
    std::string module;
    std::string name;

    /// Canonical "module::name" form
    [[nodiscard]] std::string toString() const;

    bool operator==(const FunctionIdent& other) const {
        return module == other.module && name == other.name;
    }
    bool operator<(const FunctionIdent& other) const {
        return module < other.module || (module == other.module && name < other.name);
    }
};

// ============================================================================
// Frames
// ============================================================================

/**
 * @brief Activation record reported when a call begins
 */
struct Frame {
    FrameId frameId = 0;
    FunctionIdent function;
    std::vector<TraceValue> parameters;  ///< Concrete argument values
    size_t localCount = 0;               ///< Total locals, parameters included
    size_t returnCount = 0;
    bool isNative = false;
};

// ============================================================================
// Effects
// ============================================================================

struct PushEffect {
    TraceValue value;
};

struct PopEffect {
    TraceValue value;
};

/// Read of a local; `moved` removes the value from the slot
struct ReadEffect {
    FrameId frameId = 0;
    size_t local = 0;
    TraceValue value;
    bool moved = false;
};

struct WriteEffect {
    FrameId frameId = 0;
    size_t local = 0;
    TraceValue value;
};

/// Global value loaded into the VM (object or native return reference)
struct DataLoadEffect {
    uint64_t refIndex = 0;
    TraceValue value;
};

struct ExecutionErrorEffect {
    std::string message;
};

using Effect = std::variant<
    PushEffect,
    PopEffect,
    ReadEffect,
    WriteEffect,
    DataLoadEffect,
    ExecutionErrorEffect
>;

// ============================================================================
// Trace Events
// ============================================================================

struct OpenFrameEvent {
    Frame frame;
};

/// Fires before the decoded instruction executes
struct InstructionEvent {
    ProgramCounter pc = 0;
    Instruction instruction;
};

struct EffectEvent {
    Effect effect;
};

struct CloseFrameEvent {
    FrameId frameId = 0;
    size_t returnCount = 0;
};

/// Out-of-band marker, e.g. "MoveCallStart" before each top-level command
struct ExternalEvent {
    std::string marker;
};

using TraceEvent = std::variant<
    OpenFrameEvent,
    InstructionEvent,
    EffectEvent,
    CloseFrameEvent,
    ExternalEvent
>;

/**
 * @brief Short name of the event alternative for logging
 */
const char* eventName(const TraceEvent& event) noexcept;

// ============================================================================
// Execution Effects
// ============================================================================

enum class ExecutionStatus : uint8_t {
    Success,
    Failure
};

/**
 * @brief Application-level event emitted by the contract under test
 */
struct EmittedEvent {
    std::string module;
    std::string name;
    nlohmann::json payload;
};

void to_json(nlohmann::json& j, const EmittedEvent& event);

/**
 * @brief Final effects of a top-level execution
 */
struct ExecutionEffects {
    ExecutionStatus status = ExecutionStatus::Success;
    std::optional<uint64_t> abortCode;          ///< Set for a Move abort
    std::optional<FunctionIdent> abortLocation;
    std::vector<EmittedEvent> events;

    [[nodiscard]] bool succeeded() const noexcept { return status == ExecutionStatus::Success; }
};

} // namespace Vigil::Trace

#endif // VIGIL_TRACE_TRACE_EVENT_HPP
