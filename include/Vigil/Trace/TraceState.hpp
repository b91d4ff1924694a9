/**
 * @file TraceState.hpp
 * @brief Concrete VM state reconstructed from the trace event stream
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#pragma once

#ifndef VIGIL_TRACE_TRACE_STATE_HPP
#define VIGIL_TRACE_TRACE_STATE_HPP

#include <Vigil/Core/ErrorCodes.hpp>
#include <Vigil/Trace/TraceEvent.hpp>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace Vigil::Trace {

/**
 * @brief Locals of one live call frame
 */
struct FrameLocals {
    FrameId frameId = 0;
    bool isNative = false;
    std::map<size_t, TraceValue> locals;
};

/**
 * @brief Operand stack, call stack and loaded globals of the VM
 *
 * Mutated only through apply(); oracles receive a const reference that is
 * valid for the duration of one hook call.
 */
class TraceState {
public:
    /**
     * @brief Apply one event to the state machine
     * @return StackUnderflow when popping an empty stack, UnbalancedFrames
     *         when closing a frame that is not the innermost, UnknownLocation
     *         for an effect on a frame that is not live
     */
    VoidResult apply(const TraceEvent& event);

    /// Drop all frames, operands and loaded globals (new top-level command)
    void reset();

    [[nodiscard]] const std::vector<TraceValue>& operandStack() const noexcept { return operandStack_; }

    /// Top `n` operands in stack order, empty if fewer are present
    [[nodiscard]] std::span<const TraceValue> lastN(size_t n) const noexcept;

    [[nodiscard]] size_t frameDepth() const noexcept { return callStack_.size(); }
    [[nodiscard]] const std::map<FrameId, FrameLocals>& callStack() const noexcept { return callStack_; }
    [[nodiscard]] std::optional<TraceValue> local(FrameId frameId, size_t index) const;
    [[nodiscard]] const std::map<uint64_t, TraceValue>& loadedValues() const noexcept { return loaded_; }

private:
    VoidResult applyEffect(const Effect& effect);

    std::vector<TraceValue> operandStack_;
    std::map<FrameId, FrameLocals> callStack_;
    std::map<uint64_t, TraceValue> loaded_;
};

} // namespace Vigil::Trace

#endif // VIGIL_TRACE_TRACE_STATE_HPP
