/**
 * @file Oracle.hpp
 * @brief Contract between the trace engine and pluggable bug detectors
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * Every hook has a no-op default so a detector overrides only the
 * callbacks it cares about. Hooks run synchronously on the VM thread and
 * may not retain references to the state they are handed.
 */

#pragma once

#ifndef VIGIL_ORACLE_ORACLE_HPP
#define VIGIL_ORACLE_ORACLE_HPP

#include <Vigil/Core/ErrorCodes.hpp>
#include <Vigil/Concolic/ConcolicState.hpp>
#include <Vigil/Oracle/OracleFinding.hpp>
#include <Vigil/Trace/TraceEvent.hpp>
#include <Vigil/Trace/TraceState.hpp>
#include <optional>

namespace Vigil::Oracle {

/**
 * @brief Policy inputs owned by the surrounding fuzz harness
 *
 * Created per execution and passed by reference through every hook.
 */
struct HarnessState {
    /// Whether a successful execution of this input is acceptable
    std::optional<bool> allowedSuccess;
};

/**
 * @brief Read-only view of the execution handed to a hook
 */
struct OracleContext {
    const Trace::TraceState& trace;
    const Concolic::ConcolicState& symbols;
    const Trace::FunctionIdent* currentFunction;  ///< nullptr outside any frame
    HarnessState& harness;
};

/**
 * @brief Base class for all detectors
 */
class Oracle {
public:
    virtual ~Oracle() = default;

    /// Stable identifier used in findings and configuration
    virtual const char* name() const noexcept = 0;

    /// A new execution begins
    virtual VoidResult preExecution(HarnessState& harness);

    /// A call frame was entered; parameters are already in the frame's locals
    virtual Result<FindingList> openFrame(const Trace::Frame& frame, const OracleContext& ctx);

    /// The instruction is about to execute; both stacks hold its operands
    virtual Result<FindingList> beforeInstruction(ProgramCounter pc,
                                                  const Trace::Instruction& instruction,
                                                  const OracleContext& ctx);

    /// Generic channel, sees every event including frame opens and instructions
    virtual Result<FindingList> event(const Trace::TraceEvent& event, const OracleContext& ctx);

    /// The top-level execution finished
    virtual Result<FindingList> doneExecution(const Trace::ExecutionEffects& effects,
                                              HarnessState& harness);

    /// Drop per-execution state
    virtual void reset() {}
};

} // namespace Vigil::Oracle

#endif // VIGIL_ORACLE_ORACLE_HPP
