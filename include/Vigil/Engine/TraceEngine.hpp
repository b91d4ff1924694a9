/**
 * @file TraceEngine.hpp
 * @brief Drives concrete and symbolic state from VM callbacks and
 *        dispatches every event to the registered oracles
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * One engine analyses one execution. It owns the solver context and both
 * states; the oracle registry and the harness state are borrowed.
 *
 * Usage:
 * @code
 *   Oracle::HarnessState harness;
 *   Engine::TraceEngine engine(*registry, harness);
 *   engine.preExecution();
 *   for (const auto& ev : trace) engine.event(ev);
 *   engine.doneExecution(effects);
 *   sink.addAll(engine.outcome().findings);
 * @endcode
 */

#pragma once

#ifndef VIGIL_ENGINE_TRACE_ENGINE_HPP
#define VIGIL_ENGINE_TRACE_ENGINE_HPP

#include <Vigil/Core/ErrorCodes.hpp>
#include <Vigil/Concolic/ConcolicState.hpp>
#include <Vigil/Oracle/OracleRegistry.hpp>
#include <Vigil/Trace/TraceEvent.hpp>
#include <Vigil/Trace/TraceState.hpp>
#include <z3++.h>
#include <optional>
#include <vector>

namespace Vigil::Engine {

enum class Verdict : uint8_t {
    Ok,
    Crash   ///< At least one finding was reported
};

/**
 * @brief Everything the engine learned about one execution
 */
struct TraceOutcome {
    Oracle::FindingList findings;
    Verdict verdict = Verdict::Ok;
    std::vector<z3::expr> constraints;  ///< Path and range constraints in trace order
    std::optional<ErrorCode> error;     ///< Set once a hook failed

    [[nodiscard]] bool aborted() const noexcept { return error.has_value(); }
};

class TraceEngine {
public:
    TraceEngine(Oracle::OracleRegistry& registry, Oracle::HarnessState& harness);

    TraceEngine(const TraceEngine&) = delete;
    TraceEngine& operator=(const TraceEngine&) = delete;

    /// Start of an execution; runs every oracle's preExecution hook
    VoidResult preExecution();

    /// A call frame was entered
    Result<Oracle::FindingList> openFrame(const Trace::Frame& frame);

    /// The decoded instruction is about to execute
    Result<Oracle::FindingList> beforeInstruction(ProgramCounter pc,
                                                  const Trace::Instruction& instruction);

    /**
     * @brief Generic event channel
     *
     * OpenFrame and Instruction events are routed to the dedicated hooks so
     * a VM may stream its whole trace through this call.
     */
    Result<Oracle::FindingList> event(const Trace::TraceEvent& event);

    /// The top-level execution finished
    Result<Oracle::FindingList> doneExecution(const Trace::ExecutionEffects& effects);

    [[nodiscard]] const TraceOutcome& outcome() const noexcept { return outcome_; }
    [[nodiscard]] const Trace::TraceState& traceState() const noexcept { return trace_; }
    [[nodiscard]] const Concolic::ConcolicState& concolicState() const noexcept { return symbols_; }

    /// Innermost executing function, nullptr outside any frame
    [[nodiscard]] const Trace::FunctionIdent* currentFunction() const noexcept;

private:
    Oracle::OracleContext context();

    /// Merge a hook's findings into `found` and the outcome
    VoidResult absorb(Result<Oracle::FindingList> result, Oracle::FindingList& found);

    ErrorCode failTrace(ErrorCode error, const char* stage);

    void applySymbolic(const Trace::TraceEvent& event);

    z3::context z3_;
    Trace::TraceState trace_;
    Concolic::ConcolicState symbols_;
    std::vector<Trace::FunctionIdent> functions_;
    TraceOutcome outcome_;

    Oracle::OracleRegistry& registry_;
    Oracle::HarnessState& harness_;
};

} // namespace Vigil::Engine

#endif // VIGIL_ENGINE_TRACE_ENGINE_HPP
