/**
 * @file TraceEngine.cpp
 * @brief Event routing, state maintenance and oracle dispatch
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Engine/TraceEngine.hpp>
#include <Vigil/Core/Logger.hpp>

namespace Vigil::Engine {

TraceEngine::TraceEngine(Oracle::OracleRegistry& registry, Oracle::HarnessState& harness)
    : z3_()
    , trace_()
    , symbols_(z3_)
    , registry_(registry)
    , harness_(harness) {
}

const Trace::FunctionIdent* TraceEngine::currentFunction() const noexcept {
    return functions_.empty() ? nullptr : &functions_.back();
}

Oracle::OracleContext TraceEngine::context() {
    return Oracle::OracleContext{trace_, symbols_, currentFunction(), harness_};
}

ErrorCode TraceEngine::failTrace(ErrorCode error, const char* stage) {
    if (!outcome_.error) {
        outcome_.error = error;
        VIGIL_LOG_ERROR_F("Trace analysis aborted in %s: %s", stage,
                          getErrorMessage(error).data());
    }
    return error;
}

VoidResult TraceEngine::absorb(Result<Oracle::FindingList> result, Oracle::FindingList& found) {
    if (result.isFailure()) {
        return result.error();
    }

    for (auto& finding : result.value()) {
        VIGIL_LOG_INFO_F("Finding: %s [%s] %s", finding.oracle.c_str(),
                         Oracle::severityName(finding.severity),
                         finding.extra.dump(-1, ' ', false,
                                            nlohmann::json::error_handler_t::replace).c_str());
        outcome_.findings.push_back(finding);
        found.push_back(std::move(finding));
    }
    if (!outcome_.findings.empty()) {
        outcome_.verdict = Verdict::Crash;
    }
    return VoidResult::Success();
}

// ============================================================================
// Hooks
// ============================================================================

VoidResult TraceEngine::preExecution() {
    if (outcome_.aborted()) {
        return ErrorCode::TraceAborted;
    }
    auto result = registry_.preExecution(harness_);
    if (result.isFailure()) {
        return failTrace(result.error(), "preExecution");
    }
    return VoidResult::Success();
}

Result<Oracle::FindingList> TraceEngine::openFrame(const Trace::Frame& frame) {
    if (outcome_.aborted()) {
        return ErrorCode::TraceAborted;
    }

    const Trace::TraceEvent event = Trace::OpenFrameEvent{frame};
    auto applied = trace_.apply(event);
    if (applied.isFailure()) {
        return failTrace(applied.error(), "openFrame");
    }
    symbols_.openFrame(frame);
    functions_.push_back(frame.function);

    VIGIL_LOG_DEBUG_F("Enter %s (frame %llu, %zu params)", frame.function.toString().c_str(),
                      static_cast<unsigned long long>(frame.frameId), frame.parameters.size());

    Oracle::FindingList found;
    auto ctx = context();
    auto hooked = absorb(registry_.openFrame(frame, ctx), found);
    if (hooked.isFailure()) {
        return failTrace(hooked.error(), "openFrame");
    }
    hooked = absorb(registry_.event(event, ctx), found);
    if (hooked.isFailure()) {
        return failTrace(hooked.error(), "openFrame");
    }
    return found;
}

Result<Oracle::FindingList> TraceEngine::beforeInstruction(ProgramCounter pc,
                                                           const Trace::Instruction& instruction) {
    if (outcome_.aborted()) {
        return ErrorCode::TraceAborted;
    }

    symbols_.synchronize(trace_.operandStack().size());

    Oracle::FindingList found;
    auto ctx = context();
    auto hooked = absorb(registry_.beforeInstruction(pc, instruction, ctx), found);
    if (hooked.isFailure()) {
        return failTrace(hooked.error(), "beforeInstruction");
    }
    hooked = absorb(registry_.event(Trace::InstructionEvent{pc, instruction}, ctx), found);
    if (hooked.isFailure()) {
        return failTrace(hooked.error(), "beforeInstruction");
    }

    auto constraint = symbols_.applyInstruction(pc, instruction, trace_);
    if (constraint.isFailure()) {
        return failTrace(constraint.error(), "beforeInstruction");
    }
    if (constraint.value()) {
        outcome_.constraints.push_back(*constraint.value());
    }
    return found;
}

void TraceEngine::applySymbolic(const Trace::TraceEvent& event) {
    if (const auto* close = std::get_if<Trace::CloseFrameEvent>(&event)) {
        symbols_.closeFrame(close->returnCount);
        if (!functions_.empty()) {
            functions_.pop_back();
        }
    } else if (const auto* external = std::get_if<Trace::ExternalEvent>(&event)) {
        if (external->marker == MOVE_CALL_START_MARKER) {
            symbols_.reset();
            functions_.clear();
        }
    }
}

Result<Oracle::FindingList> TraceEngine::event(const Trace::TraceEvent& event) {
    if (const auto* open = std::get_if<Trace::OpenFrameEvent>(&event)) {
        return openFrame(open->frame);
    }
    if (const auto* instruction = std::get_if<Trace::InstructionEvent>(&event)) {
        return beforeInstruction(instruction->pc, instruction->instruction);
    }
    if (outcome_.aborted()) {
        return ErrorCode::TraceAborted;
    }

    auto applied = trace_.apply(event);
    if (applied.isFailure()) {
        return failTrace(applied.error(), Trace::eventName(event));
    }
    applySymbolic(event);

    Oracle::FindingList found;
    auto hooked = absorb(registry_.event(event, context()), found);
    if (hooked.isFailure()) {
        return failTrace(hooked.error(), Trace::eventName(event));
    }
    return found;
}

Result<Oracle::FindingList> TraceEngine::doneExecution(const Trace::ExecutionEffects& effects) {
    if (outcome_.aborted()) {
        return ErrorCode::TraceAborted;
    }

    Oracle::FindingList found;
    auto hooked = absorb(registry_.doneExecution(effects, harness_), found);
    if (hooked.isFailure()) {
        return failTrace(hooked.error(), "doneExecution");
    }

    VIGIL_LOG_DEBUG_F("Execution done: %zu findings, %zu constraints",
                      outcome_.findings.size(), outcome_.constraints.size());
    return found;
}

} // namespace Vigil::Engine
