/**
 * @file TraceState.cpp
 * @brief Concrete trace state machine
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Trace/TraceState.hpp>
#include <Vigil/Core/Logger.hpp>
#include <iterator>

namespace Vigil::Trace {

namespace {

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

VoidResult TraceState::apply(const TraceEvent& event) {
    return std::visit(Overloaded{
        [this](const OpenFrameEvent& e) -> VoidResult {
            FrameLocals frame;
            frame.frameId = e.frame.frameId;
            frame.isNative = e.frame.isNative;
            for (size_t i = 0; i < e.frame.parameters.size(); ++i) {
                // Arguments arrive in the frame itself. For the entry call the
                // stack holds nothing to pop.
                if (!operandStack_.empty()) {
                    operandStack_.pop_back();
                }
                frame.locals.emplace(i, e.frame.parameters[i]);
            }
            callStack_[e.frame.frameId] = std::move(frame);
            return VoidResult::Success();
        },
        [](const InstructionEvent&) -> VoidResult {
            return VoidResult::Success();
        },
        [this](const EffectEvent& e) -> VoidResult {
            return applyEffect(e.effect);
        },
        [this](const CloseFrameEvent& e) -> VoidResult {
            if (callStack_.empty()) {
                return ErrorCode::UnbalancedFrames;
            }
            auto innermost = std::prev(callStack_.end());
            if (innermost->first != e.frameId) {
                return ErrorCode::UnbalancedFrames;
            }
            callStack_.erase(innermost);
            return VoidResult::Success();
        },
        [this](const ExternalEvent& e) -> VoidResult {
            if (e.marker == MOVE_CALL_START_MARKER) {
                reset();
            }
            return VoidResult::Success();
        }
    }, event);
}

VoidResult TraceState::applyEffect(const Effect& effect) {
    return std::visit(Overloaded{
        [this](const PushEffect& e) -> VoidResult {
            operandStack_.push_back(e.value);
            return VoidResult::Success();
        },
        [this](const PopEffect&) -> VoidResult {
            if (operandStack_.empty()) {
                return ErrorCode::StackUnderflow;
            }
            operandStack_.pop_back();
            return VoidResult::Success();
        },
        [this](const ReadEffect& e) -> VoidResult {
            auto it = callStack_.find(e.frameId);
            if (it == callStack_.end()) {
                return ErrorCode::UnknownLocation;
            }
            if (e.moved) {
                it->second.locals.erase(e.local);
            }
            return VoidResult::Success();
        },
        [this](const WriteEffect& e) -> VoidResult {
            auto it = callStack_.find(e.frameId);
            if (it == callStack_.end()) {
                return ErrorCode::UnknownLocation;
            }
            it->second.locals[e.local] = e.value;
            return VoidResult::Success();
        },
        [this](const DataLoadEffect& e) -> VoidResult {
            loaded_[e.refIndex] = e.value;
            return VoidResult::Success();
        },
        [](const ExecutionErrorEffect& e) -> VoidResult {
            VIGIL_LOG_DEBUG_F("VM reported execution error: %s", e.message.c_str());
            return VoidResult::Success();
        }
    }, effect);
}

void TraceState::reset() {
    operandStack_.clear();
    callStack_.clear();
    loaded_.clear();
}

std::span<const TraceValue> TraceState::lastN(size_t n) const noexcept {
    if (operandStack_.size() < n) {
        return {};
    }
    return std::span<const TraceValue>(operandStack_).last(n);
}

std::optional<TraceValue> TraceState::local(FrameId frameId, size_t index) const {
    auto frame = callStack_.find(frameId);
    if (frame == callStack_.end()) {
        return std::nullopt;
    }
    auto slot = frame->second.locals.find(index);
    if (slot == frame->second.locals.end()) {
        return std::nullopt;
    }
    return slot->second;
}

} // namespace Vigil::Trace
