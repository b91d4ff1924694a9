/**
 * @file InfiniteLoopOracle.cpp
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Oracle/InfiniteLoopOracle.hpp>
#include <Vigil/Core/Logger.hpp>
#include <functional>

namespace Vigil::Oracle {

InfiniteLoopOracle::InfiniteLoopOracle(size_t threshold)
    : threshold_(threshold == 0 ? DEFAULT_LOOP_THRESHOLD : threshold) {
}

uint64_t InfiniteLoopOracle::functionKey(const Trace::FunctionIdent& function) {
    // Collisions merge two functions' tables; tolerated
    return static_cast<uint64_t>(std::hash<std::string>{}(function.toString()));
}

Result<FindingList> InfiniteLoopOracle::openFrame(const Trace::Frame& frame, const OracleContext&) {
    branches_.erase(functionKey(frame.function));
    return FindingList{};
}

Result<FindingList> InfiniteLoopOracle::beforeInstruction(ProgramCounter pc,
                                                          const Trace::Instruction& instruction,
                                                          const OracleContext& ctx) {
    if (!Trace::isConditionalBranch(instruction.op) || ctx.currentFunction == nullptr) {
        return FindingList{};
    }

    const auto& stack = ctx.symbols.stack();
    if (stack.empty() || stack.back().isUnknown()) {
        return FindingList{};
    }

    const uint64_t valueHash = std::hash<std::string>{}(stack.back().toString());
    BranchRecord& record = branches_[functionKey(*ctx.currentFunction)][pc];

    if (record.second > 0 && record.first == valueHash) {
        ++record.second;
    } else {
        record = BranchRecord{valueHash, 1};
    }

    if (record.second < threshold_) {
        return FindingList{};
    }
    record.second = 0;

    VIGIL_LOG_DEBUG_F("Branch condition at %s:%u repeated %zu times",
                      ctx.currentFunction->toString().c_str(), static_cast<unsigned>(pc), threshold_);

    OracleFinding finding;
    finding.oracle = name();
    finding.severity = Severity::Major;
    finding.extra = findingContext(name(), ctx.currentFunction, pc);
    finding.extra["repeats"] = threshold_;
    finding.extra["condition"] = stack.back().toString();
    return FindingList{std::move(finding)};
}

std::optional<size_t> InfiniteLoopOracle::repeatCount(const Trace::FunctionIdent& function,
                                                      ProgramCounter pc) const {
    auto fn = branches_.find(functionKey(function));
    if (fn == branches_.end()) {
        return std::nullopt;
    }
    auto branch = fn->second.find(pc);
    if (branch == fn->second.end()) {
        return std::nullopt;
    }
    return branch->second.second;
}

} // namespace Vigil::Oracle
