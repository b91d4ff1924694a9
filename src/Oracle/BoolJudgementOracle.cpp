/**
 * @file BoolJudgementOracle.cpp
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Oracle/BoolJudgementOracle.hpp>
#include <Vigil/Concolic/FormulaWalker.hpp>
#include <Vigil/Core/Logger.hpp>

namespace Vigil::Oracle {

BoolJudgementOracle::BoolJudgementOracle(size_t nodeCap)
    : nodeCap_(nodeCap) {
}

Result<FindingList> BoolJudgementOracle::beforeInstruction(ProgramCounter pc,
                                                           const Trace::Instruction& instruction,
                                                           const OracleContext& ctx) {
    if (!Trace::isComparison(instruction.op)) {
        return FindingList{};
    }

    auto operands = ctx.symbols.lastN(2);
    if (operands.size() < 2 || !operands[0].hasFormula() || !operands[1].hasFormula()) {
        return FindingList{};
    }

    // nullopt (walk capped) must not count as constant
    auto lhs = Concolic::containsVariable(operands[0].formula(), nodeCap_);
    auto rhs = Concolic::containsVariable(operands[1].formula(), nodeCap_);
    if (lhs != false || rhs != false) {
        return FindingList{};
    }

    VIGIL_LOG_DEBUG_F("Constant %s at pc %u", Trace::opcodeName(instruction.op),
                      static_cast<unsigned>(pc));

    OracleFinding finding;
    finding.oracle = name();
    finding.severity = Severity::Minor;
    finding.extra = findingContext(name(), ctx.currentFunction, pc);
    finding.extra["message"] = "Unnecessary bool judgement (two constants)";
    return FindingList{std::move(finding)};
}

} // namespace Vigil::Oracle
