/**
 * @file PrecisionLossOracle.cpp
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Oracle/PrecisionLossOracle.hpp>
#include <Vigil/Concolic/FormulaWalker.hpp>
#include <Vigil/Core/Logger.hpp>

namespace Vigil::Oracle {

PrecisionLossOracle::PrecisionLossOracle(size_t nodeCap)
    : nodeCap_(nodeCap) {
}

Result<FindingList> PrecisionLossOracle::beforeInstruction(ProgramCounter pc,
                                                           const Trace::Instruction& instruction,
                                                           const OracleContext& ctx) {
    if (instruction.op != Trace::Opcode::MUL) {
        return FindingList{};
    }

    auto operands = ctx.symbols.lastN(2);
    if (operands.size() < 2) {
        return FindingList{};
    }

    bool divided = false;
    for (const auto& operand : operands) {
        if (operand.hasFormula() && Concolic::containsDivision(operand.formula(), nodeCap_)) {
            divided = true;
            break;
        }
    }
    if (!divided) {
        return FindingList{};
    }

    VIGIL_LOG_DEBUG_F("Multiplication after division at pc %u", static_cast<unsigned>(pc));

    OracleFinding finding;
    finding.oracle = name();
    finding.severity = Severity::Medium;
    finding.extra = findingContext(name(), ctx.currentFunction, pc);
    return FindingList{std::move(finding)};
}

} // namespace Vigil::Oracle
