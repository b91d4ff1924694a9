/**
 * @file TypeConversionOracle.cpp
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Oracle/TypeConversionOracle.hpp>
#include <Vigil/Core/Logger.hpp>

namespace Vigil::Oracle {

Result<FindingList> TypeConversionOracle::beforeInstruction(ProgramCounter pc,
                                                            const Trace::Instruction& instruction,
                                                            const OracleContext& ctx) {
    const uint32_t target = Trace::castTargetWidth(instruction.op);
    if (target == 0) {
        return FindingList{};
    }

    auto top = ctx.trace.lastN(1);
    if (top.empty() || !top[0].isPrimitive()) {
        return FindingList{};
    }

    auto width = top[0].bitWidth();
    if (width.isFailure() || width.value() != target) {
        return FindingList{};
    }

    VIGIL_LOG_DEBUG_F("Redundant %s at pc %u", Trace::opcodeName(instruction.op),
                      static_cast<unsigned>(pc));

    OracleFinding finding;
    finding.oracle = name();
    finding.severity = Severity::Minor;
    finding.extra = findingContext(name(), ctx.currentFunction, pc);
    finding.extra["message"] = "Unnecessary type conversion";
    return FindingList{std::move(finding)};
}

} // namespace Vigil::Oracle
