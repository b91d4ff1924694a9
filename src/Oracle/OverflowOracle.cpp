/**
 * @file OverflowOracle.cpp
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Oracle/OverflowOracle.hpp>
#include <Vigil/Core/Logger.hpp>

namespace Vigil::Oracle {

Result<bool> shiftOverflows(const Trace::TraceValue& value, const Trace::TraceValue& shift) {
    if (!value.isPrimitive() || !shift.isPrimitive()) {
        return ErrorCode::MalformedTrace;
    }

    uint32_t width = 0;
    uint32_t significant = 0;
    U256 amount = 0;
    VIGIL_TRY_ASSIGN(width, value.bitWidth());
    VIGIL_TRY_ASSIGN(significant, value.significantBits());
    VIGIL_TRY_ASSIGN(amount, shift.asU256());

    if (amount >= width) {
        return true;
    }
    // amount < width <= 256 here
    return significant + amount.convert_to<uint32_t>() > width;
}

Result<FindingList> OverflowOracle::event(const Trace::TraceEvent& event, const OracleContext& ctx) {
    const auto* instruction = std::get_if<Trace::InstructionEvent>(&event);
    if (instruction == nullptr || instruction->instruction.op != Trace::Opcode::SHL) {
        return FindingList{};
    }

    auto operands = ctx.trace.lastN(2);
    if (operands.size() < 2) {
        return FindingList{};
    }

    bool overflow = false;
    VIGIL_TRY_ASSIGN(overflow, shiftOverflows(operands[0], operands[1]));
    if (!overflow) {
        return FindingList{};
    }

    VIGIL_LOG_DEBUG_F("Shift overflow: %s << %s", operands[0].toString().c_str(),
                      operands[1].toString().c_str());

    OracleFinding finding;
    finding.oracle = name();
    finding.severity = Severity::Medium;
    finding.extra = findingContext(name(), ctx.currentFunction, instruction->pc);
    finding.extra["value"] = operands[0].toString();
    finding.extra["shift"] = operands[1].toString();
    return FindingList{std::move(finding)};
}

} // namespace Vigil::Oracle
