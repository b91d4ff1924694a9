/**
 * @file Oracle.cpp
 * @brief Default hook bodies and finding helpers
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Oracle/Oracle.hpp>

namespace Vigil::Oracle {

// ============================================================================
// Findings
// ============================================================================

const char* severityName(Severity severity) noexcept {
    switch (severity) {
        case Severity::Minor:    return "Minor";
        case Severity::Medium:   return "Medium";
        case Severity::Major:    return "Major";
        case Severity::Critical: return "Critical";
    }
    return "Unknown";
}

nlohmann::json OracleFinding::toJson() const {
    return nlohmann::json{
        {"oracle", oracle},
        {"severity", severityName(severity)},
        {"extra", extra}
    };
}

nlohmann::json findingContext(const std::string& oracle,
                              const Trace::FunctionIdent* function,
                              std::optional<ProgramCounter> pc) {
    nlohmann::json extra = nlohmann::json::object();
    extra["oracle"] = oracle;
    extra["function"] = function ? nlohmann::json(function->toString()) : nlohmann::json(nullptr);
    extra["pc"] = pc ? nlohmann::json(*pc) : nlohmann::json(nullptr);
    return extra;
}

// ============================================================================
// Default Hooks
// ============================================================================

VoidResult Oracle::preExecution(HarnessState&) {
    return VoidResult::Success();
}

Result<FindingList> Oracle::openFrame(const Trace::Frame&, const OracleContext&) {
    return FindingList{};
}

Result<FindingList> Oracle::beforeInstruction(ProgramCounter, const Trace::Instruction&,
                                              const OracleContext&) {
    return FindingList{};
}

Result<FindingList> Oracle::event(const Trace::TraceEvent&, const OracleContext&) {
    return FindingList{};
}

Result<FindingList> Oracle::doneExecution(const Trace::ExecutionEffects&, HarnessState&) {
    return FindingList{};
}

} // namespace Vigil::Oracle
