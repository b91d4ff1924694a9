/**
 * @file TypedBugOracle.cpp
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Oracle/TypedBugOracle.hpp>
#include <Vigil/Core/Logger.hpp>

namespace Vigil::Oracle {

Result<FindingList> TypedBugOracle::doneExecution(const Trace::ExecutionEffects& effects,
                                                  HarnessState& harness) {
    switch (options_.mode) {
        case Mode::AbortCode:
            return checkAbortCode(effects);
        case Mode::EventSignal:
            return checkEvents(effects, harness);
    }
    return FindingList{};
}

FindingList TypedBugOracle::checkAbortCode(const Trace::ExecutionEffects& effects) const {
    if (effects.succeeded() || !effects.abortCode ||
        *effects.abortCode != options_.sentinelAbortCode) {
        return {};
    }

    const Trace::FunctionIdent* location =
        effects.abortLocation ? &*effects.abortLocation : nullptr;

    VIGIL_LOG_DEBUG_F("Sentinel abort code %llu reached",
                      static_cast<unsigned long long>(*effects.abortCode));

    OracleFinding finding;
    finding.oracle = name();
    finding.severity = Severity::Critical;
    finding.extra = findingContext(name(), location, std::nullopt);
    finding.extra["abort_code"] = *effects.abortCode;
    finding.extra["location"] = location ? nlohmann::json(location->toString()) : nlohmann::json(nullptr);
    return {std::move(finding)};
}

FindingList TypedBugOracle::checkEvents(const Trace::ExecutionEffects& effects,
                                        const HarnessState& harness) const {
    if (!harness.allowedSuccess.value_or(false) || !effects.succeeded()) {
        return {};
    }

    for (const auto& event : effects.events) {
        if (event.module != options_.markerModule || event.name != options_.markerEvent) {
            continue;
        }

        VIGIL_LOG_DEBUG_F("Marker event %s::%s emitted", event.module.c_str(), event.name.c_str());

        OracleFinding finding;
        finding.oracle = name();
        finding.severity = Severity::Critical;
        finding.extra = findingContext(name(), nullptr, std::nullopt);
        finding.extra["event"] = event;
        return {std::move(finding)};
    }
    return {};
}

} // namespace Vigil::Oracle
