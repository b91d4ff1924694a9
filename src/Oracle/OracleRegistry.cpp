/**
 * @file OracleRegistry.cpp
 * @brief Ordered oracle dispatch
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Oracle/OracleRegistry.hpp>
#include <Vigil/Core/Logger.hpp>
#include <algorithm>

namespace Vigil::Oracle {

void OracleRegistry::registerOracle(std::unique_ptr<Oracle> oracle, bool enabled) {
    if (!oracle) {
        return;
    }
    entries_.push_back(Entry{std::move(oracle), enabled});
}

bool OracleRegistry::setEnabled(const std::string& name, bool enabled) {
    for (auto& entry : entries_) {
        if (name == entry.oracle->name()) {
            entry.enabled = enabled;
            return true;
        }
    }
    return false;
}

bool OracleRegistry::isEnabled(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (name == entry.oracle->name()) {
            return entry.enabled;
        }
    }
    return false;
}

size_t OracleRegistry::enabledCount() const noexcept {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const Entry& entry) { return entry.enabled; }));
}

std::vector<std::string> OracleRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.emplace_back(entry.oracle->name());
    }
    return result;
}

Result<FindingList> OracleRegistry::collect(
    const std::function<Result<FindingList>(Oracle&)>& hook) {

    FindingList all;
    for (auto& entry : entries_) {
        if (!entry.enabled) {
            continue;
        }

        auto result = hook(*entry.oracle);
        if (result.isFailure()) {
            VIGIL_LOG_ERROR_F("Oracle %s failed: %s", entry.oracle->name(),
                              getErrorMessage(result.error()).data());
            return result.error();
        }

        FindingList& findings = result.value();
        all.insert(all.end(),
                   std::make_move_iterator(findings.begin()),
                   std::make_move_iterator(findings.end()));
    }
    return all;
}

VoidResult OracleRegistry::preExecution(HarnessState& harness) {
    for (auto& entry : entries_) {
        if (!entry.enabled) {
            continue;
        }
        VIGIL_TRY(entry.oracle->preExecution(harness));
    }
    return VoidResult::Success();
}

Result<FindingList> OracleRegistry::openFrame(const Trace::Frame& frame, const OracleContext& ctx) {
    return collect([&](Oracle& oracle) { return oracle.openFrame(frame, ctx); });
}

Result<FindingList> OracleRegistry::beforeInstruction(ProgramCounter pc,
                                                      const Trace::Instruction& instruction,
                                                      const OracleContext& ctx) {
    return collect([&](Oracle& oracle) { return oracle.beforeInstruction(pc, instruction, ctx); });
}

Result<FindingList> OracleRegistry::event(const Trace::TraceEvent& event, const OracleContext& ctx) {
    return collect([&](Oracle& oracle) { return oracle.event(event, ctx); });
}

Result<FindingList> OracleRegistry::doneExecution(const Trace::ExecutionEffects& effects,
                                                  HarnessState& harness) {
    return collect([&](Oracle& oracle) { return oracle.doneExecution(effects, harness); });
}

void OracleRegistry::resetAll() {
    for (auto& entry : entries_) {
        entry.oracle->reset();
    }
}

} // namespace Vigil::Oracle
