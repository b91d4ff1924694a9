/**
 * @file OracleRegistry.hpp
 * @brief Ordered, owning collection of oracles with per-entry enable flags
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * Findings of one hook are concatenated in registration order. A failing
 * oracle stops dispatch for that hook and its error is returned.
 */

#pragma once

#ifndef VIGIL_ORACLE_ORACLE_REGISTRY_HPP
#define VIGIL_ORACLE_ORACLE_REGISTRY_HPP

#include <Vigil/Oracle/Oracle.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Vigil::Oracle {

class OracleRegistry {
public:
    OracleRegistry() = default;
    ~OracleRegistry() = default;

    OracleRegistry(const OracleRegistry&) = delete;
    OracleRegistry& operator=(const OracleRegistry&) = delete;

    /**
     * @brief Register an oracle (registry takes ownership)
     * @param enabled Disabled entries keep their position but never run
     */
    void registerOracle(std::unique_ptr<Oracle> oracle, bool enabled = true);

    /**
     * @brief Enable or disable an entry by name
     * @return false if no oracle with that name is registered
     */
    bool setEnabled(const std::string& name, bool enabled);

    [[nodiscard]] bool isEnabled(const std::string& name) const;
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] size_t enabledCount() const noexcept;

    /// Names in registration order
    [[nodiscard]] std::vector<std::string> names() const;

    VoidResult preExecution(HarnessState& harness);

    Result<FindingList> openFrame(const Trace::Frame& frame, const OracleContext& ctx);

    Result<FindingList> beforeInstruction(ProgramCounter pc,
                                          const Trace::Instruction& instruction,
                                          const OracleContext& ctx);

    Result<FindingList> event(const Trace::TraceEvent& event, const OracleContext& ctx);

    Result<FindingList> doneExecution(const Trace::ExecutionEffects& effects,
                                      HarnessState& harness);

    /// Clear per-execution state of every oracle
    void resetAll();

private:
    struct Entry {
        std::unique_ptr<Oracle> oracle;
        bool enabled = true;
    };

    Result<FindingList> collect(const std::function<Result<FindingList>(Oracle&)>& hook);

    std::vector<Entry> entries_;
};

} // namespace Vigil::Oracle

#endif // VIGIL_ORACLE_ORACLE_REGISTRY_HPP
