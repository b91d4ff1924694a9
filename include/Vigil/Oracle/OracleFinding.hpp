/**
 * @file OracleFinding.hpp
 * @brief Uniform record every oracle reports through
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#pragma once

#ifndef VIGIL_ORACLE_ORACLE_FINDING_HPP
#define VIGIL_ORACLE_ORACLE_FINDING_HPP

#include <Vigil/Core/Types.hpp>
#include <Vigil/Trace/TraceEvent.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Vigil::Oracle {

/**
 * @brief Finding severity, ordered Minor < Medium < Major < Critical
 */
enum class Severity : uint8_t {
    Minor = 0,
    Medium = 1,
    Major = 2,
    Critical = 3
};

const char* severityName(Severity severity) noexcept;

/**
 * @brief One suspicious condition observed during an execution
 *
 * `extra` always carries `oracle`, `function` and `pc` (null when unknown)
 * plus oracle-specific fields.
 */
struct OracleFinding {
    std::string oracle;
    Severity severity = Severity::Minor;
    nlohmann::json extra = nlohmann::json::object();

    /// {"oracle": ..., "severity": "Medium", "extra": {...}}
    [[nodiscard]] nlohmann::json toJson() const;
};

using FindingList = std::vector<OracleFinding>;

/**
 * @brief Build the common part of a finding's payload
 */
nlohmann::json findingContext(const std::string& oracle,
                              const Trace::FunctionIdent* function,
                              std::optional<ProgramCounter> pc);

} // namespace Vigil::Oracle

#endif // VIGIL_ORACLE_ORACLE_FINDING_HPP
