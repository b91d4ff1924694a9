/**
 * @file FindingSink.hpp
 * @brief Accumulates findings across executions for reporting
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#pragma once

#ifndef VIGIL_ORACLE_FINDING_SINK_HPP
#define VIGIL_ORACLE_FINDING_SINK_HPP

#include <Vigil/Core/ErrorCodes.hpp>
#include <Vigil/Oracle/OracleFinding.hpp>
#include <array>
#include <map>
#include <string>

namespace Vigil::Oracle {

class FindingSink {
public:
    void add(OracleFinding finding);
    void addAll(const FindingList& findings);
    void clear();

    /// Findings in arrival order
    [[nodiscard]] const FindingList& findings() const noexcept { return findings_; }
    [[nodiscard]] size_t size() const noexcept { return findings_.size(); }
    [[nodiscard]] bool empty() const noexcept { return findings_.empty(); }

    [[nodiscard]] size_t countBySeverity(Severity severity) const noexcept;
    [[nodiscard]] size_t countByOracle(const std::string& oracle) const;
    [[nodiscard]] const std::map<std::string, size_t>& oracleCounts() const noexcept { return byOracle_; }

    /// Highest severity seen, nullopt when empty
    [[nodiscard]] std::optional<Severity> maxSeverity() const noexcept;

    /// All findings as a JSON array
    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Append one JSON object per line to `path`
     * @return FileWriteError if the file cannot be opened or written
     */
    VoidResult writeJsonLines(const std::string& path) const;

private:
    FindingList findings_;
    std::array<size_t, 4> bySeverity_{};
    std::map<std::string, size_t> byOracle_;
};

} // namespace Vigil::Oracle

#endif // VIGIL_ORACLE_FINDING_SINK_HPP
