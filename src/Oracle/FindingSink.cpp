/**
 * @file FindingSink.cpp
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Oracle/FindingSink.hpp>
#include <Vigil/Core/Logger.hpp>
#include <fstream>

namespace Vigil::Oracle {

void FindingSink::add(OracleFinding finding) {
    bySeverity_[static_cast<size_t>(finding.severity)]++;
    byOracle_[finding.oracle]++;
    findings_.push_back(std::move(finding));
}

void FindingSink::addAll(const FindingList& findings) {
    for (const auto& finding : findings) {
        add(finding);
    }
}

void FindingSink::clear() {
    findings_.clear();
    bySeverity_.fill(0);
    byOracle_.clear();
}

size_t FindingSink::countBySeverity(Severity severity) const noexcept {
    return bySeverity_[static_cast<size_t>(severity)];
}

size_t FindingSink::countByOracle(const std::string& oracle) const {
    auto it = byOracle_.find(oracle);
    return it == byOracle_.end() ? 0 : it->second;
}

std::optional<Severity> FindingSink::maxSeverity() const noexcept {
    for (size_t i = bySeverity_.size(); i > 0; --i) {
        if (bySeverity_[i - 1] > 0) {
            return static_cast<Severity>(i - 1);
        }
    }
    return std::nullopt;
}

nlohmann::json FindingSink::toJson() const {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& finding : findings_) {
        array.push_back(finding.toJson());
    }
    return array;
}

VoidResult FindingSink::writeJsonLines(const std::string& path) const {
    std::ofstream out(path, std::ios::out | std::ios::app);
    if (!out.is_open()) {
        VIGIL_LOG_ERROR_F("Cannot open findings file: %s", path.c_str());
        return ErrorCode::FileWriteError;
    }

    for (const auto& finding : findings_) {
        out << finding.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
            << '\n';
    }
    out.flush();
    if (!out) {
        return ErrorCode::FileWriteError;
    }
    return VoidResult::Success();
}

} // namespace Vigil::Oracle
