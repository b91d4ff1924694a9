/**
 * @file TypedBugOracle.hpp
 * @brief Detects bugs the contract under test signals on purpose
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * Benchmarks plant a marker where a bug becomes reachable: either an abort
 * with a sentinel code, or an emitted `oracle::Crash` event in a run the
 * harness considers a legitimate success. Only one mechanism is active.
 */

#pragma once

#ifndef VIGIL_ORACLE_TYPED_BUG_ORACLE_HPP
#define VIGIL_ORACLE_TYPED_BUG_ORACLE_HPP

#include <Vigil/Oracle/Oracle.hpp>
#include <string>

namespace Vigil::Oracle {

class TypedBugOracle : public Oracle {
public:
    enum class Mode : uint8_t {
        AbortCode,   ///< Failure with the sentinel abort code
        EventSignal  ///< Marker event in an allowed successful run
    };

    struct Options {
        Mode mode = Mode::AbortCode;
        uint64_t sentinelAbortCode = DEFAULT_SENTINEL_ABORT_CODE;
        std::string markerModule = "oracle";
        std::string markerEvent = "Crash";
    };

    TypedBugOracle() = default;
    explicit TypedBugOracle(Options options) : options_(std::move(options)) {}

    const char* name() const noexcept override { return "TypedBugOracle"; }

    Result<FindingList> doneExecution(const Trace::ExecutionEffects& effects,
                                      HarnessState& harness) override;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    FindingList checkAbortCode(const Trace::ExecutionEffects& effects) const;
    FindingList checkEvents(const Trace::ExecutionEffects& effects, const HarnessState& harness) const;

    Options options_;
};

} // namespace Vigil::Oracle

#endif // VIGIL_ORACLE_TYPED_BUG_ORACLE_HPP
