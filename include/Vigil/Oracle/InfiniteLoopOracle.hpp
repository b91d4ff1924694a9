/**
 * @file InfiniteLoopOracle.hpp
 * @brief Flags conditional branches whose condition never changes
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * For each (function, pc) of a BrTrue/BrFalse the oracle remembers a hash
 * of the condition's formula and how many times in a row it was seen.
 * Reaching the threshold reports a loop and restarts the count.
 */

#pragma once

#ifndef VIGIL_ORACLE_INFINITE_LOOP_ORACLE_HPP
#define VIGIL_ORACLE_INFINITE_LOOP_ORACLE_HPP

#include <Vigil/Oracle/Oracle.hpp>
#include <map>
#include <utility>

namespace Vigil::Oracle {

class InfiniteLoopOracle : public Oracle {
public:
    explicit InfiniteLoopOracle(size_t threshold = DEFAULT_LOOP_THRESHOLD);

    const char* name() const noexcept override { return "InfiniteLoopOracle"; }

    Result<FindingList> openFrame(const Trace::Frame& frame, const OracleContext& ctx) override;

    Result<FindingList> beforeInstruction(ProgramCounter pc,
                                          const Trace::Instruction& instruction,
                                          const OracleContext& ctx) override;

    void reset() override { branches_.clear(); }

    [[nodiscard]] size_t threshold() const noexcept { return threshold_; }

    /// Current repeat count at a branch, nullopt if never seen
    [[nodiscard]] std::optional<size_t> repeatCount(const Trace::FunctionIdent& function,
                                                    ProgramCounter pc) const;

private:
    /// (hash of the condition, consecutive repeats)
    using BranchRecord = std::pair<uint64_t, size_t>;

    static uint64_t functionKey(const Trace::FunctionIdent& function);

    size_t threshold_;
    std::map<uint64_t, std::map<ProgramCounter, BranchRecord>> branches_;
};

} // namespace Vigil::Oracle

#endif // VIGIL_ORACLE_INFINITE_LOOP_ORACLE_HPP
