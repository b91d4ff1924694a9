/**
 * @file BoolJudgementOracle.hpp
 * @brief Flags comparisons whose both sides are constant formulas
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#pragma once

#ifndef VIGIL_ORACLE_BOOL_JUDGEMENT_ORACLE_HPP
#define VIGIL_ORACLE_BOOL_JUDGEMENT_ORACLE_HPP

#include <Vigil/Oracle/Oracle.hpp>

namespace Vigil::Oracle {

/**
 * @brief A comparison of two formulas without any input variable is
 *        decided statically and the branch it feeds is dead code.
 */
class BoolJudgementOracle : public Oracle {
public:
    explicit BoolJudgementOracle(size_t nodeCap = DEFAULT_FORMULA_NODE_CAP);

    const char* name() const noexcept override { return "BoolJudgementOracle"; }

    Result<FindingList> beforeInstruction(ProgramCounter pc,
                                          const Trace::Instruction& instruction,
                                          const OracleContext& ctx) override;

private:
    size_t nodeCap_;
};

} // namespace Vigil::Oracle

#endif // VIGIL_ORACLE_BOOL_JUDGEMENT_ORACLE_HPP
