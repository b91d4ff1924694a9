/**
 * @file PrecisionLossOracle.hpp
 * @brief Detects multiplication of an already divided value
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#pragma once

#ifndef VIGIL_ORACLE_PRECISION_LOSS_ORACLE_HPP
#define VIGIL_ORACLE_PRECISION_LOSS_ORACLE_HPP

#include <Vigil/Oracle/Oracle.hpp>

namespace Vigil::Oracle {

/**
 * @brief `(a / b) * c` truncates before it scales. Flags a `Mul` whose
 *        operand formula contains a division node.
 */
class PrecisionLossOracle : public Oracle {
public:
    explicit PrecisionLossOracle(size_t nodeCap = DEFAULT_FORMULA_NODE_CAP);

    const char* name() const noexcept override { return "PrecisionLossOracle"; }

    Result<FindingList> beforeInstruction(ProgramCounter pc,
                                          const Trace::Instruction& instruction,
                                          const OracleContext& ctx) override;

private:
    size_t nodeCap_;
};

} // namespace Vigil::Oracle

#endif // VIGIL_ORACLE_PRECISION_LOSS_ORACLE_HPP
