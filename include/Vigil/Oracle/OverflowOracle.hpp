/**
 * @file OverflowOracle.hpp
 * @brief Detects left shifts that drop significant bits
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#pragma once

#ifndef VIGIL_ORACLE_OVERFLOW_ORACLE_HPP
#define VIGIL_ORACLE_OVERFLOW_ORACLE_HPP

#include <Vigil/Oracle/Oracle.hpp>

namespace Vigil::Oracle {

/**
 * @brief Reports `Shl` where shift >= width or significant bits + shift > width
 *
 * Works on the concrete operands only, through the generic event hook.
 */
class OverflowOracle : public Oracle {
public:
    const char* name() const noexcept override { return "OverflowOracle"; }

    Result<FindingList> event(const Trace::TraceEvent& event, const OracleContext& ctx) override;
};

/**
 * @brief Whether shifting `value` left by `shift` loses bits
 * @return MalformedTrace if either operand is not a primitive
 */
[[nodiscard]] Result<bool> shiftOverflows(const Trace::TraceValue& value,
                                          const Trace::TraceValue& shift);

} // namespace Vigil::Oracle

#endif // VIGIL_ORACLE_OVERFLOW_ORACLE_HPP
