/**
 * @file TypeConversionOracle.hpp
 * @brief Flags casts to the type the operand already has
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#pragma once

#ifndef VIGIL_ORACLE_TYPE_CONVERSION_ORACLE_HPP
#define VIGIL_ORACLE_TYPE_CONVERSION_ORACLE_HPP

#include <Vigil/Oracle/Oracle.hpp>

namespace Vigil::Oracle {

class TypeConversionOracle : public Oracle {
public:
    const char* name() const noexcept override { return "TypeConversionOracle"; }

    Result<FindingList> beforeInstruction(ProgramCounter pc,
                                          const Trace::Instruction& instruction,
                                          const OracleContext& ctx) override;
};

} // namespace Vigil::Oracle

#endif // VIGIL_ORACLE_TYPE_CONVERSION_ORACLE_HPP
