/**
 * @file SymbolValue.hpp
 * @brief Symbolic counterpart of one operand stack slot
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#pragma once

#ifndef VIGIL_CONCOLIC_SYMBOL_VALUE_HPP
#define VIGIL_CONCOLIC_SYMBOL_VALUE_HPP

#include <z3++.h>
#include <optional>
#include <string>

namespace Vigil::Concolic {

/**
 * @brief Either Unknown or an integer formula describing how the slot's
 *        value was derived
 */
class SymbolValue {
public:
    /// Unknown: only the concrete path is available
    SymbolValue() = default;

    explicit SymbolValue(const z3::expr& formula) : formula_(formula) {}

    static SymbolValue unknown() { return SymbolValue(); }

    [[nodiscard]] bool isUnknown() const noexcept { return !formula_.has_value(); }
    [[nodiscard]] bool hasFormula() const noexcept { return formula_.has_value(); }

    /// Precondition: hasFormula()
    [[nodiscard]] const z3::expr& formula() const { return *formula_; }

    /// "Unknown" or the solver's canonical rendering of the formula
    [[nodiscard]] std::string toString() const;

private:
    std::optional<z3::expr> formula_;
};

} // namespace Vigil::Concolic

#endif // VIGIL_CONCOLIC_SYMBOL_VALUE_HPP
