/**
 * @file SymbolValue.cpp
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Concolic/SymbolValue.hpp>

namespace Vigil::Concolic {

std::string SymbolValue::toString() const {
    if (!formula_) {
        return "Unknown";
    }
    return formula_->to_string();
}

} // namespace Vigil::Concolic
