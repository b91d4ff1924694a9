/**
 * @file TraceEvent.cpp
 * @brief Trace event helpers
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Trace/TraceEvent.hpp>

namespace Vigil::Trace {

using json = nlohmann::json;

std::string FunctionIdent::toString() const {
    return module + "::" + name;
}

const char* eventName(const TraceEvent& event) noexcept {
    switch (event.index()) {
        case 0: return "OpenFrame";
        case 1: return "Instruction";
        case 2: return "Effect";
        case 3: return "CloseFrame";
        case 4: return "External";
        default: return "Unknown";
    }
}

void to_json(json& j, const EmittedEvent& event) {
    j = json{
        {"module", event.module},
        {"name", event.name},
        {"payload", event.payload}
    };
}

} // namespace Vigil::Trace
