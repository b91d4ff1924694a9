/**
 * @file TraceValue.cpp
 * @brief Concrete trace value helpers
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Trace/TraceValue.hpp>
#include <sstream>

namespace Vigil::Trace {

namespace {

const char* kindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::Bool:    return "Bool";
        case ValueKind::U8:      return "U8";
        case ValueKind::U16:     return "U16";
        case ValueKind::U32:     return "U32";
        case ValueKind::U64:     return "U64";
        case ValueKind::U128:    return "U128";
        case ValueKind::U256:    return "U256";
        case ValueKind::Address: return "Address";
        case ValueKind::Vector:  return "Vector";
        case ValueKind::Struct:  return "Struct";
    }
    return "Unknown";
}

} // namespace

TraceValue TraceValue::boolean(bool value) {
    TraceValue v;
    v.kind_ = ValueKind::Bool;
    v.number_ = value ? 1 : 0;
    return v;
}

TraceValue TraceValue::integer(ValueKind kind, const U256& value) {
    TraceValue v;
    v.kind_ = kind;
    uint32_t width = kindBitWidth(kind);
    if (width == 0 || width >= 256) {
        v.number_ = value;
    } else {
        U256 mask = (U256(1) << width) - 1;
        v.number_ = value & mask;
    }
    return v;
}

TraceValue TraceValue::address(std::string hex) {
    TraceValue v;
    v.kind_ = ValueKind::Address;
    v.label_ = std::move(hex);
    return v;
}

TraceValue TraceValue::vector(size_t length) {
    TraceValue v;
    v.kind_ = ValueKind::Vector;
    v.length_ = length;
    return v;
}

TraceValue TraceValue::structure(std::string typeName) {
    TraceValue v;
    v.kind_ = ValueKind::Struct;
    v.label_ = std::move(typeName);
    return v;
}

TraceValue TraceValue::asReference(RefKind ref) const {
    TraceValue v = *this;
    v.ref_ = ref;
    return v;
}

Result<uint32_t> TraceValue::bitWidth() const {
    uint32_t width = kindBitWidth(kind_);
    if (width == 0) {
        return ErrorCode::NotPrimitive;
    }
    return width;
}

Result<U256> TraceValue::asU256() const {
    if (!isPrimitive()) {
        return ErrorCode::NotPrimitive;
    }
    return number_;
}

Result<uint32_t> TraceValue::significantBits() const {
    if (!isPrimitive()) {
        return ErrorCode::NotPrimitive;
    }
    if (number_ == 0) {
        return 0u;
    }
    return static_cast<uint32_t>(boost::multiprecision::msb(number_)) + 1;
}

std::string TraceValue::toString() const {
    std::ostringstream oss;
    if (ref_ == RefKind::Immutable) oss << "&";
    if (ref_ == RefKind::Mutable) oss << "&mut ";
    oss << kindName(kind_) << "(";
    switch (kind_) {
        case ValueKind::Bool:
            oss << (number_ != 0 ? "true" : "false");
            break;
        case ValueKind::Address:
        case ValueKind::Struct:
            oss << label_;
            break;
        case ValueKind::Vector:
            oss << "len=" << length_;
            break;
        default:
            oss << number_;
            break;
    }
    oss << ")";
    return oss.str();
}

bool TraceValue::operator==(const TraceValue& other) const {
    return kind_ == other.kind_ && ref_ == other.ref_ && number_ == other.number_ &&
           length_ == other.length_ && label_ == other.label_;
}

Result<int> compareValues(const TraceValue& lhs, const TraceValue& rhs) {
    if (!lhs.isPrimitive() || !rhs.isPrimitive() || lhs.kind() != rhs.kind()) {
        return ErrorCode::MalformedTrace;
    }
    U256 l = lhs.asU256().value();
    U256 r = rhs.asU256().value();
    if (l < r) return -1;
    if (l > r) return 1;
    return 0;
}

} // namespace Vigil::Trace
