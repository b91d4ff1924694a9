/**
 * @file TraceValue.hpp
 * @brief Concrete VM values as reported by the execution trace
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#pragma once

#ifndef VIGIL_TRACE_TRACE_VALUE_HPP
#define VIGIL_TRACE_TRACE_VALUE_HPP

#include <Vigil/Core/Types.hpp>
#include <Vigil/Core/ErrorCodes.hpp>
#include <string>

namespace Vigil::Trace {

/**
 * @brief Runtime type of a trace value
 *
 * Bool and the unsigned integers are primitives; everything else is opaque
 * to the engine.
 */
enum class ValueKind : uint8_t {
    Bool,
    U8,
    U16,
    U32,
    U64,
    U128,
    U256,
    Address,
    Vector,
    Struct
};

/**
 * @brief Reference flavour of a value on the operand stack
 */
enum class RefKind : uint8_t {
    None,       ///< Plain value
    Immutable,  ///< &T, the snapshot is the referenced value
    Mutable     ///< &mut T, the snapshot is the referenced value
};

/**
 * @brief Bit width of a primitive kind, 0 for non-primitives
 */
constexpr uint32_t kindBitWidth(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Bool: return 1;
        case ValueKind::U8:   return 8;
        case ValueKind::U16:  return 16;
        case ValueKind::U32:  return 32;
        case ValueKind::U64:  return 64;
        case ValueKind::U128: return 128;
        case ValueKind::U256: return 256;
        default:              return 0;
    }
}

/**
 * @brief One concrete value from the operand stack or a local slot
 *
 * References are read through their snapshot, so a `&u64` reports the
 * width and magnitude of the referenced u64.
 */
class TraceValue {
public:
    TraceValue() = default;

    static TraceValue boolean(bool value);
    static TraceValue u8(uint8_t value)   { return integer(ValueKind::U8, value); }
    static TraceValue u16(uint16_t value) { return integer(ValueKind::U16, value); }
    static TraceValue u32(uint32_t value) { return integer(ValueKind::U32, value); }
    static TraceValue u64(uint64_t value) { return integer(ValueKind::U64, value); }
    static TraceValue u128(const U256& value) { return integer(ValueKind::U128, value); }
    static TraceValue u256(const U256& value) { return integer(ValueKind::U256, value); }

    /// Integer of the given kind; the value is truncated to the kind's width
    static TraceValue integer(ValueKind kind, const U256& value);

    static TraceValue address(std::string hex);
    static TraceValue vector(size_t length);
    static TraceValue structure(std::string typeName);

    /// Same value seen through a reference
    [[nodiscard]] TraceValue asReference(RefKind ref) const;

    [[nodiscard]] ValueKind kind() const noexcept { return kind_; }
    [[nodiscard]] RefKind refKind() const noexcept { return ref_; }
    [[nodiscard]] bool isReference() const noexcept { return ref_ != RefKind::None; }
    [[nodiscard]] bool isPrimitive() const noexcept { return kindBitWidth(kind_) != 0; }

    /// Declared width: 1 for Bool, 8..256 for integers
    [[nodiscard]] Result<uint32_t> bitWidth() const;

    /// Numeric magnitude; Bool reads as 0 or 1
    [[nodiscard]] Result<U256> asU256() const;

    /// Bit length of the magnitude, 0 for a zero value
    [[nodiscard]] Result<uint32_t> significantBits() const;

    [[nodiscard]] std::string toString() const;

    bool operator==(const TraceValue& other) const;
    bool operator!=(const TraceValue& other) const { return !(*this == other); }

private:
    ValueKind kind_ = ValueKind::Bool;
    RefKind ref_ = RefKind::None;
    U256 number_ = 0;
    size_t length_ = 0;
    std::string label_;
};

/**
 * @brief Three-way compare of two primitives of the same kind
 * @return negative, zero or positive; MalformedTrace when kinds differ
 *         or either side is not primitive
 */
[[nodiscard]] Result<int> compareValues(const TraceValue& lhs, const TraceValue& rhs);

} // namespace Vigil::Trace

#endif // VIGIL_TRACE_TRACE_VALUE_HPP
