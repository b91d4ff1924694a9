/**
 * @file Bytecode.hpp
 * @brief Decoded Move bytecode vocabulary observed by the trace engine
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * STACK MODEL:
 * - Single operand stack shared by all frames
 * - Call arguments are moved off the stack into the callee's locals
 * - Instructions consume and produce stack values; the engine mirrors
 *   every effect on its symbolic shadow stack
 */

#pragma once

#ifndef VIGIL_TRACE_BYTECODE_HPP
#define VIGIL_TRACE_BYTECODE_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace Vigil::Trace {

// ============================================================================
// Opcode Enumeration
// ============================================================================

/**
 * @brief Instructions of the stack VM under test
 */
enum class Opcode : uint8_t {
    // ========== Control Flow ==========
    POP             = 0x01,     ///< Discard top of stack
    RET             = 0x02,     ///< Return from function
    BR_TRUE         = 0x03,     ///< Branch if top is true [target]
    BR_FALSE        = 0x04,     ///< Branch if top is false [target]
    BRANCH          = 0x05,     ///< Unconditional branch [target]
    ABORT           = 0x06,     ///< Abort with code on top of stack
    NOP             = 0x07,     ///< No operation

    // ========== Constants ==========
    LD_U8           = 0x10,
    LD_U16          = 0x11,
    LD_U32          = 0x12,
    LD_U64          = 0x13,
    LD_U128         = 0x14,
    LD_U256         = 0x15,
    LD_CONST        = 0x16,     ///< Load from constant pool [idx]
    LD_TRUE         = 0x17,
    LD_FALSE        = 0x18,

    // ========== Casts ==========
    CAST_U8         = 0x20,
    CAST_U16        = 0x21,
    CAST_U32        = 0x22,
    CAST_U64        = 0x23,
    CAST_U128       = 0x24,
    CAST_U256       = 0x25,

    // ========== Locals ==========
    COPY_LOC        = 0x30,     ///< Push copy of local [idx]
    MOVE_LOC        = 0x31,     ///< Move local onto stack [idx]
    ST_LOC          = 0x32,     ///< Pop into local [idx]
    MUT_BORROW_LOC  = 0x33,     ///< Push &mut local [idx]
    IMM_BORROW_LOC  = 0x34,     ///< Push &local [idx]

    // ========== Calls ==========
    CALL            = 0x40,
    CALL_GENERIC    = 0x41,

    // ========== Structs ==========
    PACK                = 0x50, ///< Fields → struct (field count in extra)
    PACK_GENERIC        = 0x51,
    UNPACK              = 0x52, ///< Struct → fields (field count in extra)
    UNPACK_GENERIC      = 0x53,
    PACK_VARIANT        = 0x54,
    UNPACK_VARIANT      = 0x55,
    MUT_BORROW_FIELD    = 0x56,
    IMM_BORROW_FIELD    = 0x57,

    // ========== References ==========
    READ_REF        = 0x60,
    WRITE_REF       = 0x61,
    FREEZE_REF      = 0x62,

    // ========== Arithmetic ==========
    ADD             = 0x70,     ///< a + b
    SUB             = 0x71,     ///< a - b
    MUL             = 0x72,     ///< a * b
    MOD             = 0x73,     ///< a % b
    DIV             = 0x74,     ///< a / b
    BIT_OR          = 0x75,     ///< a | b
    BIT_AND         = 0x76,     ///< a & b
    XOR             = 0x77,     ///< a ^ b
    OR              = 0x78,     ///< a || b
    AND             = 0x79,     ///< a && b
    NOT             = 0x7A,     ///< !a
    SHL             = 0x7B,     ///< a << b (b is u8)
    SHR             = 0x7C,     ///< a >> b (b is u8)

    // ========== Comparison ==========
    EQ              = 0x80,
    NEQ             = 0x81,
    LT              = 0x82,
    GT              = 0x83,
    LE              = 0x84,
    GE              = 0x85,

    // ========== Vectors ==========
    VEC_PACK        = 0x90,     ///< n elements → vector [n]
    VEC_LEN         = 0x91,
    VEC_IMM_BORROW  = 0x92,
    VEC_MUT_BORROW  = 0x93,
    VEC_PUSH_BACK   = 0x94,
    VEC_POP_BACK    = 0x95,
    VEC_UNPACK      = 0x96,     ///< vector → n elements [n]
    VEC_SWAP        = 0x97,
};

/**
 * @brief One decoded instruction as reported before it executes
 *
 * `operand` carries the local index, branch target or vector element
 * count depending on the opcode. `fieldCount` is the VM's extra
 * information for struct and variant pack/unpack and may be absent.
 */
struct Instruction {
    Opcode op = Opcode::NOP;
    uint64_t operand = 0;
    std::optional<uint32_t> fieldCount;

    Instruction() = default;
    Instruction(Opcode o, uint64_t arg = 0, std::optional<uint32_t> fields = std::nullopt)
        : op(o), operand(arg), fieldCount(fields) {}
};

// ============================================================================
// Opcode Metadata
// ============================================================================

/**
 * @brief Mnemonic for logs and finding payloads
 */
const char* opcodeName(Opcode op) noexcept;

constexpr bool isConditionalBranch(Opcode op) noexcept {
    return op == Opcode::BR_TRUE || op == Opcode::BR_FALSE;
}

constexpr bool isComparison(Opcode op) noexcept {
    switch (op) {
        case Opcode::EQ:
        case Opcode::NEQ:
        case Opcode::LT:
        case Opcode::GT:
        case Opcode::LE:
        case Opcode::GE:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Target bit width of a cast opcode, 0 for anything else
 */
constexpr uint32_t castTargetWidth(Opcode op) noexcept {
    switch (op) {
        case Opcode::CAST_U8:   return 8;
        case Opcode::CAST_U16:  return 16;
        case Opcode::CAST_U32:  return 32;
        case Opcode::CAST_U64:  return 64;
        case Opcode::CAST_U128: return 128;
        case Opcode::CAST_U256: return 256;
        default:                return 0;
    }
}

} // namespace Vigil::Trace

#endif // VIGIL_TRACE_BYTECODE_HPP
