/**
 * @file Bytecode.cpp
 * @brief Opcode mnemonics
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Trace/Bytecode.hpp>

namespace Vigil::Trace {

const char* opcodeName(Opcode op) noexcept {
    switch (op) {
        case Opcode::POP:              return "Pop";
        case Opcode::RET:              return "Ret";
        case Opcode::BR_TRUE:          return "BrTrue";
        case Opcode::BR_FALSE:         return "BrFalse";
        case Opcode::BRANCH:           return "Branch";
        case Opcode::ABORT:            return "Abort";
        case Opcode::NOP:              return "Nop";
        case Opcode::LD_U8:            return "LdU8";
        case Opcode::LD_U16:           return "LdU16";
        case Opcode::LD_U32:           return "LdU32";
        case Opcode::LD_U64:           return "LdU64";
        case Opcode::LD_U128:          return "LdU128";
        case Opcode::LD_U256:          return "LdU256";
        case Opcode::LD_CONST:         return "LdConst";
        case Opcode::LD_TRUE:          return "LdTrue";
        case Opcode::LD_FALSE:         return "LdFalse";
        case Opcode::CAST_U8:          return "CastU8";
        case Opcode::CAST_U16:         return "CastU16";
        case Opcode::CAST_U32:         return "CastU32";
        case Opcode::CAST_U64:         return "CastU64";
        case Opcode::CAST_U128:        return "CastU128";
        case Opcode::CAST_U256:        return "CastU256";
        case Opcode::COPY_LOC:         return "CopyLoc";
        case Opcode::MOVE_LOC:         return "MoveLoc";
        case Opcode::ST_LOC:           return "StLoc";
        case Opcode::MUT_BORROW_LOC:   return "MutBorrowLoc";
        case Opcode::IMM_BORROW_LOC:   return "ImmBorrowLoc";
        case Opcode::CALL:             return "Call";
        case Opcode::CALL_GENERIC:     return "CallGeneric";
        case Opcode::PACK:             return "Pack";
        case Opcode::PACK_GENERIC:     return "PackGeneric";
        case Opcode::UNPACK:           return "Unpack";
        case Opcode::UNPACK_GENERIC:   return "UnpackGeneric";
        case Opcode::PACK_VARIANT:     return "PackVariant";
        case Opcode::UNPACK_VARIANT:   return "UnpackVariant";
        case Opcode::MUT_BORROW_FIELD: return "MutBorrowField";
        case Opcode::IMM_BORROW_FIELD: return "ImmBorrowField";
        case Opcode::READ_REF:         return "ReadRef";
        case Opcode::WRITE_REF:        return "WriteRef";
        case Opcode::FREEZE_REF:       return "FreezeRef";
        case Opcode::ADD:              return "Add";
        case Opcode::SUB:              return "Sub";
        case Opcode::MUL:              return "Mul";
        case Opcode::MOD:              return "Mod";
        case Opcode::DIV:              return "Div";
        case Opcode::BIT_OR:           return "BitOr";
        case Opcode::BIT_AND:          return "BitAnd";
        case Opcode::XOR:              return "Xor";
        case Opcode::OR:               return "Or";
        case Opcode::AND:              return "And";
        case Opcode::NOT:              return "Not";
        case Opcode::SHL:              return "Shl";
        case Opcode::SHR:              return "Shr";
        case Opcode::EQ:               return "Eq";
        case Opcode::NEQ:              return "Neq";
        case Opcode::LT:               return "Lt";
        case Opcode::GT:               return "Gt";
        case Opcode::LE:               return "Le";
        case Opcode::GE:               return "Ge";
        case Opcode::VEC_PACK:         return "VecPack";
        case Opcode::VEC_LEN:          return "VecLen";
        case Opcode::VEC_IMM_BORROW:   return "VecImmBorrow";
        case Opcode::VEC_MUT_BORROW:   return "VecMutBorrow";
        case Opcode::VEC_PUSH_BACK:    return "VecPushBack";
        case Opcode::VEC_POP_BACK:     return "VecPopBack";
        case Opcode::VEC_UNPACK:       return "VecUnpack";
        case Opcode::VEC_SWAP:         return "VecSwap";
    }
    return "Unknown";
}

} // namespace Vigil::Trace
