/**
 * @file ConcolicState.cpp
 * @brief Symbolic effect of each instruction on the shadow stack
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Concolic/ConcolicState.hpp>
#include <Vigil/Core/Logger.hpp>
#include <algorithm>
#include <string>

namespace Vigil::Concolic {

using Trace::Opcode;
using Trace::TraceValue;

ConcolicState::ConcolicState(z3::context& ctx)
    : ctx_(ctx) {
}

// ============================================================================
// Stack Primitives
// ============================================================================

std::span<const SymbolValue> ConcolicState::lastN(size_t n) const noexcept {
    if (n > stack_.size()) {
        return {};
    }
    return std::span<const SymbolValue>(stack_).subspan(stack_.size() - n);
}

void ConcolicState::push(SymbolValue value) {
    stack_.push_back(std::move(value));
}

SymbolValue ConcolicState::pop() {
    if (stack_.empty()) {
        VIGIL_LOG_DEBUG("Shadow stack underflow ignored");
        return SymbolValue::unknown();
    }
    SymbolValue top = std::move(stack_.back());
    stack_.pop_back();
    return top;
}

void ConcolicState::popN(size_t n) {
    for (size_t i = 0; i < n; ++i) {
        pop();
    }
}

void ConcolicState::pushUnknown(size_t n) {
    stack_.insert(stack_.end(), n, SymbolValue::unknown());
}

size_t ConcolicState::synchronize(size_t concreteDepth) {
    size_t current = stack_.size();
    if (current == concreteDepth) {
        return 0;
    }

    if (concreteDepth == 0) {
        stack_.clear();
    } else if (concreteDepth > current) {
        pushUnknown(concreteDepth - current);
    } else {
        stack_.resize(concreteDepth);
    }

    size_t drift = concreteDepth > current ? concreteDepth - current : current - concreteDepth;
    VIGIL_LOG_DEBUG_F("Shadow stack resynchronized: %zu -> %zu", current, concreteDepth);
    return drift;
}

// ============================================================================
// Numerals
// ============================================================================

z3::expr ConcolicState::numeral(const U256& value) const {
    return ctx_.int_val(value.str().c_str());
}

z3::expr ConcolicState::twoPow(uint32_t bits) const {
    // 2^256 does not fit U256
    boost::multiprecision::cpp_int power = 1;
    power <<= bits;
    return ctx_.int_val(power.str().c_str());
}

z3::expr ConcolicState::maxUnsigned(uint32_t bits) const {
    boost::multiprecision::cpp_int power = 1;
    power <<= bits;
    power -= 1;
    return ctx_.int_val(power.str().c_str());
}

std::optional<std::pair<z3::expr, z3::expr>> ConcolicState::resolveOperands(
    const SymbolValue& lhs, const SymbolValue& rhs,
    std::span<const TraceValue> concrete) const {

    if (lhs.isUnknown() && rhs.isUnknown()) {
        return std::nullopt;
    }

    auto side = [&](const SymbolValue& symbol, size_t index) -> std::optional<z3::expr> {
        if (symbol.hasFormula()) {
            return symbol.formula();
        }
        if (concrete.size() != 2) {
            return std::nullopt;
        }
        auto value = concrete[index].asU256();
        if (value.isFailure()) {
            return std::nullopt;
        }
        return numeral(value.value());
    };

    auto l = side(lhs, 0);
    auto r = side(rhs, 1);
    if (!l || !r) {
        return std::nullopt;
    }
    return std::make_pair(*l, *r);
}

// ============================================================================
// Instruction Effects
// ============================================================================

Constraint ConcolicState::applyArithmetic(Opcode op, std::span<const TraceValue> concrete) {
    SymbolValue rhs = pop();
    SymbolValue lhs = pop();

    auto operands = resolveOperands(lhs, rhs, concrete);
    if (!operands) {
        push(SymbolValue::unknown());
        return Constraint{};
    }

    const z3::expr& l = operands->first;
    const z3::expr& r = operands->second;
    switch (op) {
        case Opcode::ADD: push(SymbolValue(l + r)); break;
        case Opcode::SUB: push(SymbolValue(l - r)); break;
        case Opcode::MUL: push(SymbolValue(l * r)); break;
        case Opcode::DIV: push(SymbolValue(l / r)); break;
        case Opcode::MOD: push(SymbolValue(z3::mod(l, r))); break;
        default:          push(SymbolValue::unknown()); break;
    }
    return Constraint{};
}

Constraint ConcolicState::applyBitwise(Opcode op, std::span<const TraceValue> concrete) {
    SymbolValue rhs = pop();
    SymbolValue lhs = pop();

    // Only a symbol masked by a constant is modelled
    if (lhs.hasFormula() == rhs.hasFormula() || concrete.size() != 2) {
        push(SymbolValue::unknown());
        return Constraint{};
    }

    auto width = concrete[0].bitWidth();
    if (width.isFailure()) {
        push(SymbolValue::unknown());
        return Constraint{};
    }

    const bool symbolicLeft = lhs.hasFormula();
    const z3::expr& symbol = symbolicLeft ? lhs.formula() : rhs.formula();
    auto mask = concrete[symbolicLeft ? 1 : 0].asU256();
    if (mask.isFailure()) {
        push(SymbolValue::unknown());
        return Constraint{};
    }

    unsigned w = width.value();
    z3::expr vector = z3::int2bv(w, symbol);
    z3::expr constant = ctx_.bv_val(mask.value().str().c_str(), w);

    switch (op) {
        case Opcode::BIT_AND:
        case Opcode::AND:
            push(SymbolValue(z3::bv2int(vector & constant, false)));
            break;
        case Opcode::BIT_OR:
        case Opcode::OR:
            push(SymbolValue(z3::bv2int(vector | constant, false)));
            break;
        case Opcode::XOR:
            push(SymbolValue(z3::bv2int(vector ^ constant, false)));
            break;
        default:
            push(SymbolValue::unknown());
            break;
    }
    return Constraint{};
}

Constraint ConcolicState::applyShift(Opcode op, std::span<const TraceValue> concrete) {
    SymbolValue rhs = pop();
    SymbolValue lhs = pop();

    if (lhs.isUnknown() || rhs.hasFormula() || concrete.size() != 2) {
        push(SymbolValue::unknown());
        return Constraint{};
    }

    auto width = concrete[0].bitWidth();
    auto amount = concrete[1].asU256();
    if (width.isFailure() || amount.isFailure() || amount.value() > 256) {
        push(SymbolValue::unknown());
        return Constraint{};
    }

    uint32_t shift = amount.value().convert_to<uint32_t>();
    const z3::expr& l = lhs.formula();

    if (op == Opcode::SHL) {
        z3::expr product = l * twoPow(shift);
        push(SymbolValue(z3::mod(product, twoPow(width.value()))));
        return Constraint(product > maxUnsigned(width.value()));
    }

    push(SymbolValue(l / twoPow(shift)));
    return Constraint{};
}

Constraint ConcolicState::applyComparison(Opcode op, std::span<const TraceValue> concrete) {
    SymbolValue rhs = pop();
    SymbolValue lhs = pop();

    if (concrete.size() != 2 || !concrete[0].isPrimitive() || !concrete[1].isPrimitive()) {
        push(SymbolValue::unknown());
        return Constraint{};
    }

    auto operands = resolveOperands(lhs, rhs, concrete);
    auto ordering = Trace::compareValues(concrete[0], concrete[1]);
    if (!operands || ordering.isFailure()) {
        push(SymbolValue::unknown());
        return Constraint{};
    }

    const z3::expr& l = operands->first;
    const z3::expr& r = operands->second;
    const int cmp = ordering.value();

    std::optional<z3::expr> condition;
    bool holds = false;
    switch (op) {
        case Opcode::EQ:  condition = (l == r); holds = cmp == 0; break;
        case Opcode::NEQ: condition = (l != r); holds = cmp != 0; break;
        case Opcode::LT:  condition = (l < r);  holds = cmp < 0;  break;
        case Opcode::GT:  condition = (l > r);  holds = cmp > 0;  break;
        case Opcode::LE:  condition = (l <= r); holds = cmp <= 0; break;
        case Opcode::GE:  condition = (l >= r); holds = cmp >= 0; break;
        default:
            push(SymbolValue::unknown());
            return Constraint{};
    }

    push(SymbolValue(z3::ite(*condition, ctx_.int_val(1), ctx_.int_val(0))));
    if (holds) {
        return Constraint(*condition);
    }
    return Constraint(!*condition);
}

Constraint ConcolicState::applyCast(Opcode op) {
    uint32_t width = Trace::castTargetWidth(op);
    if (width == 0 || width >= 256 || stack_.empty() || stack_.back().isUnknown()) {
        return Constraint{};
    }
    return Constraint(stack_.back().formula() <= maxUnsigned(width));
}

void ConcolicState::applyLocal(ProgramCounter pc, const Trace::Instruction& instruction) {
    const size_t index = static_cast<size_t>(instruction.operand);

    if (frames_.empty()) {
        VIGIL_LOG_DEBUG_F("Local access outside any frame at pc %u", static_cast<unsigned>(pc));
        if (instruction.op == Opcode::ST_LOC) {
            pop();
        } else {
            push(SymbolValue::unknown());
        }
        return;
    }

    std::vector<SymbolValue>& locals = frames_.back().locals;
    if (instruction.op == Opcode::ST_LOC) {
        if (index >= locals.size()) {
            locals.resize(index + 1);
        }
        locals[index] = pop();
        return;
    }

    SymbolValue value = index < locals.size() ? locals[index] : SymbolValue::unknown();
    if (instruction.op == Opcode::MOVE_LOC && index < locals.size()) {
        locals[index] = SymbolValue::unknown();
    }
    push(std::move(value));
}

Result<Constraint> ConcolicState::applyInstruction(ProgramCounter pc,
                                                   const Trace::Instruction& instruction,
                                                   const Trace::TraceState& concrete) {
    try {
        switch (instruction.op) {
            case Opcode::POP:
            case Opcode::BR_TRUE:
            case Opcode::BR_FALSE:
            case Opcode::ABORT:
                pop();
                break;

            case Opcode::LD_U8:
            case Opcode::LD_U16:
            case Opcode::LD_U32:
            case Opcode::LD_U64:
            case Opcode::LD_U128:
            case Opcode::LD_U256:
            case Opcode::LD_CONST:
                push(SymbolValue::unknown());
                break;
            case Opcode::LD_TRUE:
                push(SymbolValue(ctx_.int_val(1)));
                break;
            case Opcode::LD_FALSE:
                push(SymbolValue(ctx_.int_val(0)));
                break;

            case Opcode::ADD:
            case Opcode::SUB:
            case Opcode::MUL:
            case Opcode::DIV:
            case Opcode::MOD:
                return applyArithmetic(instruction.op, concrete.lastN(2));

            case Opcode::BIT_AND:
            case Opcode::BIT_OR:
            case Opcode::XOR:
            case Opcode::AND:
            case Opcode::OR:
                return applyBitwise(instruction.op, concrete.lastN(2));

            case Opcode::SHL:
            case Opcode::SHR:
                return applyShift(instruction.op, concrete.lastN(2));

            case Opcode::NOT: {
                SymbolValue operand = pop();
                auto top = concrete.lastN(1);
                if (operand.isUnknown() || top.empty() || top[0].bitWidth().isFailure()) {
                    push(SymbolValue::unknown());
                    break;
                }
                uint32_t width = top[0].bitWidth().value();
                push(SymbolValue(maxUnsigned(width) - z3::mod(operand.formula(), twoPow(width))));
                break;
            }

            case Opcode::EQ:
            case Opcode::NEQ:
            case Opcode::LT:
            case Opcode::GT:
            case Opcode::LE:
            case Opcode::GE:
                return applyComparison(instruction.op, concrete.lastN(2));

            case Opcode::CAST_U8:
            case Opcode::CAST_U16:
            case Opcode::CAST_U32:
            case Opcode::CAST_U64:
            case Opcode::CAST_U128:
            case Opcode::CAST_U256:
                return applyCast(instruction.op);

            case Opcode::COPY_LOC:
            case Opcode::MOVE_LOC:
            case Opcode::ST_LOC:
            case Opcode::MUT_BORROW_LOC:
            case Opcode::IMM_BORROW_LOC:
                applyLocal(pc, instruction);
                break;

            case Opcode::READ_REF:
            case Opcode::FREEZE_REF:
                break;
            case Opcode::WRITE_REF:
            case Opcode::VEC_PUSH_BACK:
                popN(2);
                break;
            case Opcode::VEC_SWAP:
                popN(3);
                break;
            case Opcode::VEC_IMM_BORROW:
            case Opcode::VEC_MUT_BORROW:
                popN(2);
                push(SymbolValue::unknown());
                break;
            case Opcode::VEC_LEN:
            case Opcode::VEC_POP_BACK:
            case Opcode::MUT_BORROW_FIELD:
            case Opcode::IMM_BORROW_FIELD:
                pop();
                push(SymbolValue::unknown());
                break;
            case Opcode::VEC_PACK:
                popN(static_cast<size_t>(instruction.operand));
                push(SymbolValue::unknown());
                break;
            case Opcode::VEC_UNPACK:
                pop();
                pushUnknown(static_cast<size_t>(instruction.operand));
                break;

            case Opcode::PACK:
            case Opcode::PACK_GENERIC:
            case Opcode::PACK_VARIANT:
                if (instruction.fieldCount) {
                    popN(*instruction.fieldCount);
                }
                push(SymbolValue::unknown());
                break;
            case Opcode::UNPACK:
            case Opcode::UNPACK_GENERIC:
            case Opcode::UNPACK_VARIANT:
                pop();
                if (instruction.fieldCount) {
                    pushUnknown(*instruction.fieldCount);
                }
                break;

            case Opcode::BRANCH:
            case Opcode::NOP:
            case Opcode::CALL:
            case Opcode::CALL_GENERIC:
            case Opcode::RET:
                break;
        }
    } catch (const z3::exception& e) {
        VIGIL_LOG_ERROR_F("Symbolic update of %s at pc %u failed: %s",
                          Trace::opcodeName(instruction.op), static_cast<unsigned>(pc), e.msg());
        return ErrorCode::SymbolicError;
    }
    return Constraint{};
}

// ============================================================================
// Frames
// ============================================================================

void ConcolicState::openFrame(const Trace::Frame& frame) {
    ShadowFrame shadow;
    const size_t paramCount = frame.parameters.size();
    const size_t available = std::min(paramCount, stack_.size());

    if (frames_.empty()) {
        const size_t command = commandArgs_.size();
        std::map<size_t, z3::expr> args;
        for (size_t i = 0; i < paramCount; ++i) {
            const TraceValue& param = frame.parameters[i];
            if (param.isPrimitive() && !param.isReference()) {
                std::string name = std::to_string(command) + "." + std::to_string(i);
                z3::expr variable = ctx_.int_const(name.c_str());
                args.emplace(i, variable);
                shadow.locals.emplace_back(variable);
            } else {
                shadow.locals.emplace_back();
            }
        }
        commandArgs_.push_back(std::move(args));
        stack_.resize(stack_.size() - available);
    } else {
        // Arguments sit on top of the caller's stack in parameter order
        shadow.locals.resize(paramCount - available);
        shadow.locals.insert(shadow.locals.end(),
                             stack_.end() - static_cast<std::ptrdiff_t>(available), stack_.end());
        stack_.resize(stack_.size() - available);
    }

    if (shadow.locals.size() < frame.localCount) {
        shadow.locals.resize(frame.localCount);
    }
    shadow.stackBase = stack_.size();
    frames_.push_back(std::move(shadow));
}

void ConcolicState::closeFrame(size_t returnCount) {
    size_t base = frames_.empty() ? 0 : frames_.back().stackBase;
    base = std::min(base, stack_.size());

    const size_t above = stack_.size() - base;
    const size_t kept = std::min(returnCount, above);

    std::vector<SymbolValue> results(stack_.end() - static_cast<std::ptrdiff_t>(kept), stack_.end());
    stack_.resize(base);
    pushUnknown(returnCount - kept);
    stack_.insert(stack_.end(), results.begin(), results.end());

    if (!frames_.empty()) {
        frames_.pop_back();
    }
}

void ConcolicState::reset() {
    stack_.clear();
    frames_.clear();
}

} // namespace Vigil::Concolic
