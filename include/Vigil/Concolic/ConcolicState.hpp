/**
 * @file ConcolicState.hpp
 * @brief Symbolic shadow of the VM operand stack and frame locals
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * Every concrete operand has exactly one SymbolValue on the shadow stack,
 * in the same order. The trace engine re-establishes this before each
 * instruction (synchronize), lets oracles observe the pre-instruction
 * view, then applies the instruction's symbolic effect.
 *
 * Formulas live in the integer theory. Comparisons produce ite(c, 1, 0)
 * and record the branch taken as a path constraint; casts and left shifts
 * record the range constraint that would make them abort or overflow.
 */

#pragma once

#ifndef VIGIL_CONCOLIC_CONCOLIC_STATE_HPP
#define VIGIL_CONCOLIC_CONCOLIC_STATE_HPP

#include <Vigil/Core/ErrorCodes.hpp>
#include <Vigil/Concolic/SymbolValue.hpp>
#include <Vigil/Trace/TraceEvent.hpp>
#include <Vigil/Trace/TraceState.hpp>
#include <z3++.h>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace Vigil::Concolic {

/// Constraint produced by an instruction, if any
using Constraint = std::optional<z3::expr>;

/**
 * @brief Shadow locals and stack base of one live frame
 */
struct ShadowFrame {
    size_t stackBase = 0;
    std::vector<SymbolValue> locals;
};

class ConcolicState {
public:
    explicit ConcolicState(z3::context& ctx);

    // ------------------------------------------------------------------
    // Read access (oracles)
    // ------------------------------------------------------------------

    [[nodiscard]] const std::vector<SymbolValue>& stack() const noexcept { return stack_; }
    [[nodiscard]] size_t size() const noexcept { return stack_.size(); }
    [[nodiscard]] bool empty() const noexcept { return stack_.empty(); }

    /// Top `n` symbols in stack order, empty if fewer are present
    [[nodiscard]] std::span<const SymbolValue> lastN(size_t n) const noexcept;

    [[nodiscard]] size_t frameDepth() const noexcept { return frames_.size(); }
    [[nodiscard]] const std::vector<ShadowFrame>& frames() const noexcept { return frames_; }

    /// Symbolic parameters of each top-level command, keyed by parameter index
    [[nodiscard]] const std::vector<std::map<size_t, z3::expr>>& commandArgs() const noexcept {
        return commandArgs_;
    }

    [[nodiscard]] z3::context& context() const noexcept { return ctx_; }

    // ------------------------------------------------------------------
    // Mutation (trace engine)
    // ------------------------------------------------------------------

    void push(SymbolValue value);

    /// Pop the top symbol; Unknown when the shadow stack is empty
    SymbolValue pop();

    /**
     * @brief Re-establish the one-symbol-per-operand discipline
     *
     * An empty concrete stack clears the shadow; a deeper concrete stack is
     * padded with Unknown; a shallower one drops symbols from the top.
     * @return Number of slots that had to be added or dropped
     */
    size_t synchronize(size_t concreteDepth);

    /**
     * @brief Apply the symbolic effect of an instruction
     * @param concrete Concrete state *before* the instruction
     * @return The constraint the instruction implies, SymbolicError if the
     *         solver library rejected a formula
     */
    Result<Constraint> applyInstruction(ProgramCounter pc, const Trace::Instruction& instruction,
                                        const Trace::TraceState& concrete);

    /**
     * @brief Enter a frame
     *
     * The first frame of a command gets fresh variables "<command>.<param>"
     * for its primitive, non-reference parameters. Nested frames take their
     * arguments off the shadow stack.
     */
    void openFrame(const Trace::Frame& frame);

    /// Leave the innermost frame keeping `returnCount` symbols above its base
    void closeFrame(size_t returnCount);

    /// Forget stack and frames (new top-level command); command args are kept
    void reset();

private:
    std::optional<std::pair<z3::expr, z3::expr>> resolveOperands(
        const SymbolValue& lhs, const SymbolValue& rhs,
        std::span<const Trace::TraceValue> concrete) const;

    Constraint applyArithmetic(Trace::Opcode op, std::span<const Trace::TraceValue> concrete);
    Constraint applyBitwise(Trace::Opcode op, std::span<const Trace::TraceValue> concrete);
    Constraint applyShift(Trace::Opcode op, std::span<const Trace::TraceValue> concrete);
    Constraint applyComparison(Trace::Opcode op, std::span<const Trace::TraceValue> concrete);
    Constraint applyCast(Trace::Opcode op);
    void applyLocal(ProgramCounter pc, const Trace::Instruction& instruction);

    void popN(size_t n);
    void pushUnknown(size_t n);

    z3::expr numeral(const U256& value) const;
    z3::expr twoPow(uint32_t bits) const;
    z3::expr maxUnsigned(uint32_t bits) const;

    z3::context& ctx_;
    std::vector<SymbolValue> stack_;
    std::vector<ShadowFrame> frames_;
    std::vector<std::map<size_t, z3::expr>> commandArgs_;
};

} // namespace Vigil::Concolic

#endif // VIGIL_CONCOLIC_CONCOLIC_STATE_HPP
