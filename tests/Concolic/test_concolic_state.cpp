/**
 * @file test_concolic_state.cpp
 * @brief Unit tests for the symbolic shadow stack
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Concolic/ConcolicState.hpp>
#include <Vigil/Concolic/FormulaWalker.hpp>
#include <gtest/gtest.h>

using namespace Vigil;
using namespace Vigil::Concolic;
using Vigil::Trace::Instruction;
using Vigil::Trace::Opcode;
using Vigil::Trace::TraceValue;

/**
 * Drives TraceState and ConcolicState the way the engine does, minus the
 * resynchronisation, so any modelling drift shows up as a size mismatch.
 */
class ConcolicStateTest : public ::testing::Test {
protected:
    ConcolicStateTest() : symbols_(ctx_) {}

    void enter(FrameId id, std::vector<TraceValue> params, size_t localCount) {
        Trace::Frame frame;
        frame.frameId = id;
        frame.function = Trace::FunctionIdent{"0x1::vault", "withdraw"};
        frame.parameters = std::move(params);
        frame.localCount = localCount;
        ASSERT_TRUE(trace_.apply(Trace::OpenFrameEvent{frame}).isSuccess());
        symbols_.openFrame(frame);
    }

    Constraint exec(Instruction instruction, size_t pops, std::vector<TraceValue> pushes = {}) {
        auto result = symbols_.applyInstruction(pc_++, instruction, trace_);
        EXPECT_TRUE(result.isSuccess());
        for (size_t i = 0; i < pops; ++i) {
            EXPECT_TRUE(trace_.apply(Trace::EffectEvent{Trace::PopEffect{}}).isSuccess());
        }
        for (auto& value : pushes) {
            EXPECT_TRUE(trace_.apply(Trace::EffectEvent{Trace::PushEffect{std::move(value)}}).isSuccess());
        }
        EXPECT_EQ(symbols_.size(), trace_.operandStack().size());
        return result.isSuccess() ? result.value() : Constraint{};
    }

    z3::expr arg(size_t command, size_t param) {
        std::string name = std::to_string(command) + "." + std::to_string(param);
        return ctx_.int_const(name.c_str());
    }

    z3::context ctx_;
    Trace::TraceState trace_;
    ConcolicState symbols_;
    ProgramCounter pc_ = 0;
};

// Test 1: Entry frame creates one variable per primitive parameter
TEST_F(ConcolicStateTest, EntryFrameArguments) {
    enter(1, {TraceValue::u64(5), TraceValue::vector(2), TraceValue::u8(1).asReference(Trace::RefKind::Immutable)}, 4);

    ASSERT_EQ(symbols_.commandArgs().size(), 1u);
    const auto& args = symbols_.commandArgs()[0];
    ASSERT_EQ(args.size(), 1u);
    EXPECT_TRUE(z3::eq(args.at(0), arg(0, 0)));

    ASSERT_EQ(symbols_.frames().size(), 1u);
    const auto& locals = symbols_.frames()[0].locals;
    ASSERT_EQ(locals.size(), 4u);
    EXPECT_TRUE(locals[0].hasFormula());
    EXPECT_TRUE(locals[1].isUnknown());
    EXPECT_TRUE(locals[2].isUnknown());
}

// Test 2: Scripted stream keeps one symbol per operand
TEST_F(ConcolicStateTest, ShadowStackDiscipline) {
    enter(1, {TraceValue::u64(40), TraceValue::u64(3)}, 3);

    exec({Opcode::COPY_LOC, 0}, 0, {TraceValue::u64(40)});
    exec({Opcode::MOVE_LOC, 1}, 0, {TraceValue::u64(3)});
    exec({Opcode::DIV}, 2, {TraceValue::u64(13)});
    exec({Opcode::LD_U64}, 0, {TraceValue::u64(2)});
    exec({Opcode::MUL}, 2, {TraceValue::u64(26)});
    exec({Opcode::ST_LOC, 2}, 1);
    exec({Opcode::COPY_LOC, 2}, 0, {TraceValue::u64(26)});
    exec({Opcode::CAST_U8}, 1, {TraceValue::u8(26)});
    exec({Opcode::LD_U8}, 0, {TraceValue::u8(4)});
    exec({Opcode::SHL}, 2, {TraceValue::u8(160)});
    exec({Opcode::LD_U8}, 0, {TraceValue::u8(100)});
    exec({Opcode::GT}, 2, {TraceValue::boolean(true)});
    exec({Opcode::BR_TRUE, 20}, 1);
    exec({Opcode::VEC_PACK, 0}, 0, {TraceValue::vector(0)});
    exec({Opcode::VEC_LEN}, 1, {TraceValue::u64(0)});
    exec({Opcode::POP}, 1);
    exec({Opcode::LD_TRUE}, 0, {TraceValue::boolean(true)});
    exec({Opcode::NOT}, 1, {TraceValue::boolean(false)});
    exec({Opcode::RET}, 0);

    EXPECT_EQ(symbols_.size(), 1u);
}

// Test 3: Arithmetic builds formulas, substituting concrete values for Unknown
TEST_F(ConcolicStateTest, ArithmeticFormula) {
    enter(1, {TraceValue::u64(40)}, 1);

    exec({Opcode::COPY_LOC, 0}, 0, {TraceValue::u64(40)});
    exec({Opcode::LD_U64}, 0, {TraceValue::u64(4)});
    exec({Opcode::DIV}, 2, {TraceValue::u64(10)});

    ASSERT_TRUE(symbols_.stack().back().hasFormula());
    EXPECT_TRUE(z3::eq(symbols_.stack().back().formula(), arg(0, 0) / ctx_.int_val(4)));
    EXPECT_TRUE(containsDivision(symbols_.stack().back().formula()));
}

TEST_F(ConcolicStateTest, BothUnknownStaysUnknown) {
    enter(1, {}, 0);
    exec({Opcode::LD_U64}, 0, {TraceValue::u64(1)});
    exec({Opcode::LD_U64}, 0, {TraceValue::u64(2)});
    exec({Opcode::ADD}, 2, {TraceValue::u64(3)});
    EXPECT_TRUE(symbols_.stack().back().isUnknown());
}

// Test 4: Comparisons record the branch actually taken
TEST_F(ConcolicStateTest, ComparisonConstraint) {
    enter(1, {TraceValue::u64(3)}, 1);

    exec({Opcode::COPY_LOC, 0}, 0, {TraceValue::u64(3)});
    exec({Opcode::LD_U64}, 0, {TraceValue::u64(5)});
    Constraint taken = exec({Opcode::LT}, 2, {TraceValue::boolean(true)});

    z3::expr cond = arg(0, 0) < ctx_.int_val(5);
    ASSERT_TRUE(taken.has_value());
    EXPECT_TRUE(z3::eq(*taken, cond));
    EXPECT_TRUE(z3::eq(symbols_.stack().back().formula(),
                       z3::ite(cond, ctx_.int_val(1), ctx_.int_val(0))));

    exec({Opcode::POP}, 1);
    exec({Opcode::COPY_LOC, 0}, 0, {TraceValue::u64(3)});
    exec({Opcode::LD_U64}, 0, {TraceValue::u64(5)});
    Constraint notTaken = exec({Opcode::GE}, 2, {TraceValue::boolean(false)});
    ASSERT_TRUE(notTaken.has_value());
    EXPECT_TRUE(z3::eq(*notTaken, !(arg(0, 0) >= ctx_.int_val(5))));
}

// Test 5: Left shift of a symbol yields wrap-around and overflow constraint
TEST_F(ConcolicStateTest, ShiftLeftConstraint) {
    enter(1, {TraceValue::u8(5)}, 1);

    exec({Opcode::COPY_LOC, 0}, 0, {TraceValue::u8(5)});
    exec({Opcode::LD_U8}, 0, {TraceValue::u8(4)});
    Constraint overflow = exec({Opcode::SHL}, 2, {TraceValue::u8(80)});

    z3::expr product = arg(0, 0) * ctx_.int_val(16);
    ASSERT_TRUE(overflow.has_value());
    EXPECT_TRUE(z3::eq(*overflow, product > ctx_.int_val(255)));
    EXPECT_TRUE(z3::eq(symbols_.stack().back().formula(), z3::mod(product, ctx_.int_val(256))));
}

TEST_F(ConcolicStateTest, ShiftRightHasNoConstraint) {
    enter(1, {TraceValue::u64(64)}, 1);

    exec({Opcode::COPY_LOC, 0}, 0, {TraceValue::u64(64)});
    exec({Opcode::LD_U8}, 0, {TraceValue::u8(3)});
    Constraint none = exec({Opcode::SHR}, 2, {TraceValue::u64(8)});

    EXPECT_FALSE(none.has_value());
    EXPECT_TRUE(z3::eq(symbols_.stack().back().formula(), arg(0, 0) / ctx_.int_val(8)));
}

// Test 6: Narrowing casts record the range constraint, stack unchanged
TEST_F(ConcolicStateTest, CastConstraint) {
    enter(1, {TraceValue::u64(300)}, 1);

    exec({Opcode::COPY_LOC, 0}, 0, {TraceValue::u64(300)});
    Constraint range = exec({Opcode::CAST_U8}, 1, {TraceValue::u8(44)});
    ASSERT_TRUE(range.has_value());
    EXPECT_TRUE(z3::eq(*range, arg(0, 0) <= ctx_.int_val(255)));
    EXPECT_TRUE(z3::eq(symbols_.stack().back().formula(), arg(0, 0)));

    Constraint wide = exec({Opcode::CAST_U256}, 1, {TraceValue::u256(44)});
    EXPECT_FALSE(wide.has_value());
}

// Test 7: Bit operations need exactly one symbolic side
TEST_F(ConcolicStateTest, BitwiseMask) {
    enter(1, {TraceValue::u8(0xAB)}, 1);

    exec({Opcode::COPY_LOC, 0}, 0, {TraceValue::u8(0xAB)});
    exec({Opcode::LD_U8}, 0, {TraceValue::u8(0x0F)});
    exec({Opcode::BIT_AND}, 2, {TraceValue::u8(0x0B)});

    ASSERT_TRUE(symbols_.stack().back().hasFormula());
    z3::expr expected = z3::bv2int(z3::int2bv(8, arg(0, 0)) & ctx_.bv_val("15", 8), false);
    EXPECT_TRUE(z3::eq(symbols_.stack().back().formula(), expected));

    // Both symbolic: not modelled
    exec({Opcode::COPY_LOC, 0}, 0, {TraceValue::u8(0xAB)});
    exec({Opcode::XOR}, 2, {TraceValue::u8(0xA0)});
    EXPECT_TRUE(symbols_.stack().back().isUnknown());
}

// Test 8: Nested frames take arguments from the caller and return results
TEST_F(ConcolicStateTest, NestedFrameAndReturn) {
    enter(1, {TraceValue::u64(8)}, 1);
    exec({Opcode::LD_U64}, 0, {TraceValue::u64(1)});
    exec({Opcode::COPY_LOC, 0}, 0, {TraceValue::u64(8)});
    exec({Opcode::CALL}, 0);

    enter(2, {TraceValue::u64(8)}, 2);
    EXPECT_EQ(symbols_.size(), 1u);
    ASSERT_EQ(symbols_.frames().size(), 2u);
    EXPECT_EQ(symbols_.frames().back().stackBase, 1u);
    ASSERT_TRUE(symbols_.frames().back().locals[0].hasFormula());
    EXPECT_TRUE(z3::eq(symbols_.frames().back().locals[0].formula(), arg(0, 0)));

    exec({Opcode::COPY_LOC, 0}, 0, {TraceValue::u64(8)});
    exec({Opcode::LD_U64}, 0, {TraceValue::u64(2)});
    exec({Opcode::MUL}, 2, {TraceValue::u64(16)});
    exec({Opcode::RET}, 0);

    symbols_.closeFrame(1);
    ASSERT_TRUE(trace_.apply(Trace::CloseFrameEvent{2, 1}).isSuccess());
    ASSERT_EQ(symbols_.size(), 2u);
    EXPECT_TRUE(symbols_.stack()[0].isUnknown());
    EXPECT_TRUE(z3::eq(symbols_.stack()[1].formula(), arg(0, 0) * ctx_.int_val(2)));
    EXPECT_EQ(symbols_.frames().size(), 1u);
}

// Test 9: Close with fewer results than declared pads with Unknown
TEST_F(ConcolicStateTest, ClosePadsMissingResults) {
    enter(1, {}, 0);
    symbols_.push(SymbolValue(ctx_.int_val(5)));
    enter(2, {}, 0);
    symbols_.closeFrame(2);
    ASSERT_EQ(symbols_.size(), 3u);
    EXPECT_TRUE(symbols_.stack()[1].isUnknown());
    EXPECT_TRUE(symbols_.stack()[2].isUnknown());
}

// Test 10: Resynchronisation pads, truncates and clears
TEST_F(ConcolicStateTest, Synchronize) {
    EXPECT_EQ(symbols_.synchronize(3), 3u);
    EXPECT_EQ(symbols_.size(), 3u);
    EXPECT_EQ(symbols_.synchronize(3), 0u);
    EXPECT_EQ(symbols_.synchronize(1), 2u);
    EXPECT_EQ(symbols_.size(), 1u);
    symbols_.synchronize(0);
    EXPECT_TRUE(symbols_.empty());
}

// Test 11: Underflow of the shadow stack is ignored
TEST_F(ConcolicStateTest, PopOnEmptyIsIgnored) {
    auto result = symbols_.applyInstruction(0, Instruction(Opcode::POP), trace_);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(symbols_.empty());
}

// Test 12: A new command starts a fresh naming scope
TEST_F(ConcolicStateTest, CommandIndexAdvances) {
    enter(1, {TraceValue::u64(1)}, 1);
    symbols_.reset();
    ASSERT_TRUE(trace_.apply(Trace::ExternalEvent{MOVE_CALL_START_MARKER}).isSuccess());
    enter(1, {TraceValue::u64(2), TraceValue::u64(3)}, 2);

    ASSERT_EQ(symbols_.commandArgs().size(), 2u);
    EXPECT_TRUE(z3::eq(symbols_.commandArgs()[1].at(1), arg(1, 1)));
}

// Test 13: Struct effects without field count leave the rest to resync
TEST_F(ConcolicStateTest, PackWithoutFieldCount) {
    enter(1, {}, 0);
    symbols_.synchronize(2);
    auto result = symbols_.applyInstruction(0, Instruction(Opcode::PACK), trace_);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(symbols_.size(), 3u);

    result = symbols_.applyInstruction(1, Instruction(Opcode::PACK, 0, 2u), trace_);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(symbols_.size(), 2u);
}
