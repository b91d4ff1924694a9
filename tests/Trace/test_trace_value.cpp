/**
 * @file test_trace_value.cpp
 * @brief Unit tests for concrete trace values
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Trace/TraceValue.hpp>
#include <Vigil/Trace/Bytecode.hpp>
#include <gtest/gtest.h>

using namespace Vigil;
using namespace Vigil::Trace;

TEST(TraceValueTest, WidthsOfPrimitives) {
    EXPECT_EQ(TraceValue::boolean(true).bitWidth().value(), 1u);
    EXPECT_EQ(TraceValue::u8(1).bitWidth().value(), 8u);
    EXPECT_EQ(TraceValue::u64(1).bitWidth().value(), 64u);
    EXPECT_EQ(TraceValue::u256(1).bitWidth().value(), 256u);
}

TEST(TraceValueTest, NonPrimitivesAreOpaque) {
    auto vec = TraceValue::vector(3);
    EXPECT_FALSE(vec.isPrimitive());
    EXPECT_EQ(vec.bitWidth().error(), ErrorCode::NotPrimitive);
    EXPECT_EQ(TraceValue::address("0x2").asU256().error(), ErrorCode::NotPrimitive);
    EXPECT_EQ(TraceValue::structure("0x2::coin::Coin").significantBits().error(),
              ErrorCode::NotPrimitive);
}

TEST(TraceValueTest, SignificantBits) {
    EXPECT_EQ(TraceValue::u8(0).significantBits().value(), 0u);
    EXPECT_EQ(TraceValue::u8(1).significantBits().value(), 1u);
    EXPECT_EQ(TraceValue::u8(5).significantBits().value(), 3u);
    EXPECT_EQ(TraceValue::u8(255).significantBits().value(), 8u);

    U256 top = U256(1) << 255;
    EXPECT_EQ(TraceValue::u256(top).significantBits().value(), 256u);
}

TEST(TraceValueTest, IntegerTruncatesToKind) {
    auto value = TraceValue::integer(ValueKind::U8, 0x1FF);
    EXPECT_EQ(value.asU256().value(), U256(0xFF));
}

TEST(TraceValueTest, ReferencesReadThrough) {
    auto ref = TraceValue::u64(7).asReference(RefKind::Mutable);
    EXPECT_TRUE(ref.isReference());
    EXPECT_TRUE(ref.isPrimitive());
    EXPECT_EQ(ref.bitWidth().value(), 64u);
    EXPECT_EQ(ref.asU256().value(), U256(7));
    EXPECT_EQ(ref.toString(), "&mut U64(7)");
}

TEST(TraceValueTest, CompareSameKind) {
    EXPECT_LT(compareValues(TraceValue::u64(3), TraceValue::u64(5)).value(), 0);
    EXPECT_EQ(compareValues(TraceValue::u64(5), TraceValue::u64(5)).value(), 0);
    EXPECT_GT(compareValues(TraceValue::boolean(true), TraceValue::boolean(false)).value(), 0);
}

TEST(TraceValueTest, CompareMismatchedKindsIsMalformed) {
    EXPECT_EQ(compareValues(TraceValue::u8(1), TraceValue::u64(1)).error(), ErrorCode::MalformedTrace);
    EXPECT_EQ(compareValues(TraceValue::vector(0), TraceValue::vector(0)).error(),
              ErrorCode::MalformedTrace);
}

TEST(BytecodeTest, OpcodeMetadata) {
    EXPECT_TRUE(isConditionalBranch(Opcode::BR_TRUE));
    EXPECT_FALSE(isConditionalBranch(Opcode::BRANCH));
    EXPECT_TRUE(isComparison(Opcode::GE));
    EXPECT_FALSE(isComparison(Opcode::ADD));
    EXPECT_EQ(castTargetWidth(Opcode::CAST_U16), 16u);
    EXPECT_EQ(castTargetWidth(Opcode::MUL), 0u);
    EXPECT_STREQ(opcodeName(Opcode::BR_TRUE), "BrTrue");
}
