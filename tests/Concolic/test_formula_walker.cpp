/**
 * @file test_formula_walker.cpp
 * @brief Unit tests for bounded formula search
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Concolic/FormulaWalker.hpp>
#include <Vigil/Concolic/SymbolValue.hpp>
#include <gtest/gtest.h>

using namespace Vigil;
using namespace Vigil::Concolic;

class FormulaWalkerTest : public ::testing::Test {
protected:
    /// ((x / 2) + 1) + 2 ... + depth
    z3::expr deepChainOverDivision(int depth) {
        z3::expr e = ctx_.int_const("x") / ctx_.int_val(2);
        for (int i = 1; i <= depth; ++i) {
            e = e + ctx_.int_val(1000 + i);
        }
        return e;
    }

    z3::context ctx_;
};

// Test 1: Division found below the root
TEST_F(FormulaWalkerTest, FindsDivision) {
    z3::expr x = ctx_.int_const("x");
    EXPECT_TRUE(containsDivision((x / ctx_.int_val(3)) + ctx_.int_val(1)));
    EXPECT_FALSE(containsDivision((x * ctx_.int_val(3)) + ctx_.int_val(1)));
    EXPECT_FALSE(containsDivision(z3::mod(x, ctx_.int_val(3))));
}

// Test 2: Variables versus constant-folded formulas
TEST_F(FormulaWalkerTest, DetectsVariables) {
    z3::expr x = ctx_.int_const("0.0");
    EXPECT_EQ(containsVariable(x * ctx_.int_val(2)), std::optional<bool>(true));
    EXPECT_EQ(containsVariable(ctx_.int_val(2) + ctx_.int_val(3)), std::optional<bool>(false));
    EXPECT_EQ(containsVariable(z3::ite(ctx_.int_val(1) < ctx_.int_val(2),
                                       ctx_.int_val(1), ctx_.int_val(0))),
              std::optional<bool>(false));
}

// Test 3: Node cap terminates the walk as "no match"
TEST_F(FormulaWalkerTest, CapMeansNoMatch) {
    z3::expr chain = deepChainOverDivision(50);
    EXPECT_TRUE(containsDivision(chain));
    EXPECT_FALSE(containsDivision(chain, 10));
    EXPECT_FALSE(containsVariable(chain, 10).has_value());

    auto counted = findNode(chain, [](const z3::expr&) { return false; }, 10);
    EXPECT_EQ(counted, WalkResult::CapReached);
}

// Test 4: Shared sub-terms are visited once
TEST_F(FormulaWalkerTest, SharedNodesVisitedOnce) {
    z3::expr x = ctx_.int_const("x");
    z3::expr shared = x + ctx_.int_val(1);
    z3::expr e = shared;
    for (int i = 0; i < 64; ++i) {
        e = e * shared;  // DAG with many paths to `shared`
    }

    size_t visits = 0;
    auto result = findNode(e, [&visits](const z3::expr&) { ++visits; return false; });
    EXPECT_EQ(result, WalkResult::NotFound);
    EXPECT_LT(visits, 200u);
}

TEST(SymbolValueTest, UnknownAndFormula) {
    z3::context ctx;
    SymbolValue unknown;
    EXPECT_TRUE(unknown.isUnknown());
    EXPECT_EQ(unknown.toString(), "Unknown");

    SymbolValue value(ctx.int_val(7));
    EXPECT_TRUE(value.hasFormula());
    EXPECT_EQ(value.toString(), "7");
}
