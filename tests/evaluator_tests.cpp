#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <vector>

#include "errors.hpp"
#include "evaluator.hpp"
#include "parser.hpp"
#include "test_support.hpp"

using dice::RollEvaluator;
using dice::Term;
using dice::testing::BoundRandomSource;
using dice::testing::ScriptedRandomSource;

TEST(RollEvaluator, SumsDiceAndAppliesSigns) {
    auto source = std::make_shared<ScriptedRandomSource>(std::vector<std::int64_t>{3, 5, 2, 4});
    RollEvaluator evaluator(source);

    // 2d6 -> 3 + 5, -2d4 -> -(2 + 4), +7
    auto roll = evaluator.evaluate(std::vector<Term>{
        Term::dieRoll(2, 6), Term::dieRoll(2, 4, -1), Term::modifier(7)});

    EXPECT_EQ(roll.total(), 3 + 5 - (2 + 4) + 7);
    ASSERT_EQ(roll.outcomes().size(), 3u);
    EXPECT_EQ(roll.outcomes()[0].values, (std::vector<std::int64_t>{3, 5}));
    EXPECT_EQ(roll.outcomes()[0].subtotal, 8);
    EXPECT_EQ(roll.outcomes()[1].values, (std::vector<std::int64_t>{2, 4}));
    EXPECT_EQ(roll.outcomes()[1].subtotal, -6);
    EXPECT_EQ(roll.outcomes()[2].values, (std::vector<std::int64_t>{7}));
    EXPECT_EQ(roll.outcomes()[2].subtotal, 7);
}

TEST(RollEvaluator, DrawsEachDieFromOneToSides) {
    auto source = std::make_shared<ScriptedRandomSource>(std::vector<std::int64_t>{1, 1, 1, 20});
    RollEvaluator evaluator(source);

    evaluator.evaluate(std::vector<Term>{Term::dieRoll(3, 8), Term::modifier(2), Term::dieRoll(1, 20)});

    ASSERT_EQ(source->requests.size(), 4u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(source->requests[i].first, 1);
        EXPECT_EQ(source->requests[i].second, 8);
    }
    EXPECT_EQ(source->requests[3].first, 1);
    EXPECT_EQ(source->requests[3].second, 20);
}

TEST(RollEvaluator, ModifiersConsumeNoRandomness) {
    auto source = std::make_shared<BoundRandomSource>(false);
    RollEvaluator evaluator(source);

    auto roll = evaluator.evaluate(dice::parseTerms("+6-2+10"));

    EXPECT_EQ(roll.total(), 14);
    EXPECT_EQ(source->calls, 0u);
}

TEST(RollEvaluator, TotalMayBeNegative) {
    RollEvaluator evaluator(std::make_shared<BoundRandomSource>(true));
    auto roll = evaluator.evaluate(dice::parseTerms("-3d4-1"));
    EXPECT_EQ(roll.total(), -13);
}

TEST(RollEvaluator, MinimumAndMaximumBounds) {
    auto terms = dice::parseTerms("3d10+5d100-21+7");

    RollEvaluator low(std::make_shared<BoundRandomSource>(false));
    RollEvaluator high(std::make_shared<BoundRandomSource>(true));

    EXPECT_EQ(low.evaluate(terms).total(), -11);
    EXPECT_EQ(high.evaluate(terms).total(), 516);
}

TEST(RollEvaluator, LargestAllowedTermFitsIn64Bits) {
    RollEvaluator evaluator(std::make_shared<BoundRandomSource>(true));
    auto roll = evaluator.evaluate(dice::parseTerms("10000d1000000000-1000000000"));
    EXPECT_EQ(roll.total(), 10000LL * 1000000000LL - 1000000000LL);
}

TEST(RollEvaluator, ReportsOverflowInsteadOfWrapping) {
    // Источник, нарушающий контракт, позволяет проверить ветку переполнения
    auto source = std::make_shared<ScriptedRandomSource>(
        std::vector<std::int64_t>{std::numeric_limits<std::int64_t>::max(), 1});
    RollEvaluator evaluator(source);

    EXPECT_THROW(evaluator.evaluate(std::vector<Term>{Term::dieRoll(2, 6)}), dice::OverflowError);
}

TEST(RollEvaluator, EvaluateTermReturnsLiteralForModifier) {
    RollEvaluator evaluator(std::make_shared<BoundRandomSource>(true));

    auto outcome = evaluator.evaluateTerm(Term::modifier(7, -1));
    ASSERT_EQ(outcome.values.size(), 1u);
    EXPECT_EQ(outcome.values[0], 7);
    EXPECT_EQ(outcome.subtotal, -7);

    auto dieOutcome = evaluator.evaluateTerm(Term::dieRoll(4, 1, -1));
    EXPECT_EQ(dieOutcome.values, (std::vector<std::int64_t>{1, 1, 1, 1}));
    EXPECT_EQ(dieOutcome.subtotal, -4);
}
