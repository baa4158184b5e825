#include <gtest/gtest.h>

#include <limits>
#include <memory>

#include "dice_roller.hpp"
#include "errors.hpp"
#include "range_roller.hpp"
#include "test_support.hpp"

using dice::RangeError;
using dice::RangeRoller;
using dice::testing::BoundRandomSource;

TEST(RangeRoller, DegenerateRangeReturnsBound) {
    EXPECT_EQ(dice::rollRange(3, 3), 3);
    EXPECT_EQ(dice::rollRange(4, 4), 4);
    EXPECT_EQ(dice::rollRange(-7, -7), -7);
}

TEST(RangeRoller, StaysWithinInclusiveBounds) {
    for (int i = 0; i < 1000; ++i) {
        auto value = dice::rollRange(-5, 5);
        EXPECT_GE(value, -5);
        EXPECT_LE(value, 5);
    }
}

TEST(RangeRoller, ReachesBothBounds) {
    RangeRoller low(std::make_shared<BoundRandomSource>(false));
    RangeRoller high(std::make_shared<BoundRandomSource>(true));

    EXPECT_EQ(low.roll(1, 20), 1);
    EXPECT_EQ(high.roll(1, 20), 20);
}

TEST(RangeRoller, SwappedBoundsFail) {
    EXPECT_THROW(dice::rollRange(5, 1), RangeError);
    EXPECT_THROW(dice::rollRange(12, 1), RangeError);

    try {
        dice::rollRange(5, 1);
        FAIL() << "expected RangeError";
    } catch (const RangeError& ex) {
        EXPECT_EQ(ex.low(), 5);
        EXPECT_EQ(ex.high(), 1);
    }
}

TEST(RangeRoller, SwappedBoundsDoNotConsumeRandomness) {
    auto source = std::make_shared<BoundRandomSource>(false);
    RangeRoller roller(source);

    EXPECT_THROW(roller.roll(2, 1), RangeError);
    EXPECT_EQ(source->calls, 0u);
}

TEST(RangeRoller, FullIntegerRange) {
    RangeRoller roller(std::make_shared<dice::MersenneRandomSource>(7));
    EXPECT_NO_THROW(roller.roll(std::numeric_limits<std::int64_t>::min(),
                                std::numeric_limits<std::int64_t>::max()));
}
