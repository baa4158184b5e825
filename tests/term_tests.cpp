#include <gtest/gtest.h>

#include <sstream>

#include "term.hpp"

using dice::Term;

TEST(Term, DieRollTextHasSignOnlyWhenNegative) {
    EXPECT_EQ(Term::dieRoll(3, 6).toString(), "3d6");
    EXPECT_EQ(Term::dieRoll(2, 4, -1).toString(), "-2d4");
}

TEST(Term, ModifierTextAlwaysSigned) {
    EXPECT_EQ(Term::modifier(5).toString(), "+5");
    EXPECT_EQ(Term::modifier(6, -1).toString(), "-6");
}

TEST(Term, StreamsTextForm) {
    std::ostringstream out;
    out << Term::dieRoll(1, 20) << " " << Term::modifier(3, -1);
    EXPECT_EQ(out.str(), "1d20 -3");
}

TEST(Term, SignIsNormalized) {
    EXPECT_EQ(Term::modifier(1, -5).sign, -1);
    EXPECT_EQ(Term::dieRoll(1, 6, 7).sign, 1);
}
