// -*- c++ -*-
// Unit tests for interval arithmetic

#include <gtest/gtest.h>

#include "arithmetic.hpp"

using AsymInt::Ain;

class ArithmeticTest : public ::testing::Test {
   protected:
    static void expect_ain(const Ain& a, double lower, double upper, double expected) {
        EXPECT_NEAR(a.lower(), lower, 1e-12);
        EXPECT_NEAR(a.upper(), upper, 1e-12);
        EXPECT_NEAR(a.expected(), expected, 1e-12);
    }

    static void expect_inside(const Ain& a) {
        if (a.is_degenerate()) {
            EXPECT_DOUBLE_EQ(a.lower(), a.upper());
            EXPECT_DOUBLE_EQ(a.expected(), a.lower());
        } else {
            EXPECT_LT(a.lower(), a.expected());
            EXPECT_LT(a.expected(), a.upper());
        }
    }
};

TEST_F(ArithmeticTest, Negate) {
    expect_ain(-Ain(1.0, 4.0, 2.0), -4.0, -1.0, -2.0);
    expect_ain(AsymInt::negate(Ain(3.0, 3.0, 3.0)), -3.0, -3.0, -3.0);
}

TEST_F(ArithmeticTest, AddIntervals) {
    expect_ain(Ain(0.0, 10.0, 2.0) + Ain(2.0, 8.0, 3.0), 2.0, 18.0, 5.0);
}

TEST_F(ArithmeticTest, AddDegenerateIsIdentity) {
    EXPECT_EQ(Ain(0.0, 10.0, 5.0) + Ain(0.0, 0.0, 0.0), Ain(0.0, 10.0, 5.0));
}

TEST_F(ArithmeticTest, ShiftFarFromOriginCollapsesNarrowInterval) {
    // 1e6 + 1e-10 rounds to the next double above 1e6: nothing lies in between
    Ain r;
    ASSERT_NO_THROW(r = Ain(0.0, 1e-10, 5e-11) + 1e6);
    EXPECT_TRUE(r.is_degenerate());
    EXPECT_DOUBLE_EQ(r.expected(), 1e6);

    Ain s;
    ASSERT_NO_THROW(s = Ain(0.0, 1e-10, 5e-11) + Ain(1e6, 1e6, 1e6));
    EXPECT_EQ(r, s);
}

TEST_F(ArithmeticTest, AddScalarBothSides) {
    expect_ain(Ain(0.0, 10.0, 2.0) + 1.5, 1.5, 11.5, 3.5);
    expect_ain(1.5 + Ain(0.0, 10.0, 2.0), 1.5, 11.5, 3.5);
}

TEST_F(ArithmeticTest, SubtractIntervals) {
    expect_ain(Ain(0.0, 10.0, 2.0) - Ain(2.0, 8.0, 3.0), -8.0, 8.0, -1.0);
}

TEST_F(ArithmeticTest, SubtractScalarBothSides) {
    expect_ain(Ain(1.0, 4.0, 2.0) - 1.0, 0.0, 3.0, 1.0);
    expect_ain(10.0 - Ain(1.0, 4.0, 2.0), 6.0, 9.0, 8.0);
}

TEST_F(ArithmeticTest, SubtractIsAddNegated) {
    Ain x(0.0, 10.0, 2.0);
    Ain y(2.0, 8.0, 3.0);
    EXPECT_EQ(x - y, x + (-y));
}

TEST_F(ArithmeticTest, MultiplyIntervals) {
    expect_ain(Ain(1.0, 4.0, 2.0) * Ain(2.0, 4.0, 3.0), 2.0, 16.0, 6.0);
    expect_ain(Ain(-1.0, 2.0, 0.5) * Ain(1.0, 3.0, 2.0), -3.0, 6.0, 1.0);
}

TEST_F(ArithmeticTest, MultiplyScalar) {
    expect_ain(Ain(1.0, 4.0, 2.0) * 3.0, 3.0, 12.0, 6.0);
    expect_ain(-2.0 * Ain(1.0, 4.0, 2.0), -8.0, -2.0, -4.0);

    Ain zero = Ain(1.0, 4.0, 2.0) * 0.0;
    EXPECT_TRUE(zero.is_degenerate());
    EXPECT_DOUBLE_EQ(zero.expected(), 0.0);
}

TEST_F(ArithmeticTest, DivideIntervals) {
    // E[X / Y] = E[X] E[1/Y] with E[1/Y] = ln(2) / 2 for Y = AIN(2, 4, 3)
    expect_ain(Ain(4.0, 8.0, 6.0) / Ain(2.0, 4.0, 3.0), 1.0, 4.0, 2.0794415416798353);
}

TEST_F(ArithmeticTest, DivideByScalar) {
    expect_ain(Ain(0.0, 10.0, 2.0) / 2.0, 0.0, 5.0, 1.0);
    expect_ain(Ain(0.0, 10.0, 2.0) / -2.0, -5.0, 0.0, -1.0);
}

TEST_F(ArithmeticTest, DivideByDegenerateIntervalUsesMidpoint) {
    expect_ain(Ain(0.0, 10.0, 2.0) / Ain(2.0, 2.0, 2.0), 0.0, 5.0, 2.5);
}

TEST_F(ArithmeticTest, ScalarDividedByInterval) {
    Ain q = 10.0 / Ain(2.0, 4.0, 3.0);
    EXPECT_NEAR(q.lower(), 2.5, 1e-12);
    EXPECT_NEAR(q.upper(), 5.0, 1e-12);
    EXPECT_NEAR(q.expected(), 3.465735902799726, 1e-12);
}

TEST_F(ArithmeticTest, DivideByIntervalJustAboveZero) {
    Ain q;
    ASSERT_NO_THROW(q = Ain(2.0, 4.0, 3.0) / Ain(1e-13, 1.0));
    EXPECT_NEAR(q.lower(), 2.0, 1e-12);
    EXPECT_NEAR(q.upper(), 4e13, 1e-1);
    expect_inside(q);
}

TEST_F(ArithmeticTest, DivisionByZero) {
    EXPECT_THROW(Ain(0.0, 10.0, 2.0) / 0.0, AsymInt::DomainError);
    EXPECT_THROW(Ain(0.0, 10.0, 2.0) / Ain(-1.0, 1.0, 0.0), AsymInt::DomainError);
    EXPECT_THROW(Ain(0.0, 10.0, 2.0) / Ain(0.0, 2.0, 1.0), AsymInt::DomainError);
    EXPECT_THROW(Ain(0.0, 10.0, 2.0) / Ain(0.0, 0.0, 0.0), AsymInt::DomainError);
}

TEST_F(ArithmeticTest, IntegerPower) {
    expect_ain(AsymInt::power(Ain(4.0, 8.0, 5.0), 2.0), 16.0, 64.0, 26.0);
}

TEST_F(ArithmeticTest, EvenPowerAcrossZero) {
    expect_ain(AsymInt::power(Ain(-2.0, 2.0, 0.5), 2.0), 0.0, 4.0, 1.5);
}

TEST_F(ArithmeticTest, OddPowerAcrossZero) {
    Ain c = AsymInt::power(Ain(-2.0, 2.0, 0.5), 3.0);
    EXPECT_DOUBLE_EQ(c.lower(), -8.0);
    EXPECT_DOUBLE_EQ(c.upper(), 8.0);
    EXPECT_NEAR(c.expected(), 1.0625, 1e-12);
}

TEST_F(ArithmeticTest, FractionalPower) {
    Ain r = AsymInt::power(Ain(1.0, 4.0, 2.0), 0.5);
    EXPECT_NEAR(r.lower(), 1.0, 1e-12);
    EXPECT_NEAR(r.upper(), 2.0, 1e-12);
    EXPECT_NEAR(r.expected(), 1.3872534860265078, 1e-12);
}

TEST_F(ArithmeticTest, ReciprocalPower) {
    Ain r = AsymInt::power(Ain(2.0, 4.0, 3.0), -1.0);
    EXPECT_NEAR(r.lower(), 0.25, 1e-12);
    EXPECT_NEAR(r.upper(), 0.5, 1e-12);
    EXPECT_NEAR(r.expected(), 0.3465735902799726, 1e-12);
}

TEST_F(ArithmeticTest, ReciprocalOfIntervalJustAboveZero) {
    Ain r;
    ASSERT_NO_THROW(r = AsymInt::power(Ain(1e-13, 1.0), -1.0));
    EXPECT_DOUBLE_EQ(r.lower(), 1.0);
    EXPECT_NEAR(r.upper(), 1e13, 1e-2);
    expect_inside(r);
}

TEST_F(ArithmeticTest, ReciprocalOfIntervalContainingZero) {
    EXPECT_THROW(AsymInt::power(Ain(-2.0, 10.0, 3.0), -1.0), AsymInt::DomainError);
}

TEST_F(ArithmeticTest, SquareOfNarrowInterval) {
    // E[X^2] lies within a few ulps of the lower bound 1
    Ain r;
    ASSERT_NO_THROW(r = AsymInt::power(Ain(1.0, 1.0 + 1e-9), 2.0));
    EXPECT_FALSE(r.is_degenerate());
    EXPECT_DOUBLE_EQ(r.lower(), 1.0);
    EXPECT_NEAR(r.expected(), 1.0 + 1e-9, 1e-15);
    expect_inside(r);
}

TEST_F(ArithmeticTest, NarrowIntervalsAwayFromOrigin) {
    Ain x(1e6, 1e6 + 1e-3);
    Ain y(2.0, 2.0 + 1e-9, 2.0 + 4e-10);
    for (const Ain& r : {x * y, x / y, x - y, AsymInt::power(x, 3.0), AsymInt::power(y, -1.0),
                         AsymInt::power(x, 0.5)}) {
        expect_inside(r);
    }
}

TEST_F(ArithmeticTest, NegativePowerOfNegativeInterval) {
    Ain r = AsymInt::power(Ain(-2.0, -1.0, -1.5), -2.0);
    EXPECT_NEAR(r.lower(), 0.25, 1e-12);
    EXPECT_NEAR(r.upper(), 1.0, 1e-12);
    EXPECT_GT(r.expected(), 0.25);
    EXPECT_LT(r.expected(), 1.0);
}

TEST_F(ArithmeticTest, ZeroPowerIsOne) {
    Ain one = AsymInt::power(Ain(-3.0, 5.0, 1.0), 0.0);
    EXPECT_TRUE(one.is_degenerate());
    EXPECT_DOUBLE_EQ(one.expected(), 1.0);
}

TEST_F(ArithmeticTest, PowerDomainErrors) {
    EXPECT_THROW(AsymInt::power(Ain(-2.0, 2.0, 0.5), -1.0), AsymInt::DomainError);
    EXPECT_THROW(AsymInt::power(Ain(0.0, 2.0, 0.5), -2.0), AsymInt::DomainError);
    EXPECT_THROW(AsymInt::power(Ain(-4.0, -1.0, -2.0), 0.5), AsymInt::ComplexResultError);
    EXPECT_THROW(AsymInt::power(Ain(-1.0, 1.0, 0.0), 1.5), AsymInt::ComplexResultError);
}

TEST_F(ArithmeticTest, PowerOfDegenerate) {
    expect_ain(AsymInt::power(Ain(3.0, 3.0, 3.0), 2.0), 9.0, 9.0, 9.0);
    EXPECT_THROW(AsymInt::power(Ain(0.0, 0.0, 0.0), -1.0), AsymInt::DomainError);
    EXPECT_THROW(AsymInt::power(Ain(-8.0, -8.0, -8.0), 1.0 / 3.0), AsymInt::ComplexResultError);
}

TEST_F(ArithmeticTest, ResultsAreValidIntervals) {
    Ain x(0.0, 10.0, 2.0);
    Ain y(2.0, 8.0, 3.0);
    for (const Ain& r : {x + y, x - y, x * y, y / (x + 1.0), AsymInt::power(y, 3.0)}) {
        EXPECT_LT(r.lower(), r.expected());
        EXPECT_LT(r.expected(), r.upper());
        EXPECT_NEAR(r.alpha() * (r.expected() - r.lower()) + r.beta() * (r.upper() - r.expected()),
                    1.0, 1e-12);
    }
}

TEST_F(ArithmeticTest, OperandVariant) {
    AsymInt::Operand scalar = 2.0;
    AsymInt::Operand interval = Ain(1.0, 3.0, 2.0);
    expect_ain(AsymInt::add(Ain(0.0, 1.0), scalar), 2.0, 3.0, 2.5);
    expect_ain(AsymInt::add(Ain(0.0, 1.0), interval), 1.0, 4.0, 2.5);
}
