// -*- c++ -*-
// Unit tests for numerical helpers

#include <gtest/gtest.h>

#include <algorithm>
#include <boost/math/constants/constants.hpp>
#include <cmath>

#include "util_numerical.hpp"

using AsymInt::binary_entropy;
using AsymInt::has_periodic_point;
using AsymInt::overlap_integral;
using AsymInt::periodic_point_count;
using AsymInt::mean_cos;
using AsymInt::mean_exp;
using AsymInt::mean_log;
using AsymInt::mean_power;
using AsymInt::mean_sin;
using AsymInt::mean_tan;
using AsymInt::round_to;

namespace {

const double PI = boost::math::constants::pi<double>();

// Midpoint rule for ∫_p^q max(0, r - max(y, s)) dy
double brute_overlap(double p, double q, double r, double s) {
    const int n = 200000;
    double h = (q - p) / n;
    double sum = 0.0;
    for (int i = 0; i < n; i++) {
        double y = p + (i + 0.5) * h;
        double v = r - std::max(y, s);
        sum += (v > 0.0 ? v : 0.0) * h;
    }
    return sum;
}

}  // namespace

TEST(OverlapIntegralTest, NoOverlap) {
    EXPECT_DOUBLE_EQ(overlap_integral(5.0, 6.0, 4.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(overlap_integral(5.0, 6.0, 5.0, 0.0), 0.0);
}

TEST(OverlapIntegralTest, RangeBelowThreshold) {
    EXPECT_DOUBLE_EQ(overlap_integral(0.0, 1.0, 5.0, 2.0), 3.0);
}

TEST(OverlapIntegralTest, RangeAboveThreshold) {
    EXPECT_DOUBLE_EQ(overlap_integral(1.0, 3.0, 5.0, 0.0), 6.0);
    EXPECT_DOUBLE_EQ(overlap_integral(1.0, 6.0, 4.0, 0.0), 4.5);
}

TEST(OverlapIntegralTest, PartialOverlap) {
    EXPECT_DOUBLE_EQ(overlap_integral(0.0, 10.0, 8.0, 2.0), 30.0);
    EXPECT_DOUBLE_EQ(overlap_integral(0.0, 4.0, 8.0, 2.0), 22.0);
}

TEST(OverlapIntegralTest, AgreesWithMidpointRule) {
    const double cases[][4] = {
        {0.0, 3.0, 10.0, 2.0}, {2.0, 3.0, 2.5, 0.0}, {4.0, 9.0, 10.0, 5.0}, {-1.0, 1.0, 0.5, -0.5}};
    for (const auto& c : cases) {
        EXPECT_NEAR(overlap_integral(c[0], c[1], c[2], c[3]), brute_overlap(c[0], c[1], c[2], c[3]), 1e-6);
    }
}

TEST(PeriodicPointTest, Count) {
    EXPECT_DOUBLE_EQ(periodic_point_count(0.0, 7.0, PI / 2.0, 2.0 * PI), 1.0);
    EXPECT_DOUBLE_EQ(periodic_point_count(0.0, 20.0, 0.0, 2.0 * PI), 4.0);
    EXPECT_DOUBLE_EQ(periodic_point_count(1.0, 2.0, 0.0, 2.0 * PI), 0.0);
    EXPECT_DOUBLE_EQ(periodic_point_count(-10.0, -1.0, PI / 2.0, PI), 3.0);
}

TEST(PeriodicPointTest, EndpointsCount) {
    EXPECT_TRUE(has_periodic_point(0.0, 1.0, 0.0, 2.0 * PI));
    EXPECT_TRUE(has_periodic_point(-1.0, 0.0, 0.0, 2.0 * PI));
    EXPECT_FALSE(has_periodic_point(0.1, 1.0, 0.0, 2.0 * PI));
}

TEST(PieceMeanTest, WideIntervalsMatchAntiderivatives) {
    EXPECT_NEAR(mean_exp(0.0, 2.0), (std::exp(2.0) - 1.0) / 2.0, 1e-14);
    EXPECT_NEAR(mean_exp(-1.0, 0.5), (std::exp(0.5) - std::exp(-1.0)) / 1.5, 1e-14);
    EXPECT_NEAR(mean_log(1.0, 3.0), (3.0 * std::log(3.0) - 3.0 + 1.0) / 2.0, 1e-14);
    EXPECT_NEAR(mean_power(2.0, 4.0, -1.0), std::log(2.0) / 2.0, 1e-14);
    EXPECT_NEAR(mean_power(-4.0, -2.0, -1.0), -std::log(2.0) / 2.0, 1e-14);
    EXPECT_NEAR(mean_power(4.0, 5.0, 2.0), (125.0 - 64.0) / 3.0, 1e-12);
    EXPECT_NEAR(mean_power(-2.0, 0.5, 3.0), (0.0625 - 16.0) / 10.0, 1e-14);
    EXPECT_NEAR(mean_power(-3.0, -2.5, 2.0), (27.0 - 15.625) / 1.5, 1e-12);
    EXPECT_NEAR(mean_power(0.0, 4.0, 0.5), 2.0 * 8.0 / 3.0 / 4.0, 1e-14);
    EXPECT_NEAR(mean_sin(0.0, PI), 2.0 / PI, 1e-14);
    EXPECT_NEAR(mean_cos(0.0, PI / 2.0), 2.0 / PI, 1e-14);
    EXPECT_NEAR(mean_tan(0.0, 1.0), -std::log(std::cos(1.0)), 1e-14);
    EXPECT_NEAR(mean_tan(2.0, 4.0), (std::log(std::fabs(std::cos(2.0))) - std::log(std::fabs(std::cos(4.0)))) / 2.0,
                1e-14);
}

TEST(PieceMeanTest, NarrowIntervalsKeepPrecision) {
    // The mean of g over [a, a + d] is g(a) + g'(a) d / 2 + O(d^2). Dividing
    // G(b) - G(a) by d would lose about seven digits here.
    double b = 1.0 + 1e-9;
    double d = b - 1.0;
    EXPECT_NEAR(mean_log(1.0, b), d / 2.0, 1e-17);
    EXPECT_NEAR(mean_tan(0.0, d), d / 2.0, 1e-17);
    EXPECT_NEAR(mean_exp(0.0, d), 1.0 + d / 2.0, 1e-15);
    EXPECT_NEAR(mean_power(1.0, b, 2.0), 1.0 + d, 1e-15);
    EXPECT_NEAR(mean_power(1.0, b, -1.0), 1.0 - d / 2.0, 1e-15);
    EXPECT_NEAR(mean_power(-b, -1.0, 3.0), -1.0 - 1.5 * d, 1e-15);
}

TEST(PieceMeanTest, StaysBetweenEndpointImages) {
    double a = 1e6;
    double b = 1e6 + 1e-3;
    double m = mean_log(a, b);
    EXPECT_GT(m, std::log(a));
    EXPECT_LT(m, std::log(b));
}

TEST(RoundToTest, Decimals) {
    EXPECT_DOUBLE_EQ(round_to(0.57749, 4), 0.5775);
    EXPECT_DOUBLE_EQ(round_to(-1.23456, 2), -1.23);
    EXPECT_DOUBLE_EQ(round_to(2.5, 0), 3.0);
}

TEST(BinaryEntropyTest, Values) {
    EXPECT_DOUBLE_EQ(binary_entropy(0.0), 0.0);
    EXPECT_DOUBLE_EQ(binary_entropy(1.0), 0.0);
    EXPECT_DOUBLE_EQ(binary_entropy(0.5), 1.0);
    EXPECT_NEAR(binary_entropy(0.25), 0.8112781244591328, 1e-12);
    EXPECT_NEAR(binary_entropy(0.25), binary_entropy(0.75), 1e-15);
}
