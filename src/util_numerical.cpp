// -*- c++ -*-

#include "util_numerical.hpp"

#include <algorithm>
#include <cmath>

namespace AsymInt {

double overlap_integral(double p, double q, double r, double s) {
    // No overlap: every y in [p, q] is at or above r
    if (r <= p) {
        return 0.0;
    }

    // Full overlap below threshold: max(y, s) == s on the whole range
    if (q <= s) {
        return (q - p) * (r - s);
    }

    if (s <= p) {
        // Full overlap above threshold: max(y, s) == y and y < r on the range
        if (q <= r) {
            return (q - p) * (r - (p + q) / 2.0);
        }
        // Threshold beyond range: the integrand reaches zero at y == r
        return (r - p) * (r - p) / 2.0;
    }

    // Partial overlap: constant r - s on [p, s), then r - y up to min(q, r)
    double t = std::min(q, r);
    double flat = (s - p) * (r - s);
    double slope = ((r - s) * (r - s) - (r - t) * (r - t)) / 2.0;
    return flat + slope;
}

double periodic_point_count(double lower, double upper, double phase, double period) {
    double k_min = std::ceil((lower - phase) / period);
    double k_max = std::floor((upper - phase) / period);
    return std::max(0.0, k_max - k_min + 1.0);
}

bool has_periodic_point(double lower, double upper, double phase, double period) {
    return periodic_point_count(lower, upper, phase, period) > 0.0;
}

double mean_exp(double a, double b) {
    double d = b - a;
    if (d == 0.0) {
        return std::exp(a);
    }
    if (std::fabs(d) <= 1.0) {
        return std::exp(a) * std::expm1(d) / d;
    }
    return (std::exp(b) - std::exp(a)) / d;
}

double mean_log(double a, double b) {
    // (b ln b - a ln a) / d - 1 = ln a + ln(1 + r) + (ln(1 + r) / r - 1), r = d / a
    double r = (b - a) / a;
    double tail = 0.0;
    if (std::fabs(r) < 1.0e-4) {
        tail = r * (-1.0 / 2.0 + r * (1.0 / 3.0 + r * (-1.0 / 4.0 + r / 5.0)));
    } else {
        tail = std::log1p(r) / r - 1.0;
    }
    return std::log(a) + std::log1p(r) + tail;
}

double mean_power(double a, double b, double n) {
    double d = b - a;

    if (n == -1.0) {
        return std::log1p(d / a) / d;
    }

    double m = n + 1.0;
    bool narrow = (a > 0.0 || b < 0.0) && std::fabs(d / a) < 0.5;
    if (narrow) {
        // b^m - a^m = a^m ((b / a)^m - 1), b / a > 0
        return std::pow(a, m) * std::expm1(m * std::log1p(d / a)) / (m * d);
    }
    return (std::pow(b, m) - std::pow(a, m)) / (m * d);
}

double mean_sin(double a, double b) {
    double h = (b - a) / 2.0;
    return std::sin(a + h) * std::sin(h) / h;
}

double mean_cos(double a, double b) {
    double h = (b - a) / 2.0;
    return std::cos(a + h) * std::sin(h) / h;
}

double mean_tan(double a, double b) {
    // cos b / cos a = 1 - 2 sin^2(d / 2) - tan a sin d
    double d = b - a;
    double s = std::sin(d / 2.0);
    return -std::log1p(-2.0 * s * s - std::tan(a) * std::sin(d)) / d;
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double binary_entropy(double p) {
    if (p <= 0.0 || p >= 1.0) {
        return 0.0;
    }
    return -(p * std::log2(p) + (1.0 - p) * std::log2(1.0 - p));
}

}  // namespace AsymInt
