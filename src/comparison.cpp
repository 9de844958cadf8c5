// -*- c++ -*-

#include "comparison.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <type_traits>

#include "util_numerical.hpp"

namespace AsymInt {

namespace {

// Constant-density piece [begin, end) of an interval's density
struct Piece {
    double begin;
    double end;
    double weight;
};

Ain to_interval(const Operand& y) {
    return std::visit(
        [](const auto& v) -> Ain {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(v)) {
                    std::ostringstream what;
                    what << "comparison operand must be a finite number, got " << v;
                    throw RangeError(what.str());
                }
                return Ain(v, v, v);
            } else {
                return v;
            }
        },
        y);
}

bool same_point(const Ain& x, const Ain& y) {
    return x.is_degenerate() && y.is_degenerate() &&
           std::fabs(x.lower() - y.lower()) <= DEGENERATE_TOLERANCE;
}

// P(X > Y) for independent X, Y
double probability_greater(const Ain& x, const Ain& y) {
    if (x.is_degenerate() && y.is_degenerate()) {
        return (x.lower() - y.lower() > DEGENERATE_TOLERANCE) ? 1.0 : 0.0;
    }
    if (y.is_degenerate()) {
        return 1.0 - x.cdf(y.lower());
    }
    if (x.is_degenerate()) {
        // P(Y < x) == cdf_Y(x) for a continuous Y
        return y.cdf(x.lower());
    }

    // Complete separation
    if (x.upper() <= y.lower()) {
        return 0.0;
    }
    if (y.upper() <= x.lower()) {
        return 1.0;
    }

    // Overlap: sum over the 2 x 2 pairs of density pieces of
    // w_x w_y * area{x in X-piece, y in Y-piece, x > y}
    const Piece xs[] = {{x.lower(), x.expected(), x.alpha()}, {x.expected(), x.upper(), x.beta()}};
    const Piece ys[] = {{y.lower(), y.expected(), y.alpha()}, {y.expected(), y.upper(), y.beta()}};

    double p = 0.0;
    for (const auto& px : xs) {
        for (const auto& py : ys) {
            p += px.weight * py.weight * overlap_integral(py.begin, py.end, px.end, px.begin);
        }
    }

#ifdef DEBUG
    std::cerr << "P(" << to_string(x) << " > " << to_string(y) << ") = " << p << std::endl;
#endif  // DEBUG

    return std::clamp(p, 0.0, 1.0);
}

}  // namespace

double gt(const Ain& x, const Operand& y) {
    return probability_greater(x, to_interval(y));
}

double lt(const Ain& x, const Operand& y) {
    return probability_greater(to_interval(y), x);
}

double eq(const Ain& x, const Operand& y) {
    return same_point(x, to_interval(y)) ? 1.0 : 0.0;
}

double ge(const Ain& x, const Operand& y) {
    Ain other = to_interval(y);
    double e = same_point(x, other) ? 1.0 : 0.0;
    return std::max(probability_greater(x, other), e);
}

double le(const Ain& x, const Operand& y) {
    Ain other = to_interval(y);
    double e = same_point(x, other) ? 1.0 : 0.0;
    return std::max(probability_greater(other, x), e);
}

}  // namespace AsymInt
