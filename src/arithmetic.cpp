// -*- c++ -*-

#include "arithmetic.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <type_traits>

#include "util_numerical.hpp"

namespace AsymInt {

namespace {

bool contains_zero(const Ain& x) {
    return x.lower() <= 0.0 && x.upper() >= 0.0;
}

bool is_integer(double n) {
    return std::floor(n) == n;
}

// Builds an Ain from two unordered bounds and an expected value
Ain ordered(double a, double b, double expected) {
    return make_derived(std::min(a, b), std::max(a, b), expected);
}

}  // namespace

Ain negate(const Ain& x) {
    return Ain(-x.upper(), -x.lower(), -x.expected());
}

Ain add(const Ain& x, const Operand& y) {
    return std::visit(
        [&x](const auto& v) -> Ain {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
                return make_derived(x.lower() + v, x.upper() + v, x.expected() + v);
            } else {
                // E[X + Y] = E[X] + E[Y]
                return make_derived(x.lower() + v.lower(), x.upper() + v.upper(),
                                    x.expected() + v.expected());
            }
        },
        y);
}

Ain subtract(const Ain& x, const Operand& y) {
    return std::visit(
        [&x](const auto& v) -> Ain {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
                return make_derived(x.lower() - v, x.upper() - v, x.expected() - v);
            } else {
                return make_derived(x.lower() - v.upper(), x.upper() - v.lower(),
                                    x.expected() - v.expected());
            }
        },
        y);
}

Ain multiply(const Ain& x, const Operand& y) {
    return std::visit(
        [&x](const auto& v) -> Ain {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
                return ordered(x.lower() * v, x.upper() * v, x.expected() * v);
            } else {
                double c[] = {x.lower() * v.lower(), x.lower() * v.upper(),
                              x.upper() * v.lower(), x.upper() * v.upper()};
                auto mm = std::minmax_element(std::begin(c), std::end(c));
                // Independence assumption: E[XY] = E[X] E[Y]
                return make_derived(*mm.first, *mm.second, x.expected() * v.expected());
            }
        },
        y);
}

Ain divide(const Ain& x, const Operand& y) {
    return std::visit(
        [&x](const auto& v) -> Ain {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
                if (v == 0.0) {
                    throw DomainError("division by zero");
                }
                return ordered(x.lower() / v, x.upper() / v, x.expected() / v);
            } else {
                if (contains_zero(v)) {
                    throw DomainError("division by an interval containing 0: " + to_string(v));
                }
                double c[] = {x.lower() / v.lower(), x.lower() / v.upper(),
                              x.upper() / v.lower(), x.upper() / v.upper()};
                auto mm = std::minmax_element(std::begin(c), std::end(c));
                double lo = *mm.first;
                double hi = *mm.second;

                if (v.is_degenerate()) {
                    return make_derived(lo, hi, (lo + hi) / 2.0);
                }

                // E[X / Y] = E[X] E[1/Y], E[1/Y] by LOTUS over both pieces
                double inv = expectation(v, [](double a, double b) { return mean_power(a, b, -1.0); });
                return make_derived(lo, hi, x.expected() * inv);
            }
        },
        y);
}

Ain power(const Ain& x, double n) {
    if (!std::isfinite(n)) {
        throw DomainError("exponent must be finite");
    }

    if (x.is_degenerate()) {
        double c = x.lower();
        if (c == 0.0 && n < 0.0) {
            throw DomainError("The operation cannot be executed because 0 is raised to a negative power");
        }
        if (c < 0.0 && !is_integer(n)) {
            std::ostringstream what;
            what << "The operation cannot be executed because it will be complex number in result for n = " << n;
            throw ComplexResultError(what.str());
        }
        double v = std::pow(c, n);
        return Ain(v, v, v);
    }

    if (n == 0.0) {
        return Ain(1.0, 1.0, 1.0);
    }

    double l = x.lower();
    double u = x.upper();

    if (l < 0.0 && !is_integer(n)) {
        std::ostringstream what;
        what << "The operation cannot be executed because it will be complex number in result for n = " << n;
        throw ComplexResultError(what.str());
    }
    if (n < 0.0 && contains_zero(x)) {
        throw DomainError("The operation cannot be executed because 0 is included in the interval");
    }

    double lp = std::pow(l, n);
    double up = std::pow(u, n);

    double lo = (l < 0.0 && u > 0.0) ? std::min(0.0, lp) : std::min(lp, up);
    double hi = std::max(lp, up);

    // E[X^n], with E[1/X] = alpha ln(e/l) + beta ln(u/e) for n == -1
    double expected = expectation(x, [n](double a, double b) { return mean_power(a, b, n); });
    return make_derived(lo, hi, expected);
}

Ain operator-(const Ain& x) {
    return negate(x);
}

Ain operator+(const Ain& a, const Ain& b) {
    return add(a, b);
}

Ain operator+(const Ain& a, double b) {
    return add(a, b);
}

Ain operator+(double a, const Ain& b) {
    return add(b, a);
}

Ain operator-(const Ain& a, const Ain& b) {
    return subtract(a, b);
}

Ain operator-(const Ain& a, double b) {
    return subtract(a, b);
}

Ain operator-(double a, const Ain& b) {
    return add(negate(b), a);
}

Ain operator*(const Ain& a, const Ain& b) {
    return multiply(a, b);
}

Ain operator*(const Ain& a, double b) {
    return multiply(a, b);
}

Ain operator*(double a, const Ain& b) {
    return multiply(b, a);
}

Ain operator/(const Ain& a, const Ain& b) {
    return divide(a, b);
}

Ain operator/(const Ain& a, double b) {
    return divide(a, b);
}

Ain operator/(double a, const Ain& b) {
    return multiply(power(b, -1.0), a);
}

}  // namespace AsymInt
