// -*- c++ -*-

#include "transcendental.hpp"

#include <algorithm>
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <sstream>
#include <type_traits>

#include "util_numerical.hpp"

namespace AsymInt {

namespace {

namespace bmc = boost::math::double_constants;

Ain point(double v) {
    return Ain(v, v, v);
}

void check_tan_domain(const Ain& x) {
    if (has_periodic_point(x.lower(), x.upper(), bmc::half_pi, bmc::pi)) {
        std::ostringstream what;
        what << "tan is discontinuous on " << to_string(x)
             << " (an asymptote pi/2 + k*pi lies in the interval)";
        throw DomainError(what.str());
    }
}

}  // namespace

Ain log(const Ain& x) {
    if (x.lower() <= 0.0) {
        throw DomainError("log requires a positive lower bound, got " + to_string(x));
    }
    if (x.is_degenerate()) {
        return point(std::log(x.lower()));
    }

    // Antiderivative x ln x - x
    double expected = expectation(x, mean_log);
    return make_derived(std::log(x.lower()), std::log(x.upper()), expected);
}

Ain log2(const Ain& x) {
    return multiply(log(x), 1.0 / bmc::ln_two);
}

Ain log10(const Ain& x) {
    return multiply(log(x), 1.0 / bmc::ln_ten);
}

Ain exp(const Ain& x) {
    if (x.is_degenerate()) {
        return point(std::exp(x.lower()));
    }

    double expected = expectation(x, mean_exp);
    return make_derived(std::exp(x.lower()), std::exp(x.upper()), expected);
}

Ain sin(const Ain& x) {
    if (x.is_degenerate()) {
        return point(std::sin(x.lower()));
    }

    double l = x.lower();
    double u = x.upper();
    double sl = std::sin(l);
    double su = std::sin(u);
    double lo = std::min(sl, su);
    double hi = std::max(sl, su);

    // Interior maxima at pi/2 + 2k*pi, minima at -pi/2 + 2k*pi
    if (has_periodic_point(l, u, bmc::half_pi, bmc::two_pi)) {
        hi = 1.0;
    }
    if (has_periodic_point(l, u, -bmc::half_pi, bmc::two_pi)) {
        lo = -1.0;
    }

    double expected = expectation(x, mean_sin);
    return make_derived(lo, hi, expected);
}

Ain cos(const Ain& x) {
    if (x.is_degenerate()) {
        return point(std::cos(x.lower()));
    }

    double l = x.lower();
    double u = x.upper();
    double cl = std::cos(l);
    double cu = std::cos(u);
    double lo = std::min(cl, cu);
    double hi = std::max(cl, cu);

    // Interior maxima at 2k*pi, minima at pi + 2k*pi
    if (has_periodic_point(l, u, 0.0, bmc::two_pi)) {
        hi = 1.0;
    }
    if (has_periodic_point(l, u, bmc::pi, bmc::two_pi)) {
        lo = -1.0;
    }

    double expected = expectation(x, mean_cos);
    return make_derived(lo, hi, expected);
}

Ain tan(const Ain& x) {
    check_tan_domain(x);

    if (x.is_degenerate()) {
        return point(std::tan(x.lower()));
    }

    // tan is increasing between two asymptotes
    // Antiderivative -ln|cos x|
    double expected = expectation(x, mean_tan);
    return make_derived(std::tan(x.lower()), std::tan(x.upper()), expected);
}

Ain pow(double base, const Ain& x) {
    if (!(base > 0.0) || base == 1.0 || !std::isfinite(base)) {
        std::ostringstream what;
        what << "base must be positive, finite and different from 1, got " << base;
        throw DomainError(what.str());
    }
    if (x.is_degenerate()) {
        return point(std::pow(base, x.lower()));
    }

    double bl = std::pow(base, x.lower());
    double bu = std::pow(base, x.upper());
    // base^t = exp(t ln base)
    double k = std::log(base);
    double expected = expectation(x, [k](double a, double b) { return mean_exp(a * k, b * k); });
    return make_derived(std::min(bl, bu), std::max(bl, bu), expected);
}

Ain pow(const Ain& x, const Operand& y) {
    return std::visit(
        [&x](const auto& v) -> Ain {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
                return power(x, v);
            } else {
                // X^Y = exp(Y log X)
                return exp(multiply(v, log(x)));
            }
        },
        y);
}

}  // namespace AsymInt
