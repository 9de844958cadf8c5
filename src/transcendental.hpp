// -*- c++ -*-
//
// Transcendental functions of asymmetric interval numbers
//
// Bounds are the exact image of [lower, upper]; the expected value is
// E[g(X)] = alpha ∫_lower^expected g + beta ∫_expected^upper g, evaluated
// from the mean of g over each piece, in closed form.

#ifndef ASYMINT_TRANSCENDENTAL__H
#define ASYMINT_TRANSCENDENTAL__H

#include "arithmetic.hpp"

namespace AsymInt {

// Requires lower > 0
Ain log(const Ain& x);
Ain log2(const Ain& x);
Ain log10(const Ain& x);

Ain exp(const Ain& x);

Ain sin(const Ain& x);
Ain cos(const Ain& x);

// Requires that no asymptote pi/2 + k*pi lies in [lower, upper]
Ain tan(const Ain& x);

// base^X, requires base > 0 and base != 1
Ain pow(double base, const Ain& x);

// X^n for a scalar exponent, exp(Y log X) for an interval exponent
Ain pow(const Ain& x, const Operand& y);

}  // namespace AsymInt

#endif  // ASYMINT_TRANSCENDENTAL__H
