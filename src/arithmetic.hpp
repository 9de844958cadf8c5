// -*- c++ -*-
//
// Arithmetic on asymmetric interval numbers
//
// Every operation returns a freshly validated Ain built by make_derived;
// invariant violations of the result surface as ValidationError.

#ifndef ASYMINT_ARITHMETIC__H
#define ASYMINT_ARITHMETIC__H

#include <variant>

#include "ain.hpp"

namespace AsymInt {

// Right-hand operand of a binary operation: a scalar or an interval
using Operand = std::variant<double, Ain>;

Ain negate(const Ain& x);
Ain add(const Ain& x, const Operand& y);
Ain subtract(const Ain& x, const Operand& y);
Ain multiply(const Ain& x, const Operand& y);
Ain divide(const Ain& x, const Operand& y);

// X^n for a real exponent n. There is no operator form: ^ would bind more
// loosely than + and *.
Ain power(const Ain& x, double n);

Ain operator-(const Ain& x);

Ain operator+(const Ain& a, const Ain& b);
Ain operator+(const Ain& a, double b);
Ain operator+(double a, const Ain& b);

Ain operator-(const Ain& a, const Ain& b);
Ain operator-(const Ain& a, double b);
Ain operator-(double a, const Ain& b);

Ain operator*(const Ain& a, const Ain& b);
Ain operator*(const Ain& a, double b);
Ain operator*(double a, const Ain& b);

Ain operator/(const Ain& a, const Ain& b);
Ain operator/(const Ain& a, double b);
Ain operator/(double a, const Ain& b);

}  // namespace AsymInt

#endif  // ASYMINT_ARITHMETIC__H
