// -*- c++ -*-
//
// Stochastic comparison of asymmetric interval numbers
//
// Comparisons return probabilities for independent operands, not booleans:
// gt(X, Y) = P(X > Y). A scalar operand is a degenerate interval.
// For any X and Y: gt(X, Y) + lt(X, Y) + eq(X, Y) == 1.

#ifndef ASYMINT_COMPARISON__H
#define ASYMINT_COMPARISON__H

#include "arithmetic.hpp"

namespace AsymInt {

[[nodiscard]] double gt(const Ain& x, const Operand& y);
[[nodiscard]] double lt(const Ain& x, const Operand& y);
[[nodiscard]] double ge(const Ain& x, const Operand& y);
[[nodiscard]] double le(const Ain& x, const Operand& y);

// 1 when both operands are degenerate and equal, 0 otherwise
[[nodiscard]] double eq(const Ain& x, const Operand& y);

}  // namespace AsymInt

#endif  // ASYMINT_COMPARISON__H
