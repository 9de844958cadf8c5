// -*- c++ -*-

#ifndef ASYMINT_UTIL_NUMERICAL__H
#define ASYMINT_UTIL_NUMERICAL__H

namespace AsymInt {

// ∫_p^q max(0, r - max(y, s)) dy
//
// Area of {(x, y) : s <= x <= r, p <= y <= q, x > y}, i.e. the mass of the
// event X > Y when X and Y are uniform (unnormalised) on [s, r] and [p, q].
// Preconditions: p <= q, s <= r
double overlap_integral(double p, double q, double r, double s);

// Number of integers k with phase + k * period in [lower, upper],
// from ceil((lower - phase) / period) to floor((upper - phase) / period)
double periodic_point_count(double lower, double upper, double phase, double period);

// True when some point phase + k * period lies in [lower, upper]
bool has_periodic_point(double lower, double upper, double phase, double period);

// Mean value of g over [a, b], (G(b) - G(a)) / (b - a) for an
// antiderivative G, rewritten with expm1 and log1p so that narrow intervals
// far from the origin keep full precision. Require a != b.
double mean_exp(double a, double b);

// Requires 0 < a
double mean_log(double a, double b);

// Mean of t^n, n != 0. Non-integer n requires 0 <= a, negative n requires
// that 0 is outside [a, b].
double mean_power(double a, double b, double n);

double mean_sin(double a, double b);
double mean_cos(double a, double b);

// Requires that no asymptote of tan lies in [a, b]
double mean_tan(double a, double b);

// Rounds to the given number of decimals (half away from zero)
double round_to(double value, int decimals);

// h(p) = -(p log2 p + (1-p) log2 (1-p)), with h(0) = h(1) = 0
double binary_entropy(double p);

}  // namespace AsymInt

#endif  // ASYMINT_UTIL_NUMERICAL__H
