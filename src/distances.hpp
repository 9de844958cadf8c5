// -*- c++ -*-
//
// Wasserstein-type distances between asymmetric interval numbers
//
// The distances integrate the quantile difference D(t) = Q_X(t) - Q_Y(t)
// over t in [0, 1]. D is linear between the split masses of X and Y, so
// [0, 1] decomposes into at most three segments with D(t) = a + b t.

#ifndef ASYMINT_DISTANCES__H
#define ASYMINT_DISTANCES__H

#include <vector>

#include "ain.hpp"

namespace AsymInt {

struct QuantileSegment {
    double begin;
    double end;
    double a;
    double b;

    QuantileSegment(double begin_, double end_, double a_, double b_)
        : begin(begin_)
        , end(end_)
        , a(a_)
        , b(b_) {}
};

using QuantileSegments = std::vector<QuantileSegment>;

// Segments of D(t) covering [0, 1] in increasing order. When the split
// mass of X exceeds that of Y the operands are swapped, which negates D.
QuantileSegments quantile_segments(const Ain& x, const Ain& y);

// ∫ |D(t)| dt
double w1(const Ain& x, const Ain& y);

// sqrt(∫ D(t)^2 dt)
double w2(const Ain& x, const Ain& y);

// max |D(t)|
double winf(const Ain& x, const Ain& y);

}  // namespace AsymInt

#endif  // ASYMINT_DISTANCES__H
