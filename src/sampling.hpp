// -*- c++ -*-

#ifndef ASYMINT_SAMPLING__H
#define ASYMINT_SAMPLING__H

#include <cstddef>
#include <random>
#include <vector>

#include "ain.hpp"

namespace AsymInt {

// Draws n values distributed per the interval's density by quantile
// inversion of uniform draws
std::vector<double> sample(const Ain& x, size_t n, std::mt19937_64& engine);

}  // namespace AsymInt

#endif  // ASYMINT_SAMPLING__H
