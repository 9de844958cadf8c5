// -*- c++ -*-

#include "sampling.hpp"

namespace AsymInt {

std::vector<double> sample(const Ain& x, size_t n, std::mt19937_64& engine) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    std::vector<double> values;
    values.reserve(n);
    for (size_t i = 0; i < n; i++) {
        values.push_back(x.quantile(uniform(engine)));
    }
    return values;
}

}  // namespace AsymInt
