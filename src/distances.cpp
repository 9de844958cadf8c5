// -*- c++ -*-

#include "distances.hpp"

#include <algorithm>
#include <cmath>

namespace AsymInt {

QuantileSegments quantile_segments(const Ain& x, const Ain& y) {
    QuantileSegments segments;

    if (x.is_degenerate() && y.is_degenerate()) {
        segments.emplace_back(0.0, 1.0, x.expected() - y.expected(), 0.0);
        return segments;
    }

    if (x.is_degenerate()) {
        double t2 = y.split_mass();
        segments.emplace_back(0.0, t2, x.expected() - y.lower(), -1.0 / y.alpha());
        segments.emplace_back(t2, 1.0, x.expected() - y.expected() + t2 / y.beta(), -1.0 / y.beta());
        return segments;
    }

    if (y.is_degenerate()) {
        double t1 = x.split_mass();
        segments.emplace_back(0.0, t1, x.lower() - y.expected(), 1.0 / x.alpha());
        segments.emplace_back(t1, 1.0, x.expected() - y.expected() - t1 / x.beta(), 1.0 / x.beta());
        return segments;
    }

    const Ain* p = &x;
    const Ain* q = &y;
    if (p->split_mass() > q->split_mass()) {
        std::swap(p, q);
    }
    double t1 = p->split_mass();
    double t2 = q->split_mass();

    segments.emplace_back(0.0, t1, p->lower() - q->lower(), 1.0 / p->alpha() - 1.0 / q->alpha());
    segments.emplace_back(t1, t2, p->expected() - q->lower() - t1 / p->beta(),
                          1.0 / p->beta() - 1.0 / q->alpha());
    segments.emplace_back(t2, 1.0, p->expected() - q->expected() - t1 / p->beta() + t2 / q->beta(),
                          1.0 / p->beta() - 1.0 / q->beta());
    return segments;
}

double w1(const Ain& x, const Ain& y) {
    // ∫_p^r (a + b t) dt
    auto integral = [](double a, double b, double p, double r) {
        return a * (r - p) + b / 2.0 * (r * r - p * p);
    };

    double distance = 0.0;
    for (const auto& s : quantile_segments(x, y)) {
        double sign = (s.a + s.b * s.begin) * (s.a + s.b * s.end);
        if (sign >= 0.0) {
            distance += std::fabs(integral(s.a, s.b, s.begin, s.end));
        } else {
            // D changes sign at its root inside the segment
            double root = -s.a / s.b;
            distance += std::fabs(integral(s.a, s.b, s.begin, root));
            distance += std::fabs(integral(s.a, s.b, root, s.end));
        }
    }
    return distance;
}

double w2(const Ain& x, const Ain& y) {
    double distance = 0.0;
    for (const auto& s : quantile_segments(x, y)) {
        double p = s.begin;
        double r = s.end;
        distance += s.a * s.a * (r - p) + s.a * s.b * (r * r - p * p) +
                    s.b * s.b / 3.0 * (r * r * r - p * p * p);
    }
    return std::sqrt(std::max(distance, 0.0));
}

double winf(const Ain& x, const Ain& y) {
    // |D| is piecewise linear, so its maximum is at t = 0, t = 1 or a split point
    double distance = std::max(std::fabs(x.lower() - y.lower()), std::fabs(x.upper() - y.upper()));

    QuantileSegments segments = quantile_segments(x, y);
    for (size_t i = 1; i < segments.size(); i++) {
        const auto& s = segments[i];
        distance = std::max(distance, std::fabs(s.a + s.b * s.begin));
    }
    return distance;
}

}  // namespace AsymInt
