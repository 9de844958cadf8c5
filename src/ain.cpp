// -*- c++ -*-

#include "ain.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

namespace AsymInt {

Ain::Ain() {
    init(0.0, 0.0, 0.0);
}

Ain::Ain(double lower, double upper)
    : Ain(lower, upper, (lower + upper) / 2.0) {}

Ain::Ain(double lower, double upper, double expected) {
    validate(lower, upper, expected);
    init(lower, upper, expected);
#ifdef DEBUG
    std::cerr << "Ain(" << this << ":" << to_string(*this) << ") is created" << std::endl;
#endif  // DEBUG
}

AinResult Ain::create(double lower, double upper) {
    return create(lower, upper, (lower + upper) / 2.0);
}

AinResult Ain::create(double lower, double upper, double expected) {
    try {
        return AinResult::success(Ain(lower, upper, expected));
    } catch (const ValidationError& e) {
        return AinResult::failure(e.kind(), e.detail());
    }
}

void Ain::validate(double lower, double upper, double expected) {
    // Input validation: catch invalid numeric values at the boundary
    // to prevent silent propagation through calculations
    if (!std::isfinite(lower) || !std::isfinite(upper) || !std::isfinite(expected)) {
        throw ValidationError("AIN bounds and expected value must be finite");
    }

    std::ostringstream what;
    what << "It is not a proper AIN " << std::fixed << std::setprecision(4) << lower << ", "
         << upper << ", " << expected;

    if (lower > upper + DEGENERATE_TOLERANCE) {
        throw ValidationError(what.str() + " (lower is above upper)");
    }

    if (upper - lower <= DEGENERATE_TOLERANCE) {
        if (std::fabs(expected - lower) > DEGENERATE_TOLERANCE) {
            throw ValidationError(what.str() + " (degenerate interval requires expected == lower)");
        }
        return;
    }

    // The alpha piece [lower, expected) and the beta piece [expected, upper)
    // both need positive width for the density to be finite.
    if (!(lower < expected && expected < upper)) {
        throw ValidationError(what.str() + " (expected must lie strictly inside the interval)");
    }
}

void Ain::init(double lower, double upper, double expected) {
    degenerate_ = (upper - lower <= DEGENERATE_TOLERANCE);

    if (degenerate_) {
        lower_ = lower;
        upper_ = lower;
        expected_ = lower;
        alpha_ = 1.0;
        beta_ = 1.0;
        asymmetry_ = 0.0;
        variance_ = 0.0;
        return;
    }

    lower_ = lower;
    upper_ = upper;
    expected_ = expected;

    double w = upper - lower;
    double left = expected - lower;
    double right = upper - expected;

    alpha_ = right / (w * left);
    beta_ = left / (w * right);
    asymmetry_ = (lower + upper - 2.0 * expected) / w;

    // Second central moment of the piecewise density
    variance_ = alpha_ * left * left * left / 3.0 + beta_ * right * right * right / 3.0;
}

double Ain::std_dev() const {
    return std::sqrt(variance_);
}

double Ain::midpoint() const {
    return (lower_ + upper_) / 2.0;
}

double Ain::width() const {
    return upper_ - lower_;
}

double Ain::split_mass() const {
    if (degenerate_) {
        return 0.0;
    }
    return alpha_ * (expected_ - lower_);
}

double Ain::pdf(double x) const {
    if (degenerate_) {
        return 0.0;
    }
    if (x < lower_) {
        return 0.0;
    }
    if (x < expected_) {
        return alpha_;
    }
    if (x < upper_) {
        return beta_;
    }
    return 0.0;
}

double Ain::cdf(double x) const {
    if (x < lower_) {
        return 0.0;
    }
    if (degenerate_) {
        return 1.0;
    }
    if (x < expected_) {
        return alpha_ * (x - lower_);
    }
    if (x < upper_) {
        return split_mass() + beta_ * (x - expected_);
    }
    return 1.0;
}

double Ain::quantile(double y) const {
    if (!(y >= 0.0 && y <= 1.0)) {
        std::ostringstream what;
        what << "Argument y = " << y << " is out of range; it should be between 0 and 1";
        throw RangeError(what.str());
    }

    if (degenerate_) {
        return lower_;
    }

    double t = split_mass();
    if (y < t) {
        return y / alpha_ + lower_;
    }
    return (y - t) / beta_ + expected_;
}

bool Ain::operator==(const Ain& rhs) const {
    return lower_ == rhs.lower_ && upper_ == rhs.upper_ && expected_ == rhs.expected_;
}

//// AinResult ////

AinResult AinResult::success(const Ain& value) {
    AinResult r;
    r.value_ = value;
    return r;
}

AinResult AinResult::failure(ErrorKind kind, const std::string& message) {
    AinResult r;
    r.kind_ = kind;
    r.message_ = message;
    return r;
}

const Ain& AinResult::value() const {
    if (!value_) {
        throw_error(kind_, message_);
    }
    return *value_;
}

Ain make_derived(double lower, double upper, double expected) {
    if (!std::isfinite(lower) || !std::isfinite(upper) || !std::isfinite(expected)) {
        return Ain(lower, upper, expected);
    }

    double slack = 8.0 * std::numeric_limits<double>::epsilon() *
                   std::max(std::fabs(lower), std::fabs(upper));
    if (expected < lower - slack || expected > upper + slack) {
        return Ain(lower, upper, expected);
    }

    if (upper - lower <= DEGENERATE_TOLERANCE) {
        return Ain(lower, upper, lower);
    }

    double inner_lower = std::nextafter(lower, upper);
    double inner_upper = std::nextafter(upper, lower);
    if (inner_lower >= upper) {
        // No double lies strictly between the bounds
        double v = std::clamp(expected, lower, upper);
        return Ain(v, v, v);
    }
    return Ain(lower, upper, std::clamp(expected, inner_lower, inner_upper));
}

void throw_error(ErrorKind kind, const std::string& message) {
    switch (kind) {
        case ErrorKind::Validation:
            throw ValidationError(message);
        case ErrorKind::Domain:
            throw DomainError(message);
        case ErrorKind::ComplexResult:
            throw ComplexResultError(message);
        case ErrorKind::Range:
            throw RangeError(message);
        case ErrorKind::Configuration:
            throw ConfigurationException(message);
        default:
            throw RuntimeException(message);
    }
}

//// formatting ////

std::string to_string(const Ain& a) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4);
    oss << "[" << a.lower() << ", " << a.upper() << "]_{" << a.expected() << "}";
    return oss.str();
}

std::string repr(const Ain& a) {
    std::ostringstream oss;
    oss << "AIN(" << a.lower() << ", " << a.upper() << ", " << a.expected() << ")";
    return oss.str();
}

std::string summary(const Ain& a, int precision) {
    if (precision < 0) {
        throw RangeError("summary precision must be non-negative, got " + std::to_string(precision));
    }

    auto format = [precision](double v) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << v;
        return oss.str();
    };

    std::vector<std::pair<std::string, std::string>> elements = {
        {"Alpha", format(a.alpha())},
        {"Beta", format(a.beta())},
        {"Asymmetry", format(a.asymmetry())},
        {"Exp. val.", format(a.expected())},
        {"Variance", format(a.variance())},
        {"Std. dev.", format(a.std_dev())},
        {"Midpoint", format(a.midpoint())}};

    size_t width = 0;
    for (const auto& e : elements) {
        width = std::max(width, e.second.size());
    }
    width += 4;

    std::ostringstream oss;
    oss << "=== AIN ============================" << std::endl;
    oss << to_string(a) << std::endl;
    oss << "=== Summary ========================" << std::endl;
    for (const auto& e : elements) {
        oss << std::left << std::setw(12) << e.first << " = ";
        oss << std::right << std::setw(static_cast<int>(width)) << e.second << std::endl;
    }
    oss << "====================================" << std::endl;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Ain& a) {
    return os << to_string(a);
}

}  // namespace AsymInt
