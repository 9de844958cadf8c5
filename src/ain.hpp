// -*- c++ -*-
//
// Ain: Asymmetric Interval Number
//
// A bounded quantity [lower, upper] carrying a two-piece constant density:
// alpha on [lower, expected) and beta on [expected, upper). The density
// integrates to one and its mean is exactly `expected`.

#ifndef ASYMINT_AIN__H
#define ASYMINT_AIN__H

#include <asymint/exception.hpp>
#include <iosfwd>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace AsymInt {

// Absolute tolerance used to decide degeneracy (lower == upper) and
// equality of degenerate intervals.
constexpr double DEGENERATE_TOLERANCE = 1.0e-12;

class AinResult;

class Ain {
   public:
    // Degenerate interval at 0
    Ain();

    // expected defaults to the midpoint
    Ain(double lower, double upper);
    Ain(double lower, double upper, double expected);

    // Checked construction: never throws, reports ValidationError as a result
    [[nodiscard]] static AinResult create(double lower, double upper);
    [[nodiscard]] static AinResult create(double lower, double upper, double expected);

    [[nodiscard]] double lower() const {
        return lower_;
    }
    [[nodiscard]] double upper() const {
        return upper_;
    }
    [[nodiscard]] double expected() const {
        return expected_;
    }
    [[nodiscard]] double alpha() const {
        return alpha_;
    }
    [[nodiscard]] double beta() const {
        return beta_;
    }
    [[nodiscard]] double asymmetry() const {
        return asymmetry_;
    }
    [[nodiscard]] double variance() const {
        return variance_;
    }
    [[nodiscard]] bool is_degenerate() const {
        return degenerate_;
    }

    [[nodiscard]] double std_dev() const;
    [[nodiscard]] double midpoint() const;
    [[nodiscard]] double width() const;

    // Cumulative mass of the alpha piece: alpha * (expected - lower)
    [[nodiscard]] double split_mass() const;

    // Distribution interface
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] double cdf(double x) const;
    [[nodiscard]] double quantile(double y) const;

    // Field-wise comparison (not a probabilistic one, see comparison.hpp)
    bool operator==(const Ain& rhs) const;
    bool operator!=(const Ain& rhs) const {
        return !(*this == rhs);
    }

   private:
    static void validate(double lower, double upper, double expected);
    void init(double lower, double upper, double expected);

    double lower_;
    double upper_;
    double expected_;
    double alpha_;
    double beta_;
    double asymmetry_;
    double variance_;
    bool degenerate_;
};

// Result of a checked operation: either an Ain or the kind and message of
// the error that stopped the computation.
class AinResult {
   public:
    [[nodiscard]] static AinResult success(const Ain& value);
    [[nodiscard]] static AinResult failure(ErrorKind kind, const std::string& message);

    [[nodiscard]] bool ok() const {
        return value_.has_value();
    }
    explicit operator bool() const {
        return ok();
    }

    // Rethrows the stored error as its exception type when not ok()
    [[nodiscard]] const Ain& value() const;

    [[nodiscard]] ErrorKind error() const {
        return kind_;
    }
    [[nodiscard]] const std::string& message() const {
        return message_;
    }

    // Applies op to the held value. A failed result is passed through
    // unchanged; an AsymInt::Exception thrown by op becomes the new failure.
    template <class Op>
    [[nodiscard]] AinResult then(Op&& op) const {
        if (!ok()) {
            return *this;
        }
        try {
            return success(std::forward<Op>(op)(*value_));
        } catch (const Exception& e) {
            return failure(e.kind(), e.detail());
        }
    }

   private:
    AinResult() = default;

    std::optional<Ain> value_;
    ErrorKind kind_ = ErrorKind::None;
    std::string message_;
};

// Runs op and captures its Ain or its AsymInt::Exception
template <class Op>
[[nodiscard]] AinResult evaluate(Op&& op) {
    try {
        return AinResult::success(std::forward<Op>(op)());
    } catch (const Exception& e) {
        return AinResult::failure(e.kind(), e.detail());
    }
}

// Builds the result of an operator from computed bounds and expected value.
// Rounding can put a computed expected value a few ulps on or past a bound:
// it is moved to the nearest interior double, and an interval too narrow to
// hold one collapses to a point. Larger violations throw ValidationError.
Ain make_derived(double lower, double upper, double expected);

// E[g(X)] from the mean of g over each piece, mean(a, b) = ∫_a^b g / (b - a).
// X must not be degenerate.
template <class PieceMean>
double expectation(const Ain& x, PieceMean mean) {
    double left = x.alpha() * (x.expected() - x.lower());
    double right = x.beta() * (x.upper() - x.expected());
    return left * mean(x.lower(), x.expected()) + right * mean(x.expected(), x.upper());
}

// Throws the exception type matching kind
[[noreturn]] void throw_error(ErrorKind kind, const std::string& message);

// "[lower, upper]_{expected}" with four decimals
std::string to_string(const Ain& a);

// "AIN(lower, upper, expected)"
std::string repr(const Ain& a);

// Framed report of the derived parameters
std::string summary(const Ain& a, int precision = 6);

std::ostream& operator<<(std::ostream& os, const Ain& a);

}  // namespace AsymInt

#endif  // ASYMINT_AIN__H
