/// @file rational.cpp
/// @brief Rational and RationalLine implementation for unispace_completion

#include <unispace/completion/rational.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace unispace_completion {

namespace {

/// Levels beyond this exceed what a double can resolve near the origin
constexpr Level APPROXIMATION_LEVEL_CAP = 60;

/// Finer bits than 2^-FRACTION_BITS are truncated
constexpr int FRACTION_BITS = 62;

constexpr std::int64_t INT64_LOWEST = std::numeric_limits<std::int64_t>::min();

std::int64_t checked_mul(std::int64_t a, std::int64_t b) {
    std::int64_t result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        throw std::overflow_error("Rational: product leaves int64");
    }
    return result;
}

std::int64_t checked_add(std::int64_t a, std::int64_t b) {
    std::int64_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        throw std::overflow_error("Rational: sum leaves int64");
    }
    return result;
}

/// Floor division with a remainder in [0, den), den > 0
void floor_divmod(std::int64_t num, std::int64_t den, std::int64_t& quotient, std::int64_t& remainder) {
    quotient = num / den;
    remainder = num % den;
    if (remainder < 0) {
        remainder += den;
        --quotient;
    }
}

/// Compares a/b with c/d (b, d > 0) by continued fraction expansion,
/// so no cross product is ever formed
std::strong_ordering compare_fractions(std::int64_t a, std::int64_t b, std::int64_t c, std::int64_t d) {
    bool reversed = false;
    while (true) {
        std::int64_t q1 = 0, r1 = 0, q2 = 0, r2 = 0;
        floor_divmod(a, b, q1, r1);
        floor_divmod(c, d, q2, r2);

        std::strong_ordering order = q1 <=> q2;
        if (order == 0 && (r1 == 0 || r2 == 0)) {
            order = r1 <=> r2;
        }
        if (order != 0 || r1 == 0) {
            return reversed ? 0 <=> order : order;
        }

        // r1/b against r2/d is b/r1 against d/r2, reversed
        a = b;
        b = r1;
        c = d;
        d = r2;
        reversed = !reversed;
    }
}

} // anonymous namespace

// =============================================================================
// Rational
// =============================================================================

Rational::Rational(std::int64_t integer) : m_num(integer) {
    if (integer == INT64_LOWEST) {
        throw std::overflow_error("Rational: numerator out of range");
    }
}

Rational::Rational(std::int64_t num, std::int64_t den) {
    if (den == 0) {
        throw std::invalid_argument("Rational: zero denominator");
    }
    if (num == INT64_LOWEST || den == INT64_LOWEST) {
        throw std::overflow_error("Rational: component out of range");
    }
    if (den < 0) {
        num = -num;
        den = -den;
    }
    const std::int64_t g = std::gcd(num, den);
    m_num = num / g;
    m_den = den / g;
}

std::optional<Rational> Rational::from_double(double x) {
    if (!std::isfinite(x)) return std::nullopt;
    if (x == 0.0) return Rational(0);
    if (std::fabs(x) >= std::ldexp(1.0, FRACTION_BITS)) return std::nullopt;

    int exponent = 0;
    const double mantissa = std::frexp(x, &exponent);
    auto digits = static_cast<std::int64_t>(std::ldexp(mantissa, 53));
    int shift = exponent - 53;
    while (shift < 0 && digits % 2 == 0) {
        digits /= 2;
        ++shift;
    }
    if (shift >= 0) {
        return Rational(digits * (std::int64_t(1) << shift));
    }
    if (-shift > FRACTION_BITS) return std::nullopt;
    return Rational(digits, std::int64_t(1) << -shift);
}

double Rational::to_double() const noexcept {
    return static_cast<double>(m_num) / static_cast<double>(m_den);
}

std::string Rational::to_string() const {
    if (m_den == 1) return std::to_string(m_num);
    return std::to_string(m_num) + "/" + std::to_string(m_den);
}

Rational Rational::operator+(const Rational& other) const {
    const std::int64_t g = std::gcd(m_den, other.m_den);
    const std::int64_t num = checked_add(checked_mul(m_num, other.m_den / g),
                                         checked_mul(other.m_num, m_den / g));
    return Rational(num, checked_mul(m_den / g, other.m_den));
}

Rational Rational::operator-(const Rational& other) const {
    return *this + (-other);
}

Rational Rational::operator*(const Rational& other) const {
    const std::int64_t g1 = std::gcd(m_num, other.m_den);
    const std::int64_t g2 = std::gcd(other.m_num, m_den);
    return Rational(checked_mul(m_num / g1, other.m_num / g2), checked_mul(m_den / g2, other.m_den / g1));
}

Rational Rational::operator/(const Rational& other) const {
    if (other.m_num == 0) {
        throw std::invalid_argument("Rational: division by zero");
    }
    return *this * Rational(other.m_den, other.m_num);
}

std::strong_ordering Rational::operator<=>(const Rational& other) const {
    return compare_fractions(m_num, m_den, other.m_num, other.m_den);
}

std::ostream& operator<<(std::ostream& os, const Rational& q) {
    return os << q.to_string();
}

// =============================================================================
// RationalLine
// =============================================================================

bool RationalLine::within(const Rational& p, const Rational& q, Level k) const noexcept {
    if (p == q) return true;
    return ExtendedRealLine{}.within(p.to_double(), q.to_double(), k);
}

Rational dyadic_approximation(double x, Level k) {
    if (std::isnan(x)) {
        throw std::invalid_argument("dyadic_approximation: NaN is not a point");
    }
    if (auto exact = Rational::from_double(x)) {
        return *exact;
    }
    const Level level = std::min(k, APPROXIMATION_LEVEL_CAP);
    const double bound = std::ldexp(1.0, static_cast<int>(level));

    // Past 2^level both points sit within 2^-level of the same end of [-1, 1]
    if (std::isinf(x) || std::fabs(x) >= bound) {
        const std::int64_t magnitude = std::int64_t(1) << level;
        return Rational(x > 0 ? magnitude : -magnitude);
    }

    // Only values below 2^-10 reach here. Truncating at 2^-(level + 1) stays
    // within 2^-level and keeps the denominator no larger than needed.
    const int bits = std::min(static_cast<int>(level) + 1, FRACTION_BITS);
    const double scaled = std::trunc(std::ldexp(x, bits));
    return Rational(static_cast<std::int64_t>(scaled), std::int64_t(1) << bits);
}

DenseUniformEmbedding<RationalLine, ExtendedRealLine> rational_embedding() {
    return DenseUniformEmbedding<RationalLine, ExtendedRealLine>(
        RationalLine{}, ExtendedRealLine{},
        [](const Rational& q) { return q.to_double(); },
        [](const double& a, Level k) { return dyadic_approximation(a, k); },
        [](Level k) { return k; },
        "Q -> [-inf, +inf]");
}

} // namespace unispace_completion
