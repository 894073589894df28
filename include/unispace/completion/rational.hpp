#pragma once

/// @file rational.hpp
/// @brief Exact rationals and the rational line with its dense embedding
///        into the extended real line

#include "extended_real.hpp"
#include "leveled_maps.hpp"
#include "leveled_space.hpp"
#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace unispace_completion {

// =============================================================================
// Rational
// =============================================================================

/// Reduced fraction with positive denominator.
/// Arithmetic is exact while numerators and denominators fit in int64; an
/// intermediate value that leaves int64 throws std::overflow_error.
/// INT64_MIN is never a component, so negation is always safe.
class Rational {
public:
    constexpr Rational() = default;

    /// Throws std::overflow_error for INT64_MIN
    Rational(std::int64_t integer);

    /// Throws std::invalid_argument for a zero denominator and
    /// std::overflow_error when either component is INT64_MIN
    Rational(std::int64_t num, std::int64_t den);

    /// Exact value of a finite double, when it fits
    [[nodiscard]] static std::optional<Rational> from_double(double x);

    [[nodiscard]] std::int64_t num() const noexcept { return m_num; }
    [[nodiscard]] std::int64_t den() const noexcept { return m_den; }

    [[nodiscard]] double to_double() const noexcept;
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] Rational operator+(const Rational& other) const;
    [[nodiscard]] Rational operator-(const Rational& other) const;
    [[nodiscard]] Rational operator*(const Rational& other) const;
    [[nodiscard]] Rational operator/(const Rational& other) const;
    [[nodiscard]] Rational operator-() const { return Rational(-m_num, m_den); }

    bool operator==(const Rational& other) const noexcept = default;
    std::strong_ordering operator<=>(const Rational& other) const;

private:
    std::int64_t m_num = 0;
    std::int64_t m_den = 1;
};

std::ostream& operator<<(std::ostream& os, const Rational& q);

// =============================================================================
// RationalLine
// =============================================================================

/// The rationals with the uniformity induced from the extended real line.
/// Separated but not complete: there is no find_limit.
class RationalLine {
public:
    using Point = Rational;

    static constexpr bool is_separated = true;

    [[nodiscard]] bool within(const Rational& p, const Rational& q, Level k) const noexcept;

    [[nodiscard]] std::string name() const { return "Q"; }
};

/// Rational within 2^-k of x in sigma-coordinates: x itself when it is an
/// exact rational, +-2^k for infinite x or x too large for one, otherwise a
/// truncation to a dyadic with denominator 2^(k + 1)
[[nodiscard]] Rational dyadic_approximation(double x, Level k);

/// Q -> [-inf, +inf], inducing with identity modulus and dense range
[[nodiscard]] DenseUniformEmbedding<RationalLine, ExtendedRealLine> rational_embedding();

} // namespace unispace_completion
