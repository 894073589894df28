#pragma once

/// @file extended_real.hpp
/// @brief The extended real line [-inf, +inf] as a complete leveled space
///
/// Points are doubles, the infinities included. The homeomorphism
/// sigma(x) = x / (1 + |x|) onto [-1, 1] carries the uniformity:
///
///     (x, y) ∈ V_k  iff  |sigma(x) - sigma(y)| <= 2^-k
///
/// Limits are taken at MAX_LEVEL, which bounds the precision of every result
/// to 2^-MAX_LEVEL in sigma-coordinates. Approximants that agree at
/// MAX_LEVEL / 2 and MAX_LEVEL are the limit. Otherwise the limit is an
/// infinity only when the approximants run out toward that end: within
/// 2^-MAX_LEVEL of +-1 and at least twice as close as at MAX_LEVEL / 2.

#include "leveled_space.hpp"
#include <string>

namespace unispace_completion {

class ExtendedRealLine {
public:
    using Point = double;

    static constexpr bool is_separated = true;
    static constexpr Level MAX_LEVEL = 40;

    /// Order-preserving homeomorphism onto [-1, 1]
    [[nodiscard]] static double sigma(double x) noexcept;

    /// Inverse of sigma
    [[nodiscard]] static double sigma_inverse(double s) noexcept;

    /// NaN is not a point
    [[nodiscard]] static bool is_point(double x) noexcept;

    [[nodiscard]] bool within(double x, double y, Level k) const noexcept;

    [[nodiscard]] double find_limit(const CauchyFilter<double>& filter) const;

    [[nodiscard]] std::string name() const { return "[-inf, +inf]"; }
};

} // namespace unispace_completion
