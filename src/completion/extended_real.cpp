/// @file extended_real.cpp
/// @brief ExtendedRealLine implementation for unispace_completion

#include <unispace/completion/extended_real.hpp>
#include <unispace/core/log.hpp>

#include <cmath>
#include <limits>

namespace unispace_completion {

namespace {

/// The approximants run out to one end of [-1, 1]: the fine one is within
/// 2^-MAX_LEVEL of that end and at most half as far from it as the coarse one
bool escapes_to_infinity(double coarse, double fine) {
    if (std::signbit(coarse) != std::signbit(fine)) return false;
    const double precision = std::ldexp(1.0, -static_cast<int>(ExtendedRealLine::MAX_LEVEL));
    const double gap = 1.0 - std::fabs(ExtendedRealLine::sigma(fine));
    const double coarse_gap = 1.0 - std::fabs(ExtendedRealLine::sigma(coarse));
    return gap <= precision && gap <= coarse_gap / 2.0;
}

} // anonymous namespace

double ExtendedRealLine::sigma(double x) noexcept {
    if (std::isinf(x)) return x > 0 ? 1.0 : -1.0;
    return x / (1.0 + std::fabs(x));
}

double ExtendedRealLine::sigma_inverse(double s) noexcept {
    if (s >= 1.0) return std::numeric_limits<double>::infinity();
    if (s <= -1.0) return -std::numeric_limits<double>::infinity();
    return s / (1.0 - std::fabs(s));
}

bool ExtendedRealLine::is_point(double x) noexcept {
    return !std::isnan(x);
}

bool ExtendedRealLine::within(double x, double y, Level k) const noexcept {
    if (!is_point(x) || !is_point(y)) return false;
    if (x == y) return true;
    return std::fabs(sigma(x) - sigma(y)) <= std::ldexp(1.0, -static_cast<int>(k));
}

double ExtendedRealLine::find_limit(const CauchyFilter<double>& filter) const {
    const double approximant = filter(MAX_LEVEL);
    const double coarse = filter(MAX_LEVEL / 2);
    double limit = approximant;
    if (approximant != coarse && escapes_to_infinity(coarse, approximant)) {
        limit = std::copysign(std::numeric_limits<double>::infinity(), approximant);
    }
    unispace_core::completion_logger()->trace("extended real limit at level {}: {}", MAX_LEVEL, limit);
    return limit;
}

} // namespace unispace_completion
