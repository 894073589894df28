#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for unispace_set types

#include <cstddef>

namespace unispace_set {

/// A point of a finite carrier {0..n-1}
using Point = std::size_t;

/// Largest base carrier accepted by validating constructors.
/// The pair carrier of a base carrier has MAX_CARRIER_SIZE^2 points.
inline constexpr std::size_t MAX_CARRIER_SIZE = 64;

/// Subset of a finite carrier
class Subset;

/// Total function between finite carriers
class FiniteMap;

} // namespace unispace_set
