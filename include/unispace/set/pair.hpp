#pragma once

/// @file pair.hpp
/// @brief Encoding of product carriers
///
/// The product of carriers {0..n1-1} and {0..n2-1} is the carrier
/// {0..n1*n2-1}, with (a, b) stored at index a*n2 + b. The pair carrier of a
/// single carrier of size n is the product with itself, so a relation on X is
/// a subset of the pair carrier of X.

#include "fwd.hpp"
#include <utility>

namespace unispace_set {

/// Index of (a, b) in a product whose right factor has n2 points
[[nodiscard]] constexpr Point encode_pair(std::size_t n2, Point a, Point b) noexcept {
    return a * n2 + b;
}

/// Inverse of encode_pair
[[nodiscard]] constexpr std::pair<Point, Point> decode_pair(std::size_t n2, Point index) noexcept {
    return {index / n2, index % n2};
}

/// Size of the pair carrier of a carrier with n points
[[nodiscard]] constexpr std::size_t pair_carrier_size(std::size_t n) noexcept {
    return n * n;
}

} // namespace unispace_set
