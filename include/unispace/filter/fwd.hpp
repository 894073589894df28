#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for unispace_filter types

#include <cstddef>

namespace unispace_filter {

/// Filter on a finite carrier
class Filter;

/// Function argument certified monotone, consumed by lift
template<typename R>
class MonotoneMap;

/// Largest domain carrier MonotoneMap::certify will check exhaustively
inline constexpr std::size_t MONOTONE_CERTIFY_LIMIT = 16;

} // namespace unispace_filter
