#pragma once

/// @file cauchy.hpp
/// @brief Cauchy filters, limits and completeness on finite spaces

#include "fwd.hpp"
#include "uniform_core.hpp"
#include "maps.hpp"
#include <unispace/core/error.hpp>

namespace unispace_uniform {

/// Non-trivial and F x F <= U
[[nodiscard]] bool is_cauchy(const UniformCore& core, const Filter& filter);

/// F <= nhds x
[[nodiscard]] bool le_nhds(const UniformCore& core, const Filter& filter, Point x);

/// The generating entourage is the diagonal
[[nodiscard]] bool is_separated(const UniformCore& core);

/// Every Cauchy filter having s as a member converges to a point of s
[[nodiscard]] bool is_complete(const UniformCore& core, const Subset& s);

[[nodiscard]] bool is_complete_space(const UniformCore& core);

/// Canonical limit of a Cauchy filter: the least point x with F <= nhds x
[[nodiscard]] unispace_core::Result<Point> find_limit(const UniformCore& core, const Filter& filter);

/// Completeness of s transported to f(s) along a uniformly inducing map:
/// every Cauchy filter on the image pulls back to a Cauchy filter on s
[[nodiscard]] bool is_complete_image(const UniformInducing& f, const Subset& s);

} // namespace unispace_uniform
