#pragma once

/// @file entourage_basis.hpp
/// @brief Shrinking entourages and closed/open entourage bases
///
/// Every combinator takes a member S of the uniformity and returns a member
/// contained in S with an extra property (symmetric, T o T within S, open,
/// closed). Passing a relation that is not a member throws
/// std::invalid_argument.

#include "fwd.hpp"
#include "uniform_core.hpp"
#include <cstdint>

namespace unispace_uniform {

/// A member of the uniformity together with the number of shrink steps
/// (T o T within the previous member) that produced it
struct ShrunkEntourage {
    Relation relation;
    std::uint32_t generation = 0;
};

// =============================================================================
// Topology of the Pair Carrier
// =============================================================================

/// Closure of v in X x X: the intersection of T o v o T over members T
[[nodiscard]] Relation closure(const UniformCore& core, const Relation& v);

/// Interior of v in X x X
[[nodiscard]] Relation interior(const UniformCore& core, const Relation& v);

[[nodiscard]] bool is_closed_relation(const UniformCore& core, const Relation& v);
[[nodiscard]] bool is_open_relation(const UniformCore& core, const Relation& v);

// =============================================================================
// Shrink Combinators
// =============================================================================

/// Member T with T o T within S, found through the triangle axiom
[[nodiscard]] ShrunkEntourage comp_mem(const UniformCore& core, const ShrunkEntourage& s);

/// One triangle shrink followed by symmetrization
[[nodiscard]] ShrunkEntourage shrink_then_symmetrize(const UniformCore& core, const ShrunkEntourage& s);

/// Symmetric member T with T o T within S
[[nodiscard]] ShrunkEntourage comp_symm_mem(const UniformCore& core, const Relation& s);

/// Symmetric member T with T o T o T within S
[[nodiscard]] ShrunkEntourage comp_comp_symm_mem(const UniformCore& core, const Relation& s);

// =============================================================================
// Closed and Open Bases
// =============================================================================

/// Open member contained in S
[[nodiscard]] ShrunkEntourage open_mem(const UniformCore& core, const Relation& s);

/// Open symmetric member contained in S
[[nodiscard]] ShrunkEntourage open_symm_mem(const UniformCore& core, const Relation& s);

/// Closed member contained in S: closure of the three-fold shrink
[[nodiscard]] ShrunkEntourage closed_mem(const UniformCore& core, const Relation& s);

} // namespace unispace_uniform
