#pragma once

/// @file uniform_core.hpp
/// @brief Uniform structures on finite carriers
///
/// A uniform core on {0..n-1} is a filter U on the pair carrier with
///   (i)   every member containing the diagonal,
///   (ii)  map swap U = U,
///   (iii) U.lift' (V -> V o V) <= U.
/// On a finite carrier these say exactly that the generating entourage is an
/// equivalence relation. Cores are validated once by create() and are
/// immutable afterwards; the constructions below produce valid cores directly.

#include "fwd.hpp"
#include "topology.hpp"
#include <unispace/core/error.hpp>
#include <unispace/filter/lattice.hpp>
#include <unispace/relation/pair_relation.hpp>
#include <unispace/set/finite_map.hpp>
#include <unispace/set/subset.hpp>
#include <cstddef>
#include <vector>

namespace unispace_uniform {

using unispace_filter::Filter;
using unispace_relation::Relation;
using unispace_set::FiniteMap;
using unispace_set::Point;
using unispace_set::Subset;

// =============================================================================
// UniformCore
// =============================================================================

class UniformCore {
public:
    /// Validate a filter on the pair carrier of n against the three axioms
    [[nodiscard]] static unispace_core::Result<UniformCore> create(std::size_t n, const Filter& uniformity);

    /// Core generated by a single entourage (the principal filter of v)
    [[nodiscard]] static unispace_core::Result<UniformCore> from_entourage(const Relation& v);

    /// Core whose generating entourage is the equivalence with the given classes
    [[nodiscard]] static unispace_core::Result<UniformCore> from_blocks(
        std::size_t n, const std::vector<std::vector<Point>>& blocks);

    // =========================================================================
    // Lattice of Cores
    // =========================================================================

    /// Bottom: generated by the diagonal
    [[nodiscard]] static UniformCore discrete(std::size_t n);

    /// Top: only the full relation is a member
    [[nodiscard]] static UniformCore indiscrete(std::size_t n);

    /// Filter infimum; the axioms are preserved
    [[nodiscard]] static UniformCore inf(const UniformCore& a, const UniformCore& b);

    /// Least core above both operands
    [[nodiscard]] static UniformCore sup(const UniformCore& a, const UniformCore& b);

    /// Infimum of a family; the empty infimum is indiscrete
    [[nodiscard]] static UniformCore inf_all(std::size_t n, const std::vector<UniformCore>& cores);

    /// Supremum of a family; the empty supremum is discrete
    [[nodiscard]] static UniformCore sup_all(std::size_t n, const std::vector<UniformCore>& cores);

    // =========================================================================
    // Constructions
    // =========================================================================

    /// comap (f x f) of the target uniformity
    [[nodiscard]] static UniformCore induced(const FiniteMap& f, const UniformCore& target);

    /// map (f x f) of the source uniformity, validated like create(); fails
    /// when f is not surjective or glues classes without their links
    [[nodiscard]] static unispace_core::Result<UniformCore> coinduced(const FiniteMap& f, const UniformCore& source);

    /// Infimum of the pullbacks along both projections of n1 x n2
    [[nodiscard]] static UniformCore product(const UniformCore& a, const UniformCore& b);

    /// Join of the pushforwards along both injections into n1 + n2
    [[nodiscard]] static UniformCore sum(const UniformCore& a, const UniformCore& b);

    /// Uniformity induced on s, its points numbered in increasing order
    [[nodiscard]] static UniformCore subspace(const UniformCore& core, const Subset& s);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::size_t carrier_size() const noexcept { return m_n; }

    /// The uniformity filter on the pair carrier
    [[nodiscard]] const Filter& uniformity() const noexcept { return m_uniformity; }

    /// The generating entourage, the smallest member
    [[nodiscard]] Relation entourage() const;

    /// v is a member of the uniformity
    [[nodiscard]] bool is_entourage(const Relation& v) const;

    /// ball(x, gen)
    [[nodiscard]] Subset ball(Point x) const;

    /// Finer-than order of the underlying filters
    [[nodiscard]] bool le(const UniformCore& other) const { return m_uniformity.le(other.m_uniformity); }

    bool operator==(const UniformCore& other) const noexcept {
        return m_n == other.m_n && m_uniformity == other.m_uniformity;
    }
    bool operator!=(const UniformCore& other) const noexcept { return !(*this == other); }

    /// The topology whose neighborhood filter at x is comap (y -> (x, y)) U
    [[nodiscard]] Topology to_topology() const;

private:
    UniformCore(std::size_t n, Filter uniformity);

    std::size_t m_n;
    Filter m_uniformity;
};

[[nodiscard]] inline bool coinduced_is_core(const FiniteMap& f, const UniformCore& source) {
    return UniformCore::coinduced(f, source).is_ok();
}

/// ball(x, v) = {y | (x, y) in v}
[[nodiscard]] inline Subset ball(Point x, const Relation& v) { return v.ball(x); }

} // namespace unispace_uniform
