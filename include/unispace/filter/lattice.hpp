#pragma once

/// @file lattice.hpp
/// @brief Filters on finite carriers and their complete lattice
///
/// A filter on {0..n-1} is determined by its generating set: the intersection
/// of all members, which is itself a member. A set belongs to the filter iff
/// it contains the generating set.
///
/// Order follows the "finer is smaller" convention: F <= G iff every member
/// of G is a member of F, i.e. iff gen(F) is contained in gen(G). The bottom
/// filter has every set as a member (empty generating set); the top filter has
/// only the whole carrier.

#include "fwd.hpp"
#include <unispace/set/subset.hpp>
#include <unispace/set/finite_map.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace unispace_filter {

using unispace_set::FiniteMap;
using unispace_set::Point;
using unispace_set::Subset;

// =============================================================================
// Filter
// =============================================================================

/// Immutable filter on a finite carrier, stored as its generating set
class Filter {
public:
    /// Principal filter of a set: members are exactly its supersets
    [[nodiscard]] static Filter principal(const Subset& generating_set);

    [[nodiscard]] static Filter bottom(std::size_t n);
    [[nodiscard]] static Filter top(std::size_t n);

    /// Principal filter of a single point
    [[nodiscard]] static Filter pure(std::size_t n, Point x);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::size_t carrier_size() const noexcept { return m_generating.carrier_size(); }

    /// Intersection of all members; the canonical basis
    [[nodiscard]] const Subset& generating_set() const noexcept { return m_generating; }

    /// Membership test
    [[nodiscard]] bool contains(const Subset& s) const { return m_generating.subset_of(s); }

    /// Every member of other is a member of this
    [[nodiscard]] bool le(const Filter& other) const { return m_generating.subset_of(other.m_generating); }

    [[nodiscard]] bool is_bottom() const noexcept { return m_generating.is_empty(); }
    [[nodiscard]] bool is_top() const noexcept { return m_generating.is_univ(); }

    /// Non-trivial: the empty set is not a member
    [[nodiscard]] bool ne_bot() const noexcept { return !m_generating.is_empty(); }

    /// {x | pred x} is a member
    [[nodiscard]] bool eventually(const std::function<bool(Point)>& pred) const;

    /// {x | not pred x} is not a member
    [[nodiscard]] bool frequently(const std::function<bool(Point)>& pred) const;

    /// All members, in enumeration order. 2^(n - |gen|) sets; small carriers only.
    [[nodiscard]] std::vector<Subset> members() const;

    bool operator==(const Filter& other) const noexcept { return m_generating == other.m_generating; }
    bool operator!=(const Filter& other) const noexcept { return !(*this == other); }

    /// Render as "<{0, 1}>"
    [[nodiscard]] std::string to_string() const;

private:
    explicit Filter(Subset generating_set);

    Subset m_generating;
};

// =============================================================================
// Pullback and Pushforward
// =============================================================================

/// comap f F: members are the sets containing f^-1(M) for a member M of F
[[nodiscard]] Filter comap(const FiniteMap& f, const Filter& filter);

/// map f F: members are the sets whose preimage under f is a member of F
[[nodiscard]] Filter map(const FiniteMap& f, const Filter& filter);

/// map f F <= G
[[nodiscard]] bool tendsto(const FiniteMap& f, const Filter& source, const Filter& target);

// =============================================================================
// Lattice Operations
// =============================================================================

/// Meet: generated by the union of both member families
[[nodiscard]] Filter inf(const Filter& a, const Filter& b);

/// Join: intersection of both member families
[[nodiscard]] Filter sup(const Filter& a, const Filter& b);

/// Meet of a family on a carrier with n points; the empty meet is top
[[nodiscard]] Filter inf_all(std::size_t n, const std::vector<Filter>& filters);

/// Join of a family on a carrier with n points; the empty join is bottom
[[nodiscard]] Filter sup_all(std::size_t n, const std::vector<Filter>& filters);

/// Product filter on the product carrier: generated by gen(a) x gen(b)
[[nodiscard]] Filter prod(const Filter& a, const Filter& b);

} // namespace unispace_filter
