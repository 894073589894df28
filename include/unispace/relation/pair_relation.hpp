#pragma once

/// @file pair_relation.hpp
/// @brief Binary relations on a finite carrier (entourage candidates)
///
/// A relation on {0..n-1} is a subset of the pair carrier {0..n*n-1}, pair
/// (x, y) stored at x*n + y. Composition uses the middle-point convention
///
///     V o W = {(x, y) | exists z, (x, z) in V and (z, y) in W}

#include <unispace/set/subset.hpp>
#include <unispace/set/pair.hpp>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace unispace_relation {

using unispace_set::Point;
using unispace_set::Subset;

/// Immutable-style relation value on a carrier with n points
class Relation {
public:
    /// Empty relation on a carrier with n points
    explicit Relation(std::size_t n = 0);

    // =========================================================================
    // Factories
    // =========================================================================

    [[nodiscard]] static Relation empty(std::size_t n) { return Relation(n); }
    [[nodiscard]] static Relation full(std::size_t n);

    /// The diagonal {(x, x)}
    [[nodiscard]] static Relation id_rel(std::size_t n);

    [[nodiscard]] static Relation from_pairs(std::size_t n, std::initializer_list<std::pair<Point, Point>> pairs);
    [[nodiscard]] static Relation from_pairs(std::size_t n, const std::vector<std::pair<Point, Point>>& pairs);

    /// Reinterpret a subset of the pair carrier of n
    [[nodiscard]] static Relation from_subset(std::size_t n, const Subset& pairs);

    /// Equivalence relation whose classes are the given blocks.
    /// Points not covered by any block form singleton classes.
    [[nodiscard]] static Relation from_blocks(std::size_t n, const std::vector<std::vector<Point>>& blocks);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::size_t carrier_size() const noexcept { return m_n; }
    [[nodiscard]] bool contains(Point x, Point y) const noexcept;
    [[nodiscard]] std::size_t count() const noexcept { return m_pairs.count(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_pairs.is_empty(); }

    [[nodiscard]] bool is_reflexive() const;
    [[nodiscard]] bool is_symmetric() const;
    [[nodiscard]] bool is_transitive() const;
    [[nodiscard]] bool is_equivalence() const { return is_reflexive() && is_symmetric() && is_transitive(); }

    [[nodiscard]] bool subset_of(const Relation& other) const;

    /// ball(x) = {y | (x, y) in this}
    [[nodiscard]] Subset ball(Point x) const;

    /// Image of a set: {y | exists x in s, (x, y) in this}
    [[nodiscard]] Subset image(const Subset& s) const;

    [[nodiscard]] std::vector<std::pair<Point, Point>> pairs() const;

    /// The relation as a subset of the pair carrier
    [[nodiscard]] const Subset& as_subset() const noexcept { return m_pairs; }

    // =========================================================================
    // Algebra
    // =========================================================================

    /// {(y, x) | (x, y) in this}
    [[nodiscard]] Relation swap() const;

    [[nodiscard]] Relation operator|(const Relation& other) const;
    [[nodiscard]] Relation operator&(const Relation& other) const;

    bool operator==(const Relation& other) const noexcept { return m_n == other.m_n && m_pairs == other.m_pairs; }
    bool operator!=(const Relation& other) const noexcept { return !(*this == other); }

    /// "{(0,1), (1,0)}"
    [[nodiscard]] std::string to_string() const;

private:
    void require_same_carrier(const Relation& other) const;

    std::size_t m_n;
    Subset m_pairs;
};

// =============================================================================
// Relation Algebra
// =============================================================================

/// V o W with the middle-point convention
[[nodiscard]] Relation compose(const Relation& v, const Relation& w);

/// V intersected with swap(V)
[[nodiscard]] Relation symmetrize(const Relation& v);

/// Least transitive relation containing v
[[nodiscard]] Relation transitive_closure(const Relation& v);

/// Least equivalence relation containing v
[[nodiscard]] Relation equivalence_closure(const Relation& v);

/// On the product carrier n1*n2: (a, b) ~ (a', b') iff (a, a') in V and (b, b') in W
[[nodiscard]] Relation prod_rel(const Relation& v, const Relation& w);

/// On the disjoint union n1+n2: V on the left summand, W on the right, no cross pairs
[[nodiscard]] Relation sum_rel(const Relation& v, const Relation& w);

/// True iff y in ball(x, v), z in ball(y, w) imply z in ball(x, v o w) for all x, y, z
[[nodiscard]] bool ball_triangle_holds(const Relation& v, const Relation& w);

} // namespace unispace_relation
