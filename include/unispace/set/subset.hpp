#pragma once

/// @file subset.hpp
/// @brief Subsets of a finite carrier

#include "fwd.hpp"
#include <unispace/structures/bitset.hpp>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace unispace_set {

/// Subset of the carrier {0..n-1}
///
/// A value type. Binary operations require both operands to live on the same
/// carrier and throw std::invalid_argument otherwise.
class Subset {
public:
    /// Empty subset of a carrier with n points
    explicit Subset(std::size_t carrier_size = 0);

    // =========================================================================
    // Factories
    // =========================================================================

    [[nodiscard]] static Subset empty(std::size_t n);
    [[nodiscard]] static Subset univ(std::size_t n);
    [[nodiscard]] static Subset singleton(std::size_t n, Point x);
    [[nodiscard]] static Subset of(std::size_t n, std::initializer_list<Point> points);
    [[nodiscard]] static Subset of(std::size_t n, const std::vector<Point>& points);
    [[nodiscard]] static Subset from_predicate(std::size_t n, const std::function<bool(Point)>& pred);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::size_t carrier_size() const noexcept { return m_bits.size(); }

    /// Membership; points outside the carrier are never members
    [[nodiscard]] bool contains(Point x) const noexcept { return m_bits.get(x); }

    [[nodiscard]] std::size_t count() const noexcept { return m_bits.count_ones(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_bits.none(); }
    [[nodiscard]] bool is_univ() const noexcept { return m_bits.all(); }

    /// Inclusion this ⊆ other
    [[nodiscard]] bool subset_of(const Subset& other) const;

    [[nodiscard]] bool intersects(const Subset& other) const;

    /// Least member, if any
    [[nodiscard]] std::optional<Point> first() const noexcept;

    [[nodiscard]] std::vector<Point> elements() const;

    // =========================================================================
    // Mutation (builders)
    // =========================================================================

    /// Add a point; throws std::out_of_range outside the carrier
    void insert(Point x);

    void erase(Point x);

    // =========================================================================
    // Set Algebra
    // =========================================================================

    [[nodiscard]] Subset operator|(const Subset& other) const;
    [[nodiscard]] Subset operator&(const Subset& other) const;
    [[nodiscard]] Subset operator-(const Subset& other) const;
    [[nodiscard]] Subset complement() const;

    Subset& operator|=(const Subset& other);
    Subset& operator&=(const Subset& other);

    bool operator==(const Subset& other) const noexcept { return m_bits == other.m_bits; }
    bool operator!=(const Subset& other) const noexcept { return !(*this == other); }

    /// Total order used to key maps of subsets
    [[nodiscard]] bool lexicographic_less(const Subset& other) const noexcept;

    // =========================================================================
    // Iteration
    // =========================================================================

    [[nodiscard]] auto begin() const { return m_bits.iter_ones().begin(); }
    [[nodiscard]] auto end() const { return m_bits.iter_ones().end(); }

    [[nodiscard]] const unispace_structures::BitSet& bits() const noexcept { return m_bits; }

    /// Render as "{0, 2, 5}"
    [[nodiscard]] std::string to_string() const;

private:
    void require_same_carrier(const Subset& other) const;

    unispace_structures::BitSet m_bits;
};

// =============================================================================
// Enumeration
// =============================================================================

/// Number of supersets of base within its carrier
[[nodiscard]] inline std::size_t supersets_count(const Subset& base) {
    const std::size_t free_points = base.carrier_size() - base.count();
    if (free_points >= 40) {
        throw std::length_error("supersets_count: too many free points to enumerate");
    }
    return std::size_t(1) << free_points;
}

/// Call fn on every superset of base within its carrier.
/// There are 2^(n - |base|) of them; intended for small carriers.
template<typename F>
void for_each_superset(const Subset& base, F&& fn) {
    const std::size_t n = base.carrier_size();
    std::vector<Point> free_points;
    for (Point x = 0; x < n; ++x) {
        if (!base.contains(x)) free_points.push_back(x);
    }
    const std::size_t k = free_points.size();
    if (k >= 40) {
        throw std::length_error("for_each_superset: too many free points to enumerate");
    }
    const std::size_t total = std::size_t(1) << k;
    for (std::size_t mask = 0; mask < total; ++mask) {
        Subset s = base;
        for (std::size_t i = 0; i < k; ++i) {
            if ((mask >> i) & 1) s.insert(free_points[i]);
        }
        fn(s);
    }
}

/// Call fn on every subset of a carrier with n points
template<typename F>
void for_each_subset(std::size_t n, F&& fn) {
    for_each_superset(Subset::empty(n), std::forward<F>(fn));
}

} // namespace unispace_set
