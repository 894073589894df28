#pragma once

/// @file finite_map.hpp
/// @brief Total functions between finite carriers

#include "fwd.hpp"
#include "subset.hpp"
#include <unispace/core/error.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace unispace_set {

/// Total function {0..n-1} -> {0..m-1} stored as a lookup table
class FiniteMap {
public:
    /// Map with the given codomain size and table; throws std::out_of_range
    /// if some entry lies outside the codomain
    FiniteMap(std::size_t codomain_size, std::vector<Point> table);

    /// Validating constructor for externally supplied tables
    [[nodiscard]] static unispace_core::Result<FiniteMap> create(
        std::size_t domain_size, std::size_t codomain_size, std::vector<Point> table);

    // =========================================================================
    // Standard Maps
    // =========================================================================

    [[nodiscard]] static FiniteMap identity(std::size_t n);
    [[nodiscard]] static FiniteMap constant(std::size_t n, std::size_t m, Point value);

    /// (x, y) -> (y, x) on the pair carrier of n
    [[nodiscard]] static FiniteMap swap(std::size_t n);

    /// First projection of the product n1 x n2
    [[nodiscard]] static FiniteMap fst(std::size_t n1, std::size_t n2);

    /// Second projection of the product n1 x n2
    [[nodiscard]] static FiniteMap snd(std::size_t n1, std::size_t n2);

    /// Left injection n1 -> n1 + n2
    [[nodiscard]] static FiniteMap inl(std::size_t n1, std::size_t n2);

    /// Right injection n2 -> n1 + n2
    [[nodiscard]] static FiniteMap inr(std::size_t n1, std::size_t n2);

    /// y -> (x, y) into the pair carrier of n
    [[nodiscard]] static FiniteMap section(std::size_t n, Point x);

    /// x -> (x, x) into the pair carrier of n
    [[nodiscard]] static FiniteMap diagonal(std::size_t n);

    /// Inclusion of s into its carrier, numbering the points of s in order
    [[nodiscard]] static FiniteMap inclusion(const Subset& s);

    /// (a, b) -> (f a, g b)
    [[nodiscard]] static FiniteMap prod_map(const FiniteMap& f, const FiniteMap& g);

    /// f x f, the action of f on pair carriers
    [[nodiscard]] static FiniteMap pair_map(const FiniteMap& f);

    // =========================================================================
    // Evaluation
    // =========================================================================

    [[nodiscard]] std::size_t domain_size() const noexcept { return m_table.size(); }
    [[nodiscard]] std::size_t codomain_size() const noexcept { return m_codomain; }

    [[nodiscard]] Point operator()(Point x) const { return m_table.at(x); }

    [[nodiscard]] const std::vector<Point>& table() const noexcept { return m_table; }

    // =========================================================================
    // Composition and Images
    // =========================================================================

    /// this ∘ f, i.e. x -> this(f(x)); f's codomain must be this domain
    [[nodiscard]] FiniteMap after(const FiniteMap& f) const;

    [[nodiscard]] Subset image(const Subset& s) const;
    [[nodiscard]] Subset preimage(const Subset& s) const;
    [[nodiscard]] Subset range() const;

    [[nodiscard]] bool is_injective() const;
    [[nodiscard]] bool is_surjective() const;

    bool operator==(const FiniteMap& other) const noexcept {
        return m_codomain == other.m_codomain && m_table == other.m_table;
    }

    [[nodiscard]] std::string to_string() const;

private:
    std::size_t m_codomain;
    std::vector<Point> m_table;
};

} // namespace unispace_set
