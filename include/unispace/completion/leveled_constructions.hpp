#pragma once

/// @file leveled_constructions.hpp
/// @brief Products, disjoint unions and closed subspaces of leveled spaces
///
/// Completeness is transported: a Cauchy filter on the construction maps to
/// Cauchy filters on the factors (or on one summand, or on the ambient
/// space), whose limits assemble the limit.

#include "leveled_space.hpp"
#include <functional>
#include <string>
#include <utility>
#include <variant>

namespace unispace_completion {

// =============================================================================
// ProductSpace
// =============================================================================

/// Product uniformity: (p, q) ∈ V_k iff both components are in V_k
template<LeveledSpace A, LeveledSpace B>
class ProductSpace {
public:
    using Point = std::pair<typename A::Point, typename B::Point>;

    static constexpr bool is_separated = SeparatedSpace<A> && SeparatedSpace<B>;

    ProductSpace() = default;
    ProductSpace(A first, B second)
        : m_first(std::move(first))
        , m_second(std::move(second)) {}

    [[nodiscard]] bool within(const Point& p, const Point& q, Level k) const {
        return m_first.within(p.first, q.first, k) && m_second.within(p.second, q.second, k);
    }

    [[nodiscard]] Point find_limit(const CauchyFilter<Point>& filter) const
        requires CompleteSpace<A> && CompleteSpace<B> {
        const auto first = filter.map([](const Point& p) { return p.first; });
        const auto second = filter.map([](const Point& p) { return p.second; });
        return Point(m_first.find_limit(first), m_second.find_limit(second));
    }

    [[nodiscard]] std::string name() const { return m_first.name() + " x " + m_second.name(); }

    [[nodiscard]] const A& first() const noexcept { return m_first; }
    [[nodiscard]] const B& second() const noexcept { return m_second; }

private:
    A m_first;
    B m_second;
};

// =============================================================================
// SumSpace
// =============================================================================

/// Disjoint union: points on different sides are never related, at any level
template<LeveledSpace A, LeveledSpace B>
class SumSpace {
public:
    using Point = std::variant<typename A::Point, typename B::Point>;

    static constexpr bool is_separated = SeparatedSpace<A> && SeparatedSpace<B>;

    SumSpace() = default;
    SumSpace(A left, B right)
        : m_left(std::move(left))
        , m_right(std::move(right)) {}

    [[nodiscard]] static Point inl(const typename A::Point& p) { return Point(std::in_place_index<0>, p); }
    [[nodiscard]] static Point inr(const typename B::Point& p) { return Point(std::in_place_index<1>, p); }

    [[nodiscard]] bool within(const Point& p, const Point& q, Level k) const {
        if (p.index() != q.index()) return false;
        if (p.index() == 0) {
            return m_left.within(std::get<0>(p), std::get<0>(q), k);
        }
        return m_right.within(std::get<1>(p), std::get<1>(q), k);
    }

    /// The side is fixed by the level 0 approximant: all later approximants
    /// are V_0-related to it
    [[nodiscard]] Point find_limit(const CauchyFilter<Point>& filter) const
        requires CompleteSpace<A> && CompleteSpace<B> {
        if (filter(0).index() == 0) {
            return inl(m_left.find_limit(filter.map([](const Point& p) { return std::get<0>(p); })));
        }
        return inr(m_right.find_limit(filter.map([](const Point& p) { return std::get<1>(p); })));
    }

    [[nodiscard]] std::string name() const { return m_left.name() + " + " + m_right.name(); }

private:
    A m_left;
    B m_right;
};

// =============================================================================
// ClosedSubspace
// =============================================================================

/// Subspace cut out by a closed predicate, with the induced uniformity.
/// Closedness keeps limits of Cauchy filters on the subspace inside it.
template<LeveledSpace S>
class ClosedSubspace {
public:
    using Point = typename S::Point;
    using Predicate = std::function<bool(const Point&)>;

    static constexpr bool is_separated = SeparatedSpace<S>;

    ClosedSubspace(S ambient, Predicate contains, std::string name)
        : m_ambient(std::move(ambient))
        , m_contains(std::move(contains))
        , m_name(std::move(name)) {}

    [[nodiscard]] bool contains(const Point& p) const { return m_contains(p); }

    [[nodiscard]] bool within(const Point& p, const Point& q, Level k) const {
        return m_ambient.within(p, q, k);
    }

    [[nodiscard]] Point find_limit(const CauchyFilter<Point>& filter) const
        requires CompleteSpace<S> {
        return m_ambient.find_limit(filter);
    }

    [[nodiscard]] std::string name() const { return m_name; }
    [[nodiscard]] const S& ambient() const noexcept { return m_ambient; }

private:
    S m_ambient;
    Predicate m_contains;
    std::string m_name;
};

} // namespace unispace_completion
