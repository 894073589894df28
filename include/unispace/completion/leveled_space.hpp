#pragma once

/// @file leveled_space.hpp
/// @brief Uniform spaces with a countable entourage basis
///
/// A leveled space exposes its uniformity through a decreasing basis
/// V_0 ⊇ V_1 ⊇ ... of symmetric entourages with V_{k+1} o V_{k+1} ⊆ V_k.
/// `space.within(p, q, k)` decides (p, q) ∈ V_k. Raising the level by one is
/// one shrink step, so the symmetric three-fold shrink of V_k is V_{k+2}.

#include <unispace/core/error.hpp>
#include <concepts>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace unispace_completion {

/// Index into the entourage basis
using Level = std::uint32_t;

// =============================================================================
// Concepts
// =============================================================================

template<typename S>
concept LeveledSpace = requires(const S& space, const typename S::Point& p, const typename S::Point& q, Level k) {
    typename S::Point;
    { space.within(p, q, k) } -> std::convertible_to<bool>;
    { space.name() } -> std::convertible_to<std::string>;
};

/// Points related at every level are equal
template<typename S>
concept SeparatedSpace = LeveledSpace<S> && requires {
    requires S::is_separated;
};

template<typename P>
class CauchyFilter;

/// Every Cauchy filter has a limit, produced by find_limit
template<typename S>
concept CompleteSpace = LeveledSpace<S> && requires(const S& space, const CauchyFilter<typename S::Point>& filter) {
    { space.find_limit(filter) } -> std::same_as<typename S::Point>;
};

// =============================================================================
// CauchyFilter
// =============================================================================

/// Cauchy filter given by approximants: the filter generated by the tails
/// {approximant(j) | j >= l}, with (approximant(j), approximant(k)) ∈ V_l
/// whenever j, k >= l
template<typename P>
class CauchyFilter {
public:
    using Approximant = std::function<P(Level)>;

    explicit CauchyFilter(Approximant approximant)
        : m_approximant(std::move(approximant)) {}

    [[nodiscard]] P operator()(Level level) const { return m_approximant(level); }

    /// Pushforward along a map carrying V_l into V_l
    template<typename F>
    [[nodiscard]] auto map(F&& fn) const -> CauchyFilter<std::decay_t<decltype(fn(std::declval<P>()))>> {
        using Q = std::decay_t<decltype(fn(std::declval<P>()))>;
        return CauchyFilter<Q>([approximant = m_approximant, fn = std::forward<F>(fn)](Level level) {
            return fn(approximant(level));
        });
    }

private:
    Approximant m_approximant;
};

// =============================================================================
// Basis Axioms
// =============================================================================

/// Check the leveled basis axioms on every pair and triple of sample points
/// for levels 0..max_level: reflexivity, symmetry, nesting and
/// V_{k+1} o V_{k+1} ⊆ V_k
template<LeveledSpace S>
[[nodiscard]] unispace_core::Result<void> verify_basis_axioms(
    const S& space, const std::vector<typename S::Point>& samples, Level max_level) {
    using unispace_core::AxiomError;
    using unispace_core::Err;
    using unispace_core::Error;
    using unispace_core::Ok;

    auto reject = [&space](AxiomError axiom, Level k) {
        Error error(std::move(axiom));
        error.with_context("space", space.name()).with_context("level", std::to_string(k));
        return Err<void>(std::move(error));
    };
    auto samples_at = [](std::size_t i, std::size_t j) {
        return "samples " + std::to_string(i) + "," + std::to_string(j);
    };

    const std::size_t n = samples.size();
    for (Level k = 0; k < max_level; ++k) {
        for (std::size_t i = 0; i < n; ++i) {
            if (!space.within(samples[i], samples[i], k)) {
                return reject(AxiomError::reflexivity("sample " + std::to_string(i)), k);
            }
            for (std::size_t j = 0; j < n; ++j) {
                if (space.within(samples[i], samples[j], k) != space.within(samples[j], samples[i], k)) {
                    return reject(AxiomError::symmetry(samples_at(i, j)), k);
                }
                const bool fine = space.within(samples[i], samples[j], k + 1);
                if (!fine) continue;
                if (!space.within(samples[i], samples[j], k)) {
                    return reject(AxiomError::triangle(samples_at(i, j) + " (nesting)"), k);
                }
                for (std::size_t l = 0; l < n; ++l) {
                    if (space.within(samples[j], samples[l], k + 1) && !space.within(samples[i], samples[l], k)) {
                        return reject(AxiomError::triangle(samples_at(i, l)), k);
                    }
                }
            }
        }
    }
    return Ok();
}

} // namespace unispace_completion
