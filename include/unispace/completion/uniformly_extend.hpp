#pragma once

/// @file uniformly_extend.hpp
/// @brief Extension of uniformly continuous maps along dense embeddings
///
/// Given a dense uniform embedding e : Beta -> Alpha and a uniformly
/// continuous f : Beta -> Gamma into a complete separated space, the
/// extension psi : Alpha -> Gamma sends a to the limit of the Cauchy filter
/// f(comap e (nhds a)). On leveled spaces that filter is generated by the
/// approximants f(approximate(a, L(k))), where
///
///     L(k) = inducing_modulus(f.modulus(k)) + 2
///
/// makes any two approximants of index >= k land in V_k.

#include "leveled_maps.hpp"
#include "leveled_space.hpp"
#include <unispace/core/log.hpp>
#include <optional>
#include <utility>

namespace unispace_completion {

template<LeveledSpace Beta, LeveledSpace Alpha, LeveledSpace Gamma>
    requires CompleteSpace<Gamma> && SeparatedSpace<Gamma>
class Extension {
public:
    using BetaPoint = typename Beta::Point;
    using AlphaPoint = typename Alpha::Point;
    using GammaPoint = typename Gamma::Point;

    /// A point where a candidate is separated from every continuous extension:
    /// its value at `point` is not V_level-close to psi(point), while
    /// e(witness) is arbitrarily close to `point` and f(witness) is
    /// V_{level+1}-close to psi(point)
    struct Defect {
        AlphaPoint point;
        Level level;
        BetaPoint witness;
        GammaPoint candidate_value;
        GammaPoint extension_value;
    };

    Extension(DenseUniformEmbedding<Beta, Alpha> embedding, UniformlyContinuousMap<Beta, Gamma> map)
        : m_embedding(std::move(embedding))
        , m_map(std::move(map)) {}

    /// psi(a): the limit of f along the approximants of a
    [[nodiscard]] GammaPoint operator()(const AlphaPoint& a) const {
        CauchyFilter<GammaPoint> filter([this, a](Level k) {
            return m_map(m_embedding.approximate(a, approximation_level(k)));
        });
        return m_map.target().find_limit(filter);
    }

    /// Level of the density witness used for the k-th approximant
    [[nodiscard]] Level approximation_level(Level k) const {
        return m_embedding.inducing_modulus(m_map.modulus(k)) + 2;
    }

    /// Modulus of uniform continuity of psi: (a, a') ∈ V_{modulus(d)} implies
    /// (psi a, psi a') ∈ V_d. Three-fold shrink: psi a, f(b), f(b'), psi a'
    /// are consecutively V_{d+2}-close and V_{d+2} o V_{d+2} o V_{d+2} ⊆ V_d.
    [[nodiscard]] Level modulus(Level target_level) const {
        return approximation_level(target_level + 3);
    }

    /// Separation argument at a single point. Returns the defect when the
    /// candidate's value at a is not V_level-close to psi(a); such a candidate
    /// cannot be a continuous extension of f.
    template<typename Candidate>
    [[nodiscard]] std::optional<Defect> find_defect(const Candidate& candidate, const AlphaPoint& a,
                                                    Level level) const {
        const GammaPoint extension_value = (*this)(a);
        const GammaPoint candidate_value = candidate(a);
        if (m_map.target().within(candidate_value, extension_value, level)) {
            return std::nullopt;
        }
        const BetaPoint witness = m_embedding.approximate(a, approximation_level(level + 2));
        unispace_core::completion_logger()->debug("extension candidate separated at level {}", level);
        return Defect{a, level, witness, candidate_value, extension_value};
    }

    [[nodiscard]] const DenseUniformEmbedding<Beta, Alpha>& embedding() const noexcept { return m_embedding; }
    [[nodiscard]] const UniformlyContinuousMap<Beta, Gamma>& map() const noexcept { return m_map; }

private:
    DenseUniformEmbedding<Beta, Alpha> m_embedding;
    UniformlyContinuousMap<Beta, Gamma> m_map;
};

/// Build the extension of f along e
template<LeveledSpace Beta, LeveledSpace Alpha, LeveledSpace Gamma>
    requires CompleteSpace<Gamma> && SeparatedSpace<Gamma>
[[nodiscard]] Extension<Beta, Alpha, Gamma> uniformly_extend(DenseUniformEmbedding<Beta, Alpha> e,
                                                             UniformlyContinuousMap<Beta, Gamma> f) {
    unispace_core::completion_logger()->debug("extending {} along {}: {} -> {}",
        f.name(), e.name(), e.alpha().name(), f.target().name());
    return Extension<Beta, Alpha, Gamma>(std::move(e), std::move(f));
}

} // namespace unispace_completion
