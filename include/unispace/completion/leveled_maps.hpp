#pragma once

/// @file leveled_maps.hpp
/// @brief Uniformly continuous maps and dense embeddings between leveled spaces

#include "leveled_space.hpp"
#include <unispace/core/error.hpp>
#include <unispace/core/log.hpp>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace unispace_completion {

// =============================================================================
// UniformlyContinuousMap
// =============================================================================

/// Map together with a modulus of uniform continuity:
/// (p, q) ∈ V_{modulus(k)} implies (f p, f q) ∈ V_k
template<LeveledSpace Src, LeveledSpace Dst>
class UniformlyContinuousMap {
public:
    using SourcePoint = typename Src::Point;
    using TargetPoint = typename Dst::Point;
    using Function = std::function<TargetPoint(const SourcePoint&)>;
    using Modulus = std::function<Level(Level)>;

    UniformlyContinuousMap(Src source, Dst target, Function fn, Modulus modulus, std::string name = "f")
        : m_source(std::move(source))
        , m_target(std::move(target))
        , m_fn(std::move(fn))
        , m_modulus(std::move(modulus))
        , m_name(std::move(name)) {}

    /// Construct after checking the modulus on every pair of samples up to max_level
    [[nodiscard]] static unispace_core::Result<UniformlyContinuousMap> create(
        Src source, Dst target, Function fn, Modulus modulus,
        const std::vector<SourcePoint>& samples, Level max_level, std::string name = "f") {
        UniformlyContinuousMap candidate(std::move(source), std::move(target), std::move(fn),
            std::move(modulus), std::move(name));
        for (Level k = 0; k <= max_level; ++k) {
            const Level m = candidate.modulus(k);
            for (const auto& p : samples) {
                for (const auto& q : samples) {
                    if (candidate.m_source.within(p, q, m) &&
                        !candidate.m_target.within(candidate(p), candidate(q), k)) {
                        unispace_core::Error error(
                            unispace_core::EmbeddingError::not_uniformly_continuous(candidate.m_name));
                        error.with_context("level", std::to_string(k));
                        unispace_core::completion_logger()->warn("{}", unispace_core::build_error_chain(error));
                        return unispace_core::Err<UniformlyContinuousMap>(std::move(error));
                    }
                }
            }
        }
        return unispace_core::Ok(std::move(candidate));
    }

    [[nodiscard]] TargetPoint operator()(const SourcePoint& p) const { return m_fn(p); }
    [[nodiscard]] Level modulus(Level k) const { return m_modulus(k); }

    [[nodiscard]] const Src& source() const noexcept { return m_source; }
    [[nodiscard]] const Dst& target() const noexcept { return m_target; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

private:
    Src m_source;
    Dst m_target;
    Function m_fn;
    Modulus m_modulus;
    std::string m_name;
};

/// g after f; the moduli compose in the opposite order
template<LeveledSpace A, LeveledSpace B, LeveledSpace C>
[[nodiscard]] UniformlyContinuousMap<A, C> compose(const UniformlyContinuousMap<B, C>& g,
                                                   const UniformlyContinuousMap<A, B>& f) {
    return UniformlyContinuousMap<A, C>(
        f.source(), g.target(),
        [g, f](const typename A::Point& p) { return g(f(p)); },
        [g, f](Level k) { return f.modulus(g.modulus(k)); },
        g.name() + " o " + f.name());
}

// =============================================================================
// DenseUniformEmbedding
// =============================================================================

/// Uniformly inducing map e : Beta -> Alpha with dense range.
///
/// - approximate(a, k) is a density witness: (e(approximate(a, k)), a) ∈ V_k
/// - inducing_modulus(k): (e p, e q) ∈ V_{inducing_modulus(k)} implies (p, q) ∈ V_k
template<LeveledSpace Beta, LeveledSpace Alpha>
class DenseUniformEmbedding {
public:
    using BetaPoint = typename Beta::Point;
    using AlphaPoint = typename Alpha::Point;
    using Embed = std::function<AlphaPoint(const BetaPoint&)>;
    using Approximate = std::function<BetaPoint(const AlphaPoint&, Level)>;
    using Modulus = std::function<Level(Level)>;

    DenseUniformEmbedding(Beta beta, Alpha alpha, Embed embed, Approximate approximate,
                          Modulus inducing_modulus, std::string name = "e")
        : m_beta(std::move(beta))
        , m_alpha(std::move(alpha))
        , m_embed(std::move(embed))
        , m_approximate(std::move(approximate))
        , m_inducing_modulus(std::move(inducing_modulus))
        , m_name(std::move(name)) {}

    /// Construct after checking density witnesses on alpha samples and the
    /// inducing modulus on pairs of beta samples, for levels up to max_level
    [[nodiscard]] static unispace_core::Result<DenseUniformEmbedding> create(
        Beta beta, Alpha alpha, Embed embed, Approximate approximate, Modulus inducing_modulus,
        const std::vector<BetaPoint>& beta_samples, const std::vector<AlphaPoint>& alpha_samples,
        Level max_level, std::string name = "e") {
        using unispace_core::EmbeddingError;
        using unispace_core::Err;
        using unispace_core::Error;

        DenseUniformEmbedding candidate(std::move(beta), std::move(alpha), std::move(embed),
            std::move(approximate), std::move(inducing_modulus), std::move(name));

        auto reject = [&candidate](EmbeddingError kind, Level k) {
            Error error(std::move(kind));
            error.with_context("level", std::to_string(k));
            unispace_core::completion_logger()->warn("{}", unispace_core::build_error_chain(error));
            return Err<DenseUniformEmbedding>(std::move(error));
        };

        for (Level k = 0; k <= max_level; ++k) {
            for (const auto& a : alpha_samples) {
                if (!candidate.m_alpha.within(candidate.embed(candidate.approximate(a, k)), a, k)) {
                    return reject(EmbeddingError::not_dense(candidate.m_name), k);
                }
            }
            const Level m = candidate.inducing_modulus(k);
            for (const auto& p : beta_samples) {
                for (const auto& q : beta_samples) {
                    if (candidate.m_alpha.within(candidate.embed(p), candidate.embed(q), m) &&
                        !candidate.m_beta.within(p, q, k)) {
                        return reject(EmbeddingError::not_inducing(candidate.m_name), k);
                    }
                }
            }
        }
        unispace_core::completion_logger()->debug("dense embedding {}: {} -> {}",
            candidate.m_name, candidate.m_beta.name(), candidate.m_alpha.name());
        return unispace_core::Ok(std::move(candidate));
    }

    [[nodiscard]] AlphaPoint embed(const BetaPoint& b) const { return m_embed(b); }
    [[nodiscard]] AlphaPoint operator()(const BetaPoint& b) const { return m_embed(b); }
    [[nodiscard]] BetaPoint approximate(const AlphaPoint& a, Level k) const { return m_approximate(a, k); }
    [[nodiscard]] Level inducing_modulus(Level k) const { return m_inducing_modulus(k); }

    [[nodiscard]] const Beta& beta() const noexcept { return m_beta; }
    [[nodiscard]] const Alpha& alpha() const noexcept { return m_alpha; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

private:
    Beta m_beta;
    Alpha m_alpha;
    Embed m_embed;
    Approximate m_approximate;
    Modulus m_inducing_modulus;
    std::string m_name;
};

} // namespace unispace_completion
