/// @file maps.cpp
/// @brief Map predicates and witnesses for unispace_uniform

#include <unispace/uniform/maps.hpp>
#include <unispace/core/log.hpp>

#include <stdexcept>

namespace unispace_uniform {

using unispace_core::CarrierError;
using unispace_core::EmbeddingError;
using unispace_core::Err;
using unispace_core::Error;
using unispace_core::Ok;
using unispace_core::Result;

namespace {

void require_matching(const FiniteMap& f, const UniformCore& source, const UniformCore& target) {
    if (f.domain_size() != source.carrier_size() || f.codomain_size() != target.carrier_size()) {
        throw std::invalid_argument("map " + f.to_string() + " does not match the carriers " +
            std::to_string(source.carrier_size()) + " -> " + std::to_string(target.carrier_size()));
    }
}

std::optional<Error> check_carriers(const FiniteMap& f, const UniformCore& source, const UniformCore& target) {
    if (f.domain_size() != source.carrier_size()) {
        return Error(CarrierError::size_mismatch(source.carrier_size(), f.domain_size()));
    }
    if (f.codomain_size() != target.carrier_size()) {
        return Error(CarrierError::size_mismatch(target.carrier_size(), f.codomain_size()));
    }
    return std::nullopt;
}

template<typename T>
Result<T> reject(Error error, const std::string& name) {
    error.with_context("map", name);
    unispace_core::debug::record_error(error);
    unispace_core::uniform_logger()->warn("map witness rejected: {}", error.message());
    return Err<T>(std::move(error));
}

void require_composable(const MapWitness& g, const MapWitness& f) {
    if (f.target() != g.source()) {
        throw std::invalid_argument("compose: target of " + f.name() + " is not the source of " + g.name());
    }
}

} // anonymous namespace

// =============================================================================
// Predicates
// =============================================================================

bool is_uniformly_continuous(const FiniteMap& f, const UniformCore& source, const UniformCore& target) {
    require_matching(f, source, target);
    return unispace_filter::tendsto(FiniteMap::pair_map(f), source.uniformity(), target.uniformity());
}

bool is_uniform_inducing(const FiniteMap& f, const UniformCore& source, const UniformCore& target) {
    require_matching(f, source, target);
    return unispace_filter::comap(FiniteMap::pair_map(f), target.uniformity()) == source.uniformity();
}

bool is_uniform_embedding(const FiniteMap& f, const UniformCore& source, const UniformCore& target) {
    return is_uniform_inducing(f, source, target) && f.is_injective();
}

bool is_dense_inducing(const FiniteMap& f, const UniformCore& source, const UniformCore& target) {
    return is_uniform_inducing(f, source, target) && target.to_topology().is_dense(f.range());
}

// =============================================================================
// UniformlyContinuous
// =============================================================================

Result<UniformlyContinuous> UniformlyContinuous::create(FiniteMap f, UniformCore source, UniformCore target,
                                                        std::string name) {
    if (auto error = check_carriers(f, source, target)) {
        return reject<UniformlyContinuous>(std::move(*error), name);
    }
    if (!is_uniformly_continuous(f, source, target)) {
        return reject<UniformlyContinuous>(EmbeddingError::not_uniformly_continuous(name), name);
    }
    return Ok(UniformlyContinuous(std::move(f), std::move(source), std::move(target), std::move(name)));
}

UniformlyContinuous compose(const UniformlyContinuous& g, const UniformlyContinuous& f) {
    require_composable(g, f);
    return UniformlyContinuous(g.map().after(f.map()), f.source(), g.target(), g.name() + " o " + f.name());
}

// =============================================================================
// UniformInducing
// =============================================================================

Result<UniformInducing> UniformInducing::create(FiniteMap f, UniformCore source, UniformCore target,
                                                std::string name) {
    if (auto error = check_carriers(f, source, target)) {
        return reject<UniformInducing>(std::move(*error), name);
    }
    if (!is_uniform_inducing(f, source, target)) {
        return reject<UniformInducing>(EmbeddingError::not_inducing(name), name);
    }
    return Ok(UniformInducing(std::move(f), std::move(source), std::move(target), std::move(name)));
}

UniformlyContinuous UniformInducing::uniformly_continuous() const {
    return UniformlyContinuous(m_map, m_source, m_target, m_name);
}

UniformInducing compose(const UniformInducing& g, const UniformInducing& f) {
    require_composable(g, f);
    return UniformInducing(g.map().after(f.map()), f.source(), g.target(), g.name() + " o " + f.name());
}

UniformInducing prod(const UniformInducing& f, const UniformInducing& g) {
    return UniformInducing(FiniteMap::prod_map(f.map(), g.map()),
        UniformCore::product(f.source(), g.source()),
        UniformCore::product(f.target(), g.target()),
        f.name() + " x " + g.name());
}

// =============================================================================
// UniformEmbedding
// =============================================================================

Result<UniformEmbedding> UniformEmbedding::create(FiniteMap f, UniformCore source, UniformCore target,
                                                  std::string name) {
    if (auto error = check_carriers(f, source, target)) {
        return reject<UniformEmbedding>(std::move(*error), name);
    }
    if (!is_uniform_inducing(f, source, target)) {
        return reject<UniformEmbedding>(EmbeddingError::not_inducing(name), name);
    }
    if (!f.is_injective()) {
        return reject<UniformEmbedding>(EmbeddingError::not_injective(name), name);
    }
    return Ok(UniformEmbedding(std::move(f), std::move(source), std::move(target), std::move(name)));
}

UniformInducing UniformEmbedding::inducing() const {
    return UniformInducing(m_map, m_source, m_target, m_name);
}

// =============================================================================
// DenseInducing
// =============================================================================

Result<DenseInducing> DenseInducing::create(FiniteMap f, UniformCore source, UniformCore target,
                                            std::string name) {
    if (auto error = check_carriers(f, source, target)) {
        return reject<DenseInducing>(std::move(*error), name);
    }
    if (!is_uniform_inducing(f, source, target)) {
        return reject<DenseInducing>(EmbeddingError::not_inducing(name), name);
    }
    if (!target.to_topology().is_dense(f.range())) {
        return reject<DenseInducing>(EmbeddingError::not_dense(name), name);
    }
    unispace_core::uniform_logger()->debug("dense inducing map {}: {} -> {} points",
        name, source.carrier_size(), target.carrier_size());
    return Ok(DenseInducing(std::move(f), std::move(source), std::move(target), std::move(name)));
}

UniformInducing DenseInducing::inducing() const {
    return UniformInducing(m_map, m_source, m_target, m_name);
}

DenseInducing compose(const DenseInducing& g, const DenseInducing& f) {
    require_composable(g, f);
    return DenseInducing(g.map().after(f.map()), f.source(), g.target(), g.name() + " o " + f.name());
}

DenseInducing prod(const DenseInducing& f, const DenseInducing& g) {
    return DenseInducing(FiniteMap::prod_map(f.map(), g.map()),
        UniformCore::product(f.source(), g.source()),
        UniformCore::product(f.target(), g.target()),
        f.name() + " x " + g.name());
}

} // namespace unispace_uniform
