#pragma once

/// @file maps.hpp
/// @brief Uniformly continuous, inducing and dense maps between finite spaces
///
/// The predicates evaluate the defining filter inequalities directly. The
/// witness types bundle a map with its validated property; they are built once
/// through create() and combined functionally without re-validation.

#include "fwd.hpp"
#include "uniform_core.hpp"
#include <unispace/core/error.hpp>
#include <string>

namespace unispace_uniform {

// =============================================================================
// Predicates
// =============================================================================

/// map (f x f) U_src <= U_dst
[[nodiscard]] bool is_uniformly_continuous(const FiniteMap& f, const UniformCore& source, const UniformCore& target);

/// comap (f x f) U_dst = U_src
[[nodiscard]] bool is_uniform_inducing(const FiniteMap& f, const UniformCore& source, const UniformCore& target);

/// Inducing and injective
[[nodiscard]] bool is_uniform_embedding(const FiniteMap& f, const UniformCore& source, const UniformCore& target);

/// Inducing with range dense in the target topology
[[nodiscard]] bool is_dense_inducing(const FiniteMap& f, const UniformCore& source, const UniformCore& target);

// =============================================================================
// MapWitness
// =============================================================================

/// A map between finite uniform spaces together with both cores
class MapWitness {
public:
    [[nodiscard]] const FiniteMap& map() const noexcept { return m_map; }
    [[nodiscard]] const UniformCore& source() const noexcept { return m_source; }
    [[nodiscard]] const UniformCore& target() const noexcept { return m_target; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    [[nodiscard]] Point operator()(Point x) const { return m_map(x); }

protected:
    MapWitness(FiniteMap f, UniformCore source, UniformCore target, std::string name)
        : m_map(std::move(f))
        , m_source(std::move(source))
        , m_target(std::move(target))
        , m_name(std::move(name)) {}

    FiniteMap m_map;
    UniformCore m_source;
    UniformCore m_target;
    std::string m_name;
};

// =============================================================================
// Witness Types
// =============================================================================

class UniformlyContinuous : public MapWitness {
public:
    [[nodiscard]] static unispace_core::Result<UniformlyContinuous> create(
        FiniteMap f, UniformCore source, UniformCore target, std::string name = "f");

    /// g after f
    friend UniformlyContinuous compose(const UniformlyContinuous& g, const UniformlyContinuous& f);

private:
    friend class UniformInducing;

    UniformlyContinuous(FiniteMap f, UniformCore source, UniformCore target, std::string name)
        : MapWitness(std::move(f), std::move(source), std::move(target), std::move(name)) {}
};

class UniformInducing : public MapWitness {
public:
    [[nodiscard]] static unispace_core::Result<UniformInducing> create(
        FiniteMap f, UniformCore source, UniformCore target, std::string name = "e");

    /// Inducing maps are uniformly continuous
    [[nodiscard]] UniformlyContinuous uniformly_continuous() const;

    friend UniformInducing compose(const UniformInducing& g, const UniformInducing& f);

    /// f x g between product spaces
    friend UniformInducing prod(const UniformInducing& f, const UniformInducing& g);

private:
    friend class UniformEmbedding;
    friend class DenseInducing;

    UniformInducing(FiniteMap f, UniformCore source, UniformCore target, std::string name)
        : MapWitness(std::move(f), std::move(source), std::move(target), std::move(name)) {}
};

class UniformEmbedding : public MapWitness {
public:
    [[nodiscard]] static unispace_core::Result<UniformEmbedding> create(
        FiniteMap f, UniformCore source, UniformCore target, std::string name = "e");

    [[nodiscard]] UniformInducing inducing() const;

private:
    UniformEmbedding(FiniteMap f, UniformCore source, UniformCore target, std::string name)
        : MapWitness(std::move(f), std::move(source), std::move(target), std::move(name)) {}
};

class DenseInducing : public MapWitness {
public:
    [[nodiscard]] static unispace_core::Result<DenseInducing> create(
        FiniteMap f, UniformCore source, UniformCore target, std::string name = "e");

    [[nodiscard]] UniformInducing inducing() const;

    /// Range of the map, a dense subset of the target
    [[nodiscard]] Subset range() const { return m_map.range(); }

    friend DenseInducing compose(const DenseInducing& g, const DenseInducing& f);
    friend DenseInducing prod(const DenseInducing& f, const DenseInducing& g);

private:
    DenseInducing(FiniteMap f, UniformCore source, UniformCore target, std::string name)
        : MapWitness(std::move(f), std::move(source), std::move(target), std::move(name)) {}
};

[[nodiscard]] UniformlyContinuous compose(const UniformlyContinuous& g, const UniformlyContinuous& f);
[[nodiscard]] UniformInducing compose(const UniformInducing& g, const UniformInducing& f);
[[nodiscard]] UniformInducing prod(const UniformInducing& f, const UniformInducing& g);
[[nodiscard]] DenseInducing compose(const DenseInducing& g, const DenseInducing& f);
[[nodiscard]] DenseInducing prod(const DenseInducing& f, const DenseInducing& g);

} // namespace unispace_uniform
