#pragma once

/// @file uniform_space.hpp
/// @brief A uniform core bundled with its compatible topology

#include "fwd.hpp"
#include "topology.hpp"
#include "uniform_core.hpp"
#include <unispace/core/error.hpp>

namespace unispace_uniform {

/// Uniform core plus a topology satisfying
///   is_open(s) iff for all x in s, {(p, q) | p = x -> q in s} is an entourage.
/// Compatibility is checked once at construction.
class UniformSpace {
public:
    [[nodiscard]] static unispace_core::Result<UniformSpace> create(UniformCore core, Topology topology);

    /// Space carrying the topology derived from the core
    [[nodiscard]] static UniformSpace from_core(UniformCore core);

    [[nodiscard]] std::size_t carrier_size() const noexcept { return m_core.carrier_size(); }
    [[nodiscard]] const UniformCore& core() const noexcept { return m_core; }
    [[nodiscard]] const Topology& topology() const noexcept { return m_topology; }

    [[nodiscard]] bool is_open(const Subset& s) const { return m_topology.is_open(s); }

private:
    UniformSpace(UniformCore core, Topology topology);

    UniformCore m_core;
    Topology m_topology;
};

/// The open-set predicate of the core, evaluated literally: for each x in s
/// the relation {(p, q) | p = x -> q in s} must be an entourage
[[nodiscard]] bool is_open_in(const UniformCore& core, const Subset& s);

} // namespace unispace_uniform
