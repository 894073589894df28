/// @file uniform_space.cpp
/// @brief UniformSpace implementation for unispace_uniform

#include <unispace/uniform/uniform_space.hpp>
#include <unispace/core/log.hpp>
#include <unispace/set/pair.hpp>

#include <stdexcept>

namespace unispace_uniform {

using unispace_core::AxiomError;
using unispace_core::CarrierError;
using unispace_core::Err;
using unispace_core::Error;
using unispace_core::Ok;
using unispace_core::Result;

UniformSpace::UniformSpace(UniformCore core, Topology topology)
    : m_core(std::move(core))
    , m_topology(std::move(topology)) {}

Result<UniformSpace> UniformSpace::create(UniformCore core, Topology topology) {
    if (core.carrier_size() != topology.carrier_size()) {
        return Err<UniformSpace>(CarrierError::size_mismatch(core.carrier_size(), topology.carrier_size()));
    }

    // Finite topologies agree iff their least neighborhoods agree
    const Topology derived = core.to_topology();
    for (Point x = 0; x < core.carrier_size(); ++x) {
        if (derived.minimal_neighborhood(x) != topology.minimal_neighborhood(x)) {
            Error error(AxiomError::topology_mismatch(std::to_string(x)));
            error.with_context("expected", derived.minimal_neighborhood(x).to_string())
                 .with_context("found", topology.minimal_neighborhood(x).to_string());
            unispace_core::debug::record_error(error);
            unispace_core::uniform_logger()->warn("uniform space rejected: {}", error.message());
            return Err<UniformSpace>(std::move(error));
        }
    }
    return Ok(UniformSpace(std::move(core), std::move(topology)));
}

UniformSpace UniformSpace::from_core(UniformCore core) {
    Topology topology = core.to_topology();
    return UniformSpace(std::move(core), std::move(topology));
}

bool is_open_in(const UniformCore& core, const Subset& s) {
    const std::size_t n = core.carrier_size();
    if (s.carrier_size() != n) {
        throw std::invalid_argument("is_open_in: subset lives on another carrier");
    }
    for (Point x : s) {
        Subset pairs(unispace_set::pair_carrier_size(n));
        for (Point p = 0; p < n; ++p) {
            for (Point q = 0; q < n; ++q) {
                if (p != x || s.contains(q)) {
                    pairs.insert(unispace_set::encode_pair(n, p, q));
                }
            }
        }
        if (!core.uniformity().contains(pairs)) return false;
    }
    return true;
}

} // namespace unispace_uniform
