/// @file uniform_core.cpp
/// @brief UniformCore validation and lattice for unispace_uniform

#include <unispace/uniform/uniform_core.hpp>
#include <unispace/core/log.hpp>
#include <unispace/filter/monotone.hpp>
#include <unispace/set/pair.hpp>

#include <stdexcept>

namespace unispace_uniform {

using unispace_core::AxiomError;
using unispace_core::CarrierError;
using unispace_core::Err;
using unispace_core::Error;
using unispace_core::Ok;
using unispace_core::Result;
using unispace_set::MAX_CARRIER_SIZE;
using unispace_set::pair_carrier_size;

namespace {

Result<UniformCore> reject(Error error) {
    unispace_core::debug::record_error(error);
    unispace_core::uniform_logger()->warn("uniform core rejected: {}", error.message());
    return Err<UniformCore>(std::move(error));
}

std::string pair_string(Point x, Point y) {
    return "(" + std::to_string(x) + "," + std::to_string(y) + ")";
}

} // anonymous namespace

// =============================================================================
// Validation
// =============================================================================

UniformCore::UniformCore(std::size_t n, Filter uniformity)
    : m_n(n)
    , m_uniformity(std::move(uniformity)) {}

Result<UniformCore> UniformCore::create(std::size_t n, const Filter& uniformity) {
    if (n > MAX_CARRIER_SIZE) {
        return reject(CarrierError::too_large(n, MAX_CARRIER_SIZE));
    }
    if (uniformity.carrier_size() != pair_carrier_size(n)) {
        return reject(CarrierError::size_mismatch(pair_carrier_size(n), uniformity.carrier_size()));
    }

    const Relation gen = Relation::from_subset(n, uniformity.generating_set());

    // Reflexivity: the smallest member contains the diagonal
    for (Point x = 0; x < n; ++x) {
        if (!gen.contains(x, x)) {
            return reject(AxiomError::reflexivity(pair_string(x, x)));
        }
    }

    // Symmetry: invariance under pushforward by swap
    if (unispace_filter::map(FiniteMap::swap(n), uniformity) != uniformity) {
        for (const auto& [x, y] : gen.pairs()) {
            if (!gen.contains(y, x)) {
                return reject(AxiomError::symmetry(pair_string(x, y)));
            }
        }
    }

    // Triangle: lift' (V -> V o V) <= U
    const auto square = unispace_filter::SetMap::trusted(pair_carrier_size(n), [n](const Subset& v) {
        const Relation r = Relation::from_subset(n, v);
        return compose(r, r).as_subset();
    });
    const Filter squared = unispace_filter::lift_prime(uniformity, square);
    if (!squared.le(uniformity)) {
        const Relation excess = Relation::from_subset(n, squared.generating_set() - uniformity.generating_set());
        const auto [x, y] = excess.pairs().front();
        return reject(AxiomError::triangle(pair_string(x, y)));
    }

    unispace_core::uniform_logger()->debug("uniform core on {} points, generating entourage has {} pairs",
        n, gen.count());
    return Ok(UniformCore(n, uniformity));
}

Result<UniformCore> UniformCore::from_entourage(const Relation& v) {
    return create(v.carrier_size(), Filter::principal(v.as_subset()));
}

Result<UniformCore> UniformCore::from_blocks(std::size_t n, const std::vector<std::vector<Point>>& blocks) {
    for (const auto& block : blocks) {
        for (Point x : block) {
            if (x >= n) {
                return reject(CarrierError::out_of_range(x, n));
            }
        }
    }
    return from_entourage(Relation::from_blocks(n, blocks));
}

// =============================================================================
// Lattice of Cores
// =============================================================================

UniformCore UniformCore::discrete(std::size_t n) {
    return UniformCore(n, Filter::principal(Relation::id_rel(n).as_subset()));
}

UniformCore UniformCore::indiscrete(std::size_t n) {
    return UniformCore(n, Filter::top(pair_carrier_size(n)));
}

UniformCore UniformCore::inf(const UniformCore& a, const UniformCore& b) {
    if (a.m_n != b.m_n) {
        throw std::invalid_argument("UniformCore::inf: carrier size mismatch");
    }
    return UniformCore(a.m_n, unispace_filter::inf(a.m_uniformity, b.m_uniformity));
}

UniformCore UniformCore::sup(const UniformCore& a, const UniformCore& b) {
    if (a.m_n != b.m_n) {
        throw std::invalid_argument("UniformCore::sup: carrier size mismatch");
    }
    // The filter join may violate the triangle axiom; close it up.
    const Relation joined = a.entourage() | b.entourage();
    return UniformCore(a.m_n, Filter::principal(unispace_relation::equivalence_closure(joined).as_subset()));
}

UniformCore UniformCore::inf_all(std::size_t n, const std::vector<UniformCore>& cores) {
    UniformCore result = indiscrete(n);
    for (const auto& core : cores) {
        result = inf(result, core);
    }
    return result;
}

UniformCore UniformCore::sup_all(std::size_t n, const std::vector<UniformCore>& cores) {
    UniformCore result = discrete(n);
    for (const auto& core : cores) {
        result = sup(result, core);
    }
    return result;
}

// =============================================================================
// Queries
// =============================================================================

Relation UniformCore::entourage() const {
    return Relation::from_subset(m_n, m_uniformity.generating_set());
}

bool UniformCore::is_entourage(const Relation& v) const {
    if (v.carrier_size() != m_n) {
        throw std::invalid_argument("UniformCore::is_entourage: relation lives on another carrier");
    }
    return m_uniformity.contains(v.as_subset());
}

Subset UniformCore::ball(Point x) const {
    return entourage().ball(x);
}

Topology UniformCore::to_topology() const {
    std::vector<Subset> neighborhoods;
    neighborhoods.reserve(m_n);
    for (Point x = 0; x < m_n; ++x) {
        const Filter nhds = unispace_filter::comap(FiniteMap::section(m_n, x), m_uniformity);
        neighborhoods.push_back(nhds.generating_set());
    }
    return Topology(std::move(neighborhoods));
}

} // namespace unispace_uniform
