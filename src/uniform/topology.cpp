/// @file topology.cpp
/// @brief Finite topology implementation for unispace_uniform

#include <unispace/uniform/topology.hpp>

#include <stdexcept>

namespace unispace_uniform {

using unispace_core::CarrierError;
using unispace_core::Err;
using unispace_core::Error;
using unispace_core::ErrorCode;
using unispace_core::Ok;
using unispace_core::Result;
using unispace_filter::Filter;
using unispace_set::FiniteMap;
using unispace_set::Point;
using unispace_set::Subset;

Topology::Topology(std::vector<Subset> minimal_neighborhoods)
    : m_neighborhoods(std::move(minimal_neighborhoods)) {}

Result<Topology> Topology::create(std::vector<Subset> minimal_neighborhoods) {
    const std::size_t n = minimal_neighborhoods.size();
    for (Point x = 0; x < n; ++x) {
        const Subset& u = minimal_neighborhoods[x];
        if (u.carrier_size() != n) {
            return Err<Topology>(CarrierError::size_mismatch(n, u.carrier_size()));
        }
        if (!u.contains(x)) {
            return Err<Topology>(Error(ErrorCode::InvalidArgument,
                "Neighborhood of " + std::to_string(x) + " does not contain the point"));
        }
        for (Point y : u) {
            if (!minimal_neighborhoods[y].subset_of(u)) {
                return Err<Topology>(Error(ErrorCode::InvalidArgument,
                    "Neighborhood of " + std::to_string(y) + " is not contained in that of " +
                    std::to_string(x)));
            }
        }
    }
    return Ok(Topology(std::move(minimal_neighborhoods)));
}

Topology Topology::from_open_sets(std::size_t n, const std::vector<Subset>& opens) {
    std::vector<Subset> neighborhoods(n, Subset::univ(n));
    for (const auto& open : opens) {
        if (open.carrier_size() != n) {
            throw std::invalid_argument("Topology::from_open_sets: open set lives on another carrier");
        }
        for (Point x : open) {
            neighborhoods[x] &= open;
        }
    }
    return Topology(std::move(neighborhoods));
}

Topology Topology::discrete(std::size_t n) {
    std::vector<Subset> neighborhoods;
    neighborhoods.reserve(n);
    for (Point x = 0; x < n; ++x) {
        neighborhoods.push_back(Subset::singleton(n, x));
    }
    return Topology(std::move(neighborhoods));
}

Topology Topology::indiscrete(std::size_t n) {
    return Topology(std::vector<Subset>(n, Subset::univ(n)));
}

Filter Topology::nhds(Point x) const {
    return Filter::principal(m_neighborhoods.at(x));
}

bool Topology::is_open(const Subset& s) const {
    for (Point x : s) {
        if (!m_neighborhoods[x].subset_of(s)) return false;
    }
    return true;
}

bool Topology::is_closed(const Subset& s) const {
    return is_open(s.complement());
}

Subset Topology::closure(const Subset& s) const {
    Subset result(carrier_size());
    for (Point x = 0; x < carrier_size(); ++x) {
        if (m_neighborhoods[x].intersects(s)) result.insert(x);
    }
    return result;
}

Subset Topology::interior(const Subset& s) const {
    Subset result(carrier_size());
    for (Point x : s) {
        if (m_neighborhoods[x].subset_of(s)) result.insert(x);
    }
    return result;
}

bool Topology::is_dense(const Subset& s) const {
    return closure(s).is_univ();
}

bool continuous_at(const FiniteMap& f, const Topology& source, const Topology& target, Point x) {
    return unispace_filter::tendsto(f, source.nhds(x), target.nhds(f(x)));
}

bool continuous(const FiniteMap& f, const Topology& source, const Topology& target) {
    if (f.domain_size() != source.carrier_size() || f.codomain_size() != target.carrier_size()) {
        throw std::invalid_argument("continuous: map does not match the topologies");
    }
    for (Point x = 0; x < source.carrier_size(); ++x) {
        if (!continuous_at(f, source, target, x)) return false;
    }
    return true;
}

} // namespace unispace_uniform
