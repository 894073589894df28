#pragma once

/// @file topology.hpp
/// @brief Topologies on finite carriers
///
/// A topology on a finite carrier is determined by the least open
/// neighborhood U(x) of each point; the neighborhood filter of x is the
/// principal filter of U(x) and a set is open iff it contains U(x) for each
/// of its points.

#include "fwd.hpp"
#include <unispace/core/error.hpp>
#include <unispace/filter/lattice.hpp>
#include <unispace/set/finite_map.hpp>
#include <unispace/set/subset.hpp>
#include <cstddef>
#include <vector>

namespace unispace_uniform {

class Topology {
public:
    /// Validate a family of least neighborhoods: x in U(x), and y in U(x)
    /// implies U(y) within U(x)
    [[nodiscard]] static unispace_core::Result<Topology> create(std::vector<unispace_set::Subset> minimal_neighborhoods);

    /// Topology generated by a family of open sets
    [[nodiscard]] static Topology from_open_sets(std::size_t n, const std::vector<unispace_set::Subset>& opens);

    [[nodiscard]] static Topology discrete(std::size_t n);
    [[nodiscard]] static Topology indiscrete(std::size_t n);

    [[nodiscard]] std::size_t carrier_size() const noexcept { return m_neighborhoods.size(); }

    /// Neighborhood filter of x
    [[nodiscard]] unispace_filter::Filter nhds(unispace_set::Point x) const;

    /// Least open set containing x
    [[nodiscard]] const unispace_set::Subset& minimal_neighborhood(unispace_set::Point x) const {
        return m_neighborhoods.at(x);
    }

    [[nodiscard]] bool is_open(const unispace_set::Subset& s) const;
    [[nodiscard]] bool is_closed(const unispace_set::Subset& s) const;
    [[nodiscard]] unispace_set::Subset closure(const unispace_set::Subset& s) const;
    [[nodiscard]] unispace_set::Subset interior(const unispace_set::Subset& s) const;
    [[nodiscard]] bool is_dense(const unispace_set::Subset& s) const;

    bool operator==(const Topology& other) const { return m_neighborhoods == other.m_neighborhoods; }
    bool operator!=(const Topology& other) const { return !(*this == other); }

private:
    friend class UniformCore;

    explicit Topology(std::vector<unispace_set::Subset> minimal_neighborhoods);

    std::vector<unispace_set::Subset> m_neighborhoods;
};

/// map f (nhds x) <= nhds (f x)
[[nodiscard]] bool continuous_at(const unispace_set::FiniteMap& f, const Topology& source,
                                 const Topology& target, unispace_set::Point x);

[[nodiscard]] bool continuous(const unispace_set::FiniteMap& f, const Topology& source, const Topology& target);

} // namespace unispace_uniform
