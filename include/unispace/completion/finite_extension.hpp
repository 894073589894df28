#pragma once

/// @file finite_extension.hpp
/// @brief Extension along dense inducing maps between finite uniform spaces
///
/// The filter algorithm run literally: psi(a) is the limit of
/// map f (comap e (nhds a)) in the complete separated target.

#include <unispace/core/error.hpp>
#include <unispace/uniform/maps.hpp>
#include <unispace/uniform/uniform_core.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace unispace_completion {

using unispace_set::FiniteMap;
using unispace_set::Point;

/// Outcome of FiniteExtension::certify
struct ExtensionReport {
    bool agrees_on_range = false;       // psi o e = f
    bool continuous = false;            // psi continuous for the derived topologies
    bool uniformly_continuous = false;  // three-fold shrink argument succeeded
    std::size_t pairs_checked = 0;
    std::uint32_t shrink_generation = 0;

    [[nodiscard]] bool certified() const noexcept {
        return agrees_on_range && continuous && uniformly_continuous;
    }

    [[nodiscard]] std::string to_string() const;
};

class FiniteExtension {
public:
    /// Requires e and f to share their source and the target of f to be
    /// separated; the limits exist because finite uniform spaces are complete
    [[nodiscard]] static unispace_core::Result<FiniteExtension> create(
        unispace_uniform::DenseInducing embedding, unispace_uniform::UniformlyContinuous map);

    [[nodiscard]] Point operator()(Point a) const { return m_extension(a); }

    /// psi as a lookup table
    [[nodiscard]] const FiniteMap& extension() const noexcept { return m_extension; }

    [[nodiscard]] const unispace_uniform::DenseInducing& embedding() const noexcept { return m_embedding; }
    [[nodiscard]] const unispace_uniform::UniformlyContinuous& map() const noexcept { return m_map; }

    /// Check agreement on the range of e, continuity, and uniform continuity
    /// through density witnesses and the three-fold shrink of the target
    /// generating entourage
    [[nodiscard]] ExtensionReport certify() const;

    /// candidate o e = f
    [[nodiscard]] bool agrees_with(const FiniteMap& candidate) const;

    /// Uniqueness against a candidate: a continuous candidate agreeing with f
    /// on the range of e equals psi
    [[nodiscard]] bool is_unique_among(const FiniteMap& candidate) const;

    /// Least point where the candidate differs from psi
    [[nodiscard]] std::optional<Point> find_defect(const FiniteMap& candidate) const;

private:
    FiniteExtension(unispace_uniform::DenseInducing embedding, unispace_uniform::UniformlyContinuous map,
                    FiniteMap extension);

    unispace_uniform::DenseInducing m_embedding;
    unispace_uniform::UniformlyContinuous m_map;
    FiniteMap m_extension;
};

} // namespace unispace_completion
