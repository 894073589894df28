#pragma once

/// @file monotone.hpp
/// @brief Monotone set functions and the lift operations

#include "fwd.hpp"
#include "lattice.hpp"
#include <unispace/core/error.hpp>
#include <unispace/core/log.hpp>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace unispace_filter {

namespace detail {

[[nodiscard]] inline bool precedes(const Subset& a, const Subset& b) { return a.subset_of(b); }
[[nodiscard]] inline bool precedes(const Filter& a, const Filter& b) { return a.le(b); }

} // namespace detail

// =============================================================================
// MonotoneMap
// =============================================================================

/// Function from subsets of a carrier to R (Subset or Filter) known to be
/// monotone: s <= t implies f(s) <= f(t).
///
/// Obtained either unchecked through trusted() for maps monotone by
/// construction, or through certify(), which checks every subset and every
/// single-point extension of it.
template<typename R>
class MonotoneMap {
public:
    using Function = std::function<R(const Subset&)>;

    /// Wrap a map the caller knows to be monotone
    [[nodiscard]] static MonotoneMap trusted(std::size_t domain_size, Function fn) {
        return MonotoneMap(domain_size, std::move(fn));
    }

    /// Check monotonicity exhaustively on a small domain
    [[nodiscard]] static unispace_core::Result<MonotoneMap> certify(
        std::size_t domain_size, Function fn, const std::string& name = "monotone map") {
        using unispace_core::AxiomError;
        using unispace_core::CarrierError;
        using unispace_core::Err;
        using unispace_core::Ok;

        if (domain_size > MONOTONE_CERTIFY_LIMIT) {
            return Err<MonotoneMap>(CarrierError::too_large(domain_size, MONOTONE_CERTIFY_LIMIT));
        }

        std::string witness;
        unispace_set::for_each_subset(domain_size, [&](const Subset& s) {
            if (!witness.empty()) return;
            const R at_s = fn(s);
            for (Point x = 0; x < domain_size; ++x) {
                if (s.contains(x)) continue;
                Subset t = s;
                t.insert(x);
                if (!detail::precedes(at_s, fn(t))) {
                    witness = s.to_string() + " <= " + t.to_string();
                    return;
                }
            }
        });

        if (!witness.empty()) {
            unispace_core::filter_logger()->warn("{} rejected: not monotone at {}", name, witness);
            return Err<MonotoneMap>(unispace_core::Error(AxiomError::not_monotone(witness))
                .with_context("map", name));
        }

        unispace_core::filter_logger()->debug("{} certified monotone on {} points", name, domain_size);
        return Ok(MonotoneMap(domain_size, std::move(fn)));
    }

    [[nodiscard]] std::size_t domain_size() const noexcept { return m_domain; }

    /// Apply; throws std::invalid_argument for a subset of another carrier
    [[nodiscard]] R operator()(const Subset& s) const {
        if (s.carrier_size() != m_domain) {
            throw std::invalid_argument("MonotoneMap: argument lives on a carrier of size " +
                std::to_string(s.carrier_size()) + ", expected " + std::to_string(m_domain));
        }
        return m_fn(s);
    }

private:
    MonotoneMap(std::size_t domain_size, Function fn)
        : m_domain(domain_size)
        , m_fn(std::move(fn)) {}

    std::size_t m_domain;
    Function m_fn;
};

using SetMap = MonotoneMap<Subset>;
using FilterMap = MonotoneMap<Filter>;

// =============================================================================
// Lift
// =============================================================================

/// F.lift g: the infimum over members s of F of g(s).
/// Monotonicity makes the infimum attained at the generating set.
[[nodiscard]] inline Filter lift(const Filter& filter, const FilterMap& g) {
    return g(filter.generating_set());
}

/// F.lift' g: the infimum over members s of F of principal(g(s))
[[nodiscard]] inline Filter lift_prime(const Filter& filter, const SetMap& g) {
    return Filter::principal(g(filter.generating_set()));
}

} // namespace unispace_filter
