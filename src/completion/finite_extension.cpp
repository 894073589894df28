/// @file finite_extension.cpp
/// @brief FiniteExtension implementation for unispace_completion

#include <unispace/completion/finite_extension.hpp>
#include <unispace/core/log.hpp>
#include <unispace/uniform/cauchy.hpp>
#include <unispace/uniform/entourage_basis.hpp>
#include <unispace/uniform/topology.hpp>

#include <sstream>
#include <stdexcept>

namespace unispace_completion {

using unispace_core::Err;
using unispace_core::Error;
using unispace_core::ErrorCode;
using unispace_core::Ok;
using unispace_core::Result;
using unispace_filter::Filter;
using unispace_relation::Relation;
using unispace_set::Subset;
using unispace_uniform::DenseInducing;
using unispace_uniform::UniformCore;
using unispace_uniform::UniformlyContinuous;

std::string ExtensionReport::to_string() const {
    std::ostringstream oss;
    oss << "agrees_on_range=" << (agrees_on_range ? "yes" : "no")
        << " continuous=" << (continuous ? "yes" : "no")
        << " uniformly_continuous=" << (uniformly_continuous ? "yes" : "no")
        << " pairs=" << pairs_checked
        << " generation=" << shrink_generation;
    return oss.str();
}

FiniteExtension::FiniteExtension(DenseInducing embedding, UniformlyContinuous map, FiniteMap extension)
    : m_embedding(std::move(embedding))
    , m_map(std::move(map))
    , m_extension(std::move(extension)) {}

Result<FiniteExtension> FiniteExtension::create(DenseInducing embedding, UniformlyContinuous map) {
    const UniformCore& alpha = embedding.target();
    const UniformCore& gamma = map.target();

    if (embedding.source() != map.source()) {
        Error error(ErrorCode::InvalidArgument, "Embedding and map do not share their source");
        error.with_context("embedding", embedding.name()).with_context("map", map.name());
        return Err<FiniteExtension>(std::move(error));
    }
    if (!unispace_uniform::is_separated(gamma)) {
        Error error(ErrorCode::InvalidArgument, "Extension target is not separated");
        error.with_context("map", map.name());
        return Err<FiniteExtension>(std::move(error));
    }

    const unispace_uniform::Topology topology = alpha.to_topology();
    std::vector<Point> table(alpha.carrier_size());
    for (Point a = 0; a < alpha.carrier_size(); ++a) {
        // comap e (nhds a) is Cauchy by density and inducing; f keeps it Cauchy
        const Filter pulled = unispace_filter::comap(embedding.map(), topology.nhds(a));
        const Filter pushed = unispace_filter::map(map.map(), pulled);
        auto limit = unispace_uniform::find_limit(gamma, pushed);
        if (!limit) {
            Error error = limit.error();
            error.with_context("point", std::to_string(a));
            unispace_core::completion_logger()->warn("{}", unispace_core::build_error_chain(error));
            return Err<FiniteExtension>(std::move(error));
        }
        table[a] = *limit;
    }

    FiniteMap extension(gamma.carrier_size(), std::move(table));
    unispace_core::completion_logger()->debug("extended {} along {}: {}",
        map.name(), embedding.name(), extension.to_string());
    return Ok(FiniteExtension(std::move(embedding), std::move(map), std::move(extension)));
}

ExtensionReport FiniteExtension::certify() const {
    UNISPACE_LOG_SCOPE("FiniteExtension::certify", "completion");
    const UniformCore& alpha = m_embedding.target();
    const UniformCore& gamma = m_map.target();

    ExtensionReport report;
    report.agrees_on_range = agrees_with(m_extension);
    report.continuous = unispace_uniform::continuous(m_extension, alpha.to_topology(), gamma.to_topology());

    // Target entourage D and symmetric S with S o S o S within D
    const Relation d = gamma.entourage();
    const auto shrunk = unispace_uniform::comp_comp_symm_mem(gamma, d);
    const Relation& s = shrunk.relation;
    report.shrink_generation = shrunk.generation;

    auto density_witness = [this](Point a) -> std::optional<Point> {
        const Subset near = m_embedding.map().preimage(m_embedding.target().ball(a));
        return near.first();
    };

    bool uniform = true;
    for (const auto& [a, a2] : alpha.entourage().pairs()) {
        ++report.pairs_checked;
        const auto b = density_witness(a);
        const auto b2 = density_witness(a2);
        if (!b || !b2) {
            uniform = false;
            break;
        }
        const Point fb = m_map(*b);
        const Point fb2 = m_map(*b2);
        const bool chained = s.contains(m_extension(a), fb) && s.contains(fb, fb2) && s.contains(fb2, m_extension(a2));
        if (!chained || !d.contains(m_extension(a), m_extension(a2))) {
            uniform = false;
            break;
        }
    }
    report.uniformly_continuous = uniform;

    unispace_core::completion_logger()->debug("certify {}: {}", m_map.name(), report.to_string());
    return report;
}

bool FiniteExtension::agrees_with(const FiniteMap& candidate) const {
    if (candidate.domain_size() != m_extension.domain_size() ||
        candidate.codomain_size() != m_extension.codomain_size()) {
        throw std::invalid_argument("FiniteExtension: candidate has the wrong shape");
    }
    return candidate.after(m_embedding.map()) == m_map.map();
}

bool FiniteExtension::is_unique_among(const FiniteMap& candidate) const {
    const bool is_extension = agrees_with(candidate) &&
        unispace_uniform::continuous(candidate, m_embedding.target().to_topology(), m_map.target().to_topology());
    return !is_extension || candidate == m_extension;
}

std::optional<Point> FiniteExtension::find_defect(const FiniteMap& candidate) const {
    if (candidate.domain_size() != m_extension.domain_size()) {
        throw std::invalid_argument("FiniteExtension: candidate has the wrong shape");
    }
    for (Point a = 0; a < m_extension.domain_size(); ++a) {
        if (candidate(a) != m_extension(a)) return a;
    }
    return std::nullopt;
}

} // namespace unispace_completion
