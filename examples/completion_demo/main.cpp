/// @file main.cpp
/// @brief Uniform completion demo
///
/// This example walks through both extension engines:
/// - Loading a finite model (spaces and maps) from JSON
/// - Extending a map along a dense inducing embedding and certifying the result
/// - Extending q -> 2q + 1 from the rationals to the extended real line

#include <unispace/completion/completion.hpp>
#include <unispace/core/core.hpp>
#include <unispace/filter/filter.hpp>
#include <unispace/model/model.hpp>
#include <unispace/uniform/uniform.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <limits>
#include <string>

namespace {

void log_lattice_facts(const unispace_uniform::DenseInducing& e) {
    const auto& alpha = e.target();
    const auto topology = alpha.to_topology();

    for (unispace_set::Point a = 0; a < alpha.carrier_size(); ++a) {
        const auto nhds = topology.nhds(a);
        const auto pulled = unispace_filter::comap(e.map(), nhds);
        const bool gc = unispace_filter::map(e.map(), pulled).le(nhds);
        UNISPACE_LOG_INFO("  nhds({}) = {}, comap e = {}, map (comap e) <= nhds: {}",
                          a, nhds.to_string(), pulled.to_string(), gc);
    }
}

int run_finite(const std::string& path) {
    auto library = unispace_model::ModelLibrary::load_from_file(path);
    if (!library) {
        UNISPACE_LOG_ERROR("Failed to load model: {}", unispace_core::build_error_chain(library.error()));
        return EXIT_FAILURE;
    }
    library->apply_log_config();

    auto e = library->dense_inducing("e");
    auto f = library->uniformly_continuous("f");
    if (!e || !f) {
        UNISPACE_LOG_ERROR("Model maps are not usable: {}",
                           unispace_core::build_error_chain(e ? f.error() : e.error()));
        return EXIT_FAILURE;
    }

    UNISPACE_LOG_INFO("Neighborhood filters along e:");
    log_lattice_facts(*e);

    auto psi = unispace_completion::FiniteExtension::create(*e, *f);
    if (!psi) {
        UNISPACE_LOG_ERROR("Extension failed: {}", unispace_core::build_error_chain(psi.error()));
        return EXIT_FAILURE;
    }

    const auto report = psi->certify();
    UNISPACE_LOG_INFO("Extension of f along e: {}", psi->extension().to_string());
    UNISPACE_LOG_INFO("Certificate: {}", report.to_string());
    return report.certified() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int run_leveled() {
    using namespace unispace_completion;

    auto f = UniformlyContinuousMap<RationalLine, ExtendedRealLine>::create(
        RationalLine{}, ExtendedRealLine{},
        [](const Rational& q) { return (Rational(2) * q + Rational(1)).to_double(); },
        [](Level k) { return k + 3; },
        {Rational(-1, 2), Rational(0), Rational(1, 3), Rational(7)}, 16, "q -> 2q + 1");
    if (!f) {
        UNISPACE_LOG_ERROR("{}", unispace_core::build_error_chain(f.error()));
        return EXIT_FAILURE;
    }

    const auto psi = uniformly_extend(rational_embedding(), *f);
    const double inf = std::numeric_limits<double>::infinity();
    for (double x : {-inf, -0.5, 0.3, 2.0, inf}) {
        UNISPACE_LOG_INFO("  psi({}) = {}", x, psi(x));
    }

    // A candidate that differs from psi only at +inf is caught by a rational witness
    auto candidate = [&psi](double x) { return x == std::numeric_limits<double>::infinity() ? 0.0 : psi(x); };
    if (const auto defect = psi.find_defect(candidate, inf, 2)) {
        UNISPACE_LOG_INFO("  candidate separated at level {} by witness {}", defect->level, defect->witness.to_string());
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    UNISPACE_LOG_INFO("=== Uniform Completion Demo ({}) ===", unispace_core::library_version().to_string());

    const std::string path = argc > 1 ? argv[1] : UNISPACE_DEMO_MODEL;
    UNISPACE_LOG_INFO("Model file: {}", path);

    int status = run_finite(path);
    if (status == EXIT_SUCCESS) {
        UNISPACE_LOG_INFO("Extending along Q -> [-inf, +inf]:");
        status = run_leveled();
    }

    UNISPACE_LOG_DEBUG("Errors: {}", unispace_core::debug::error_stats_summary());
    unispace_core::shutdown_logging();
    return status;
}
