// unispace_completion finite extension tests

#include <catch2/catch_test_macros.hpp>
#include <unispace/completion/completion.hpp>
#include <unispace/uniform/uniform.hpp>

using namespace unispace_completion;
using unispace_core::ErrorCode;
using unispace_uniform::DenseInducing;
using unispace_uniform::UniformCore;
using unispace_uniform::UniformlyContinuous;

namespace {

/// alpha: classes {0, 1}, {2}, {3}; beta sits inside as the representatives 0, 2, 3
DenseInducing representatives() {
    const UniformCore alpha = UniformCore::from_blocks(4, {{0, 1}, {2}, {3}}).unwrap();
    return DenseInducing::create(FiniteMap(4, {0, 2, 3}), UniformCore::discrete(3), alpha, "e").unwrap();
}

UniformlyContinuous rotation() {
    return UniformlyContinuous::create(FiniteMap(3, {2, 0, 1}), UniformCore::discrete(3),
                                       UniformCore::discrete(3), "f").unwrap();
}

} // namespace

TEST_CASE("Finite extension along a dense embedding", "[completion][finite]") {
    auto psi = FiniteExtension::create(representatives(), rotation());
    REQUIRE(psi.is_ok());

    SECTION("values are limits of pushed neighborhood filters") {
        REQUIRE(psi->extension().table() == std::vector<Point>{2, 2, 0, 1});
        REQUIRE((*psi)(1) == 2);
        REQUIRE((*psi)(3) == 1);
    }

    SECTION("certificate") {
        const ExtensionReport report = psi->certify();
        REQUIRE(report.agrees_on_range);
        REQUIRE(report.continuous);
        REQUIRE(report.uniformly_continuous);
        REQUIRE(report.certified());
        REQUIRE(report.pairs_checked == 6);
        REQUIRE(report.shrink_generation == 2);
        REQUIRE(report.to_string() ==
                "agrees_on_range=yes continuous=yes uniformly_continuous=yes pairs=6 generation=2");
    }

    SECTION("agreement with f") {
        REQUIRE(psi->agrees_with(FiniteMap(3, {2, 2, 0, 1})));
        REQUIRE(psi->agrees_with(FiniteMap(3, {2, 1, 0, 1})));
        REQUIRE_FALSE(psi->agrees_with(FiniteMap(3, {0, 0, 0, 0})));
        REQUIRE_THROWS_AS(psi->agrees_with(FiniteMap(3, {2, 2, 0})), std::invalid_argument);
    }

    SECTION("uniqueness") {
        REQUIRE(psi->is_unique_among(psi->extension()));

        // agrees with f on the range but splits the class {0, 1}
        const FiniteMap split(3, {2, 1, 0, 1});
        REQUIRE(psi->is_unique_among(split));
        REQUIRE(psi->find_defect(split) == Point{1});
        REQUIRE_FALSE(psi->find_defect(psi->extension()).has_value());
    }
}

TEST_CASE("Finite extension into a coarser target", "[completion][finite]") {
    const UniformCore gamma = UniformCore::discrete(2);
    auto collapse = UniformlyContinuous::create(FiniteMap(2, {0, 1, 1}), UniformCore::discrete(3), gamma, "g");
    REQUIRE(collapse.is_ok());

    auto psi = FiniteExtension::create(representatives(), *collapse);
    REQUIRE(psi.is_ok());
    REQUIRE(psi->extension().table() == std::vector<Point>{0, 0, 1, 1});
    REQUIRE(psi->certify().certified());
}

TEST_CASE("Finite extension preconditions", "[completion][finite]") {
    SECTION("embedding and map must share a source") {
        auto f = UniformlyContinuous::create(FiniteMap(3, {0, 1}), UniformCore::discrete(2),
                                             UniformCore::discrete(3), "f2").unwrap();
        auto psi = FiniteExtension::create(representatives(), f);
        REQUIRE(psi.is_err());
        REQUIRE(psi.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(*psi.error().get_context("map") == "f2");
    }

    SECTION("target must be separated") {
        auto f = UniformlyContinuous::create(FiniteMap::identity(3), UniformCore::discrete(3),
                                             UniformCore::indiscrete(3), "blur").unwrap();
        auto psi = FiniteExtension::create(representatives(), f);
        REQUIRE(psi.is_err());
        REQUIRE(psi.error().code() == ErrorCode::InvalidArgument);
    }
}
