// unispace_uniform Cauchy filter and completeness tests

#include <catch2/catch_test_macros.hpp>
#include <unispace/uniform/uniform.hpp>

using namespace unispace_uniform;
using unispace_core::ErrorCode;

TEST_CASE("Cauchy filters", "[uniform][cauchy]") {
    const UniformCore core = UniformCore::from_blocks(4, {{0, 1}, {2, 3}}).unwrap();

    SECTION("filters inside one class are Cauchy") {
        REQUIRE(is_cauchy(core, Filter::principal(Subset::of(4, {0, 1}))));
        REQUIRE(is_cauchy(core, Filter::pure(4, 3)));
    }

    SECTION("filters spanning two classes are not") {
        REQUIRE_FALSE(is_cauchy(core, Filter::principal(Subset::of(4, {1, 2}))));
        REQUIRE_FALSE(is_cauchy(core, Filter::top(4)));
    }

    SECTION("bottom is not Cauchy") {
        REQUIRE_FALSE(is_cauchy(core, Filter::bottom(4)));
    }

    SECTION("neighborhood filters are Cauchy") {
        const Topology topology = core.to_topology();
        for (Point x = 0; x < 4; ++x) {
            REQUIRE(is_cauchy(core, topology.nhds(x)));
            REQUIRE(le_nhds(core, topology.nhds(x), x));
        }
    }

    SECTION("carrier mismatch throws") {
        REQUIRE_THROWS_AS(is_cauchy(core, Filter::top(3)), std::invalid_argument);
    }
}

TEST_CASE("Limits of Cauchy filters", "[uniform][cauchy]") {
    const UniformCore core = UniformCore::from_blocks(4, {{1, 3}}).unwrap();

    SECTION("least limit point") {
        auto limit = find_limit(core, Filter::pure(4, 3));
        REQUIRE(limit.is_ok());
        REQUIRE(*limit == 1);
    }

    SECTION("separated spaces have unique limits") {
        const UniformCore d = UniformCore::discrete(3);
        REQUIRE(is_separated(d));
        REQUIRE(*find_limit(d, Filter::pure(3, 2)) == 2);
        REQUIRE_FALSE(is_separated(core));
    }

    SECTION("non-Cauchy filter has no limit") {
        auto limit = find_limit(core, Filter::principal(Subset::of(4, {0, 2})));
        REQUIRE(limit.is_err());
        REQUIRE(limit.error().code() == ErrorCode::NotCauchy);
    }
}

TEST_CASE("Completeness", "[uniform][cauchy]") {
    const UniformCore core = UniformCore::from_blocks(4, {{0, 1}, {2, 3}}).unwrap();

    SECTION("finite spaces are complete") {
        REQUIRE(is_complete_space(core));
        REQUIRE(is_complete_space(UniformCore::indiscrete(3)));
    }

    SECTION("subsets meeting a class are complete") {
        REQUIRE(is_complete(core, Subset::of(4, {0, 2})));
        REQUIRE(is_complete(core, Subset::of(4, {1})));
        REQUIRE(is_complete(core, Subset::empty(4)));
    }

    SECTION("completeness transported along inducing maps") {
        auto f = UniformInducing::create(FiniteMap(4, {0, 1, 2}), UniformCore::from_blocks(3, {{0, 1}}).unwrap(),
                                         core, "f");
        REQUIRE(f.is_ok());
        REQUIRE(is_complete_image(*f, Subset::of(3, {0, 2})));
        REQUIRE(is_complete_image(*f, Subset::univ(3)));
    }
}
