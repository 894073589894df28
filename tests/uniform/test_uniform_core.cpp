// unispace_uniform UniformCore tests

#include <catch2/catch_test_macros.hpp>
#include <unispace/uniform/uniform.hpp>
#include <vector>

using namespace unispace_uniform;
using unispace_core::AxiomError;
using unispace_core::CarrierError;
using unispace_core::ErrorCode;
using unispace_set::pair_carrier_size;

namespace {

/// Every uniform core on n points: one per equivalence relation
std::vector<UniformCore> all_cores(std::size_t n) {
    std::vector<UniformCore> cores;
    unispace_set::for_each_subset(pair_carrier_size(n), [&](const Subset& s) {
        const Relation r = Relation::from_subset(n, s);
        if (r.is_equivalence()) {
            cores.push_back(UniformCore::from_entourage(r).unwrap());
        }
    });
    return cores;
}

} // namespace

// =============================================================================
// Validation
// =============================================================================

TEST_CASE("UniformCore accepts equivalence kernels", "[uniform][core]") {
    auto core = UniformCore::from_blocks(4, {{0, 1}, {2}, {3}});
    REQUIRE(core.is_ok());
    REQUIRE(core->carrier_size() == 4);
    REQUIRE(core->entourage() == Relation::from_blocks(4, {{0, 1}}));
    REQUIRE(core->is_entourage(Relation::full(4)));
    REQUIRE_FALSE(core->is_entourage(Relation::id_rel(4)));
    REQUIRE(core->ball(1) == Subset::of(4, {0, 1}));
}

TEST_CASE("UniformCore rejects axiom violations", "[uniform][core]") {
    SECTION("reflexivity") {
        auto core = UniformCore::from_entourage(Relation::from_pairs(2, {{0, 0}, {0, 1}, {1, 0}}));
        REQUIRE(core.is_err());
        REQUIRE(core.error().as<AxiomError>()->kind == AxiomError::Kind::Reflexivity);
        REQUIRE(core.error().as<AxiomError>()->witness == "(1,1)");
    }

    SECTION("symmetry") {
        auto core = UniformCore::from_entourage(Relation::from_pairs(2, {{0, 0}, {1, 1}, {0, 1}}));
        REQUIRE(core.is_err());
        REQUIRE(core.error().as<AxiomError>()->kind == AxiomError::Kind::Symmetry);
    }

    SECTION("triangle") {
        Relation chain = Relation::id_rel(3) | Relation::from_pairs(3, {{0, 1}, {1, 0}, {1, 2}, {2, 1}});
        auto core = UniformCore::from_entourage(chain);
        REQUIRE(core.is_err());
        REQUIRE(core.error().code() == ErrorCode::AxiomViolation);
        REQUIRE(core.error().as<AxiomError>()->kind == AxiomError::Kind::Triangle);
    }

    SECTION("carrier checks") {
        auto mismatch = UniformCore::create(3, unispace_filter::Filter::top(4));
        REQUIRE(mismatch.is_err());
        REQUIRE(mismatch.error().as<CarrierError>()->kind == CarrierError::Kind::SizeMismatch);

        auto too_large = UniformCore::create(65, unispace_filter::Filter::top(pair_carrier_size(65)));
        REQUIRE(too_large.is_err());
        REQUIRE(too_large.error().as<CarrierError>()->kind == CarrierError::Kind::TooLarge);

        auto outside = UniformCore::from_blocks(2, {{0, 2}});
        REQUIRE(outside.is_err());
        REQUIRE(outside.error().code() == ErrorCode::OutOfRange);
    }
}

// =============================================================================
// Lattice of Cores
// =============================================================================

TEST_CASE("UniformCore bounds", "[uniform][lattice]") {
    const UniformCore discrete = UniformCore::discrete(3);
    const UniformCore indiscrete = UniformCore::indiscrete(3);

    REQUIRE(discrete.entourage() == Relation::id_rel(3));
    REQUIRE(indiscrete.entourage() == Relation::full(3));

    for (const auto& core : all_cores(3)) {
        REQUIRE(discrete.le(core));
        REQUIRE(core.le(indiscrete));
    }

    REQUIRE(UniformCore::inf_all(3, {}) == indiscrete);
    REQUIRE(UniformCore::sup_all(3, {}) == discrete);
}

TEST_CASE("UniformCore meet is a core and the greatest lower bound", "[uniform][lattice]") {
    const auto cores = all_cores(3);
    REQUIRE(cores.size() == 5);

    for (const auto& a : cores) {
        for (const auto& b : cores) {
            const UniformCore m = UniformCore::inf(a, b);
            REQUIRE(UniformCore::create(3, m.uniformity()).is_ok());
            REQUIRE(m.le(a));
            REQUIRE(m.le(b));
            for (const auto& c : cores) {
                if (c.le(a) && c.le(b)) {
                    REQUIRE(c.le(m));
                }
            }
        }
    }
}

TEST_CASE("UniformCore join is a core and the meet of upper bounds", "[uniform][lattice]") {
    const auto cores = all_cores(4);

    for (const auto& a : cores) {
        for (const auto& b : cores) {
            std::vector<UniformCore> upper;
            for (const auto& c : cores) {
                if (a.le(c) && b.le(c)) upper.push_back(c);
            }
            const UniformCore j = UniformCore::sup(a, b);
            REQUIRE(UniformCore::create(4, j.uniformity()).is_ok());
            REQUIRE(j == UniformCore::inf_all(4, upper));
        }
    }

    SECTION("join of two links closes the chain") {
        const UniformCore left = UniformCore::from_blocks(3, {{0, 1}}).unwrap();
        const UniformCore right = UniformCore::from_blocks(3, {{1, 2}}).unwrap();
        REQUIRE(UniformCore::sup(left, right) == UniformCore::indiscrete(3));
        REQUIRE(UniformCore::sup_all(3, {left, right}) == UniformCore::indiscrete(3));
    }
}

// =============================================================================
// Constructions
// =============================================================================

TEST_CASE("UniformCore constructions", "[uniform][constructions]") {
    const UniformCore d2 = UniformCore::discrete(2);
    const UniformCore i2 = UniformCore::indiscrete(2);

    SECTION("product of discrete spaces is discrete") {
        REQUIRE(UniformCore::product(d2, d2) == UniformCore::discrete(4));
    }

    SECTION("product pairs componentwise") {
        const UniformCore p = UniformCore::product(i2, d2);
        REQUIRE(p.entourage() == unispace_relation::prod_rel(Relation::full(2), Relation::id_rel(2)));
    }

    SECTION("sum has no cross pairs") {
        REQUIRE(UniformCore::sum(d2, d2) == UniformCore::discrete(4));

        const UniformCore s = UniformCore::sum(i2, i2);
        REQUIRE(s.entourage() == unispace_relation::sum_rel(Relation::full(2), Relation::full(2)));
        REQUIRE_FALSE(s.entourage().contains(1, 2));
    }

    SECTION("induced along a constant map is indiscrete") {
        const UniformCore target = UniformCore::discrete(3);
        REQUIRE(UniformCore::induced(FiniteMap::constant(4, 3, 1), target) == UniformCore::indiscrete(4));
        REQUIRE_THROWS_AS(UniformCore::induced(FiniteMap::identity(2), target), std::invalid_argument);
    }

    SECTION("subspace keeps the classes it meets") {
        const UniformCore core = UniformCore::from_blocks(4, {{0, 1, 2}, {3}}).unwrap();
        REQUIRE(UniformCore::subspace(core, Subset::of(4, {1, 3})) == UniformCore::discrete(2));
        REQUIRE(UniformCore::subspace(core, Subset::of(4, {0, 2})) == UniformCore::indiscrete(2));
    }

    SECTION("coinduced along a quotient") {
        auto quotient = UniformCore::coinduced(FiniteMap(2, {0, 0, 1}), UniformCore::discrete(3));
        REQUIRE(quotient.is_ok());
        REQUIRE(*quotient == d2);

        // links 0-1 and 1-2 without 0-2
        const UniformCore blocks = UniformCore::from_blocks(4, {{0, 1}, {2, 3}}).unwrap();
        auto glued = UniformCore::coinduced(FiniteMap(3, {0, 1, 1, 2}), blocks);
        REQUIRE(glued.is_err());
        REQUIRE(glued.error().as<AxiomError>()->kind == AxiomError::Kind::Triangle);
        REQUIRE_FALSE(coinduced_is_core(FiniteMap(3, {0, 1, 1, 2}), blocks));

        auto not_onto = UniformCore::coinduced(FiniteMap(3, {0, 1}), i2);
        REQUIRE(not_onto.is_err());
        REQUIRE(not_onto.error().as<AxiomError>()->witness == "(2,2)");
        REQUIRE(coinduced_is_core(FiniteMap::identity(2), i2));
    }

    SECTION("projections are uniformly continuous") {
        const UniformCore a = UniformCore::from_blocks(3, {{0, 1}}).unwrap();
        const UniformCore p = UniformCore::product(a, d2);
        REQUIRE(is_uniformly_continuous(FiniteMap::fst(3, 2), p, a));
        REQUIRE(is_uniformly_continuous(FiniteMap::snd(3, 2), p, d2));
    }
}

// =============================================================================
// Derived Topology
// =============================================================================

TEST_CASE("Neighborhoods are pullbacks along sections", "[uniform][topology]") {
    const UniformCore core = UniformCore::from_blocks(4, {{0, 2}, {1, 3}}).unwrap();
    const Topology topology = core.to_topology();

    for (Point x = 0; x < 4; ++x) {
        REQUIRE(topology.nhds(x) == unispace_filter::comap(FiniteMap::section(4, x), core.uniformity()));
        REQUIRE(topology.minimal_neighborhood(x) == ball(x, core.entourage()));
    }
    REQUIRE(topology.minimal_neighborhood(3) == Subset::of(4, {1, 3}));
}
