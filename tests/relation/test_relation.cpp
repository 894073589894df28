// unispace_relation Relation algebra tests

#include <catch2/catch_test_macros.hpp>
#include <unispace/relation/relation.hpp>
#include <stdexcept>
#include <vector>

using namespace unispace_relation;
using unispace_set::pair_carrier_size;

namespace {

/// Every relation on a carrier of n points
std::vector<Relation> all_relations(std::size_t n) {
    std::vector<Relation> relations;
    unispace_set::for_each_subset(pair_carrier_size(n), [&](const Subset& s) {
        relations.push_back(Relation::from_subset(n, s));
    });
    return relations;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

TEST_CASE("Relation construction", "[relation][construction]") {
    SECTION("from pairs") {
        Relation r = Relation::from_pairs(3, {{0, 1}, {2, 2}});
        REQUIRE(r.count() == 2);
        REQUIRE(r.contains(0, 1));
        REQUIRE_FALSE(r.contains(1, 0));
        REQUIRE_FALSE(r.contains(5, 0));
        REQUIRE(r.to_string() == "{(0,1), (2,2)}");
    }

    SECTION("pairs outside the carrier throw") {
        REQUIRE_THROWS_AS(Relation::from_pairs(2, {{0, 2}}), std::out_of_range);
        REQUIRE_THROWS_AS(Relation::from_subset(2, Subset::univ(5)), std::invalid_argument);
    }

    SECTION("from blocks is an equivalence") {
        Relation r = Relation::from_blocks(4, {{0, 1, 2}});
        REQUIRE(r.is_equivalence());
        REQUIRE(r.contains(2, 0));
        REQUIRE_FALSE(r.contains(0, 3));
        REQUIRE(r.ball(3) == Subset::of(4, {3}));
        REQUIRE(r.count() == 10);
    }

    SECTION("full and id") {
        REQUIRE(Relation::full(3).count() == 9);
        REQUIRE(Relation::id_rel(3).is_equivalence());
        REQUIRE(Relation::empty(3).is_empty());
        REQUIRE_FALSE(Relation::empty(3).is_reflexive());
    }
}

TEST_CASE("Relation balls and images", "[relation][ball]") {
    Relation r = Relation::from_pairs(4, {{0, 1}, {0, 2}, {3, 3}});

    REQUIRE(r.ball(0) == Subset::of(4, {1, 2}));
    REQUIRE(r.ball(1).is_empty());
    REQUIRE(r.image(Subset::of(4, {0, 3})) == Subset::of(4, {1, 2, 3}));
    REQUIRE(r.swap().ball(2) == Subset::of(4, {0}));
}

// =============================================================================
// Composition
// =============================================================================

TEST_CASE("Composition uses the middle point", "[relation][compose]") {
    Relation v = Relation::from_pairs(3, {{0, 1}});
    Relation w = Relation::from_pairs(3, {{1, 2}});

    REQUIRE(compose(v, w) == Relation::from_pairs(3, {{0, 2}}));
    REQUIRE(compose(w, v).is_empty());
    REQUIRE_THROWS_AS(compose(v, Relation::id_rel(2)), std::invalid_argument);
}

TEST_CASE("Composition is associative with the diagonal as unit", "[relation][compose]") {
    const auto relations = all_relations(2);

    for (const auto& u : relations) {
        REQUIRE(compose(Relation::id_rel(2), u) == u);
        REQUIRE(compose(u, Relation::id_rel(2)) == u);
        for (const auto& v : relations) {
            const Relation uv = compose(u, v);
            for (const auto& w : relations) {
                REQUIRE(compose(uv, w) == compose(u, compose(v, w)));
            }
        }
    }
}

TEST_CASE("Swap reverses composition", "[relation][compose]") {
    Relation v = Relation::from_pairs(3, {{0, 1}, {1, 1}});
    Relation w = Relation::from_pairs(3, {{1, 2}, {0, 0}});
    REQUIRE(compose(v, w).swap() == compose(w.swap(), v.swap()));
}

// =============================================================================
// Symmetrization and Closures
// =============================================================================

TEST_CASE("Symmetrize laws", "[relation][symmetrize]") {
    for (const auto& v : all_relations(2)) {
        const Relation s = symmetrize(v);
        REQUIRE(s.is_symmetric());
        REQUIRE(s.subset_of(v));
        REQUIRE(symmetrize(s) == s);
        if (v.is_symmetric()) {
            REQUIRE(s == v);
        }
    }

    Relation v = Relation::from_pairs(3, {{0, 1}, {1, 0}, {1, 2}});
    REQUIRE(symmetrize(v) == Relation::from_pairs(3, {{0, 1}, {1, 0}}));
}

TEST_CASE("Closures", "[relation][closure]") {
    Relation chain = Relation::from_pairs(4, {{0, 1}, {1, 2}, {2, 3}});

    SECTION("transitive closure") {
        Relation t = transitive_closure(chain);
        REQUIRE(t.is_transitive());
        REQUIRE(t.contains(0, 3));
        REQUIRE_FALSE(t.contains(3, 0));
        REQUIRE(t.count() == 6);
    }

    SECTION("equivalence closure joins the chain") {
        Relation e = equivalence_closure(chain);
        REQUIRE(e.is_equivalence());
        REQUIRE(e == Relation::full(4));
    }
}

// =============================================================================
// Products and Sums
// =============================================================================

TEST_CASE("Product and sum relations", "[relation][constructions]") {
    Relation v = Relation::from_pairs(2, {{0, 1}});
    Relation w = Relation::id_rel(3);

    SECTION("product pairs componentwise") {
        Relation p = prod_rel(v, w);
        REQUIRE(p.carrier_size() == 6);
        REQUIRE(p.count() == 3);
        REQUIRE(p.contains(unispace_set::encode_pair(3, 0, 2), unispace_set::encode_pair(3, 1, 2)));
        REQUIRE_FALSE(p.contains(unispace_set::encode_pair(3, 0, 1), unispace_set::encode_pair(3, 1, 2)));
    }

    SECTION("sum has no cross pairs") {
        Relation s = sum_rel(Relation::full(2), Relation::full(2));
        REQUIRE(s.carrier_size() == 4);
        REQUIRE(s.count() == 8);
        REQUIRE(s.contains(2, 3));
        REQUIRE_FALSE(s.contains(1, 2));
        REQUIRE(s.is_equivalence());
    }
}

// =============================================================================
// Ball Triangle
// =============================================================================

TEST_CASE("Ball triangle holds for composition", "[relation][ball]") {
    SECTION("every pair of relations on three points") {
        const auto relations = all_relations(3);
        for (std::size_t i = 0; i < relations.size(); i += 7) {
            for (const auto& w : relations) {
                REQUIRE(ball_triangle_holds(relations[i], w));
            }
        }
    }

    SECTION("discrete plus the 0-1-2 link on four points") {
        const Relation linked = Relation::from_blocks(4, {{0, 1, 2}, {3}});
        const Relation discrete = Relation::id_rel(4);

        REQUIRE(ball_triangle_holds(linked, linked));
        REQUIRE(ball_triangle_holds(discrete, linked));
        REQUIRE(ball_triangle_holds(linked, discrete));
        REQUIRE(compose(linked, linked) == linked);

        // Exhaustive over the balls: z in ball(y), y in ball(x) puts z in ball(x, V o V)
        const Relation vv = compose(linked, linked);
        for (Point x = 0; x < 4; ++x) {
            for (Point y : linked.ball(x)) {
                for (Point z : linked.ball(y)) {
                    REQUIRE(vv.ball(x).contains(z));
                }
            }
        }
    }
}
