// unispace_filter Filter lattice tests

#include <catch2/catch_test_macros.hpp>
#include <unispace/filter/filter.hpp>
#include <unispace/set/pair.hpp>
#include <vector>

using namespace unispace_filter;

namespace {

/// Every filter on a carrier of n points (one per generating set)
std::vector<Filter> all_filters(std::size_t n) {
    std::vector<Filter> filters;
    unispace_set::for_each_subset(n, [&](const Subset& s) {
        filters.push_back(Filter::principal(s));
    });
    return filters;
}

} // namespace

// =============================================================================
// Filter Basics
// =============================================================================

TEST_CASE("Filter membership", "[filter][lattice]") {
    Filter f = Filter::principal(Subset::of(4, {1, 2}));

    SECTION("supersets of the generating set") {
        REQUIRE(f.contains(Subset::of(4, {1, 2})));
        REQUIRE(f.contains(Subset::of(4, {0, 1, 2})));
        REQUIRE_FALSE(f.contains(Subset::of(4, {1})));
        REQUIRE(f.contains(Subset::univ(4)));
    }

    SECTION("members enumerates every superset") {
        auto members = f.members();
        REQUIRE(members.size() == 4);
        for (const auto& m : members) {
            REQUIRE(f.contains(m));
        }
    }

    SECTION("eventually and frequently") {
        REQUIRE(f.eventually([](Point x) { return x >= 1; }));
        REQUIRE_FALSE(f.eventually([](Point x) { return x == 1; }));
        REQUIRE(f.frequently([](Point x) { return x == 1; }));
        REQUIRE_FALSE(f.frequently([](Point x) { return x == 3; }));
    }

    SECTION("rendering") {
        REQUIRE(f.to_string() == "<{1, 2}>");
    }
}

TEST_CASE("Filter bounds", "[filter][lattice]") {
    Filter bot = Filter::bottom(3);
    Filter top = Filter::top(3);

    REQUIRE(bot.is_bottom());
    REQUIRE_FALSE(bot.ne_bot());
    REQUIRE(bot.contains(Subset::empty(3)));
    REQUIRE(top.is_top());
    REQUIRE(top.ne_bot());
    REQUIRE_FALSE(top.contains(Subset::of(3, {0, 1})));

    for (const auto& f : all_filters(3)) {
        REQUIRE(bot.le(f));
        REQUIRE(f.le(top));
    }

    SECTION("pure filters are never bottom") {
        Filter p = Filter::pure(3, 1);
        REQUIRE(p.ne_bot());
        REQUIRE(p.contains(Subset::singleton(3, 1)));
    }
}

// =============================================================================
// Lattice Laws
// =============================================================================

TEST_CASE("Filter meet and join are greatest and least bounds", "[filter][lattice]") {
    const auto filters = all_filters(3);

    for (const auto& a : filters) {
        for (const auto& b : filters) {
            const Filter m = inf(a, b);
            const Filter j = sup(a, b);

            REQUIRE(m.le(a));
            REQUIRE(m.le(b));
            REQUIRE(a.le(j));
            REQUIRE(b.le(j));

            for (const auto& c : filters) {
                REQUIRE((c.le(a) && c.le(b)) == c.le(m));
                REQUIRE((a.le(c) && b.le(c)) == j.le(c));
            }
        }
    }
}

TEST_CASE("Filter family bounds", "[filter][lattice]") {
    SECTION("empty families") {
        REQUIRE(inf_all(4, {}).is_top());
        REQUIRE(sup_all(4, {}).is_bottom());
    }

    SECTION("agree with binary operations") {
        Filter a = Filter::principal(Subset::of(4, {0, 1}));
        Filter b = Filter::principal(Subset::of(4, {1, 2}));
        Filter c = Filter::principal(Subset::of(4, {3}));

        REQUIRE(inf_all(4, {a, b, c}) == inf(inf(a, b), c));
        REQUIRE(sup_all(4, {a, b, c}) == sup(sup(a, b), c));
    }
}

// =============================================================================
// Pullback and Pushforward
// =============================================================================

TEST_CASE("map and comap form a Galois connection", "[filter][comap]") {
    FiniteMap f(3, {0, 0, 2, 1});
    const auto source_filters = all_filters(4);
    const auto target_filters = all_filters(3);

    for (const auto& F : source_filters) {
        for (const auto& G : target_filters) {
            REQUIRE(map(f, F).le(G) == F.le(comap(f, G)));
            REQUIRE(tendsto(f, F, G) == map(f, F).le(G));
        }
    }
}

TEST_CASE("comap is functorial", "[filter][comap]") {
    FiniteMap f(3, {2, 0});
    FiniteMap g(4, {1, 1, 3});

    for (const auto& H : all_filters(4)) {
        REQUIRE(comap(f, comap(g, H)) == comap(g.after(f), H));
        REQUIRE(comap(FiniteMap::identity(4), H) == H);
        REQUIRE(map(g.after(f), comap(f, comap(g, H))).le(H));
    }
}

TEST_CASE("map of pure filters", "[filter][map]") {
    FiniteMap f(3, {2, 0, 2});
    REQUIRE(map(f, Filter::pure(3, 0)) == Filter::pure(3, 2));
    REQUIRE_THROWS_AS(map(f, Filter::top(4)), std::invalid_argument);
}

TEST_CASE("Product filters", "[filter][prod]") {
    Filter a = Filter::principal(Subset::of(2, {1}));
    Filter b = Filter::principal(Subset::of(3, {0, 2}));
    Filter p = prod(a, b);

    REQUIRE(p.carrier_size() == 6);
    REQUIRE(p.generating_set() ==
            Subset::of(6, {unispace_set::encode_pair(3, 1, 0), unispace_set::encode_pair(3, 1, 2)}));

    // Projections of the product recover the factors
    REQUIRE(map(FiniteMap::fst(2, 3), p) == a);
    REQUIRE(map(FiniteMap::snd(2, 3), p) == b);
}
