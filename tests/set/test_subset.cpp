// unispace_set Subset and pair encoding tests

#include <catch2/catch_test_macros.hpp>
#include <unispace/set/set.hpp>
#include <stdexcept>
#include <vector>

using namespace unispace_set;

// =============================================================================
// Subset Tests
// =============================================================================

TEST_CASE("Subset factories", "[set][subset]") {
    SECTION("empty and univ") {
        REQUIRE(Subset::empty(5).is_empty());
        REQUIRE(Subset::univ(5).is_univ());
        REQUIRE(Subset::univ(5).count() == 5);
    }

    SECTION("singleton") {
        Subset s = Subset::singleton(4, 2);
        REQUIRE(s.count() == 1);
        REQUIRE(s.contains(2));
        REQUIRE(s.first() == Point{2});
    }

    SECTION("from predicate") {
        Subset evens = Subset::from_predicate(6, [](Point x) { return x % 2 == 0; });
        REQUIRE(evens == Subset::of(6, {0, 2, 4}));
    }

    SECTION("points outside the carrier") {
        REQUIRE_THROWS_AS(Subset::of(3, {0, 3}), std::out_of_range);
        REQUIRE_FALSE(Subset::univ(3).contains(3));
    }
}

TEST_CASE("Subset algebra", "[set][subset]") {
    Subset a = Subset::of(5, {0, 1, 2});
    Subset b = Subset::of(5, {2, 3});

    SECTION("union, intersection, difference") {
        REQUIRE((a | b) == Subset::of(5, {0, 1, 2, 3}));
        REQUIRE((a & b) == Subset::of(5, {2}));
        REQUIRE((a - b) == Subset::of(5, {0, 1}));
    }

    SECTION("complement") {
        REQUIRE(a.complement() == Subset::of(5, {3, 4}));
        REQUIRE((a | a.complement()).is_univ());
    }

    SECTION("inclusion") {
        REQUIRE(Subset::of(5, {1, 2}).subset_of(a));
        REQUIRE_FALSE(b.subset_of(a));
        REQUIRE(Subset::empty(5).subset_of(b));
        REQUIRE(a.intersects(b));
    }

    SECTION("carrier mismatch throws") {
        REQUIRE_THROWS_AS(a | Subset::univ(4), std::invalid_argument);
        REQUIRE_THROWS_AS(a.subset_of(Subset::univ(6)), std::invalid_argument);
    }
}

TEST_CASE("Subset rendering and iteration", "[set][subset]") {
    Subset s = Subset::of(8, {5, 0, 2});
    REQUIRE(s.to_string() == "{0, 2, 5}");
    REQUIRE(s.elements() == std::vector<Point>{0, 2, 5});
    REQUIRE(Subset::empty(3).to_string() == "{}");

    std::vector<Point> visited;
    for (Point x : s) visited.push_back(x);
    REQUIRE(visited == s.elements());
}

TEST_CASE("Superset enumeration", "[set][subset]") {
    Subset base = Subset::of(4, {1});
    REQUIRE(supersets_count(base) == 8);

    std::size_t visited = 0;
    for_each_superset(base, [&](const Subset& s) {
        REQUIRE(base.subset_of(s));
        ++visited;
    });
    REQUIRE(visited == 8);

    REQUIRE_THROWS_AS(supersets_count(Subset(64)), std::length_error);
}

// =============================================================================
// Pair Encoding Tests
// =============================================================================

TEST_CASE("Pair encoding", "[set][pair]") {
    REQUIRE(pair_carrier_size(3) == 9);
    REQUIRE(encode_pair(3, 1, 2) == 5);
    REQUIRE(decode_pair(3, 5) == std::pair<Point, Point>{1, 2});

    for (Point a = 0; a < 4; ++a) {
        for (Point b = 0; b < 4; ++b) {
            REQUIRE(decode_pair(4, encode_pair(4, a, b)) == std::pair<Point, Point>{a, b});
        }
    }
}
