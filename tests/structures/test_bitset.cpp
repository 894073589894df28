// unispace_structures BitSet tests

#include <catch2/catch_test_macros.hpp>
#include <unispace/structures/bitset.hpp>
#include <vector>

using namespace unispace_structures;

// =============================================================================
// BitSet Construction Tests
// =============================================================================

TEST_CASE("BitSet construction", "[structures][bitset]") {
    SECTION("default is empty") {
        BitSet bs;
        REQUIRE(bs.size() == 0);
        REQUIRE(bs.empty());
        REQUIRE(bs.none());
    }

    SECTION("custom length") {
        BitSet bs(128);
        REQUIRE(bs.size() == 128);
        REQUIRE(bs.word_count() == 2);
        REQUIRE(bs.none());
    }

    SECTION("from initializer list") {
        BitSet bs({0, 5, 10}, 16);
        REQUIRE(bs.get(0));
        REQUIRE(bs.get(5));
        REQUIRE(bs.get(10));
        REQUIRE_FALSE(bs.get(1));
        REQUIRE(bs.count_ones() == 3);
    }
}

// =============================================================================
// BitSet Bit Operations Tests
// =============================================================================

TEST_CASE("BitSet set and get", "[structures][bitset]") {
    BitSet bs(70);

    SECTION("across a word boundary") {
        bs.set(63);
        bs.set(64);
        REQUIRE(bs.get(63));
        REQUIRE(bs.get(64));
        REQUIRE(bs.count_ones() == 2);
    }

    SECTION("set with value") {
        bs.set(5, true);
        REQUIRE(bs.test(5));
        bs.set(5, false);
        REQUIRE_FALSE(bs[5]);
    }

    SECTION("out of range is ignored") {
        bs.set(70);
        bs.set(1000);
        REQUIRE(bs.none());
        REQUIRE_FALSE(bs.get(1000));
    }
}

TEST_CASE("BitSet bulk operations", "[structures][bitset]") {
    BitSet bs(100);

    SECTION("set_all respects the length") {
        bs.set_all();
        REQUIRE(bs.all());
        REQUIRE(bs.count_ones() == 100);
    }

    SECTION("clear_all") {
        bs.set(3);
        bs.set(99);
        bs.clear_all();
        REQUIRE(bs.none());
    }

    SECTION("complement stays within the length") {
        bs.set(0);
        BitSet inv = ~bs;
        REQUIRE(inv.count_ones() == 99);
        REQUIRE_FALSE(inv.get(0));
    }

    SECTION("first_one") {
        REQUIRE(bs.first_one() == 100);
        bs.set(77);
        bs.set(80);
        REQUIRE(bs.first_one() == 77);
    }
}

// =============================================================================
// BitSet Set Algebra Tests
// =============================================================================

TEST_CASE("BitSet set algebra", "[structures][bitset]") {
    BitSet a({1, 2, 3}, 8);
    BitSet b({3, 4}, 8);

    SECTION("union and intersection") {
        REQUIRE((a | b) == BitSet({1, 2, 3, 4}, 8));
        REQUIRE((a & b) == BitSet({3}, 8));
    }

    SECTION("subtract") {
        BitSet c = a;
        c.subtract(b);
        REQUIRE(c == BitSet({1, 2}, 8));
    }

    SECTION("inclusion and intersection tests") {
        REQUIRE(BitSet({1, 3}, 8).is_subset_of(a));
        REQUIRE_FALSE(b.is_subset_of(a));
        REQUIRE(a.intersects(b));
        REQUIRE_FALSE(BitSet({0}, 8).intersects(a));
    }

    SECTION("equality needs equal lengths") {
        REQUIRE_FALSE(BitSet(8) == BitSet(9));
    }
}

TEST_CASE("BitSet iteration", "[structures][bitset]") {
    BitSet bs({2, 64, 65, 127}, 128);

    std::vector<std::size_t> ones;
    for (auto i : bs.iter_ones()) {
        ones.push_back(i);
    }
    REQUIRE(ones == std::vector<std::size_t>{2, 64, 65, 127});
}
