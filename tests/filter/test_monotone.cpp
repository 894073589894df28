// unispace_filter MonotoneMap and lift tests

#include <unispace/filter/monotone.hpp>

#include <catch2/catch_test_macros.hpp>
#include <unispace/filter/filter.hpp>

using namespace unispace_filter;
using unispace_core::AxiomError;
using unispace_core::ErrorCode;

// =============================================================================
// Certification
// =============================================================================

TEST_CASE("MonotoneMap certify", "[filter][monotone]") {
    SECTION("monotone set map is accepted") {
        auto widen = SetMap::certify(4, [](const Subset& s) { return s | Subset::of(4, {0}); }, "widen");
        REQUIRE(widen.is_ok());
        REQUIRE(widen->domain_size() == 4);
        REQUIRE((*widen)(Subset::of(4, {2})) == Subset::of(4, {0, 2}));
    }

    SECTION("complement is rejected with a witness") {
        auto flip = SetMap::certify(3, [](const Subset& s) { return s.complement(); }, "flip");
        REQUIRE(flip.is_err());
        REQUIRE(flip.error().code() == ErrorCode::AxiomViolation);
        REQUIRE(flip.error().as<AxiomError>()->kind == AxiomError::Kind::NotMonotone);
        REQUIRE(*flip.error().get_context("map") == "flip");
    }

    SECTION("filter-valued maps") {
        auto principal = FilterMap::certify(3, [](const Subset& s) { return Filter::principal(s); });
        REQUIRE(principal.is_ok());

        auto reversed = FilterMap::certify(3, [](const Subset& s) { return Filter::principal(s.complement()); });
        REQUIRE(reversed.is_err());
    }

    SECTION("domain too large to check") {
        auto big = SetMap::certify(MONOTONE_CERTIFY_LIMIT + 1, [](const Subset& s) { return s; });
        REQUIRE(big.is_err());
        REQUIRE(big.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("wrong carrier throws on application") {
        auto id = SetMap::trusted(3, [](const Subset& s) { return s; });
        REQUIRE_THROWS_AS(id(Subset::univ(4)), std::invalid_argument);
        REQUIRE_THROWS_WITH(id(Subset::univ(4)), "MonotoneMap: argument lives on a carrier of size 4, expected 3");
    }
}

// =============================================================================
// Lift
// =============================================================================

TEST_CASE("lift and lift_prime", "[filter][lift]") {
    Filter f = Filter::principal(Subset::of(4, {1, 2}));

    SECTION("lift_prime of principal is the identity") {
        auto id = SetMap::trusted(4, [](const Subset& s) { return s; });
        REQUIRE(lift_prime(f, id) == f);
    }

    SECTION("lift of principal agrees with lift_prime") {
        auto grow = SetMap::trusted(4, [](const Subset& s) { return s | Subset::of(4, {3}); });
        auto grow_filter = FilterMap::trusted(4, [](const Subset& s) {
            return Filter::principal(s | Subset::of(4, {3}));
        });
        REQUIRE(lift(f, grow_filter) == lift_prime(f, grow));
        REQUIRE(lift_prime(f, grow).generating_set() == Subset::of(4, {1, 2, 3}));
    }

    SECTION("lift is bounded by g on every member") {
        auto grow_filter = FilterMap::trusted(4, [](const Subset& s) {
            return Filter::principal(s | Subset::of(4, {0}));
        });
        const Filter lifted = lift(f, grow_filter);
        for (const auto& member : f.members()) {
            REQUIRE(lifted.le(grow_filter(member)));
        }
    }

    SECTION("lift is monotone in the filter") {
        auto g = SetMap::trusted(4, [](const Subset& s) { return s | Subset::of(4, {0}); });
        Filter finer = Filter::principal(Subset::of(4, {1}));
        REQUIRE(finer.le(f));
        REQUIRE(lift_prime(finer, g).le(lift_prime(f, g)));
    }
}
