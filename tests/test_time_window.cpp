/**
 * @file test_time_window.cpp
 * @brief Unit tests for deriving encodings from time windows.
 */

#include <catch2/catch.hpp>
#include <epibits/encoding.hpp>

#include <chrono>

using namespace epibits;
using namespace std::chrono;

namespace {

const sys_days REF = sys_days{year{2016} / May / 31};

} // namespace

TEST_CASE("Window at the reference instant", "[window]") {
    Encoding e = Encoding::from_time_window(REF, REF, REF, days{-1}, 4);

    REQUIRE(e.width() == 4);
    REQUIRE(e.coding_value() == 1);
    REQUIRE(e.bit_sequence() == "0001");
}

TEST_CASE("Window in the past", "[window]") {
    SECTION("older samples are more significant") {
        // Steps 2 and 3 fall in the window -> positions 5 and 4
        Encoding e = Encoding::from_time_window(REF - days{3}, REF - days{2}, REF, days{-1}, 8);
        REQUIRE(e.bit_sequence() == "00001100");
    }

    SECTION("bounds are inclusive") {
        Encoding e = Encoding::from_time_window(REF - days{5}, REF - days{1}, REF, days{-1}, 8);
        REQUIRE(e.bit_sequence() == "00111110");
        REQUIRE(e.magnitude() == 5);
    }

    SECTION("window outside the sampled range") {
        Encoding e = Encoding::from_time_window(REF - days{100}, REF - days{90}, REF, days{-1}, 8);
        REQUIRE(e.is_zero());
    }
}

TEST_CASE("Window defaults", "[window]") {
    // Default: 32 bits stepping back one day at a time
    Encoding e = Encoding::from_time_window(REF - days{31}, REF - days{31}, REF);

    REQUIRE(e.width() == DEFAULT_BIT_COUNT);
    REQUIRE(e.coding_value() == 2147483648ULL);
    REQUIRE(e.score_bitorder() == 32);
}

TEST_CASE("Reversed window yields zero", "[window]") {
    Encoding e = Encoding::from_time_window(REF - days{2}, REF - days{5}, REF, days{-1}, 8);

    REQUIRE(e.width() == 8);
    REQUIRE(e.is_zero());
}

TEST_CASE("Window covering every sample", "[window]") {
    // All-ones codes are rejected like any constructed value
    REQUIRE_THROWS_AS(
        Encoding::from_time_window(REF - days{10}, REF, REF, days{-1}, 4),
        InvalidWidthException);
}

TEST_CASE("Forward step", "[window]") {
    Encoding e = Encoding::from_time_window(REF + days{1}, REF + days{2}, REF, days{1}, 4);

    REQUIRE(e.bit_sequence() == "0110");
}

TEST_CASE("Sub-day steps", "[window]") {
    sys_seconds ref = time_point_cast<seconds>(REF + hours{12});
    sys_seconds start = ref - hours{12};
    sys_seconds end = ref - hours{6};

    Encoding e = Encoding::from_time_window(start, end, ref, hours{-6}, 4);

    REQUIRE(e.bit_sequence() == "0110");
}

TEST_CASE("Drug episodes with lingering effect", "[window][interaction]") {
    Encoding drug_a = Encoding::from_time_window(REF - days{20}, REF - days{10}, REF);
    Encoding drug_b = Encoding::from_time_window(REF - days{8}, REF - days{2}, REF);

    SECTION("episodes do not overlap") {
        REQUIRE(Encoding::eb_and(drug_a, drug_b).is_zero());
        REQUIRE(Encoding::interaction(drug_a, drug_b, 0).is_zero());
        REQUIRE(Encoding::interaction(drug_a, drug_b, 1).is_zero());
    }

    SECTION("effect of the first drug reaches the second") {
        // drug_a extended by 3 days covers days 7..20 before the reference
        Encoding inter = Encoding::interaction(drug_a, drug_b, 3);
        REQUIRE(inter.magnitude() == 2);
        REQUIRE(inter.value().get_bit(31 - 8) == 1);
        REQUIRE(inter.value().get_bit(31 - 7) == 1);
    }
}
