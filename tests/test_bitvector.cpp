/**
 * @file test_bitvector.cpp
 * @brief Unit tests for BitVector class.
 */

#include <epibits/bitvector.hpp>
#include <epibits/error.hpp>

#include <catch2/catch.hpp>

#include <vector>

using namespace epibits;

TEST_CASE("BitVector construction", "[bitvector]") {
    SECTION("construction with size") {
        BitVector bv(32);
        REQUIRE(bv.length() == 32);
        REQUIRE(bv.num_words() == 1);
    }

    SECTION("365-bit vector") {
        BitVector bv(365);
        REQUIRE(bv.length() == 365);
        REQUIRE(bv.num_words() == 12); // ceil(365/32) = 12
    }

    SECTION("initial state is zero") {
        BitVector bv(64);
        for (std::size_t i = 0; i < 64; ++i) {
            REQUIRE(bv.get_bit(i) == 0);
        }
        REQUIRE(bv.is_zero());
    }

    SECTION("default constructed is empty") {
        BitVector bv;
        REQUIRE(bv.length() == 0);
        REQUIRE(bv.num_words() == 0);
        REQUIRE(bv.is_zero());
        REQUIRE(bv.to_string().empty());
    }
}

TEST_CASE("BitVector bit access", "[bitvector]") {
    BitVector bv(32);

    SECTION("set and get individual bits") {
        bv.set_bit(0, 1);
        REQUIRE(bv.get_bit(0) == 1);

        bv.set_bit(31, 1);
        REQUIRE(bv.get_bit(31) == 1);

        bv.set_bit(15, 1);
        REQUIRE(bv.get_bit(15) == 1);
    }

    SECTION("clear bits") {
        bv.set_bit(5, 1);
        REQUIRE(bv.get_bit(5) == 1);
        bv.set_bit(5, 0);
        REQUIRE(bv.get_bit(5) == 0);
    }

    SECTION("position 0 is the most significant bit") {
        bv.set_bit(0, 1);
        REQUIRE(bv.to_uint64() == 0x80000000ULL);
        bv.set_bit(0, 0);
        bv.set_bit(31, 1);
        REQUIRE(bv.to_uint64() == 1);
    }

    SECTION("out of range access is ignored") {
        bv.set_bit(32, 1);
        REQUIRE(bv.is_zero());
        REQUIRE(bv.get_bit(100) == 0);
    }

    SECTION("multi-word bit access") {
        BitVector bv40(40);
        bv40.set_bit(0, 1);
        bv40.set_bit(8, 1);
        bv40.set_bit(39, 1);
        REQUIRE(bv40.get_bit(0) == 1);
        REQUIRE(bv40.get_bit(8) == 1);
        REQUIRE(bv40.get_bit(39) == 1);
        REQUIRE(bv40.get_bit(1) == 0);
        REQUIRE(bv40.to_uint64() == ((1ULL << 39) | (1ULL << 31) | 1ULL));
    }
}

TEST_CASE("BitVector from integer", "[bitvector]") {
    SECTION("value is right aligned") {
        BitVector bv = BitVector::from_uint64(6, 4);
        REQUIRE(bv.to_string() == "0110");
    }

    SECTION("bits above the length are dropped") {
        BitVector bv = BitVector::from_uint64(0xFF, 4);
        REQUIRE(bv.to_uint64() == 0xF);
    }

    SECTION("full 64-bit value") {
        BitVector bv = BitVector::from_uint64(0xFFFFFFFFFFFFFFFFULL, 64);
        REQUIRE(bv.hamming_weight() == 64);
        REQUIRE(bv.to_uint64() == 0xFFFFFFFFFFFFFFFFULL);
    }
}

TEST_CASE("BitVector from string", "[bitvector]") {
    SECTION("MSB first") {
        BitVector bv = BitVector::from_string("1010");
        REQUIRE(bv.length() == 4);
        REQUIRE(bv.to_uint64() == 10);
        REQUIRE(bv.to_string() == "1010");
    }

    SECTION("leading zeros keep the length") {
        BitVector bv = BitVector::from_string("0001");
        REQUIRE(bv.length() == 4);
        REQUIRE(bv.to_uint64() == 1);
        REQUIRE(bv.bit_length() == 1);
    }

    SECTION("invalid character") {
        REQUIRE_THROWS_AS(BitVector::from_string("10x1"), InvalidArgumentException);
    }
}

TEST_CASE("BitVector hamming weight and bit length", "[bitvector]") {
    BitVector bv(100);
    REQUIRE(bv.hamming_weight() == 0);
    REQUIRE(bv.bit_length() == 0);

    bv.set_bit(99, 1);
    REQUIRE(bv.bit_length() == 1);

    bv.set_bit(0, 1);
    bv.set_bit(50, 1);
    REQUIRE(bv.hamming_weight() == 3);
    REQUIRE(bv.bit_length() == 100);
}

TEST_CASE("BitVector resize", "[bitvector]") {
    SECTION("growing keeps the value") {
        BitVector bv = BitVector::from_uint64(5, 3);
        bv.resize(70);
        REQUIRE(bv.length() == 70);
        REQUIRE(bv.to_uint64() == 5);
        REQUIRE(bv.get_bit(69) == 1);
        REQUIRE(bv.get_bit(67) == 1);
    }

    SECTION("shrinking drops high bits") {
        BitVector bv = BitVector::from_string("11011");
        bv.resize(3);
        REQUIRE(bv.to_string() == "011");
    }
}

TEST_CASE("BitVector OR and AND", "[bitvector]") {
    BitVector a = BitVector::from_string("1100");
    BitVector b = BitVector::from_string("0110");

    SECTION("OR") {
        a.or_with(b);
        REQUIRE(a.to_string() == "1110");
    }

    SECTION("AND") {
        a.and_with(b);
        REQUIRE(a.to_string() == "0100");
    }

    SECTION("shorter operand is zero extended") {
        BitVector wide = BitVector::from_string("10000001");
        BitVector narrow = BitVector::from_string("11");

        BitVector or_result = narrow;
        or_result.or_with(wide);
        REQUIRE(or_result.to_string() == "10000011");

        wide.and_with(narrow);
        REQUIRE(wide.to_string() == "00000001");
    }
}

TEST_CASE("BitVector shifts", "[bitvector]") {
    SECTION("left shift moves toward the MSB") {
        BitVector bv = BitVector::from_string("0011");
        bv.left_shift(1);
        REQUIRE(bv.to_string() == "0110");
        bv.left_shift(2);
        REQUIRE(bv.to_string() == "1000");
    }

    SECTION("right shift moves toward the LSB") {
        BitVector bv = BitVector::from_string("1100");
        bv.right_shift(1);
        REQUIRE(bv.to_string() == "0110");
        bv.right_shift(2);
        REQUIRE(bv.to_string() == "0001");
    }

    SECTION("shift by the length clears") {
        BitVector bv = BitVector::from_string("1111");
        bv.right_shift(4);
        REQUIRE(bv.is_zero());

        BitVector bv2 = BitVector::from_string("1111");
        bv2.left_shift(10);
        REQUIRE(bv2.is_zero());
    }

    SECTION("shifts across word boundaries") {
        BitVector bv(96);
        bv.set_bit(95, 1);
        bv.left_shift(33);
        REQUIRE(bv.get_bit(62) == 1);
        REQUIRE(bv.hamming_weight() == 1);

        bv.right_shift(40);
        REQUIRE(bv.get_bit(62 + 40) == 0);
        REQUIRE(bv.is_zero());

        BitVector bv2(96);
        bv2.set_bit(0, 1);
        bv2.right_shift(65);
        REQUIRE(bv2.get_bit(65) == 1);
        REQUIRE(bv2.hamming_weight() == 1);
    }
}

TEST_CASE("BitVector multiply", "[bitvector]") {
    SECTION("small product") {
        BitVector bv = BitVector::from_uint64(6, 8);
        bv.multiply(3);
        REQUIRE(bv.length() == 40);
        REQUIRE(bv.to_uint64() == 18);
    }

    SECTION("product carries into a new word") {
        BitVector bv = BitVector::from_uint64(0xFFFFFFFFULL, 32);
        bv.multiply(0xFFFFFFFFU);
        REQUIRE(bv.length() == 64);
        REQUIRE(bv.to_uint64() == 0xFFFFFFFFULL * 0xFFFFFFFFULL);
    }

    SECTION("multiply by zero") {
        BitVector bv = BitVector::from_uint64(12345, 20);
        bv.multiply(0);
        REQUIRE(bv.is_zero());
    }
}

TEST_CASE("BitVector conversion overflow", "[bitvector]") {
    BitVector bv(80);
    bv.set_bit(0, 1);
    REQUIRE_THROWS_AS(bv.to_uint64(), OverflowException);

    bv.set_bit(0, 0);
    bv.set_bit(16, 1);
    REQUIRE(bv.to_uint64() == (1ULL << 63));
}

TEST_CASE("BitVector word layout", "[bitvector]") {
    // Least significant word first; position 0 is the top bit of the last word
    BitVector bv = BitVector::from_uint64(0x100000001ULL, 40);
    REQUIRE(bv.data().size() == 2);
    REQUIRE(bv.data()[0] == 0x1U);
    REQUIRE(bv.data()[1] == 0x1U);

    bv.set_bit(0, 1);
    REQUIRE(bv.data()[1] == 0x81U);

    SECTION("unused top bits stay clear") {
        bv.left_shift(1);
        REQUIRE(bv.data()[1] == 0x02U);
        REQUIRE(bv.data()[0] == 0x2U);
    }
}

TEST_CASE("BitVector set bit iteration", "[bitvector]") {
    BitVector bv(70);
    bv.set_bit(3, 1);
    bv.set_bit(40, 1);
    bv.set_bit(69, 1);

    std::vector<std::size_t> positions;
    bv.for_each_set_bit([&positions](std::size_t pos) { positions.push_back(pos); });

    REQUIRE(positions == std::vector<std::size_t>{3, 40, 69});
}

TEST_CASE("BitVector equality", "[bitvector]") {
    REQUIRE(BitVector::from_string("0101") == BitVector::from_uint64(5, 4));
    REQUIRE(BitVector::from_string("0101") != BitVector::from_string("0100"));
    // Same value, different length
    REQUIRE(BitVector::from_string("101") != BitVector::from_string("0101"));
}
