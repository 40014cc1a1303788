#include <catch2/catch.hpp>
#include <humanhash/hash/compress.hpp>
#include <humanhash/hasher.hpp>

#include <stdexcept>
#include <vector>

using namespace humanhash;
using namespace humanhash::hash;

namespace {
const std::vector<uint8_t> sample = {96, 173, 141, 13, 135, 27, 96, 149, 128, 130, 151};
}

TEST_CASE("compress known vector", "[compress]") {
    // 11 bytes into 4: segments of 2, 2, 2 and 5
    auto out = compress(sample, 4);
    REQUIRE(out == std::vector<uint8_t>{205, 128, 156, 96});
}

TEST_CASE("compress output length", "[compress]") {
    for (size_t target = 1; target <= sample.size(); ++target) {
        REQUIRE(compress(sample, target).size() == target);
    }
}

TEST_CASE("compress segment layout", "[compress]") {
    SECTION("single segment is the xor of everything") {
        REQUIRE(compress(sample, 1) == std::vector<uint8_t>{177});
    }

    SECTION("remainder goes to the last segment only") {
        // 11 bytes into 3: segments of 3, 3 and 5
        REQUIRE(compress(sample, 3) == std::vector<uint8_t>{64, 145, 96});
        // 5 bytes into 2: {1, 2} and {4, 8, 16}
        std::vector<uint8_t> input = {1, 2, 4, 8, 16};
        REQUIRE(compress(input, 2) == std::vector<uint8_t>{3, 28});
    }

    SECTION("target equal to length is the identity") {
        REQUIRE(compress(sample, sample.size()) == sample);
    }

    SECTION("equal bytes cancel out") {
        std::vector<uint8_t> input = {0xAA, 0xAA, 0x55, 0x55};
        REQUIRE(compress(input, 2) == std::vector<uint8_t>{0, 0});
    }
}

TEST_CASE("compress is deterministic", "[compress]") {
    REQUIRE(compress(sample, 4) == compress(sample, 4));
    REQUIRE(hasher::compress(sample, 4) == compress(sample, 4));
}

TEST_CASE("compress rejects invalid targets", "[compress]") {
    SECTION("more output than input") {
        REQUIRE_THROWS_AS(compress(sample, 15), insufficient_input_error);
        REQUIRE_THROWS_AS(compress(sample, sample.size() + 1), insufficient_input_error);
        REQUIRE_THROWS_AS(compress(std::vector<uint8_t>{}, 1), insufficient_input_error);
    }

    SECTION("zero target") {
        REQUIRE_THROWS_AS(compress(sample, 0), std::invalid_argument);
    }
}

TEST_CASE("xor_checksum", "[compress]") {
    REQUIRE(xor_checksum(std::vector<uint8_t>{}) == 0);
    REQUIRE(xor_checksum(std::vector<uint8_t>{0x5A}) == 0x5A);
    REQUIRE(xor_checksum(std::vector<uint8_t>{96, 173}) == 205);
}
