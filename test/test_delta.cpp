#include <doctest/doctest.h>

#include "codecs/gwd_delta.hpp"

#include <cstdint>

using namespace gwd_image;

TEST_CASE("Delta predictor: encode is the exact inverse of decode") {
    int failures = 0;
    for (int previous = 0; previous < 256; ++previous) {
        for (int current = 0; current < 256; ++current) {
            const auto p = static_cast<std::uint8_t>(previous);
            const auto c = static_cast<std::uint8_t>(current);
            if (decode_delta(encode_delta(c, p), p) != c) {
                ++failures;
            }
        }
    }
    CHECK(failures == 0);
}

TEST_CASE("Delta predictor: each table column is a permutation") {
    const auto& table = get_delta_table();
    for (int previous = 0; previous < 256; ++previous) {
        bool seen[256] = {};
        for (int symbol = 0; symbol < 256; ++symbol) {
            seen[table[symbol][previous]] = true;
        }
        int covered = 0;
        for (bool s : seen) {
            covered += s ? 1 : 0;
        }
        CHECK(covered == 256);
    }
}

TEST_CASE("Delta predictor: symbol 0 means no change") {
    for (int p = 0; p < 256; ++p) {
        const auto prev = static_cast<std::uint8_t>(p);
        CHECK(decode_delta(0, prev) == prev);
        CHECK(encode_delta(prev, prev) == 0);
    }
}

TEST_CASE("Delta predictor: known values") {
    SUBCASE("Previous 0 codes values as themselves") {
        CHECK(decode_delta(1, 0) == 1);
        CHECK(decode_delta(200, 0) == 200);
        CHECK(encode_delta(77, 0) == 77);
    }

    SUBCASE("Previous 255 is the mirror of previous 0") {
        CHECK(decode_delta(1, 255) == 254);
        CHECK(decode_delta(200, 255) == 55);
        CHECK(encode_delta(55, 255) == 200);
    }

    SUBCASE("Alternating distance around the lower half") {
        CHECK(decode_delta(1, 100) == 101);
        CHECK(decode_delta(2, 100) == 99);
        CHECK(decode_delta(3, 100) == 102);
        CHECK(decode_delta(200, 100) == 0);
        CHECK(decode_delta(199, 100) == 200);
        CHECK(decode_delta(201, 100) == 201);
    }

    SUBCASE("Alternating distance around the upper half is mirrored") {
        // previous 200 folds to 55
        CHECK(decode_delta(1, 200) == 199);
        CHECK(decode_delta(2, 200) == 201);
        CHECK(encode_delta(199, 200) == 1);
        CHECK(encode_delta(201, 200) == 2);
    }

    SUBCASE("Fold point") {
        CHECK(decode_delta(1, 127) == 128);
        CHECK(decode_delta(1, 128) == 127);
        CHECK(decode_delta(2, 128) == 129);
    }
}

TEST_CASE("Delta predictor: table is built once") {
    CHECK(&get_delta_table() == &get_delta_table());
}
