#include <doctest/doctest.h>

#include "codecs/gwd_delta.hpp"
#include "codecs/gwd_scanline.hpp"
#include "helpers/sample_images.hpp"

#include <cstdint>
#include <random>
#include <vector>

using namespace gwd_image;

namespace {

std::vector<std::uint8_t> encode_rows(const std::vector<std::vector<std::uint8_t>>& rows) {
    std::vector<std::uint8_t> out;
    bit_writer writer(out);
    for (const auto& row : rows) {
        encode_scanline(writer, row);
    }
    writer.flush();
    return out;
}

std::vector<std::uint8_t> round_trip(const std::vector<std::uint8_t>& row) {
    const auto bytes = encode_rows({row});
    bit_reader reader(bytes);
    std::vector<std::uint8_t> decoded(row.size(), 0xCD);
    auto result = decode_scanline(reader, decoded);
    REQUIRE_MESSAGE(result.ok, result.message);
    return decoded;
}

} // namespace

TEST_CASE("Scanline: exact encodings") {
    SUBCASE("Flat zero row is one zero run") {
        // width code 000, count 3 -> "01" "01"
        CHECK(encode_rows({{0, 0, 0, 0}}) == std::vector<std::uint8_t>{0x0A});
    }

    SUBCASE("Single symbol 5 is a 3-bit literal") {
        // width code 010, count 0 -> "1" "0", value 101
        CHECK(encode_rows({{5}}) == std::vector<std::uint8_t>{0x55});
    }

    SUBCASE("Single symbol 1 is widened to 2 bits") {
        // width code 001, count 0 -> "1" "0", value 01
        CHECK(encode_rows({{1}}) == std::vector<std::uint8_t>{0x32});
    }
}

TEST_CASE("Scanline: round trip") {
    SUBCASE("Constant rows") {
        for (int v : {0, 1, 127, 128, 254, 255}) {
            const std::vector<std::uint8_t> row(300, static_cast<std::uint8_t>(v));
            CHECK(round_trip(row) == row);
        }
    }

    SUBCASE("Strictly increasing row") {
        std::vector<std::uint8_t> row(256);
        for (std::size_t i = 0; i < row.size(); ++i) {
            row[i] = static_cast<std::uint8_t>(i);
        }
        CHECK(round_trip(row) == row);
    }

    SUBCASE("Alternating extremes") {
        std::vector<std::uint8_t> row(97);
        for (std::size_t i = 0; i < row.size(); ++i) {
            row[i] = (i & 1) ? 255 : 0;
        }
        CHECK(round_trip(row) == row);
    }

    SUBCASE("Runs longer than one token") {
        std::vector<std::uint8_t> row(1000, 42);
        row[0] = 7;
        row[600] = 9;
        CHECK(round_trip(row) == row);
    }

    SUBCASE("Random rows up to 4096 wide") {
        std::mt19937 rng(20240229);
        for (std::size_t width : {1u, 2u, 3u, 7u, 64u, 255u, 256u, 257u, 1000u, 4096u}) {
            const auto row = gwd_test::random_row(width, rng);
            CHECK(round_trip(row) == row);
        }
    }
}

TEST_CASE("Scanline: consecutive rows share one bit cursor") {
    std::mt19937 rng(7);
    std::vector<std::vector<std::uint8_t>> rows;
    for (int i = 0; i < 16; ++i) {
        rows.push_back(gwd_test::random_row(13, rng));
        rows.push_back(std::vector<std::uint8_t>(13, static_cast<std::uint8_t>(i * 16)));
    }

    const auto bytes = encode_rows(rows);
    bit_reader reader(bytes);
    for (const auto& row : rows) {
        std::vector<std::uint8_t> decoded(row.size());
        REQUIRE(decode_scanline(reader, decoded));
        CHECK(decoded == row);
    }
}

TEST_CASE("Scanline: decoder accepts multi-sample literal runs") {
    std::vector<std::uint8_t> bytes;
    bit_writer writer(bytes);

    SUBCASE("Three 8-bit literals in one token") {
        // pixels 10, 12, 9 -> symbols 10, 3, 6
        REQUIRE(encode_delta(12, 10) == 3);
        REQUIRE(encode_delta(9, 12) == 6);

        writer.write_bits(7, 3);   // 8-bit literals
        writer.write_bits(1, 2);   // count prefix "01"
        writer.write_bits(0, 2);   // count 2 -> three samples
        writer.write_bits(10, 8);
        writer.write_bits(3, 8);
        writer.write_bits(6, 8);
        writer.flush();

        bit_reader reader(bytes);
        std::vector<std::uint8_t> row(3);
        REQUIRE(decode_scanline(reader, row));
        CHECK(row == std::vector<std::uint8_t>{10, 12, 9});
    }

    SUBCASE("Literal run followed by a zero run") {
        // symbols 200, 1, 2, 0, 0 over previous pixels
        writer.write_bits(7, 3);
        writer.write_bits(1, 2);
        writer.write_bits(0, 2);
        writer.write_bits(200, 8);
        writer.write_bits(1, 8);
        writer.write_bits(2, 8);
        writer.write_bits(0, 3);   // zero run
        writer.write_bits(1, 1);   // count prefix "1"
        writer.write_bits(1, 1);   // count 1 -> two samples
        writer.flush();

        bit_reader reader(bytes);
        std::vector<std::uint8_t> row(5);
        REQUIRE(decode_scanline(reader, row));
        // above 127 the steps are mirrored: symbol 1 goes down, symbol 2 goes up
        CHECK(row == std::vector<std::uint8_t>{200, 199, 200, 200, 200});
    }

    SUBCASE("Narrow literals") {
        writer.write_bits(1, 3);   // 2-bit literals
        writer.write_bits(1, 1);
        writer.write_bits(1, 1);   // count 1 -> two samples
        writer.write_bits(3, 2);
        writer.write_bits(1, 2);
        writer.flush();

        bit_reader reader(bytes);
        std::vector<std::uint8_t> row(2);
        REQUIRE(decode_scanline(reader, row));
        CHECK(row == std::vector<std::uint8_t>{3, 4});
    }
}

TEST_CASE("Scanline: malformed streams") {
    std::vector<std::uint8_t> bytes;
    bit_writer writer(bytes);

    SUBCASE("Literal run past the end of the row") {
        writer.write_bits(7, 3);
        writer.write_bits(1, 2);
        writer.write_bits(0, 2);   // three samples
        writer.write_bits(0xFFFFFF, 24);
        writer.flush();

        bit_reader reader(bytes);
        std::vector<std::uint8_t> row(2);
        auto result = decode_scanline(reader, row);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::invalid_format);
    }

    SUBCASE("Zero run past the end of the row is clipped") {
        writer.write_bits(0, 3);
        writer.write_bits(1, 3);   // prefix "001"
        writer.write_bits(3, 3);   // count 9 -> ten samples
        writer.flush();

        bit_reader reader(bytes);
        std::vector<std::uint8_t> row(4, 0xEE);
        REQUIRE(decode_scanline(reader, row));
        CHECK(row == std::vector<std::uint8_t>{0, 0, 0, 0});
    }

    SUBCASE("Stream ends inside a literal run") {
        writer.write_bits(7, 3);
        writer.write_bits(1, 2);
        writer.write_bits(0, 2);
        writer.write_bits(0xAB, 8);
        writer.flush();

        bit_reader reader(bytes);
        std::vector<std::uint8_t> row(3);
        auto result = decode_scanline(reader, row);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::truncated_data);
    }

    SUBCASE("Empty stream") {
        bit_reader reader(bytes);
        std::vector<std::uint8_t> row(1);
        auto result = decode_scanline(reader, row);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::truncated_data);
    }
}
