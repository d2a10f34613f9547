#include <doctest/doctest.h>

#include "codecs/bit_io.hpp"

#include <cstdint>
#include <vector>

using gwd_image::bit_reader;
using gwd_image::bit_writer;

TEST_CASE("Bit writer: MSB-first packing") {
    std::vector<std::uint8_t> out;
    bit_writer writer(out);

    SUBCASE("Fields spanning one byte") {
        writer.write_bits(0b101, 3);
        writer.write_bits(0b11110, 5);
        REQUIRE(out.size() == 1);
        CHECK(out[0] == 0xBE);
        CHECK(writer.pending_bits() == 0);
    }

    SUBCASE("Only the low bits of the value are used") {
        writer.write_bits(0xFFFFFFF5, 4);
        writer.write_bits(0, 4);
        REQUIRE(out.size() == 1);
        CHECK(out[0] == 0x50);
    }

    SUBCASE("32-bit field after a 4-bit field") {
        writer.write_bits(0x1, 4);
        writer.write_bits(0x23456789, 32);
        writer.write_bits(0xA, 4);
        CHECK(out == std::vector<std::uint8_t>{0x12, 0x34, 0x56, 0x78, 0x9A});
    }
}

TEST_CASE("Bit writer: flush") {
    std::vector<std::uint8_t> out;
    bit_writer writer(out);

    SUBCASE("Residual bits are left-justified and zero padded") {
        writer.write_bits(0b1, 1);
        writer.write_bits(0b01, 2);
        writer.flush();
        CHECK(out == std::vector<std::uint8_t>{0xA0});
    }

    SUBCASE("Second flush writes nothing") {
        writer.write_bits(0b11, 2);
        writer.flush();
        writer.flush();
        CHECK(out.size() == 1);
    }

    SUBCASE("Flush with nothing pending writes nothing") {
        writer.write_bits(0xAB, 8);
        writer.flush();
        CHECK(out == std::vector<std::uint8_t>{0xAB});
    }
}

TEST_CASE("Bit reader: reads across byte boundaries") {
    const std::vector<std::uint8_t> data = {0x12, 0x34, 0x56, 0x78, 0x9A};
    bit_reader reader(data);
    std::uint32_t v = 0;

    REQUIRE(reader.get_bits(4, v));
    CHECK(v == 0x1);
    REQUIRE(reader.get_bits(32, v));
    CHECK(v == 0x23456789);
    REQUIRE(reader.get_next_bit(v));
    CHECK(v == 1);
    REQUIRE(reader.get_bits(3, v));
    CHECK(v == 0b010);
    CHECK(reader.bytes_consumed() == 5);
}

TEST_CASE("Bit reader: end of stream") {
    SUBCASE("Empty input") {
        bit_reader reader(std::span<const std::uint8_t>{});
        std::uint32_t v = 7;
        CHECK_FALSE(reader.get_next_bit(v));
        CHECK(v == 7);
    }

    SUBCASE("Request larger than what remains") {
        const std::vector<std::uint8_t> data = {0xFF};
        bit_reader reader(data);
        std::uint32_t v = 0;
        REQUIRE(reader.get_bits(5, v));
        CHECK(v == 0x1F);
        CHECK_FALSE(reader.get_bits(4, v));
    }
}

TEST_CASE("Bit reader and writer agree on arbitrary field widths") {
    std::vector<std::uint8_t> out;
    bit_writer writer(out);

    std::vector<std::pair<std::uint32_t, unsigned>> fields;
    std::uint32_t seed = 0x9E3779B9u;
    for (unsigned i = 0; i < 500; ++i) {
        seed = seed * 1664525u + 1013904223u;
        const unsigned n = 1 + (seed >> 27);  // 1..32
        const std::uint32_t value = n == 32 ? seed : (seed & ((1u << n) - 1));
        fields.emplace_back(value, n);
        writer.write_bits(value, n);
    }
    writer.flush();

    bit_reader reader(out);
    for (const auto& [value, n] : fields) {
        std::uint32_t got = 0;
        REQUIRE(reader.get_bits(n, got));
        CHECK(got == value);
    }
}
