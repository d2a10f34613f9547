#include <doctest/doctest.h>
#include <gwd_image/gwd_image.hpp>

#include <cstdint>
#include <vector>

using namespace gwd_image;

TEST_CASE("GWD header: byte layout") {
    gwd_header hdr;
    hdr.payload_size = 0x01020304;
    hdr.width = 0x0102;
    hdr.height = 0x0304;
    hdr.bits_per_pixel = 24;

    const auto bytes = write_gwd_header(hdr);
    const std::array<std::uint8_t, GWD_HEADER_SIZE> expected = {
        0x04, 0x03, 0x02, 0x01,  // payload size, little-endian
        'G', 'W', 'D',
        0x01, 0x02,              // width, big-endian
        0x03, 0x04,              // height, big-endian
        24
    };
    CHECK(bytes == expected);
}

TEST_CASE("GWD header: round trip") {
    for (std::uint8_t bpp : {std::uint8_t{8}, std::uint8_t{24}, std::uint8_t{32}}) {
        gwd_header hdr;
        hdr.payload_size = 0xFFFFFFF0u;
        hdr.width = 640;
        hdr.height = 65535;
        hdr.bits_per_pixel = bpp;

        const auto bytes = write_gwd_header(hdr);
        gwd_header parsed;
        REQUIRE(read_gwd_header(bytes, parsed));
        CHECK(parsed == hdr);
    }
}

TEST_CASE("GWD header: rejected input") {
    gwd_header hdr;
    hdr.width = 4;
    hdr.height = 4;
    hdr.bits_per_pixel = 8;
    const auto good = write_gwd_header(hdr);

    SUBCASE("Fewer than 12 bytes") {
        std::vector<std::uint8_t> data(good.begin(), good.begin() + 11);
        gwd_header parsed;
        auto result = read_gwd_header(data, parsed);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::invalid_format);
    }

    SUBCASE("Empty input") {
        gwd_header parsed;
        auto result = read_gwd_header({}, parsed);
        CHECK(result.error == decode_error::invalid_format);
    }

    SUBCASE("Wrong magic") {
        std::vector<std::uint8_t> data(good.begin(), good.end());
        data[6] = 'X';
        gwd_header parsed;
        auto result = read_gwd_header(data, parsed);
        CHECK_FALSE(result.ok);
        CHECK(result.error == decode_error::invalid_format);
    }
}

TEST_CASE("GWD decoder: sniff") {
    SUBCASE("Valid magic at offset 4") {
        std::vector<std::uint8_t> data = {0, 0, 0, 0, 'G', 'W', 'D', 0, 1, 0, 1, 8};
        CHECK(gwd_decoder::sniff(data));
    }

    SUBCASE("Magic at offset 0 is not GWD") {
        std::vector<std::uint8_t> data = {'G', 'W', 'D', 0, 0, 0, 0, 0, 1, 0, 1, 8};
        CHECK_FALSE(gwd_decoder::sniff(data));
    }

    SUBCASE("Too short") {
        std::vector<std::uint8_t> data = {0, 0, 0, 0, 'G', 'W', 'D'};
        CHECK_FALSE(gwd_decoder::sniff(data));
    }

    SUBCASE("Not confused with PNG") {
        std::vector<std::uint8_t> data = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
                                          0, 0, 0, 13};
        CHECK_FALSE(gwd_decoder::sniff(data));
    }
}
