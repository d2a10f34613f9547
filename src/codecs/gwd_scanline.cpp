#include "gwd_scanline.hpp"
#include "gwd_count_code.hpp"
#include "gwd_delta.hpp"

#include <algorithm>
#include <bit>
#include <string>
#include <vector>

namespace gwd_image {

namespace {

constexpr unsigned WIDTH_CODE_BITS = 3;
constexpr std::uint32_t ZERO_RUN_CODE = 0;

void write_zero_run(bit_writer& writer, std::size_t run) {
    writer.write_bits(ZERO_RUN_CODE, WIDTH_CODE_BITS);
    write_count(writer, static_cast<std::uint32_t>(run - 1));
}

void write_literal(bit_writer& writer, std::uint8_t symbol) {
    const unsigned bits = std::max(GWD_MIN_LITERAL_BITS,
                                   static_cast<unsigned>(std::bit_width(symbol)));
    writer.write_bits(bits - 1, WIDTH_CODE_BITS);
    write_count(writer, 0);
    writer.write_bits(symbol, bits);
}

} // namespace

decode_result decode_scanline(bit_reader& reader, std::span<std::uint8_t> row) {
    const std::size_t width = row.size();
    std::size_t dst = 0;

    while (dst < width) {
        std::uint32_t width_code = 0;
        if (!reader.get_bits(WIDTH_CODE_BITS, width_code)) {
            return decode_result::failure(decode_error::truncated_data,
                "GWD stream ended inside a scanline");
        }

        std::uint32_t raw_count = 0;
        auto result = read_count(reader, raw_count);
        if (!result) return result;
        const std::size_t count = static_cast<std::size_t>(raw_count) + 1;

        if (width_code == ZERO_RUN_CODE) {
            const std::size_t run = std::min(count, width - dst);
            std::fill_n(row.begin() + static_cast<std::ptrdiff_t>(dst), run, std::uint8_t{0});
            dst += run;
            continue;
        }

        if (count > width - dst) {
            return decode_result::failure(decode_error::invalid_format,
                "GWD literal run of " + std::to_string(count) +
                " samples overruns scanline at " + std::to_string(dst));
        }

        const unsigned bits = width_code + 1;
        for (std::size_t i = 0; i < count; ++i) {
            std::uint32_t symbol = 0;
            if (!reader.get_bits(bits, symbol)) {
                return decode_result::failure(decode_error::truncated_data,
                    "GWD stream ended inside a literal run");
            }
            row[dst++] = static_cast<std::uint8_t>(symbol);
        }
    }

    const auto& table = get_delta_table();
    for (std::size_t i = 1; i < width; ++i) {
        row[i] = table[row[i]][row[i - 1]];
    }

    return decode_result::success();
}

void encode_scanline(bit_writer& writer, std::span<const std::uint8_t> row) {
    const std::size_t width = row.size();
    if (width == 0) {
        return;
    }

    // Predictor context is the unmodified previous source pixel
    std::vector<std::uint8_t> symbols(width);
    symbols[0] = row[0];
    for (std::size_t i = 1; i < width; ++i) {
        symbols[i] = encode_delta(row[i], row[i - 1]);
    }

    std::size_t pos = 0;
    while (pos < width) {
        if (symbols[pos] != 0) {
            write_literal(writer, symbols[pos]);
            ++pos;
            continue;
        }

        std::size_t run = 1;
        while (pos + run < width && symbols[pos + run] == 0 && run < GWD_MAX_RUN) {
            ++run;
        }
        write_zero_run(writer, run);
        pos += run;
    }
}

} // namespace gwd_image
