#include "gwd_delta.hpp"

namespace gwd_image {

namespace {

constexpr int fold(int previous) noexcept {
    return previous < 128 ? previous : 255 - previous;
}

delta_table build_delta_table() noexcept {
    delta_table table{};
    for (int symbol = 0; symbol < 256; ++symbol) {
        for (int previous = 0; previous < 256; ++previous) {
            const int m = fold(previous);
            int v;
            if (2 * m < symbol) {
                v = symbol;
            } else if (symbol & 1) {
                v = m + ((symbol + 1) >> 1);
            } else {
                v = m - (symbol >> 1);
            }
            table[symbol][previous] = static_cast<std::uint8_t>(previous < 128 ? v : 255 - v);
        }
    }
    return table;
}

} // namespace

const delta_table& get_delta_table() noexcept {
    static const delta_table table = build_delta_table();
    return table;
}

std::uint8_t decode_delta(std::uint8_t symbol, std::uint8_t previous) noexcept {
    return get_delta_table()[symbol][previous];
}

std::uint8_t encode_delta(std::uint8_t current, std::uint8_t previous) noexcept {
    const int m = fold(previous);
    const int v = previous < 128 ? current : 255 - current;

    if (v > 2 * m) {
        return static_cast<std::uint8_t>(v);
    }
    if (v > m) {
        return static_cast<std::uint8_t>(2 * (v - m) - 1);
    }
    return static_cast<std::uint8_t>(2 * (m - v));
}

} // namespace gwd_image
