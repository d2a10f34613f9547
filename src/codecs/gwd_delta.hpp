#pragma once

#include <array>
#include <cstdint>

namespace gwd_image {

// Mirrored delta predictor.
//
// The previous pixel p is folded onto 0..127 (m = p or 255 - p). Values
// within [0, 2m] of the folded range are coded as an alternating distance
// from m (0, +1, -1, +2, -2, ...); values above 2m are coded as themselves.
// When p >= 128 the whole mapping is mirrored back.

using delta_table = std::array<std::array<std::uint8_t, 256>, 256>;

// table[symbol][previous] -> pixel. Built on first use, never modified.
[[nodiscard]] const delta_table& get_delta_table() noexcept;

[[nodiscard]] std::uint8_t decode_delta(std::uint8_t symbol, std::uint8_t previous) noexcept;

[[nodiscard]] std::uint8_t encode_delta(std::uint8_t current, std::uint8_t previous) noexcept;

} // namespace gwd_image
