#pragma once

#include "bit_io.hpp"

#include <gwd_image/types.hpp>

#include <cstdint>
#include <span>

namespace gwd_image {

// One row of one channel is a sequence of tokens:
//   3 bits  width code
//   count   universal count code, plus one
// Width code 0 is a run of zero symbols; any other code is followed by
// `count` literal symbols of (width code + 1) bits each. The decoded
// symbols are then resolved left to right through the delta table.

// Longest zero run the encoder emits in one token
constexpr std::size_t GWD_MAX_RUN = 255;

// Literal symbols are at least this wide; width code 0 is taken by zero runs.
constexpr unsigned GWD_MIN_LITERAL_BITS = 2;

/**
 * Decode one scanline into row (row.size() == image width).
 * Fails with truncated_data at end of stream and invalid_format when a
 * literal run would write past the end of the row. A zero run reaching
 * past the end is clipped.
 */
[[nodiscard]] decode_result decode_scanline(bit_reader& reader, std::span<std::uint8_t> row);

/**
 * Encode one scanline. Runs of the zero symbol become zero-run tokens;
 * every other symbol is written as its own single-literal token.
 */
void encode_scanline(bit_writer& writer, std::span<const std::uint8_t> row);

} // namespace gwd_image
