#pragma once

#include "bit_io.hpp"

#include <gwd_image/types.hpp>

#include <cstdint>

namespace gwd_image {

// Universal count code used for run lengths:
//   prefix: n-1 zero bits and a one bit (n >= 1)
//   suffix: n bits
//   value = suffix + 2^n - 2
// so prefix length n covers [2^n - 2, 2^(n+1) - 3].

// Longest prefix accepted; the decoded value still fits 32 bits.
constexpr unsigned GWD_MAX_COUNT_PREFIX = 31;

[[nodiscard]] inline decode_result read_count(bit_reader& reader, std::uint32_t& count) {
    unsigned n = 1;
    std::uint32_t bit = 0;
    for (;;) {
        if (!reader.get_next_bit(bit)) {
            return decode_result::failure(decode_error::truncated_data,
                "GWD stream ended inside a count prefix");
        }
        if (bit != 0) {
            break;
        }
        if (++n > GWD_MAX_COUNT_PREFIX) {
            return decode_result::failure(decode_error::invalid_format,
                "GWD count prefix too long");
        }
    }

    std::uint32_t suffix = 0;
    if (!reader.get_bits(n, suffix)) {
        return decode_result::failure(decode_error::truncated_data,
            "GWD stream ended inside a count suffix");
    }

    count = suffix + static_cast<std::uint32_t>((std::uint64_t{1} << n) - 2);
    return decode_result::success();
}

inline void write_count(bit_writer& writer, std::uint32_t count) {
    unsigned n = 1;
    while (static_cast<std::uint64_t>(count) > (std::uint64_t{1} << (n + 1)) - 3) {
        ++n;
    }

    // The value 1 in n bits is exactly the prefix: n-1 zeros then the stop bit.
    writer.write_bits(1, n);
    writer.write_bits(static_cast<std::uint32_t>(count - ((std::uint64_t{1} << n) - 2)), n);
}

} // namespace gwd_image
