#ifndef GWD_IMAGE_CODECS_GWD_HPP_
#define GWD_IMAGE_CODECS_GWD_HPP_

#include <gwd_image/gwd_image_export.h>
#include <gwd_image/raster.hpp>
#include <gwd_image/surface.hpp>
#include <gwd_image/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace gwd_image {

// ============================================================================
// GWD Header
// ============================================================================

// Layout (12 bytes):
//   0  u32 LE  payload size, counted from offset 4
//   4  "GWD"   magic
//   7  u16 BE  width
//   9  u16 BE  height
//   11 u8      bits per pixel (8, 24 or 32)
constexpr std::size_t GWD_HEADER_SIZE = 12;

// Flag byte at offset 4 + payload_size announcing a nested alpha image
constexpr std::uint8_t GWD_ALPHA_FLAG = 0x01;

struct gwd_header {
    std::uint32_t payload_size = 0;
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    std::uint8_t bits_per_pixel = 0;

    bool operator==(const gwd_header&) const = default;
};

/**
 * Parse a GWD header from the start of data.
 * @return invalid_format if fewer than 12 bytes are available or the
 *         magic does not match; callers may treat this as "not a GWD file"
 */
[[nodiscard]] GWD_IMAGE_EXPORT decode_result read_gwd_header(std::span<const std::uint8_t> data,
                                                              gwd_header& hdr);

[[nodiscard]] GWD_IMAGE_EXPORT std::array<std::uint8_t, GWD_HEADER_SIZE>
write_gwd_header(const gwd_header& hdr) noexcept;

// ============================================================================
// Raster-level codec
// ============================================================================

/**
 * Decode a GWD stream to a raster.
 *
 * Channels are stored in bitstream order: 1 channel for 8 bpp, 3 for
 * 24/32 bpp, and 4 when a matching alpha sub-image follows the primary
 * payload. The fourth channel holds the inverted alpha plane.
 */
[[nodiscard]] GWD_IMAGE_EXPORT decode_result decode_gwd_raster(std::span<const std::uint8_t> data,
                                                                raster& out,
                                                                const decode_options& options = {});

/**
 * Encode a 1-channel (8 bpp) or 3-channel (24 bpp) raster.
 * Alpha sub-images are never written.
 * @return GWD data, or empty vector on failure
 */
[[nodiscard]] GWD_IMAGE_EXPORT std::vector<std::uint8_t> encode_gwd_raster(const raster& src);

// ============================================================================
// GWD Decoder
// ============================================================================

/**
 * Surface decoder. Stored channels 0, 1, 2 become B, G, R on the surface
 * (rgb888, or rgba8888 with alpha); 8 bpp images become indexed8 with a
 * grey palette.
 */
class GWD_IMAGE_EXPORT gwd_decoder {
public:
    static constexpr std::string_view name = "gwd";
    static constexpr std::string_view extensions[] = {".gwd"};

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

// ============================================================================
// GWD Encoder Functions
// ============================================================================

/**
 * Encode a memory surface as a 24 bpp GWD.
 *
 * The surface's R, G, B bytes are written as stored channels 0, 1, 2
 * without the reversal gwd_decoder applies, so a file round trip swaps
 * red and blue. Alpha is dropped; indexed8 is expanded through the palette.
 *
 * @return GWD data, or empty vector on failure
 */
[[nodiscard]] GWD_IMAGE_EXPORT std::vector<std::uint8_t> encode_gwd(const memory_surface& surf);

/**
 * Save a memory surface to a GWD file.
 * Nothing is left at path if encoding or writing fails.
 * @return true on success
 */
[[nodiscard]] GWD_IMAGE_EXPORT bool save_gwd(const memory_surface& surf,
                                              const std::filesystem::path& path);

} // namespace gwd_image

#endif // GWD_IMAGE_CODECS_GWD_HPP_
