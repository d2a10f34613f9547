#ifndef GWD_IMAGE_CODECS_PNG_HPP_
#define GWD_IMAGE_CODECS_PNG_HPP_

#include <gwd_image/gwd_image_export.h>
#include <gwd_image/types.hpp>
#include <gwd_image/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace gwd_image {

// ============================================================================
// PNG Decoder
// ============================================================================

class GWD_IMAGE_EXPORT png_decoder {
public:
    static constexpr std::string_view name = "png";
    static constexpr std::string_view extensions[] = {".png"};

    /**
     * Check if data appears to be a PNG file.
     * @param data Raw file data
     * @return true if the signature matches PNG format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode PNG image data to an rgba8888 surface.
     * @param data Raw file data
     * @param surf Destination surface
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

// ============================================================================
// PNG Encoder Functions
// ============================================================================

/**
 * Encode a memory surface to PNG format.
 * @param surf Source surface
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] GWD_IMAGE_EXPORT std::vector<std::uint8_t> encode_png(const memory_surface& surf);

/**
 * Save a memory surface to a PNG file.
 * Nothing is left at path if encoding or writing fails.
 * @param surf Source surface
 * @param path Output file path
 * @return true on success
 */
[[nodiscard]] GWD_IMAGE_EXPORT bool save_png(const memory_surface& surf,
                                              const std::filesystem::path& path);

// ============================================================================
// PNG Surface
// ============================================================================

/**
 * Surface that can save its contents as PNG.
 */
class GWD_IMAGE_EXPORT png_surface : public memory_surface {
public:
    png_surface() = default;
    ~png_surface() override = default;

    png_surface(const png_surface&) = delete;
    png_surface& operator=(const png_surface&) = delete;
    png_surface(png_surface&&) noexcept = default;
    png_surface& operator=(png_surface&&) noexcept = default;

    [[nodiscard]] std::vector<std::uint8_t> encode() const;

    [[nodiscard]] bool save(const std::filesystem::path& path) const;
};

} // namespace gwd_image

#endif // GWD_IMAGE_CODECS_PNG_HPP_
