#ifndef GWD_IMAGE_BATCH_HPP_
#define GWD_IMAGE_BATCH_HPP_

#include <gwd_image/gwd_image_export.h>
#include <gwd_image/types.hpp>

#include <cstddef>
#include <filesystem>
#include <iosfwd>

namespace gwd_image {

enum class conversion {
    gwd_to_png,
    png_to_gwd
};

struct batch_report {
    std::size_t converted = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;  // entries without the input extension
};

/**
 * Convert a single file.
 * Progress lines go to log. On failure no file is left at output.
 */
[[nodiscard]] GWD_IMAGE_EXPORT decode_result convert_file(const std::filesystem::path& input,
                                                           const std::filesystem::path& output,
                                                           conversion direction,
                                                           std::ostream& log,
                                                           const decode_options& options = {});

/**
 * Convert every matching regular file of input_dir into output_dir
 * (created if missing). Files are processed in name order; a failing file
 * is reported to log and the batch moves on.
 */
[[nodiscard]] GWD_IMAGE_EXPORT batch_report convert_directory(const std::filesystem::path& input_dir,
                                                               const std::filesystem::path& output_dir,
                                                               conversion direction,
                                                               std::ostream& log,
                                                               const decode_options& options = {});

} // namespace gwd_image

#endif // GWD_IMAGE_BATCH_HPP_
