#include <gwd_image/batch.hpp>
#include <gwd_image/codecs/gwd.hpp>
#include <gwd_image/codecs/png.hpp>
#include "file_io.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace gwd_image {

namespace {

std::string_view input_extension(conversion direction) noexcept {
    return direction == conversion::gwd_to_png ? gwd_decoder::extensions[0]
                                               : png_decoder::extensions[0];
}

std::string_view output_extension(conversion direction) noexcept {
    return direction == conversion::gwd_to_png ? png_decoder::extensions[0]
                                               : gwd_decoder::extensions[0];
}

bool has_extension(const std::filesystem::path& path, std::string_view ext) {
    const std::string actual = path.extension().string();
    return std::equal(actual.begin(), actual.end(), ext.begin(), ext.end(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

decode_result gwd_to_png(std::span<const std::uint8_t> data,
                         const std::filesystem::path& output,
                         std::ostream& log,
                         const decode_options& options) {
    gwd_header hdr;
    auto result = read_gwd_header(data, hdr);
    if (!result) {
        return decode_result::failure(decode_error::invalid_format, "Invalid GWD file");
    }

    png_surface surf;
    result = gwd_decoder::decode(data, surf, options);
    if (!result) return result;

    log << "Saving image with width=" << hdr.width << ", height=" << hdr.height
        << ", bpp=" << static_cast<int>(hdr.bits_per_pixel) << "\n";

    if (!surf.save(output)) {
        return decode_result::failure(decode_error::io_error,
            "Failed to write " + output.string());
    }
    return decode_result::success();
}

decode_result png_to_gwd(std::span<const std::uint8_t> data,
                         const std::filesystem::path& output,
                         const decode_options& options) {
    memory_surface surf;
    auto result = png_decoder::decode(data, surf, options);
    if (!result) return result;

    if (!save_gwd(surf, output)) {
        return decode_result::failure(decode_error::io_error,
            "Failed to write " + output.string());
    }
    return decode_result::success();
}

} // namespace

decode_result convert_file(const std::filesystem::path& input,
                           const std::filesystem::path& output,
                           conversion direction,
                           std::ostream& log,
                           const decode_options& options) {
    std::vector<std::uint8_t> data;
    if (!read_file(input, data)) {
        return decode_result::failure(decode_error::io_error,
            "Failed to read " + input.string());
    }

    auto result = direction == conversion::gwd_to_png
        ? gwd_to_png(data, output, log, options)
        : png_to_gwd(data, output, options);
    if (!result) return result;

    log << "Converted " << input.filename().string() << " to " << output.string() << "\n";
    return result;
}

batch_report convert_directory(const std::filesystem::path& input_dir,
                               const std::filesystem::path& output_dir,
                               conversion direction,
                               std::ostream& log,
                               const decode_options& options) {
    batch_report report;
    std::error_code ec;

    if (!std::filesystem::is_directory(input_dir, ec)) {
        log << "Error: input directory not found: " << input_dir.string() << "\n";
        return report;
    }

    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        log << "Error: cannot create output directory " << output_dir.string()
            << ": " << ec.message() << "\n";
        return report;
    }

    std::vector<std::filesystem::path> inputs;
    for (std::filesystem::directory_iterator it(input_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            inputs.push_back(it->path());
        }
    }
    if (ec) {
        log << "Error: cannot list " << input_dir.string() << ": " << ec.message() << "\n";
    }
    std::sort(inputs.begin(), inputs.end());

    const auto in_ext = input_extension(direction);
    const auto out_ext = output_extension(direction);

    for (const auto& input : inputs) {
        if (!has_extension(input, in_ext)) {
            ++report.skipped;
            continue;
        }

        auto output = output_dir / input.stem();
        output += std::string(out_ext);

        auto result = convert_file(input, output, direction, log, options);
        if (!result) {
            log << "Error processing " << input.filename().string() << ": "
                << result.message << "\n";
            ++report.failed;
            continue;
        }
        ++report.converted;
    }

    return report;
}

} // namespace gwd_image
