#include <gwd_image/gwd_image.hpp>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <input_dir> <output_dir>\n";
    std::cerr << "Converts every .gwd file in input_dir to PNG in output_dir.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -h, --help    Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0)) {
        print_usage(argv[0]);
        return 0;
    }

    if (argc != 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path input_dir(argv[1]);
    const std::filesystem::path output_dir(argv[2]);

    std::error_code ec;
    if (!std::filesystem::is_directory(input_dir, ec)) {
        std::cerr << "Error: Directory not found: " << input_dir << "\n";
        return 1;
    }

    const auto report = gwd_image::convert_directory(input_dir, output_dir,
                                                     gwd_image::conversion::gwd_to_png, std::cout);

    std::cout << "Done: " << report.converted << " converted, "
              << report.failed << " failed, "
              << report.skipped << " skipped\n";

    return 0;
}
