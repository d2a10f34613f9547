#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <system_error>
#include <vector>

namespace gwd_image {

// Read a whole file. Returns false if it cannot be opened or read.
inline bool read_file(const std::filesystem::path& path, std::vector<std::uint8_t>& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    const auto size = file.tellg();
    if (size < 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);
    return file.good();
}

// Write bytes to a temporary sibling of path and rename it into place,
// so a failed write never leaves a truncated file behind.
inline bool write_file_replacing(const std::filesystem::path& path,
                                 std::span<const std::uint8_t> bytes) {
    std::filesystem::path tmp = path;
    tmp += ".part";

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return false;
        }
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        file.close();
        if (!file) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return false;
    }
    return true;
}

} // namespace gwd_image
