/**
 * @file file_utils.cpp
 * @brief Чтение и запись текстовых файлов
 */

#include "file_utils.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace caesar::io {

std::string readTextFile(const std::filesystem::path& path, std::size_t max_size) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Failed to read file '" + path.string() + "': " + ec.message());
    }
    if (size > max_size) {
        throw std::runtime_error("Input file '" + path.string() + "' exceeds maximum size of " +
                                 std::to_string(max_size) + " bytes");
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Failed to read file '" + path.string() + "'");
    }

    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        throw std::runtime_error("Failed to read file '" + path.string() + "'");
    }
    return content;
}

void atomicWrite(const std::filesystem::path& path, const std::string& content) {
    auto dir = path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        throw std::runtime_error("Output directory does not exist: " + dir.string());
    }

    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs) {
            throw std::runtime_error("Failed to open temporary file for writing: " + tmp.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!ofs) {
            throw std::runtime_error("Failed to write file: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Failed to save file: " + path.string());
    }
}

} // namespace caesar::io
