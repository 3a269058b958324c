#include "LocalFileSystem.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <system_error>

namespace hframe {

bool LocalFileSystem::exists(const std::filesystem::path& path) const {
    std::error_code ec;
    bool result = std::filesystem::exists(path, ec);
    if (ec) {
        spdlog::debug("exists({}) failed: {}", path.string(), ec.message());
        return false;
    }
    return result;
}

bool LocalFileSystem::is_directory(const std::filesystem::path& path) const {
    std::error_code ec;
    bool result = std::filesystem::is_directory(path, ec);
    return !ec && result;
}

void LocalFileSystem::make_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw FileSystemError("Failed to create directory (" + ec.message() + ")", path);
    }
    if (!is_directory(path)) {
        throw FileSystemError("Path exists but is not a directory", path);
    }
    spdlog::trace("Created directories: {}", path.string());
}

std::string LocalFileSystem::read_file(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileSystemError("Failed to open file for reading", path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void LocalFileSystem::write_file(const std::filesystem::path& path,
                                 const std::string& content,
                                 WriteMode mode) {
    auto flags = std::ios::binary | std::ios::out;
    flags |= (mode == WriteMode::APPEND) ? std::ios::app : std::ios::trunc;

    std::ofstream file(path, flags);
    if (!file) {
        throw FileSystemError("Failed to open file for writing", path);
    }

    file << content;
    file.flush();
    if (!file) {
        throw FileSystemError("Failed to write file", path);
    }

    spdlog::trace("Wrote {} bytes to {} ({})", content.size(), path.string(),
                  mode == WriteMode::APPEND ? "append" : "overwrite");
}

} // namespace hframe
