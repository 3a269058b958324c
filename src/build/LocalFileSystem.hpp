#pragma once

#include "IFileSystem.hpp"

namespace hframe {

/**
 * @brief File system capability backed by the local disk
 *
 * Uses std::filesystem for metadata and binary streams for content so file
 * bytes are written exactly as given.
 */
class LocalFileSystem : public IFileSystem {
public:
    LocalFileSystem() = default;

    bool exists(const std::filesystem::path& path) const override;
    bool is_directory(const std::filesystem::path& path) const override;
    void make_directories(const std::filesystem::path& path) override;
    std::string read_file(const std::filesystem::path& path) const override;
    void write_file(const std::filesystem::path& path,
                    const std::string& content,
                    WriteMode mode) override;
};

} // namespace hframe
