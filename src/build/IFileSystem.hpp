#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace hframe {

/**
 * @brief How write_file treats an existing file
 */
enum class WriteMode {
    OVERWRITE,
    APPEND
};

/**
 * @brief Error raised by file system implementations
 */
class FileSystemError : public std::runtime_error {
public:
    FileSystemError(const std::string& message, std::filesystem::path path)
        : std::runtime_error(message + ": " + path.string()), path_(std::move(path)) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Abstract file system capability used by the tree builder
 *
 * Implementations may target the local disk, an in-memory tree for tests,
 * or a host editor's project storage. All operations throw FileSystemError
 * on failure.
 */
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    /**
     * @brief Check if a file or directory exists at path
     */
    virtual bool exists(const std::filesystem::path& path) const = 0;

    /**
     * @brief Check if path exists and is a directory
     */
    virtual bool is_directory(const std::filesystem::path& path) const = 0;

    /**
     * @brief Create a directory and all missing parents
     */
    virtual void make_directories(const std::filesystem::path& path) = 0;

    /**
     * @brief Read the whole content of a file
     */
    virtual std::string read_file(const std::filesystem::path& path) const = 0;

    /**
     * @brief Write content to a file, creating it if needed
     * @param path Target file (parent directory must exist)
     * @param content Bytes to write
     * @param mode Overwrite or append
     */
    virtual void write_file(const std::filesystem::path& path,
                            const std::string& content,
                            WriteMode mode) = 0;
};

} // namespace hframe
