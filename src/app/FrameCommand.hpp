#pragma once

#include "app/BuildConfig.hpp"
#include "build/IFileSystem.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace hframe {

using json = nlohmann::json;

/**
 * @brief Runs the whole pipeline for one document
 *
 * Detects the tree region, parses the forest, scans fences, selects the
 * effective root and builds. Results are reported as JSON so the command
 * line front end (or any other host) can present them.
 */
class FrameCommand {
public:
    /**
     * @brief Construct command with its file system and settings
     * @throws std::invalid_argument if fs is null
     */
    FrameCommand(std::shared_ptr<IFileSystem> fs, BuildConfig config);

    /**
     * @brief Build the structure described by text
     *
     * @param text Document or selection text
     * @param source Label shown in the summary ("document", "selection")
     * @param base_dir Directory the structure is built in
     * @return Summary {success, source, root, dirs, files, skipped, fences,
     *         fences_processed, fences_failed, log, error?}
     */
    json run(std::string_view text, const std::string& source,
             const std::filesystem::path& base_dir);

    /**
     * @brief Describe what run() would do without touching the file system
     * @return {region, forest, root, promoted, fences, unnamed_fences}
     */
    json plan(std::string_view text, const std::filesystem::path& base_dir) const;

    const BuildConfig& config() const { return config_; }

private:
    std::shared_ptr<IFileSystem> fs_;
    BuildConfig config_;
};

} // namespace hframe
