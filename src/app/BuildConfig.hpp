#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace hframe {

using json = nlohmann::json;

/**
 * @brief Invalid configuration file or option value
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Settings for one invocation of the framer
 *
 * Values come from an optional JSON config file and are then overridden by
 * command-line options.
 */
struct BuildConfig {
    std::optional<std::filesystem::path> root;   // base directory; defaults to the document's
    bool keep_log = false;                       // keep the log file after a clean build
    bool write_log_file = true;                  // false keeps the build log in memory only
    std::string log_level = "info";
    std::string log_file_name = "handeeframer_log.txt";

    /**
     * @brief Read settings from a parsed JSON object
     *
     * Recognized keys: root, keep_log, write_log_file, log_level,
     * log_file_name. Unknown keys are ignored.
     * @throws ConfigError on wrong value types or an unknown log level
     */
    static BuildConfig from_json(const json& config);

    /**
     * @brief Load settings from a JSON file
     * @throws ConfigError if the file cannot be read or parsed
     */
    static BuildConfig load(const std::filesystem::path& file);

    /**
     * @brief Convert a level name (trace, debug, info, warn, error, critical)
     * @throws ConfigError for unknown names
     */
    static spdlog::level::level_enum parse_log_level(const std::string& name);

    json to_json() const;
};

} // namespace hframe
