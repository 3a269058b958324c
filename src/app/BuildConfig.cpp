#include "BuildConfig.hpp"
#include <fstream>

namespace hframe {

spdlog::level::level_enum BuildConfig::parse_log_level(const std::string& name) {
    if (name == "trace") {
        return spdlog::level::trace;
    } else if (name == "debug") {
        return spdlog::level::debug;
    } else if (name == "info") {
        return spdlog::level::info;
    } else if (name == "warn") {
        return spdlog::level::warn;
    } else if (name == "error") {
        return spdlog::level::err;
    } else if (name == "critical") {
        return spdlog::level::critical;
    }
    throw ConfigError("Invalid log level: " + name);
}

BuildConfig BuildConfig::from_json(const json& config) {
    if (!config.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    BuildConfig result;
    try {
        if (config.contains("root") && !config["root"].is_null()) {
            result.root = std::filesystem::path(config["root"].get<std::string>());
        }
        result.keep_log = config.value("keep_log", result.keep_log);
        result.write_log_file = config.value("write_log_file", result.write_log_file);
        result.log_level = config.value("log_level", result.log_level);
        result.log_file_name = config.value("log_file_name", result.log_file_name);
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }

    parse_log_level(result.log_level);

    if (result.log_file_name.empty()) {
        throw ConfigError("log_file_name cannot be empty");
    }

    return result;
}

BuildConfig BuildConfig::load(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        throw ConfigError("Failed to open config file: " + file.string());
    }

    json config;
    try {
        config = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError("Failed to parse config file " + file.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", file.string());
    return from_json(config);
}

json BuildConfig::to_json() const {
    return {
        {"root", root ? json(root->string()) : json()},
        {"keep_log", keep_log},
        {"write_log_file", write_log_file},
        {"log_level", log_level},
        {"log_file_name", log_file_name}
    };
}

} // namespace hframe
