#include "app/BuildConfig.hpp"
#include "app/FrameCommand.hpp"
#include "build/LocalFileSystem.hpp"
#include "core/TextUtils.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string read_document(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open document: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string select_lines(const std::string& text, std::size_t first, std::size_t last) {
    auto lines = hframe::TextUtils::split_lines(text);
    if (first < 1 || first > last || first > lines.size()) {
        throw std::runtime_error("Invalid line selection");
    }
    last = std::min(last, lines.size());

    std::vector<std::string_view> selected(lines.begin() + (first - 1), lines.begin() + last);
    return hframe::TextUtils::join_lines(selected);
}

void print_summary(const nlohmann::json& summary) {
    if (!summary.value("success", false)) {
        std::cerr << "HandeeFramer encountered an error.\n\n"
                  << "Error: " << summary.value("error", std::string("unknown")) << "\n";
        if (summary.contains("log") && summary["log"].is_string()) {
            std::cerr << "Check log: " << summary["log"].get<std::string>() << "\n";
        }
        return;
    }

    std::string source = summary.value("source", std::string("document"));
    if (!source.empty()) {
        source[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(source[0])));
    }

    std::cout << "HandeeFramer built successfully!\n\n"
              << "Source: " << source << "\n"
              << "Root: " << summary.value("root", std::string()) << "\n"
              << "Created " << summary.value("dirs", 0) << " directories\n"
              << "Created " << summary.value("files", 0) << " files\n"
              << "Skipped " << summary.value("skipped", 0) << " existing items\n"
              << "Processed " << summary.value("fences", 0) << " code blocks";
    if (summary.value("fences_failed", 0) > 0) {
        std::cout << " (" << summary.value("fences_failed", 0) << " failed)";
    }
    std::cout << "\n";
    if (summary.contains("log") && summary["log"].is_string()) {
        std::cout << "Log: " << summary["log"].get<std::string>() << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"HandeeFramer - build file trees and contents from a text document"};

    std::string document;
    app.add_option("document", document, "Document to build from ('-' reads stdin)")->required();

    std::string root;
    app.add_option("-r,--root", root, "Directory to build in (default: the document's directory)");

    std::vector<std::size_t> lines;
    app.add_option("--lines", lines, "Only use lines FIRST..LAST (1-based, inclusive)")
        ->expected(2);

    bool dry_run = false;
    app.add_flag("-n,--dry-run", dry_run, "Print the detected tree and fences as JSON, change nothing");

    bool keep_log = false;
    auto* keep_log_flag = app.add_flag("-k,--keep-log", keep_log, "Keep the build log even when the build succeeds");

    bool json_output = false;
    app.add_flag("--json", json_output, "Print the build summary as JSON");

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON configuration file");

    std::string log_level;
    auto* log_level_option = app.add_option("-l,--log-level", log_level,
                                            "Log level (trace, debug, info, warn, error, critical)");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "handee-framer version 1.0.0" << std::endl;
        return 0;
    }

    hframe::BuildConfig config;
    try {
        if (!config_file.empty()) {
            config = hframe::BuildConfig::load(config_file);
        }
        if (log_level_option->count() > 0) {
            config.log_level = log_level;
        }
        if (keep_log_flag->count() > 0) {
            config.keep_log = keep_log;
        }
        if (!root.empty()) {
            config.root = std::filesystem::path(root);
        }
        spdlog::set_level(hframe::BuildConfig::parse_log_level(config.log_level));
    } catch (const hframe::ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    spdlog::debug("Configuration: {}", config.to_json().dump());

    try {
        std::string text = read_document(document);
        std::string source = "document";
        if (!lines.empty()) {
            text = select_lines(text, lines[0], lines[1]);
            source = "selection";
        }

        std::filesystem::path base_dir;
        if (config.root) {
            base_dir = *config.root;
        } else if (document != "-") {
            base_dir = std::filesystem::absolute(document).parent_path();
        } else {
            std::cerr << "Reading from stdin requires --root (no document location to build in)" << std::endl;
            return 1;
        }

        auto fs = std::make_shared<hframe::LocalFileSystem>();
        hframe::FrameCommand command(fs, config);

        if (dry_run) {
            std::cout << command.plan(text, base_dir).dump(2) << std::endl;
            return 0;
        }

        spdlog::info("Building from {} into {}", source, base_dir.string());
        nlohmann::json summary = command.run(text, source, base_dir);

        if (json_output) {
            std::cout << summary.dump(2) << std::endl;
        } else {
            print_summary(summary);
        }

        return summary.value("success", false) ? 0 : 1;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
