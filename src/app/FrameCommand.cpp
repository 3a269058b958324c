#include "FrameCommand.hpp"
#include "build/BuildLog.hpp"
#include "build/TreeBuilder.hpp"
#include "core/CodeFenceScanner.hpp"
#include "core/TextUtils.hpp"
#include "core/TreeNotationParser.hpp"
#include "core/TreeRegionDetector.hpp"
#include <spdlog/spdlog.h>

namespace hframe {

namespace {

std::string_view to_string(RegionEnd reason) {
    switch (reason) {
        case RegionEnd::CODE_FENCE:
            return "code_fence";
        case RegionEnd::BLANK_RUN:
            return "blank_run";
        case RegionEnd::HEADING:
            return "heading";
        case RegionEnd::DOCUMENT_END:
        default:
            return "document_end";
    }
}

json region_to_json(const TreeRegion& region) {
    return {
        {"start", region.start},
        {"end", region.end ? json(*region.end) : json()},
        {"end_reason", to_string(region.end_reason)},
        {"keyword_found", region.keyword_found}
    };
}

void merge_stats(json& summary, const BuildStats& stats) {
    json counts = stats.to_json();
    for (const auto& item : counts.items()) {
        summary[item.key()] = item.value();
    }
}

} // namespace

FrameCommand::FrameCommand(std::shared_ptr<IFileSystem> fs, BuildConfig config)
    : fs_(std::move(fs)), config_(std::move(config)) {
    if (!fs_) {
        throw std::invalid_argument("File system cannot be null");
    }
}

json FrameCommand::plan(std::string_view text, const std::filesystem::path& base_dir) const {
    TreeRegion region = TreeRegionDetector::find_region(text);
    Forest forest = TreeNotationParser::parse(text, region.start, region.end);
    FenceScanResult scan = CodeFenceScanner::scan_with_diagnostics(text);

    json fences = json::array();
    for (const auto& fence : scan.fences) {
        fences.push_back({
            {"filename", fence.filename},
            {"line", fence.line_number},
            {"source", to_string(fence.source)},
            {"chars", fence.content.size()}
        });
    }

    json result = {
        {"region", region_to_json(region)},
        {"forest", forest_to_json(forest)},
        {"fences", fences},
        {"unnamed_fences", scan.unnamed_lines}
    };

    if (!forest.empty()) {
        BuildPlan build_plan = TreeBuilder::plan(forest, base_dir);
        result["root"] = build_plan.root.string();
        result["promoted"] = build_plan.promoted;
    }

    return result;
}

json FrameCommand::run(std::string_view text, const std::string& source,
                       const std::filesystem::path& base_dir) {
    json summary = {
        {"success", false},
        {"source", source},
        {"root", base_dir.string()}
    };

    if (TextUtils::is_blank(text)) {
        summary["error"] = "No content to build from.";
        return summary;
    }

    BuildLogOptions log_options;
    if (config_.write_log_file) {
        log_options.file = base_dir / config_.log_file_name;
    }
    log_options.keep_on_success = config_.keep_log;
    auto log = std::make_shared<BuildLog>(base_dir, log_options);

    try {
        log->info("Building from " + source);
        log->info(fmt::format("Text length: {} characters", text.size()));

        log->section("Tree Detection");
        TreeRegion region = TreeRegionDetector::find_region(text);
        log->info(fmt::format("Tree range: lines {} to {}", region.start,
                              region.end ? std::to_string(*region.end) : std::string("end")),
                  region.keyword_found ? "After structure keyword" : "First non-blank line");

        log->section("Tree Parsing");
        Forest forest = TreeNotationParser::parse(text, region.start, region.end);
        if (forest.empty()) {
            log->error("No valid tree structure found");
            summary["error"] = "No valid structure found.";
        } else {
            log->info(fmt::format("Parsed {} root node(s)", forest.size()));

            log->section("Code Fence Detection");
            FenceScanResult scan = CodeFenceScanner::scan_with_diagnostics(text);
            for (const auto& fence : scan.fences) {
                log->info("Code fence: " + fence.filename,
                          fmt::format("Line {}, {} filename, {} chars", fence.line_number,
                                      to_string(fence.source), fence.content.size()));
            }
            for (auto line : scan.unnamed_lines) {
                log->warning(fmt::format("Code fence at line {} has no filename", line), "Skipping");
            }
            log->info(fmt::format("Total fences detected: {}", scan.fences.size()));
            summary["fences"] = scan.fences.size();

            BuildPlan build_plan = TreeBuilder::plan(forest, base_dir);
            if (build_plan.promoted) {
                log->info("Single root detected: " + forest.front()->name());
            } else {
                log->info("Multiple roots detected, using base directory");
            }
            log->info("Final root path: " + build_plan.root.string());
            summary["root"] = build_plan.root.string();

            TreeBuilder builder(fs_, log);
            BuildStats stats = builder.build(build_plan, scan.fences);
            merge_stats(summary, stats);

            log->info("Build completed successfully");
            summary["success"] = true;
        }
    } catch (const BuildError& e) {
        log->error("Build failed with exception", e.what());
        merge_stats(summary, e.stats());
        summary["error"] = e.what();
    } catch (const std::exception& e) {
        log->error("Build failed with exception", e.what());
        summary["error"] = e.what();
    }

    log->finalize();
    auto log_path = log->log_path();
    summary["log"] = log_path ? json(log_path->string()) : json();

    return summary;
}

} // namespace hframe
