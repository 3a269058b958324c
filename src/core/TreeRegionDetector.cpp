#include "core/TreeRegionDetector.hpp"
#include "core/TextUtils.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <string>

namespace hframe {

namespace {

constexpr std::size_t kBlankRunLimit = 3;
constexpr std::size_t kHeadingMinTreeLines = 3;

std::optional<std::size_t> next_non_blank(const std::vector<std::string_view>& lines,
                                          std::size_t from) {
    for (std::size_t i = from; i < lines.size(); ++i) {
        if (!TextUtils::is_blank(lines[i])) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace

bool TreeRegionDetector::has_structure_keyword(std::string_view line) {
    static constexpr std::array<std::string_view, 7> keywords = {
        "structure", "file structure", "tree", "file tree",
        "directory structure", "folder structure", "project structure"
    };

    std::string lower = TextUtils::to_lower(TextUtils::trim(line));
    for (auto keyword : keywords) {
        if (lower.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool TreeRegionDetector::is_root_fence(std::string_view line) {
    return TextUtils::starts_with(line, "```");
}

std::pair<std::optional<std::size_t>, RegionEnd> TreeRegionDetector::find_end(
    const std::vector<std::string_view>& lines,
    std::size_t start_line
) {
    std::size_t tree_lines = 0;
    std::size_t blank_run = 0;

    for (std::size_t i = start_line; i < lines.size(); ++i) {
        std::string_view line = TextUtils::trim(lines[i]);

        if (is_root_fence(lines[i]) && tree_lines > 0) {
            return {i, RegionEnd::CODE_FENCE};
        }

        if (line.empty()) {
            if (++blank_run >= kBlankRunLimit) {
                return {i, RegionEnd::BLANK_RUN};
            }
        } else {
            blank_run = 0;
            ++tree_lines;
        }

        if (tree_lines > kHeadingMinTreeLines && TextUtils::starts_with(line, "#")) {
            return {i, RegionEnd::HEADING};
        }
    }

    return {std::nullopt, RegionEnd::DOCUMENT_END};
}

TreeRegion TreeRegionDetector::find_region(std::string_view text) {
    auto lines = TextUtils::split_lines(text);
    TreeRegion region;

    std::optional<std::size_t> start;
    for (std::size_t i = 0; i < lines.size() && !start; ++i) {
        if (has_structure_keyword(lines[i])) {
            start = next_non_blank(lines, i + 1);
            if (start) {
                region.keyword_found = true;
                spdlog::debug("Structure keyword on line {}, tree starts at line {}", i, *start);
            }
        }
    }

    if (!start) {
        start = next_non_blank(lines, 0);
    }

    if (!start) {
        spdlog::debug("Document is blank, no tree region");
        return region;
    }

    region.start = *start;
    auto [end, reason] = find_end(lines, region.start);
    region.end = end;
    region.end_reason = reason;

    spdlog::debug("Tree region: start={}, end={}", region.start,
                  region.end ? std::to_string(*region.end) : std::string("EOF"));
    return region;
}

} // namespace hframe
