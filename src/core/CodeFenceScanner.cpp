#include "core/CodeFenceScanner.hpp"
#include "core/TextUtils.hpp"
#include <spdlog/spdlog.h>

namespace hframe {

bool CodeFenceScanner::is_root_opener(std::string_view line) {
    return TextUtils::starts_with(line, "```");
}

std::vector<Fence> CodeFenceScanner::scan(std::string_view text) {
    return scan_with_diagnostics(text).fences;
}

FenceScanResult CodeFenceScanner::scan_with_diagnostics(std::string_view text) {
    auto lines = TextUtils::split_lines(text);
    FenceScanResult result;

    std::size_t i = 0;
    while (i < lines.size()) {
        if (!is_root_opener(lines[i])) {
            ++i;
            continue;
        }

        const std::size_t opener = i;
        spdlog::debug("Root-level fence at line {}", opener);

        std::optional<std::string> filename;
        FilenameSource source = FilenameSource::PRE_FENCE;

        if (opener > 0) {
            filename = FilenameHeuristics::from_pre_fence(lines[opener - 1]);
        }
        if (!filename) {
            filename = FilenameHeuristics::from_on_fence(lines[opener]);
            source = FilenameSource::ON_FENCE;
        }

        // Collect the body, tracking nested fences
        std::vector<std::string_view> body;
        int nesting = 0;
        ++i;
        for (; i < lines.size(); ++i) {
            std::string_view line = lines[i];
            std::string_view trimmed = TextUtils::trim(line);

            if (!TextUtils::starts_with(trimmed, "```")) {
                body.push_back(line);
                continue;
            }

            bool indented = TextUtils::leading_whitespace(line) > 0;
            bool tagged = !TextUtils::trim(trimmed.substr(3)).empty();

            if (tagged || indented) {
                ++nesting;
                body.push_back(line);
                spdlog::trace("Nested fence opened at line {} (level {})", i, nesting);
            } else if (nesting > 0) {
                --nesting;
                body.push_back(line);
                spdlog::trace("Nested fence closed at line {} (level {})", i, nesting);
            } else {
                break;
            }
        }

        if (!filename && !body.empty()) {
            filename = FilenameHeuristics::from_post_fence(body.front());
            if (filename) {
                source = FilenameSource::POST_FENCE;
                body.erase(body.begin());
            }
        }

        if (filename) {
            Fence fence;
            fence.filename = std::move(*filename);
            fence.content = TextUtils::join_lines(body);
            fence.line_number = opener;
            fence.source = source;

            spdlog::debug("Fence '{}' from {} ({} chars)", fence.filename,
                          to_string(fence.source), fence.content.size());
            result.fences.push_back(std::move(fence));
        } else {
            spdlog::debug("Fence at line {} has no filename, skipping", opener);
            result.unnamed_lines.push_back(opener);
        }

        // Step past the closing delimiter
        ++i;
    }

    return result;
}

} // namespace hframe
