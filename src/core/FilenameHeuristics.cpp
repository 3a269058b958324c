#include "core/FilenameHeuristics.hpp"
#include "core/CommentExtractor.hpp"
#include "core/TextUtils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>

namespace hframe {

namespace {

bool is_single_token(std::string_view text) {
    return !text.empty() &&
           std::none_of(text.begin(), text.end(),
                        [](unsigned char c) { return std::isspace(c); });
}

std::string_view strip_asterisks(std::string_view text) {
    while (!text.empty() && text.front() == '*') {
        text.remove_prefix(1);
    }
    while (!text.empty() && text.back() == '*') {
        text.remove_suffix(1);
    }
    return TextUtils::trim(text);
}

} // namespace

std::string_view to_string(FilenameSource source) {
    switch (source) {
        case FilenameSource::PRE_FENCE:
            return "pre-fence";
        case FilenameSource::ON_FENCE:
            return "on-fence";
        case FilenameSource::POST_FENCE:
        default:
            return "post-fence";
    }
}

bool FilenameHeuristics::is_common_filename(std::string_view name) {
    static constexpr std::array<std::string_view, 10> common_files = {
        "Makefile", "Dockerfile", "LICENSE", "README", "CHANGELOG",
        "CONTRIBUTING", "AUTHORS", "INSTALL", "Gemfile", "Rakefile"
    };
    return std::find(common_files.begin(), common_files.end(), name) != common_files.end();
}

bool FilenameHeuristics::is_language_tag(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isalpha(c); });
}

std::optional<std::string> FilenameHeuristics::extract_filename(std::string_view text) {
    text = TextUtils::trim(text);

    // **`filename`** (note) -> filename
    std::size_t first_tick = text.find('`');
    std::size_t last_tick = text.rfind('`');
    if (first_tick != std::string_view::npos && first_tick < last_tick) {
        text = text.substr(first_tick + 1, last_tick - first_tick - 1);
    }

    text = strip_asterisks(text);

    if (is_common_filename(text)) {
        return std::string(text);
    }

    if (text.find('.') == std::string_view::npos) {
        return std::nullopt;
    }

    bool path_like = text.find_first_of("/\\") != std::string_view::npos;
    if ((path_like || is_single_token(text)) && text.size() < kMaxFilenameLength) {
        return std::string(text);
    }

    return std::nullopt;
}

std::optional<std::string> FilenameHeuristics::extract_filename_from_comment(std::string_view line) {
    static constexpr std::array<std::string_view, 7> prefixes = {
        "///", "//", "/*", "#", "<!--", "<--", "--"
    };

    line = TextUtils::trim(line);
    for (auto prefix : prefixes) {
        if (!TextUtils::starts_with(line, prefix)) {
            continue;
        }

        auto remainder = TextUtils::trim(line.substr(prefix.size()));
        for (std::string_view closer : {"-->", "*/"}) {
            if (TextUtils::ends_with(remainder, closer)) {
                remainder = TextUtils::trim(remainder.substr(0, remainder.size() - closer.size()));
            }
        }

        std::string name = std::string(TextUtils::trim(CommentExtractor::extract(remainder).name));
        if (auto filename = extract_filename(name)) {
            return filename;
        }
    }
    return std::nullopt;
}

std::optional<std::string> FilenameHeuristics::from_pre_fence(std::string_view previous_line) {
    auto line = TextUtils::trim(previous_line);
    if (line.empty() || TextUtils::starts_with(line, "```")) {
        return std::nullopt;
    }
    return extract_filename(line);
}

std::optional<std::string> FilenameHeuristics::from_on_fence(std::string_view opening_line) {
    auto line = TextUtils::trim(opening_line);
    if (!TextUtils::starts_with(line, "```")) {
        return std::nullopt;
    }

    auto info = line.substr(3);
    if (info.empty() || is_language_tag(info)) {
        return std::nullopt;
    }
    return extract_filename(info);
}

std::optional<std::string> FilenameHeuristics::from_post_fence(std::string_view first_content_line) {
    auto line = TextUtils::trim(first_content_line);
    if (line.empty()) {
        return std::nullopt;
    }
    return extract_filename_from_comment(line);
}

} // namespace hframe
