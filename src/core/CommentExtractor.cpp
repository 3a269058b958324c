#include "core/CommentExtractor.hpp"
#include "core/TextUtils.hpp"
#include <array>

namespace hframe {

std::optional<std::pair<std::size_t, std::size_t>> CommentExtractor::find_marker(std::string_view line) {
    static constexpr std::array<std::string_view, 5> markers = {"<!--", "<--", "//", "/*", "#"};

    std::optional<std::pair<std::size_t, std::size_t>> earliest;
    for (auto marker : markers) {
        std::size_t pos = line.find(marker);
        if (pos != std::string_view::npos && (!earliest || pos < earliest->first)) {
            earliest = std::make_pair(pos, marker.size());
        }
    }
    return earliest;
}

ExtractedComment CommentExtractor::extract(std::string_view line) {
    auto marker = find_marker(line);
    if (!marker) {
        return {std::string(TextUtils::trim(line)), std::nullopt};
    }

    auto [offset, length] = *marker;
    ExtractedComment result;
    result.name = std::string(TextUtils::trim_right(line.substr(0, offset)));

    auto comment = TextUtils::trim(line.substr(offset + length));
    if (!comment.empty()) {
        result.comment = std::string(comment);
    }
    return result;
}

} // namespace hframe
