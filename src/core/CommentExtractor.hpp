#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace hframe {

/**
 * @brief Name portion and trailing annotation of a tree line
 */
struct ExtractedComment {
    std::string name;
    std::optional<std::string> comment;
};

/**
 * @brief Splits "name  // comment" style lines
 *
 * Recognized markers: HTML openers (<!-- and <--), C++ line and C block
 * openers, and #. The marker found at the smallest offset wins regardless of
 * its position in the marker list. Closing tokens are not interpreted and
 * stay in the comment text.
 */
class CommentExtractor {
public:
    /**
     * @brief Separate name and comment
     *
     * @param line Line content without its indentation prefix
     * @return Right-trimmed name and trimmed comment (nullopt if none or empty)
     */
    static ExtractedComment extract(std::string_view line);

    /**
     * @brief Offset and length of the earliest comment marker
     * @return Pair {offset, marker length}, or nullopt when no marker occurs
     */
    static std::optional<std::pair<std::size_t, std::size_t>> find_marker(std::string_view line);
};

} // namespace hframe
