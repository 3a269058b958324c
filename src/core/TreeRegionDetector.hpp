#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace hframe {

/**
 * @brief Why the tree region stopped where it did
 */
enum class RegionEnd {
    DOCUMENT_END,  // ran to the end of the text
    CODE_FENCE,    // root-level ``` after at least one tree line
    BLANK_RUN,     // third consecutive blank line
    HEADING        // markdown heading after more than three tree lines
};

/**
 * @brief Line range that most likely holds the tree notation
 *
 * start is inclusive, end exclusive; end is nullopt when the region runs to
 * the end of the document.
 */
struct TreeRegion {
    std::size_t start = 0;
    std::optional<std::size_t> end;
    RegionEnd end_reason = RegionEnd::DOCUMENT_END;
    bool keyword_found = false;
};

/**
 * @brief Locates tree notation inside surrounding prose
 *
 * A line mentioning a structure keyword ("file tree", "project structure",
 * ...) moves the start to the next non-blank line. Without a keyword the
 * first non-blank line is used.
 */
class TreeRegionDetector {
public:
    /**
     * @brief Detect the tree region of a whole document
     */
    static TreeRegion find_region(std::string_view text);

    /**
     * @brief Find where a region starting at start_line ends
     *
     * @param lines Document lines
     * @param start_line First line of the region
     * @return Exclusive end index and reason
     */
    static std::pair<std::optional<std::size_t>, RegionEnd> find_end(
        const std::vector<std::string_view>& lines,
        std::size_t start_line
    );

    /**
     * @brief Check if a line mentions one of the structure keywords
     */
    static bool has_structure_keyword(std::string_view line);

    /**
     * @brief Check if a line is a root-level fence delimiter
     */
    static bool is_root_fence(std::string_view line);
};

} // namespace hframe
