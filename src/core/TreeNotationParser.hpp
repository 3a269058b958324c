#pragma once

#include "core/Node.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hframe {

/**
 * @brief Notation detected for one tree line
 */
enum class LineNotation {
    INDENTED,   // one segment per line, nesting by indentation
    SHORTHAND   // a whole path chain on one line ("src/app/main.py")
};

/**
 * @brief Indentation and content of a tree line after prefix removal
 */
struct LinePrefix {
    std::size_t indent = 0;     // code points of whitespace and connectors
    std::string_view content;   // remainder of the line
};

/**
 * @brief Builds a node forest from indented, box-drawing and shorthand notation
 *
 * Notations may be mixed freely line by line. Parent resolution uses an
 * explicit stack of (indent, node) pairs: entries whose indent is greater
 * than or equal to the current line's indent are popped, and the entry left
 * on top becomes the parent.
 */
class TreeNotationParser {
public:
    /**
     * @brief Parse the given line range of a document
     *
     * @param text Whole document text
     * @param start_line First line to parse (inclusive)
     * @param end_line Last line (exclusive), nullopt for the document end
     * @return Forest of root nodes, empty when nothing usable was found
     */
    static Forest parse(std::string_view text,
                        std::size_t start_line = 0,
                        std::optional<std::size_t> end_line = std::nullopt);

    /**
     * @brief Strip leading whitespace and tree connectors (│ ├ └ ─)
     */
    static LinePrefix split_prefix(std::string_view line);

    /**
     * @brief Classify a name part as shorthand or indented notation
     *
     * Shorthand requires a separator and more than one non-empty segment.
     */
    static LineNotation classify(std::string_view name_part);

private:
    using ParentStack = std::vector<std::pair<std::size_t, Node*>>;

    static Node* resolve_parent(ParentStack& stack, std::size_t indent);

    static void parse_indented(std::string_view name_part,
                               const std::optional<std::string>& comment,
                               std::size_t indent,
                               Forest& roots,
                               ParentStack& stack);

    static void parse_shorthand(std::string_view name_part,
                                const std::optional<std::string>& comment,
                                std::size_t indent,
                                Forest& roots,
                                ParentStack& stack);
};

} // namespace hframe
