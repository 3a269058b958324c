#pragma once

#include <string>
#include <string_view>

namespace hframe {

/**
 * @brief Cleans a single path segment taken from free-form tree notation
 *
 * Strips emoji and pictographs, box-drawing glyphs, path separators,
 * characters that are invalid in file names on common platforms
 * (< > : " | ? *) and control characters. Parentheses and square brackets
 * are kept: routing conventions use them in directory names such as
 * "(dashboard)" or "[id]". Whitespace runs collapse to one space and the
 * result is trimmed.
 */
class NameSanitizer {
public:
    /**
     * @brief Sanitize one path segment
     *
     * @param raw Raw segment text (UTF-8)
     * @return Cleaned segment; empty when nothing usable remains
     */
    static std::string sanitize(std::string_view raw);

    /**
     * @brief Check if code point is an emoji or pictographic symbol
     */
    static bool is_emoji(char32_t cp);

    /**
     * @brief Check if code point is a recognized box-drawing glyph
     */
    static bool is_box_drawing(char32_t cp);

    /**
     * @brief Check if code point must never appear in a node name
     */
    static bool is_forbidden(char32_t cp);
};

} // namespace hframe
