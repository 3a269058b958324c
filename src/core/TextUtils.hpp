#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace hframe {

/**
 * @brief Small string helpers shared by the text-structure components
 *
 * All helpers treat the input as UTF-8. Whitespace trimming only considers
 * ASCII whitespace; multi-byte sequences are never split.
 */
class TextUtils {
public:
    /**
     * @brief Split text into lines on '\n'
     *
     * A trailing '\r' is removed from every line so CRLF documents parse the
     * same way as LF ones. The result always has at least one element.
     */
    static std::vector<std::string_view> split_lines(std::string_view text);

    static std::string_view trim(std::string_view text);
    static std::string_view trim_left(std::string_view text);
    static std::string_view trim_right(std::string_view text);

    static bool is_blank(std::string_view text) { return trim(text).empty(); }

    static bool starts_with(std::string_view text, std::string_view prefix) {
        return text.substr(0, prefix.size()) == prefix;
    }

    static bool ends_with(std::string_view text, std::string_view suffix) {
        return text.size() >= suffix.size() &&
               text.substr(text.size() - suffix.size()) == suffix;
    }

    /**
     * @brief Number of leading ASCII whitespace characters
     */
    static std::size_t leading_whitespace(std::string_view text);

    static std::string to_lower(std::string_view text);

    /**
     * @brief Join lines with '\n' (no trailing newline)
     */
    static std::string join_lines(const std::vector<std::string_view>& lines);

    /**
     * @brief Decode one UTF-8 code point starting at pos and advance pos
     *
     * Malformed or truncated sequences decode as the single raw byte so that
     * arbitrary input never stalls the caller.
     */
    static char32_t next_code_point(std::string_view text, std::size_t& pos);
};

} // namespace hframe
