#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace hframe {

/**
 * @brief Where a fence's filename was found
 */
enum class FilenameSource {
    PRE_FENCE,   // line right above the opening delimiter
    ON_FENCE,    // text after the backticks of the opening delimiter
    POST_FENCE   // comment on the first content line
};

/**
 * @brief Human-readable heuristic name ("pre-fence", "on-fence", "post-fence")
 */
std::string_view to_string(FilenameSource source);

/**
 * @brief Independent filename heuristics used by the code fence scanner
 *
 * Each heuristic is a pure function of its input. The scanner tries them in
 * the order pre-fence, on-fence, post-fence and keeps the first success.
 */
class FilenameHeuristics {
public:
    /**
     * @brief Extract a filename from free text
     *
     * Strips markdown decoration (text between the first and last backtick
     * is kept, surrounding asterisks are removed) and validates the rest.
     * A valid name is one of the common extensionless files (Makefile,
     * Dockerfile, ...), or contains a '.' and is either path-like or a single
     * token, shorter than 200 characters.
     *
     * @param text Candidate text
     * @return Filename or nullopt
     */
    static std::optional<std::string> extract_filename(std::string_view text);

    /**
     * @brief Extract a filename from a comment line such as "// src/main.cpp"
     *
     * The line must start with a comment opener (///, //, #, <!--, <--,
     * SQL's -- or a C block opener). A trailing block closer is dropped and
     * anything after a second comment marker is ignored.
     */
    static std::optional<std::string> extract_filename_from_comment(std::string_view line);

    /**
     * @brief Check if text is a bare language tag (purely alphabetic)
     */
    static bool is_language_tag(std::string_view text);

    /**
     * @brief Check if name is one of the common extensionless filenames
     */
    static bool is_common_filename(std::string_view name);

    /**
     * @brief Pre-fence heuristic: the line immediately above the opener
     *
     * Blank lines and lines that are fence delimiters themselves are rejected.
     */
    static std::optional<std::string> from_pre_fence(std::string_view previous_line);

    /**
     * @brief On-fence heuristic: text after the backticks of the opener
     *
     * Bare language tags ("python", "bash") are rejected.
     */
    static std::optional<std::string> from_on_fence(std::string_view opening_line);

    /**
     * @brief Post-fence heuristic: a filename comment on the first content line
     */
    static std::optional<std::string> from_post_fence(std::string_view first_content_line);

    static constexpr std::size_t kMaxFilenameLength = 200;
};

} // namespace hframe
