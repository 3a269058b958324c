#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace hframe {

/**
 * @brief Line comment syntaxes used for generated file headers
 */
enum class CommentStyle {
    HASH,     // # comment
    SLASH,    // // comment
    HTML,     // <!-- comment -->
    BLOCK,    // /* comment */
    SQL       // -- comment
};

/**
 * @brief Formats node comments in the syntax of the target file
 */
class CommentFormatter {
public:
    /**
     * @brief Detect comment style from file extension
     *
     * @param filepath Path to the file
     * @return Matching style; HASH for unknown or missing extensions
     */
    static CommentStyle detect_from_extension(const std::filesystem::path& filepath);

    /**
     * @brief Format a single comment line (no trailing newline)
     *
     * @param filepath Target file, used to pick the syntax
     * @param comment Comment text
     * @return e.g. "// Entry point" for main.cpp
     */
    static std::string format(const std::filesystem::path& filepath, std::string_view comment);
};

} // namespace hframe
