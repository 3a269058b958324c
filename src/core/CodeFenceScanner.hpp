#pragma once

#include "core/FilenameHeuristics.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace hframe {

/**
 * @brief A root-level fenced code block with an inferred filename
 */
struct Fence {
    std::string filename;        // name or relative path as written
    std::string content;         // body lines joined with '\n'
    std::size_t line_number = 0; // zero-based line of the opening delimiter
    FilenameSource source = FilenameSource::PRE_FENCE;
};

/**
 * @brief Result of a scan including the fences that had to be dropped
 */
struct FenceScanResult {
    std::vector<Fence> fences;
    std::vector<std::size_t> unnamed_lines;  // openers with no inferred filename
};

/**
 * @brief Finds root-level fenced code blocks and the file each one belongs to
 *
 * Only delimiters without leading whitespace open a fence. Inside a fence,
 * delimiters that carry a language tag or are indented open a nested block
 * and are kept verbatim; an unindented bare ``` closes the innermost open
 * nested block, or the fence itself when none is open. Fences without an
 * inferred filename are dropped.
 */
class CodeFenceScanner {
public:
    /**
     * @brief Scan a document for fences
     *
     * Pure function of the text: scanning the same text twice gives the same
     * result.
     * @param text Whole document text
     * @return Fences in document order
     */
    static std::vector<Fence> scan(std::string_view text);

    /**
     * @brief Scan and also report openers whose fence was dropped
     */
    static FenceScanResult scan_with_diagnostics(std::string_view text);

    /**
     * @brief Check if a line opens a root-level fence
     */
    static bool is_root_opener(std::string_view line);
};

} // namespace hframe
