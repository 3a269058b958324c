#include "core/NameSanitizer.hpp"
#include "core/TextUtils.hpp"
#include <set>

namespace hframe {

namespace {

struct CodePointRange {
    char32_t first;
    char32_t last;
};

// Pictograph and symbol blocks that show up as decoration in tree listings
constexpr CodePointRange kEmojiRanges[] = {
    {0x1F600, 0x1F64F},  // emoticons
    {0x1F300, 0x1F5FF},  // symbols & pictographs
    {0x1F680, 0x1F6FF},  // transport & map symbols
    {0x1F1E0, 0x1F1FF},  // regional indicators (flags)
    {0x1F170, 0x1F251},  // enclosed alphanumeric / ideographic supplement
    {0x24C2, 0x24C2},    // circled M
    {0x1F900, 0x1F9FF},  // supplemental symbols & pictographs
    {0x1FA00, 0x1FA6F},  // chess symbols
    {0x1FA70, 0x1FAFF},  // symbols & pictographs extended-A
    {0x2600, 0x26FF},    // miscellaneous symbols
    {0x2700, 0x27BF},    // dingbats
    {0xFE0F, 0xFE0F},    // emoji presentation selector
    {0x200D, 0x200D},    // zero width joiner
};

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

bool NameSanitizer::is_emoji(char32_t cp) {
    for (const auto& range : kEmojiRanges) {
        if (cp >= range.first && cp <= range.last) {
            return true;
        }
    }
    return false;
}

bool NameSanitizer::is_box_drawing(char32_t cp) {
    static const std::set<char32_t> box_chars = {
        U'│', U'├', U'└', U'─', U'┌', U'┐', U'┘', U'┤', U'┬', U'┴', U'┼',
        U'═', U'║', U'╔', U'╗', U'╚', U'╝', U'╠', U'╣', U'╦', U'╩', U'╬'
    };
    return box_chars.find(cp) != box_chars.end();
}

bool NameSanitizer::is_forbidden(char32_t cp) {
    switch (cp) {
        case U'<': case U'>': case U':': case U'"':
        case U'|': case U'?': case U'*':
        case U'/': case U'\\':
            return true;
        default:
            break;
    }
    return cp < 0x20 || cp == 0x7F;
}

std::string NameSanitizer::sanitize(std::string_view raw) {
    std::string kept;
    kept.reserve(raw.size());

    std::size_t pos = 0;
    while (pos < raw.size()) {
        std::size_t begin = pos;
        char32_t cp = TextUtils::next_code_point(raw, pos);

        if (is_emoji(cp) || is_box_drawing(cp) || is_forbidden(cp)) {
            continue;
        }

        // Malformed bytes are dropped
        if (pos - begin == 1 && cp >= 0x80) {
            continue;
        }
        append_utf8(kept, cp);
    }

    // Collapse whitespace runs and trim
    std::string result;
    result.reserve(kept.size());
    bool pending_space = false;
    for (char c : TextUtils::trim(kept)) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f') {
            pending_space = true;
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }

    return result;
}

} // namespace hframe
