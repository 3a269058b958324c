#include "core/TextUtils.hpp"
#include <algorithm>
#include <cctype>

namespace hframe {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::vector<std::string_view> TextUtils::split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t begin = 0;

    while (true) {
        std::size_t end = text.find('\n', begin);
        std::string_view line = (end == std::string_view::npos)
            ? text.substr(begin)
            : text.substr(begin, end - begin);

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);

        if (end == std::string_view::npos) {
            break;
        }
        begin = end + 1;
    }

    return lines;
}

std::string_view TextUtils::trim_left(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size() && is_space(text[i])) {
        ++i;
    }
    return text.substr(i);
}

std::string_view TextUtils::trim_right(std::string_view text) {
    std::size_t n = text.size();
    while (n > 0 && is_space(text[n - 1])) {
        --n;
    }
    return text.substr(0, n);
}

std::string_view TextUtils::trim(std::string_view text) {
    return trim_right(trim_left(text));
}

std::size_t TextUtils::leading_whitespace(std::string_view text) {
    return text.size() - trim_left(text).size();
}

std::string TextUtils::to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

std::string TextUtils::join_lines(const std::vector<std::string_view>& lines) {
    std::string joined;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

char32_t TextUtils::next_code_point(std::string_view text, std::size_t& pos) {
    auto byte = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };

    unsigned char lead = byte(pos);
    std::size_t length = 1;
    char32_t cp = lead;

    if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        cp = lead & 0x07;
    } else if (lead >= 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        cp = lead & 0x1F;
    } else {
        ++pos;
        return lead;
    }

    if (lead > 0xF4 || pos + length > text.size()) {
        ++pos;
        return lead;
    }

    for (std::size_t i = 1; i < length; ++i) {
        unsigned char cont = byte(pos + i);
        if ((cont & 0xC0) != 0x80) {
            ++pos;
            return lead;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }

    pos += length;
    return cp;
}

} // namespace hframe
