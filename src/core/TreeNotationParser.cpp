#include "core/TreeNotationParser.hpp"
#include "core/CommentExtractor.hpp"
#include "core/NameSanitizer.hpp"
#include "core/TextUtils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace hframe {

namespace {

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

bool is_prefix_code_point(char32_t cp) {
    switch (cp) {
        case U' ': case U'\t': case U'\v': case U'\f': case U'\r':
        case 0x00A0:  // no-break space
        case 0x3000:  // ideographic space
        case U'│': case U'├': case U'└': case U'─':
            return true;
        default:
            return false;
    }
}

std::vector<std::string_view> split_segments(std::string_view path) {
    std::vector<std::string_view> segments;
    std::size_t begin = 0;
    for (std::size_t i = 0; i <= path.size(); ++i) {
        if (i == path.size() || is_separator(path[i])) {
            segments.push_back(path.substr(begin, i - begin));
            begin = i + 1;
        }
    }
    return segments;
}

} // namespace

LinePrefix TreeNotationParser::split_prefix(std::string_view line) {
    LinePrefix prefix;
    std::size_t pos = 0;

    while (pos < line.size()) {
        std::size_t next = pos;
        char32_t cp = TextUtils::next_code_point(line, next);
        if (!is_prefix_code_point(cp)) {
            break;
        }
        ++prefix.indent;
        pos = next;
    }

    prefix.content = line.substr(pos);
    return prefix;
}

LineNotation TreeNotationParser::classify(std::string_view name_part) {
    if (std::none_of(name_part.begin(), name_part.end(), is_separator)) {
        return LineNotation::INDENTED;
    }

    auto segments = split_segments(name_part);
    auto non_empty = std::count_if(segments.begin(), segments.end(),
                                   [](std::string_view s) { return !s.empty(); });
    return non_empty > 1 ? LineNotation::SHORTHAND : LineNotation::INDENTED;
}

Node* TreeNotationParser::resolve_parent(ParentStack& stack, std::size_t indent) {
    while (!stack.empty() && stack.back().first >= indent) {
        stack.pop_back();
    }
    return stack.empty() ? nullptr : stack.back().second;
}

void TreeNotationParser::parse_indented(
    std::string_view name_part,
    const std::optional<std::string>& comment,
    std::size_t indent,
    Forest& roots,
    ParentStack& stack
) {
    bool explicit_directory = !name_part.empty() && is_separator(name_part.back());

    std::string joined;
    for (char c : name_part) {
        if (!is_separator(c)) {
            joined += c;
        }
    }

    std::string name = NameSanitizer::sanitize(joined);
    if (name.empty()) {
        spdlog::debug("Skipping line with no usable name: '{}'", name_part);
        return;
    }

    Node* parent = resolve_parent(stack, indent);
    // A repeated name under the same parent continues the existing node
    Node* attached = parent ? parent->find_child(name) : find_root(roots, name);
    if (attached) {
        attached->backfill_comment(comment);
        if (explicit_directory) {
            attached->mark_directory();
        }
    } else {
        auto node = std::make_unique<Node>(std::move(name), !explicit_directory, comment);
        if (parent) {
            attached = &parent->add_child(std::move(node));
        } else {
            roots.push_back(std::move(node));
            attached = roots.back().get();
        }
    }

    stack.emplace_back(indent, attached);
}

void TreeNotationParser::parse_shorthand(
    std::string_view name_part,
    const std::optional<std::string>& comment,
    std::size_t indent,
    Forest& roots,
    ParentStack& stack
) {
    std::vector<std::string> segments;
    for (auto raw : split_segments(name_part)) {
        std::string segment = NameSanitizer::sanitize(raw);
        if (!segment.empty()) {
            segments.push_back(std::move(segment));
        }
    }

    if (segments.empty()) {
        spdlog::debug("Skipping shorthand with no usable segments: '{}'", name_part);
        return;
    }

    Node* parent = resolve_parent(stack, indent);

    Node* top = nullptr;
    Node* current = nullptr;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        bool is_last = (i + 1 == segments.size());
        const std::string& segment = segments[i];

        Node* next = nullptr;
        if (i == 0) {
            next = parent ? parent->find_child(segment) : find_root(roots, segment);
        } else {
            next = current->find_child(segment);
        }

        if (next) {
            if (is_last) {
                next->backfill_comment(comment);
            }
        } else {
            auto node = std::make_unique<Node>(
                segment, is_last, is_last ? comment : std::nullopt);

            if (i == 0 && !parent) {
                roots.push_back(std::move(node));
                next = roots.back().get();
            } else {
                Node& owner = (i == 0) ? *parent : *current;
                next = &owner.add_child(std::move(node));
            }
        }

        current = next;
        if (i == 0) {
            top = current;
        }
    }

    // Only the top segment of a parentless chain is addressable by indentation
    if (!parent) {
        stack.emplace_back(indent, top);
    }
}

Forest TreeNotationParser::parse(
    std::string_view text,
    std::size_t start_line,
    std::optional<std::size_t> end_line
) {
    auto lines = TextUtils::split_lines(text);
    std::size_t last = std::min(end_line.value_or(lines.size()), lines.size());

    Forest roots;
    ParentStack stack;

    for (std::size_t i = start_line; i < last; ++i) {
        std::string_view line = lines[i];
        if (TextUtils::is_blank(line)) {
            continue;
        }

        LinePrefix prefix = split_prefix(line);
        std::string_view content = TextUtils::trim(prefix.content);
        if (content.empty() || TextUtils::starts_with(content, "```")) {
            continue;
        }

        ExtractedComment extracted = CommentExtractor::extract(content);
        std::string_view name_part = TextUtils::trim(extracted.name);
        if (name_part.empty()) {
            continue;
        }

        if (classify(name_part) == LineNotation::SHORTHAND) {
            parse_shorthand(name_part, extracted.comment, prefix.indent, roots, stack);
        } else {
            parse_indented(name_part, extracted.comment, prefix.indent, roots, stack);
        }
    }

    spdlog::debug("Parsed {} root node(s) from lines [{}, {})", roots.size(), start_line, last);
    return roots;
}

} // namespace hframe
