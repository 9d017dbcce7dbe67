#include "core/markdown.hpp"

#include <array>
#include <cctype>
#include <vector>

namespace folio::markdown {

namespace {

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_alnum(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

std::string_view first_line(std::string_view s) noexcept {
    auto nl = s.find('\n');
    return nl == std::string_view::npos ? s : s.substr(0, nl);
}

bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.substr(0, prefix.size()) == prefix;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

bool is_fence(std::string_view line) noexcept {
    auto t = trim(line);
    return starts_with(t, "```") || starts_with(t, "~~~");
}

bool is_rule_line(std::string_view line) noexcept {
    auto t = trim(line);
    if (t.size() < 3) return false;
    char marker = t.front();
    if (marker != '-' && marker != '*' && marker != '_') return false;
    int count = 0;
    for (char c : t) {
        if (c == marker) {
            ++count;
        } else if (c != ' ') {
            return false;
        }
    }
    return count >= 3;
}

// Length of an ordered-list marker ("12. " / "3) ") at the start of s, or 0.
size_t ordered_marker_length(std::string_view s) noexcept {
    size_t i = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == 0 || i + 1 >= s.size()) return 0;
    if ((s[i] == '.' || s[i] == ')') && s[i + 1] == ' ') return i + 2;
    return 0;
}

bool is_table_separator(std::string_view line) noexcept {
    auto t = trim(line);
    if (t.empty() || t.front() != '|') return false;
    for (char c : t) {
        if (c != '|' && c != '-' && c != ':' && c != ' ') return false;
    }
    return true;
}

std::string remove_html_comments(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        auto open = text.find("<!--", pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));
        auto close = text.find("-->", open + 4);
        if (close == std::string_view::npos) break;
        pos = close + 3;
    }
    return out;
}

std::string_view strip_line_prefix(std::string_view line) noexcept {
    auto t = line;
    while (!t.empty() && (t.front() == ' ' || t.front() == '\t')) t.remove_prefix(1);

    if (!t.empty() && t.front() == '#') {
        size_t n = 0;
        while (n < t.size() && t[n] == '#') ++n;
        if (n <= 6 && (n == t.size() || t[n] == ' ' || t[n] == '\t')) {
            return trim(t.substr(n));
        }
    }
    while (!t.empty() && t.front() == '>') {
        t.remove_prefix(1);
        while (!t.empty() && t.front() == ' ') t.remove_prefix(1);
    }
    if (t.size() >= 2 && (t[0] == '-' || t[0] == '*' || t[0] == '+') && t[1] == ' ') {
        t.remove_prefix(2);
    } else if (auto n = ordered_marker_length(t); n > 0) {
        t.remove_prefix(n);
    }
    if (starts_with(t, "[ ] ") || starts_with(t, "[x] ") || starts_with(t, "[X] ")) {
        t.remove_prefix(4);
    }
    return t;
}

std::string strip_inline(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        char c = s[i];

        // ![alt](url) is dropped entirely
        if (c == '!' && i + 1 < s.size() && s[i + 1] == '[') {
            auto close = s.find("](", i + 2);
            auto end = close == std::string_view::npos ? close : s.find(')', close + 2);
            if (end != std::string_view::npos) {
                i = end + 1;
                continue;
            }
        }

        if (c == '[') {
            // [^1] footnote references carry no words
            if (i + 1 < s.size() && s[i + 1] == '^') {
                auto end = s.find(']', i);
                if (end != std::string_view::npos) {
                    i = end + 1;
                    continue;
                }
            }
            // [text](url) keeps the text
            auto close = s.find(']', i + 1);
            if (close != std::string_view::npos && close + 1 < s.size() && s[close + 1] == '(') {
                auto end = s.find(')', close + 2);
                if (end != std::string_view::npos) {
                    out.append(strip_inline(s.substr(i + 1, close - i - 1)));
                    i = end + 1;
                    continue;
                }
            }
        }

        if (c == '*' || c == '`') {
            ++i;
            continue;
        }
        if (c == '~' && i + 1 < s.size() && s[i + 1] == '~') {
            i += 2;
            continue;
        }
        if (c == '_') {
            bool left_word = i > 0 && is_alnum(s[i - 1]);
            bool right_word = i + 1 < s.size() && is_alnum(s[i + 1]);
            if (!(left_word && right_word)) {
                ++i;
                continue;
            }
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

} // anonymous namespace

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::optional<int> heading_level_of(std::string_view fragment) noexcept {
    auto line = first_line(fragment);
    int level = 0;
    while (static_cast<size_t>(level) < line.size() && line[level] == '#') ++level;
    if (level < 1 || level > 6) return std::nullopt;
    if (static_cast<size_t>(level) >= line.size()) return std::nullopt;
    if (line[level] != ' ' && line[level] != '\t') return std::nullopt;
    return level;
}

std::string with_heading_level(std::string_view fragment, int level) {
    if (level <= 0 || fragment.empty() || fragment.front() != '#') {
        return std::string(fragment);
    }
    size_t n = 0;
    while (n < fragment.size() && fragment[n] == '#') ++n;
    if (n < fragment.size() && fragment[n] == ' ') ++n;

    std::string out(static_cast<size_t>(level), '#');
    out.push_back(' ');
    out.append(fragment.substr(n));
    return out;
}

BlockType detect_block_type(std::string_view fragment) noexcept {
    auto t = trim(fragment);
    if (starts_with(t, "```") || starts_with(t, "~~~")) return BlockType::CodeBlock;
    if (heading_level_of(t)) return BlockType::Heading;
    if (t == kSectionBreakMarker) return BlockType::SectionBreak;
    if (starts_with(t, "<!-- ::auto-bibliography::")) return BlockType::Bibliography;
    if (t.find('\n') == std::string_view::npos && is_rule_line(t)) return BlockType::HorizontalRule;
    if (starts_with(t, ">")) return BlockType::Blockquote;
    if (starts_with(t, "- ") || starts_with(t, "* ") || starts_with(t, "+ ")) {
        return BlockType::BulletList;
    }
    if (ordered_marker_length(t) > 0) return BlockType::OrderedList;
    if (starts_with(t, "|")) return BlockType::Table;
    if (starts_with(t, "![")) return BlockType::Image;
    return BlockType::Paragraph;
}

bool is_bibliography_heading(std::string_view fragment) noexcept {
    static constexpr std::array<std::string_view, 4> kTitles = {
        "# References", "## References", "# Bibliography", "## Bibliography"};
    auto t = trim(first_line(fragment));
    for (auto title : kTitles) {
        if (t == title) return true;
    }
    return false;
}

std::string extract_text_content(std::string_view fragment, BlockType type) {
    switch (type) {
        case BlockType::HorizontalRule:
        case BlockType::SectionBreak:
        case BlockType::Bibliography:
            return {};
        case BlockType::CodeBlock: {
            std::string out;
            for (auto line : split_lines(fragment)) {
                if (is_fence(line)) continue;
                if (!out.empty()) out.push_back('\n');
                out.append(line);
            }
            return out;
        }
        case BlockType::Image: {
            auto t = trim(fragment);
            auto close = t.find(']');
            if (t.size() > 2 && close != std::string_view::npos) {
                return std::string(t.substr(2, close - 2));
            }
            return {};
        }
        default:
            return std::string(trim(strip_markdown_syntax(fragment)));
    }
}

std::string strip_markdown_syntax(std::string_view text) {
    auto without_comments = remove_html_comments(text);
    std::string out;
    out.reserve(without_comments.size());

    bool in_code = false;
    for (auto line : split_lines(without_comments)) {
        if (is_fence(line)) {
            in_code = !in_code;
            continue;
        }
        if (!out.empty()) out.push_back('\n');
        if (in_code) {
            out.append(line);
            continue;
        }
        if (is_rule_line(line) || is_table_separator(line)) continue;

        auto body = strip_inline(strip_line_prefix(line));
        for (char& c : body) {
            if (c == '|') c = ' ';
        }
        out.append(body);
    }
    return out;
}

int word_count(std::string_view text) {
    auto plain = strip_markdown_syntax(text);
    int count = 0;
    bool in_word = false;
    for (char c : plain) {
        if (is_space(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++count;
        }
    }
    return count;
}

} // namespace folio::markdown
