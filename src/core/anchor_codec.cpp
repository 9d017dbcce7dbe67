#include "core/anchor_codec.hpp"
#include "core/markdown.hpp"

#include <algorithm>

namespace folio::anchors {

namespace {

bool is_id_char(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F') || c == '-';
}

// Length of a well-formed identity anchor starting at `pos`, or 0.
size_t match_anchor(std::string_view text, size_t pos, std::string_view& id_out) noexcept {
    if (text.compare(pos, kAnchorPrefix.size(), kAnchorPrefix) != 0) return 0;
    size_t id_start = pos + kAnchorPrefix.size();
    size_t id_end = id_start;
    while (id_end < text.size() && is_id_char(text[id_end])) ++id_end;
    if (id_end == id_start) return 0;
    if (text.compare(id_end, kAnchorSuffix.size(), kAnchorSuffix) != 0) return 0;
    id_out = text.substr(id_start, id_end - id_start);
    return id_end + kAnchorSuffix.size() - pos;
}

} // anonymous namespace

std::string make_anchor(std::string_view id) {
    std::string out;
    out.reserve(kAnchorPrefix.size() + id.size() + kAnchorSuffix.size());
    out.append(kAnchorPrefix);
    out.append(id);
    out.append(kAnchorSuffix);
    return out;
}

std::string inject(std::string_view text, std::vector<AnchorTarget> targets) {
    // Descending offset; equal offsets keep list order in the output.
    std::stable_sort(targets.begin(), targets.end(),
                     [](const AnchorTarget& a, const AnchorTarget& b) { return a.offset > b.offset; });

    std::string out(text);
    size_t last_offset = std::string::npos;
    std::string pending;

    auto flush = [&]() {
        if (!pending.empty()) {
            out.insert(std::min(last_offset, out.size()), pending);
            pending.clear();
        }
    };

    for (const auto& target : targets) {
        std::string marker;
        if (target.is_bibliography) {
            marker = std::string(kBibliographyMarker);
        } else if (is_anchor_safe_id(target.id)) {
            marker = make_anchor(target.id);
        } else {
            continue;
        }

        if (target.offset != last_offset) {
            flush();
            last_offset = target.offset;
        }
        pending.append(marker);
    }
    flush();
    return out;
}

std::string inject(std::string_view text, const SectionList& sections) {
    std::vector<AnchorTarget> targets;
    targets.reserve(sections.size());
    for (const auto& s : sections) {
        targets.push_back(AnchorTarget{
            .id = s.id,
            .offset = s.start_offset,
            .is_bibliography = s.is_bibliography,
        });
    }
    return inject(text, std::move(targets));
}

ExtractResult extract(std::string_view text) {
    ExtractResult result;
    result.text.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        auto open = text.find("<!--", pos);
        if (open == std::string_view::npos) {
            result.text.append(text.substr(pos));
            break;
        }
        result.text.append(text.substr(pos, open - pos));

        std::string_view id;
        if (auto len = match_anchor(text, open, id); len > 0) {
            result.anchors.push_back(Anchor{.id = std::string(id), .offset = result.text.size()});
            pos = open + len;
        } else if (text.compare(open, kBibliographyMarker.size(), kBibliographyMarker) == 0) {
            if (!result.bibliography_offset) result.bibliography_offset = result.text.size();
            pos = open + kBibliographyMarker.size();
        } else if (text.compare(open, kZoomNotesMarker.size(), kZoomNotesMarker) == 0) {
            if (!result.zoom_notes_offset) result.zoom_notes_offset = result.text.size();
            pos = open + kZoomNotesMarker.size();
        } else {
            // Unrelated HTML comment (section break, author notes)
            result.text.append("<!--");
            pos = open + 4;
        }
    }
    return result;
}

std::string strip_all(std::string_view text) {
    return extract(text).text;
}

std::string strip_zoom_notes(std::string_view text) {
    auto pos = text.find(kZoomNotesMarker);
    if (pos == std::string_view::npos) return std::string(text);

    auto head = text.substr(0, pos);
    while (!head.empty() && (head.back() == '\n' || head.back() == ' ')) head.remove_suffix(1);
    return std::string(head);
}

int clean_word_count(std::string_view text) {
    return markdown::word_count(strip_all(text));
}

} // namespace folio::anchors
