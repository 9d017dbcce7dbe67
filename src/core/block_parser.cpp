#include "core/block_parser.hpp"
#include "core/markdown.hpp"

#include <unordered_set>

namespace folio::parser {

namespace {

bool is_fence_line(std::string_view line) {
    auto t = markdown::trim(line);
    return t.substr(0, 3) == "```" || t.substr(0, 3) == "~~~";
}

void close_fragment(std::vector<Fragment>& out, std::string_view source,
                    size_t start, size_t end) {
    auto raw = source.substr(start, end - start);
    auto trimmed = markdown::trim(raw);
    if (trimmed.empty()) return;

    Fragment f;
    f.text = std::string(trimmed);
    f.line_start = start;
    f.offset = start + static_cast<size_t>(trimmed.data() - raw.data());
    out.push_back(std::move(f));
}

int words_for(BlockType type, std::string_view fragment) {
    switch (type) {
        case BlockType::HorizontalRule:
        case BlockType::SectionBreak:
        case BlockType::Bibliography:
        case BlockType::Image:
            return 0;
        default:
            return markdown::word_count(fragment);
    }
}

} // anonymous namespace

std::vector<Fragment> split_fragments(std::string_view source) {
    std::vector<Fragment> out;
    bool in_code = false;
    bool open = false;
    size_t start = 0;
    size_t pos = 0;

    while (pos <= source.size()) {
        auto nl = source.find('\n', pos);
        size_t line_end = nl == std::string_view::npos ? source.size() : nl;
        auto line = source.substr(pos, line_end - pos);
        bool blank = markdown::trim(line).empty();

        if (!open && !blank) {
            open = true;
            start = pos;
        }
        if (is_fence_line(line)) {
            in_code = !in_code;
        } else if (blank && !in_code && open) {
            close_fragment(out, source, start, pos);
            open = false;
        }

        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    if (open) {
        close_fragment(out, source, start, source.size());
    }
    return out;
}

std::vector<Block> parse(std::string_view source,
                         const ProjectId& project_id,
                         const std::vector<anchors::Anchor>& anchors) {
    auto fragments = split_fragments(source);
    std::vector<Block> blocks;
    blocks.reserve(fragments.size());

    std::unordered_set<BlockId> used_ids;
    size_t next_anchor = 0;
    bool in_bibliography = false;
    const auto now = Timestamp::now();

    for (size_t i = 0; i < fragments.size(); ++i) {
        auto& fragment = fragments[i];

        Block block;
        block.project_id = project_id;
        block.sort_order = static_cast<double>(i + 1);
        block.type = markdown::detect_block_type(fragment.text);
        if (block.type == BlockType::Heading) {
            block.heading_level = markdown::heading_level_of(fragment.text);
        }
        block.text_content = markdown::extract_text_content(fragment.text, block.type);
        block.word_count = words_for(block.type, fragment.text);
        block.is_pseudo_section = block.type == BlockType::SectionBreak;
        block.created_at = now;
        block.updated_at = now;

        if (block.type == BlockType::Bibliography ||
            markdown::is_bibliography_heading(fragment.text)) {
            in_bibliography = true;
        } else if (block.type == BlockType::Heading) {
            in_bibliography = false;
        }
        block.is_bibliography = in_bibliography;

        // Anchors are sorted by offset; skip any that precede this fragment.
        while (next_anchor < anchors.size() && anchors[next_anchor].offset < fragment.line_start) {
            ++next_anchor;
        }
        while (next_anchor < anchors.size() && anchors[next_anchor].offset <= fragment.offset) {
            const auto& candidate = anchors[next_anchor].id;
            ++next_anchor;
            if (block.id.empty() && used_ids.count(candidate) == 0) {
                block.id = candidate;
            }
        }
        if (block.id.empty()) {
            block.id = generate_block_id();
        }
        used_ids.insert(block.id);

        block.markdown_fragment = std::move(fragment.text);
        blocks.push_back(std::move(block));
    }
    return blocks;
}

} // namespace folio::parser
