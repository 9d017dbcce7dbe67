#include "core/section.hpp"
#include "core/content_assembler.hpp"
#include "core/hierarchy.hpp"

#include <algorithm>

namespace folio {

SectionList sections_from_blocks(std::vector<Block> blocks) {
    sort_by_document_order(blocks);
    auto doc = assemble(blocks);

    SectionList sections;
    Section* current = nullptr;
    int last_heading_level = 1;

    for (const auto& block : blocks) {
        if (!block.is_section_root()) {
            if (current) current->word_count += block.word_count;
            continue;
        }

        Section s;
        s.id = block.id;
        s.sort_order = block.sort_order;
        s.header_level = block.is_heading() ? *block.heading_level : last_heading_level;
        s.title = block.text_content;
        s.markdown = block.markdown_fragment;
        s.status = block.status;
        s.tags = block.tags;
        s.word_goal = block.word_goal;
        s.goal_type = block.goal_type;
        s.word_count = block.word_count;
        s.start_offset = doc.offset_of(block.id).value_or(0);
        s.is_pseudo_section = block.is_pseudo_section;
        s.is_bibliography = block.is_bibliography;

        if (block.is_heading()) last_heading_level = *block.heading_level;

        sections.push_back(std::move(s));
        current = &sections.back();
    }

    std::stable_partition(sections.begin(), sections.end(),
                          [](const Section& s) { return !s.is_bibliography; });
    hierarchy::recalculate_parents(sections);
    return sections;
}

std::optional<size_t> index_of(const SectionList& sections, const BlockId& id) {
    for (size_t i = 0; i < sections.size(); ++i) {
        if (sections[i].id == id) return i;
    }
    return std::nullopt;
}

const Section* find_section(const SectionList& sections, const BlockId& id) {
    auto idx = index_of(sections, id);
    return idx ? &sections[*idx] : nullptr;
}

} // namespace folio
