#include "storage/block_store.hpp"

namespace folio::storage {

Result<void, Error> persist_section_order(BlockStore& store,
                                          const ProjectId& project_id,
                                          const SectionList& sections) {
    HeadingUpdates updates;
    for (const auto& s : sections) {
        if (s.is_pseudo_section) continue;
        updates[s.id] = HeadingUpdate{.markdown_fragment = s.markdown, .heading_level = s.header_level};
    }

    auto reordered = store.reorder_all_blocks(sections, project_id, updates);
    if (reordered.is_err()) {
        return reordered;
    }

    std::vector<SectionChange> legacy;
    legacy.reserve(sections.size());
    for (size_t i = 0; i < sections.size(); ++i) {
        const auto& s = sections[i];
        legacy.push_back(SectionChange{
            .kind = SectionChange::Kind::Upsert,
            .id = s.id,
            .updates = SectionUpdates{
                .title = s.title,
                .header_level = s.header_level,
                .sort_order = static_cast<int>(i),
                .markdown = s.markdown,
                .start_offset = s.start_offset,
                .parent_id = s.parent_id,
            },
        });
    }
    return store.apply_section_changes(legacy, project_id);
}

} // namespace folio::storage
