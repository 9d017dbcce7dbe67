#include "core/zoom.hpp"

namespace folio::zoom {

std::optional<ZoomRange> compute_zoom_range(std::vector<Block> blocks,
                                            const BlockId& heading_id,
                                            ZoomMode mode) {
    sort_by_document_order(blocks);

    size_t index = blocks.size();
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (blocks[i].id == heading_id) {
            index = i;
            break;
        }
    }
    if (index == blocks.size() || !blocks[index].is_heading()) {
        return std::nullopt;
    }

    const int level = *blocks[index].heading_level;
    ZoomRange range{.start = blocks[index].sort_order, .end = std::nullopt};

    for (size_t i = index + 1; i < blocks.size(); ++i) {
        const auto& b = blocks[i];
        if (!b.is_heading()) continue;
        if (mode == ZoomMode::Shallow || *b.heading_level <= level) {
            range.end = b.sort_order;
            break;
        }
    }
    return range;
}

ZoomRange range_after_replace(std::vector<Block> blocks, double start, size_t count) {
    sort_by_document_order(blocks);
    const double new_end = start + static_cast<double>(count);

    ZoomRange range{.start = start, .end = std::nullopt};
    for (const auto& b : blocks) {
        if (b.sort_order >= new_end) {
            range.end = b.sort_order;
            break;
        }
    }
    return range;
}

std::vector<Block> filter_by_range(std::vector<Block> blocks, const ZoomRange& range) {
    sort_by_document_order(blocks);
    std::vector<Block> out;
    for (auto& b : blocks) {
        if (b.is_bibliography) continue;
        if (range.contains(b.sort_order)) out.push_back(std::move(b));
    }
    return out;
}

std::vector<Block> filter_by_ids(std::vector<Block> blocks, const IdSet& zoomed) {
    sort_by_document_order(blocks);
    std::vector<Block> out;

    bool open = false;
    int root_level = 0;
    int last_heading_level = 1;

    for (auto& b : blocks) {
        if (b.is_section_root()) {
            int level = b.is_heading() ? *b.heading_level : last_heading_level;
            if (b.is_heading()) last_heading_level = level;

            if (zoomed.count(b.id) > 0) {
                if (!open) {
                    open = true;
                    root_level = level;
                }
            } else if (open && level <= root_level) {
                open = false;
            }
        }
        if (open && !b.is_bibliography) {
            out.push_back(std::move(b));
        }
    }
    return out;
}

IdSet descendant_ids(const SectionList& sections, const BlockId& root_id, ZoomMode mode) {
    IdSet ids;
    auto root_index = index_of(sections, root_id);
    if (!root_index) return ids;

    ids.insert(root_id);
    const int root_level = sections[*root_index].header_level;

    for (size_t i = *root_index + 1; i < sections.size(); ++i) {
        const auto& s = sections[i];
        if (s.is_pseudo_section) {
            ids.insert(s.id);
            continue;
        }
        if (mode == ZoomMode::Shallow || s.header_level <= root_level) break;
        // Deeper regular sections are collected by the parent walk below.
    }
    if (mode == ZoomMode::Shallow) return ids;

    // Transitive children by parent_id; sections are in document order so a
    // single forward sweep sees every parent before its children.
    for (size_t i = *root_index + 1; i < sections.size(); ++i) {
        const auto& s = sections[i];
        if (s.parent_id && ids.count(*s.parent_id) > 0) {
            ids.insert(s.id);
        }
    }
    return ids;
}

} // namespace folio::zoom
