#pragma once

#include "core/block.hpp"
#include "core/section.hpp"

#include <optional>
#include <unordered_set>
#include <vector>

namespace folio::zoom {

enum class ZoomMode {
    Full,    // heading and every deeper heading below it
    Shallow  // heading and its body only, up to the next heading of any level
};

/**
 * Half-open interval [start, end) of sort orders; no end means through the
 * end of the document.
 */
struct ZoomRange {
    double start{0.0};
    std::optional<double> end;

    [[nodiscard]] bool contains(double sort_order) const noexcept {
        return sort_order >= start && (!end || sort_order < *end);
    }

    bool operator==(const ZoomRange&) const = default;
};

using IdSet = std::unordered_set<BlockId>;

/**
 * Range of the subtree rooted at `heading_id`. None if the block is missing
 * or is not a heading with a level.
 */
[[nodiscard]] std::optional<ZoomRange> compute_zoom_range(std::vector<Block> blocks,
                                                          const BlockId& heading_id,
                                                          ZoomMode mode = ZoomMode::Full);

/**
 * Range after a zoomed re-parse wrote `count` blocks starting at `start`:
 * the end is the first block at or after start + count.
 */
[[nodiscard]] ZoomRange range_after_replace(std::vector<Block> blocks, double start, size_t count);

/**
 * Non-bibliography blocks inside `range`, in document order.
 */
[[nodiscard]] std::vector<Block> filter_by_range(std::vector<Block> blocks, const ZoomRange& range);

/**
 * Structural fallback used before a range is known: a zoomed section root
 * opens inclusion at its level, a non-zoomed section root at or above that
 * level closes it. Bibliography blocks are never included.
 */
[[nodiscard]] std::vector<Block> filter_by_ids(std::vector<Block> blocks, const IdSet& zoomed);

/**
 * The root, the pseudo-sections that directly follow it and, in full mode,
 * every section whose parent chain reaches the root.
 */
[[nodiscard]] IdSet descendant_ids(const SectionList& sections, const BlockId& root_id,
                                   ZoomMode mode = ZoomMode::Full);

} // namespace folio::zoom
