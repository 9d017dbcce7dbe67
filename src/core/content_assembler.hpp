#pragma once

#include "core/block.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace folio {

inline constexpr std::string_view kBlockSeparator = "\n\n";

/**
 * AssembledDocument - the flat text of an ordered block list.
 *
 * `offsets` maps each block id to the byte offset of its fragment in `text`;
 * `order` is the block id sequence in the order it was joined.
 */
struct AssembledDocument {
    std::string text;
    std::unordered_map<BlockId, size_t> offsets;
    std::vector<BlockId> order;

    [[nodiscard]] std::optional<size_t> offset_of(const BlockId& id) const {
        auto it = offsets.find(id);
        if (it == offsets.end()) return std::nullopt;
        return it->second;
    }

    bool operator==(const AssembledDocument&) const = default;
};

/**
 * Join block fragments in document order (sort_order, headings first on ties)
 * with kBlockSeparator. Pure; the input does not need to be sorted.
 */
[[nodiscard]] AssembledDocument assemble(std::vector<Block> blocks);

} // namespace folio
