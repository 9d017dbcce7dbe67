#pragma once

#include "core/anchor_codec.hpp"
#include "core/block.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace folio::parser {

/**
 * A raw fragment of the source text. `line_start` is where its first line
 * begins, `offset` where its trimmed text begins.
 */
struct Fragment {
    std::string text;
    size_t line_start{0};
    size_t offset{0};
};

/**
 * Split on blank lines, keeping fenced code blocks whole.
 */
[[nodiscard]] std::vector<Fragment> split_fragments(std::string_view markdown);

/**
 * Cold re-parse of clean (marker-free) markdown into blocks with sort orders
 * 1, 2, 3, ... A block whose first line starts at an anchor's offset takes
 * that anchor's id; every other block gets a fresh id.
 */
[[nodiscard]] std::vector<Block> parse(std::string_view markdown,
                                       const ProjectId& project_id,
                                       const std::vector<anchors::Anchor>& anchors = {});

} // namespace folio::parser
