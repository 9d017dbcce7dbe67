#pragma once

#include "core/block.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace folio::markdown {

inline constexpr std::string_view kSectionBreakMarker = "<!-- ::break:: -->";

[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

/**
 * Level of an ATX heading (1..6) if the fragment's first line is one,
 * i.e. 1-6 '#' followed by whitespace.
 */
[[nodiscard]] std::optional<int> heading_level_of(std::string_view fragment) noexcept;

/**
 * Rewrite the '#' run of the first line to `level` hashes and a single space.
 * Fragments that do not start with '#' and levels <= 0 are returned unchanged.
 */
[[nodiscard]] std::string with_heading_level(std::string_view fragment, int level);

[[nodiscard]] BlockType detect_block_type(std::string_view fragment) noexcept;

// "# References", "## Bibliography" and friends
[[nodiscard]] bool is_bibliography_heading(std::string_view fragment) noexcept;

[[nodiscard]] std::string extract_text_content(std::string_view fragment, BlockType type);

/**
 * Plain text of a markdown string: markers, emphasis, inline code ticks,
 * link targets, images, rules, table pipes and HTML comments removed.
 */
[[nodiscard]] std::string strip_markdown_syntax(std::string_view text);

[[nodiscard]] int word_count(std::string_view text);

} // namespace folio::markdown
