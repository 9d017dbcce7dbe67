#pragma once

#include "core/section.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::anchors {

inline constexpr std::string_view kAnchorPrefix = "<!-- @sid:";
inline constexpr std::string_view kAnchorSuffix = " -->";
inline constexpr std::string_view kBibliographyMarker = "<!-- ::auto-bibliography:: -->";
inline constexpr std::string_view kZoomNotesMarker = "<!-- ::zoom-notes:: -->";

/**
 * A marker to place at a byte offset of the clean text. Bibliography targets
 * receive the bibliography marker instead of an identity anchor.
 */
struct AnchorTarget {
    BlockId id;
    size_t offset{0};
    bool is_bibliography{false};
};

struct Anchor {
    BlockId id;
    size_t offset{0};  // in the stripped text

    bool operator==(const Anchor&) const = default;
};

struct ExtractResult {
    std::string text;
    std::vector<Anchor> anchors;
    std::optional<size_t> bibliography_offset;
    std::optional<size_t> zoom_notes_offset;
};

[[nodiscard]] std::string make_anchor(std::string_view id);

/**
 * Insert markers into `text`, highest offset first. Each marker sits on the
 * heading's own line with no added line break. Offsets past the end clamp to
 * the end; ids the anchor grammar cannot carry are skipped.
 */
[[nodiscard]] std::string inject(std::string_view text, std::vector<AnchorTarget> targets);

/**
 * Convenience overload using each section's start_offset.
 */
[[nodiscard]] std::string inject(std::string_view text, const SectionList& sections);

/**
 * Remove every recognized marker. Anchor offsets are positions in the
 * stripped text; marker bytes never count toward them.
 *
 * Markers are recognized by their exact form only, so other HTML comments
 * survive untouched. A well-formed marker typed by the author is
 * indistinguishable from an injected one and is consumed like one: such text
 * does not survive inject/extract unchanged.
 */
[[nodiscard]] ExtractResult extract(std::string_view text);

/**
 * Text with all identity anchors, bibliography and zoom-notes markers removed.
 * This is the only stripping routine; export and word counting go through it.
 */
[[nodiscard]] std::string strip_all(std::string_view text);

/**
 * Drop the zoom-notes separator and the notes appendix that follows it.
 */
[[nodiscard]] std::string strip_zoom_notes(std::string_view text);

[[nodiscard]] int clean_word_count(std::string_view text);

} // namespace folio::anchors
