#pragma once

#include "core/section.hpp"

#include <optional>

namespace folio::hierarchy {

/**
 * Outcome of an enforcement run. `converged` is false when the pass bound
 * was reached while the last pass still changed something; the sections are
 * then returned as they stood after the final pass.
 */
struct EnforcementResult {
    SectionList sections;
    int passes{0};
    bool converged{true};
    bool changed{false};
};

/**
 * Pass bound for a list of `count` sections: max(10, count + 1).
 */
[[nodiscard]] constexpr int max_passes_for(size_t count) noexcept {
    return count + 1 > 10 ? static_cast<int>(count + 1) : 10;
}

/**
 * Correct heading-level violations with the fewest level changes.
 *
 * Each pass rebuilds the list left to right, validating element i against
 * the already-corrected element i-1 of the list being built. The first
 * section is forced to level 1; every other section is capped at its
 * predecessor's level + 1. A changed level rewrites the section's markdown
 * heading marker. Pseudo-sections follow their predecessor's level.
 */
[[nodiscard]] EnforcementResult enforce(SectionList sections);

[[nodiscard]] bool has_violations(const SectionList& sections) noexcept;

/**
 * Nearest preceding section with a strictly lower level, or none for level 1
 * and for sections with no such predecessor.
 */
[[nodiscard]] std::optional<BlockId> find_parent_by_level(const SectionList& sections,
                                                          size_t index);

void recalculate_parents(SectionList& sections);

} // namespace folio::hierarchy
