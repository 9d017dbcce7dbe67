#pragma once

#include "core/section.hpp"

#include <QString>
#include <QStringList>

namespace folio::cli {

struct OutlineOptions {
    bool include_ids = false;
};

// One line per section, indented two spaces per level below 1:
//   - Title [2] (id)
[[nodiscard]] QString format_outline(const SectionList& sections, const OutlineOptions& options = {});

/**
 * Human-readable level violations, one per line. Empty when the outline is
 * valid.
 */
[[nodiscard]] QStringList describe_violations(const SectionList& sections);

} // namespace folio::cli
