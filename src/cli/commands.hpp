#pragma once

#include "core/result.hpp"
#include "storage/block_store.hpp"

#include <QString>

namespace folio::cli {

struct ImportOptions {
    QString path;
};

struct ExportOptions {
    bool with_anchors = false;
};

struct MoveOptions {
    QString section_id;
    QString after_id;  // empty: move to the start
    int level = 0;     // 0 keeps the current level
    bool subtree = false;
};

struct ZoomOptions {
    QString section_id;
    bool shallow = false;
};

struct CheckReport {
    int violations = 0;
    QString text;
};

// Replaces the project's blocks with the parsed file and repairs its levels.
[[nodiscard]] Result<QString> import_markdown(storage::BlockStore& store,
                                              const ProjectId& project_id,
                                              const ImportOptions& options);

[[nodiscard]] Result<QString> export_document(storage::BlockStore& store,
                                              const ProjectId& project_id,
                                              const ExportOptions& options = {});

[[nodiscard]] Result<QString> show_outline(storage::BlockStore& store,
                                           const ProjectId& project_id,
                                           bool include_ids = false);

[[nodiscard]] Result<QString> move_section(storage::BlockStore& store,
                                           const ProjectId& project_id,
                                           const MoveOptions& options);

[[nodiscard]] Result<QString> show_zoomed(storage::BlockStore& store,
                                          const ProjectId& project_id,
                                          const ZoomOptions& options);

[[nodiscard]] Result<CheckReport> check_hierarchy(storage::BlockStore& store, const ProjectId& project_id);

[[nodiscard]] Result<QString> enforce_hierarchy(storage::BlockStore& store, const ProjectId& project_id);

} // namespace folio::cli
