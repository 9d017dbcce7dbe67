#pragma once

#include "storage/block_store.hpp"
#include "sync/editor_surface.hpp"

#include <string>
#include <variant>

namespace folio::sync {

// The store committed a write for this project.
struct StoreChanged {
    ProjectId project_id;
};

// Debounce happens in the coordinator, not in the surface.
struct ContentEdited {
    SurfaceKind surface{SurfaceKind::Structured};
    std::string text;
};

struct BlockChangesReported {
    storage::BlockChanges changes;
};

struct CursorSaved {
    SurfaceKind surface{SurfaceKind::Structured};
    CursorPosition cursor;
};

// The surface finished applying the last set_content.
struct ContentAcknowledged {
    SurfaceKind surface{SurfaceKind::Structured};
};

struct SurfaceReady {
    SurfaceKind surface{SurfaceKind::Structured};
};

using Message = std::variant<StoreChanged,
                             ContentEdited,
                             BlockChangesReported,
                             CursorSaved,
                             ContentAcknowledged,
                             SurfaceReady>;

} // namespace folio::sync
