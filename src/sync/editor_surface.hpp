#pragma once

#include "storage/block_store.hpp"

#include <string>
#include <vector>

namespace folio::sync {

enum class SurfaceKind { Structured, Source };

struct CursorPosition {
    size_t offset{0};

    bool operator==(const CursorPosition&) const = default;
};

/**
 * EditorSurface - what the coordinator drives on an editing surface.
 *
 * Surfaces report back by posting messages into the coordinator's inbox.
 */
class EditorSurface {
public:
    virtual ~EditorSurface() = default;

    virtual void set_content(const std::string& text) = 0;
    virtual void set_theme(const std::string& theme) = 0;
    virtual void set_cursor(const CursorPosition& cursor) = 0;

    // Reply with a CursorSaved message.
    virtual void request_cursor_save() = 0;

    // Block identities in assembled order (structured surface only).
    virtual void set_block_ids(const std::vector<BlockId>& ids) { static_cast<void>(ids); }

    // Permanent ids for blocks the surface created with temporary ids.
    virtual void confirm_block_ids(const storage::IdMapping& mapping) { static_cast<void>(mapping); }
};

/**
 * SourceSurface - plain-text surface that carries identity anchors.
 *
 * raw_content() includes markers; clean_content() must equal
 * anchors::strip_all(raw_content()) and is the only form that may be
 * persisted as block text.
 */
class SourceSurface : public EditorSurface {
public:
    [[nodiscard]] virtual std::string raw_content() const = 0;
    [[nodiscard]] virtual std::string clean_content() const = 0;
};

} // namespace folio::sync
