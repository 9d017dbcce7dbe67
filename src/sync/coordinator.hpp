#pragma once

#include "core/content_assembler.hpp"
#include "core/reorder.hpp"
#include "core/section.hpp"
#include "core/zoom.hpp"
#include "sync/debounced_task.hpp"
#include "sync/editor_surface.hpp"
#include "sync/messages.hpp"
#include "sync/session.hpp"
#include "sync/settings.hpp"

#include <QObject>
#include <QString>

#include <memory>
#include <optional>
#include <string>

namespace folio::sync {

enum class SyncState {
    Idle,
    EditorTransition,
    DragReorder,
    HierarchyEnforcement,
    ZoomTransition
};

enum class EditorMode { Structured, Source };

[[nodiscard]] const char* state_name(SyncState state) noexcept;

/**
 * SyncCoordinator - single owner of the live section list and the only
 * writer to the block store while it runs.
 *
 * Inbox messages are dropped while the state is not Idle, except the ones
 * owned by the running operation. Every store-mutating operation writes
 * before it rebuilds, and rebuilds from what the store returns.
 */
class SyncCoordinator : public QObject {
    Q_OBJECT

public:
    SyncCoordinator(DocumentSession& session,
                    EditorSurface& structured,
                    SourceSurface& source,
                    SyncSettings settings = {},
                    QObject* parent = nullptr);
    ~SyncCoordinator() override;

    /**
     * Initial fetch, enforcement if the stored outline is invalid, and the
     * first content push to the active surface.
     */
    [[nodiscard]] Result<void, Error> load();

    void post(Message message);

    void reorder(const reorder::ReorderRequest& request);

    // Ask the active surface for its cursor; the CursorSaved reply switches.
    void request_mode_switch();
    void switch_mode(EditorMode target, std::optional<CursorPosition> cursor = std::nullopt);

    void zoom_in(const BlockId& heading_id, zoom::ZoomMode mode = zoom::ZoomMode::Full);
    void zoom_out();

    /**
     * Persist pending debounced edits now (before quitting, zooming or
     * dragging).
     */
    [[nodiscard]] Result<void, Error> flush();

    // Writes status, tags and goals of `updated` where they differ.
    [[nodiscard]] Result<void, Error> update_section_metadata(const Section& updated);

    [[nodiscard]] std::optional<size_t> scroll_offset_of(const BlockId& id) const;

    void apply_theme(const std::string& theme);

    [[nodiscard]] SyncState state() const { return state_; }
    [[nodiscard]] EditorMode mode() const { return mode_; }
    [[nodiscard]] const SectionList& sections() const { return sections_; }
    [[nodiscard]] const std::optional<BlockId>& zoomed_id() const { return zoomed_id_; }
    [[nodiscard]] const std::optional<zoom::ZoomRange>& zoom_range() const { return zoom_range_; }

    // Clean text of the current view.
    [[nodiscard]] const std::string& current_text() const { return document_.text; }

signals:
    void stateChanged();
    void sectionsChanged();
    void contentRebuilt();
    void storeWriteFailed(const QString& message);
    void enforcementIncomplete(int passes);

private:
    class StateGuard;

    void handle(const StoreChanged& msg);
    void handle(const ContentEdited& msg);
    void handle(const BlockChangesReported& msg);
    void handle(const CursorSaved& msg);
    void handle(const ContentAcknowledged& msg);
    void handle(const SurfaceReady& msg);

    [[nodiscard]] bool owns(const Message& message) const;

    void set_state(SyncState state);
    [[nodiscard]] EditorSurface& active_surface();
    [[nodiscard]] SurfaceKind active_kind() const;

    // Fetch, derive sections and recompute the zoom range. No push.
    [[nodiscard]] Result<void, Error> refresh_from_store();
    // `pinned` replaces the level-derived zoom range (after a zoomed re-parse).
    void apply_blocks(std::vector<Block> blocks, std::optional<zoom::ZoomRange> pinned = std::nullopt);
    // refresh_from_store + push to the active surface.
    [[nodiscard]] Result<void, Error> rebuild();
    void push_content();

    [[nodiscard]] std::vector<Block> visible_blocks() const;
    void recompute_zoom_range();
    // Range a zoomed re-parse replaces; none when not zoomed.
    [[nodiscard]] std::optional<zoom::ZoomRange> edit_range() const;

    void run_enforcement();
    void enforce_after_edit();
    [[nodiscard]] Result<void, Error> persist_text(const std::string& text);
    [[nodiscard]] Result<void, Error> persist_pending();

    void report_failure(const char* operation, const Error& error);
    void finish_transition();

    DocumentSession& session_;
    EditorSurface& structured_;
    SourceSurface& source_;
    SyncSettings settings_;

    SyncState state_ = SyncState::Idle;
    EditorMode mode_ = EditorMode::Structured;
    bool alive_ = true;
    bool switch_requested_ = false;

    std::vector<Block> blocks_;
    SectionList sections_;
    AssembledDocument document_;

    std::optional<BlockId> zoomed_id_;
    zoom::ZoomMode zoom_mode_ = zoom::ZoomMode::Full;
    std::optional<zoom::ZoomRange> zoom_range_;
    zoom::IdSet zoomed_ids_;

    // Text most recently pushed to (or accepted from) each surface.
    std::string last_structured_text_;
    std::string last_source_text_;
    std::optional<std::string> pending_text_;

    std::unique_ptr<DebouncedTask> content_task_;
    std::unique_ptr<DebouncedTask> reparse_task_;
    std::unique_ptr<DebouncedTask> drag_task_;
    std::unique_ptr<DebouncedTask> grace_task_;
    std::unique_ptr<DebouncedTask> ack_task_;
};

} // namespace folio::sync
