#include "sync/coordinator.hpp"
#include "core/anchor_codec.hpp"
#include "core/block_parser.hpp"
#include "core/hierarchy.hpp"
#include "sync/logging.hpp"

#include <QMetaObject>

#include <algorithm>

namespace folio::sync {

namespace {

std::vector<anchors::AnchorTarget> anchor_targets(const SectionList& sections,
                                                  const AssembledDocument& document) {
    std::vector<anchors::AnchorTarget> targets;
    targets.reserve(sections.size());
    for (const auto& s : sections) {
        auto offset = document.offset_of(s.id);
        if (!offset) continue;
        targets.push_back(anchors::AnchorTarget{
            .id = s.id,
            .offset = *offset,
            .is_bibliography = s.is_bibliography,
        });
    }
    return targets;
}

// Clean offset -> offset in the injected text.
size_t to_raw_offset(const std::vector<anchors::AnchorTarget>& targets, size_t clean_offset) {
    size_t raw = clean_offset;
    for (const auto& t : targets) {
        if (t.offset > clean_offset) continue;
        if (t.is_bibliography) {
            raw += anchors::kBibliographyMarker.size();
        } else if (is_anchor_safe_id(t.id)) {
            raw += anchors::make_anchor(t.id).size();
        }
    }
    return raw;
}

// Offset in text with markers -> offset in the stripped text.
size_t to_clean_offset(const std::string& raw, size_t raw_offset) {
    const size_t end = std::min(raw_offset, raw.size());
    return anchors::strip_all(std::string_view(raw).substr(0, end)).size();
}

QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

} // anonymous namespace

const char* state_name(SyncState state) noexcept {
    switch (state) {
        case SyncState::Idle: return "idle";
        case SyncState::EditorTransition: return "editor-transition";
        case SyncState::DragReorder: return "drag-reorder";
        case SyncState::HierarchyEnforcement: return "hierarchy-enforcement";
        case SyncState::ZoomTransition: return "zoom-transition";
    }
    return "unknown";
}

/**
 * Enters a state and returns to Idle on scope exit, on every path. An
 * operation that hands completion to a background task calls hand_off().
 */
class SyncCoordinator::StateGuard {
public:
    StateGuard(SyncCoordinator& owner, SyncState state)
        : owner_(owner) {
        owner_.set_state(state);
    }
    ~StateGuard() {
        if (active_) owner_.set_state(SyncState::Idle);
    }

    StateGuard(const StateGuard&) = delete;
    StateGuard& operator=(const StateGuard&) = delete;

    void hand_off() { active_ = false; }

private:
    SyncCoordinator& owner_;
    bool active_ = true;
};

// ============================================================================
// Lifecycle
// ============================================================================

SyncCoordinator::SyncCoordinator(DocumentSession& session,
                                 EditorSurface& structured,
                                 SourceSurface& source,
                                 SyncSettings settings,
                                 QObject* parent)
    : QObject(parent)
    , session_(session)
    , structured_(structured)
    , source_(source)
    , settings_(settings)
    , content_task_(std::make_unique<DebouncedTask>())
    , reparse_task_(std::make_unique<DebouncedTask>())
    , drag_task_(std::make_unique<DebouncedTask>())
    , grace_task_(std::make_unique<DebouncedTask>())
    , ack_task_(std::make_unique<DebouncedTask>()) {
    // Queued so that a write made inside an operation is seen after it returns.
    session_.store().set_change_listener([this](const ProjectId& project_id) {
        QMetaObject::invokeMethod(
            this, [this, project_id]() { post(StoreChanged{project_id}); }, Qt::QueuedConnection);
    });
}

SyncCoordinator::~SyncCoordinator() {
    alive_ = false;
    content_task_->cancel();
    reparse_task_->cancel();
    drag_task_->cancel();
    grace_task_->cancel();
    ack_task_->cancel();
    session_.store().set_change_listener(nullptr);
}

Result<void, Error> SyncCoordinator::load() {
    auto refreshed = refresh_from_store();
    if (refreshed.is_err()) {
        return refreshed;
    }
    qCInfo(folioSyncLog) << "loaded" << blocks_.size() << "blocks," << sections_.size() << "sections";

    if (hierarchy::has_violations(sections_)) {
        qCInfo(folioSyncLog) << "stored outline has level violations, repairing";
        run_enforcement();
        return Result<void, Error>::ok();
    }
    push_content();
    return Result<void, Error>::ok();
}

// ============================================================================
// Inbox
// ============================================================================

bool SyncCoordinator::owns(const Message& message) const {
    if (const auto* ack = std::get_if<ContentAcknowledged>(&message)) {
        return state_ == SyncState::ZoomTransition && ack->surface == active_kind();
    }
    if (std::holds_alternative<CursorSaved>(message)) {
        return switch_requested_;
    }
    return false;
}

void SyncCoordinator::post(Message message) {
    if (!alive_) return;

    if (state_ != SyncState::Idle && !owns(message)) {
        qCDebug(folioSyncLog) << "dropping message" << message.index() << "while" << state_name(state_);
        return;
    }
    std::visit([this](const auto& msg) { handle(msg); }, message);
}

void SyncCoordinator::handle(const StoreChanged& msg) {
    if (msg.project_id != session_.project_id()) return;

    auto fetched = session_.store().fetch_blocks(session_.project_id());
    if (fetched.is_err()) {
        report_failure("fetch", fetched.unwrap_err());
        return;
    }
    auto blocks = std::move(fetched).unwrap();
    if (blocks == blocks_) {
        qCDebug(folioSyncLog) << "store change already applied";
        return;
    }

    qCDebug(folioSyncLog) << "external store change, reloading";
    apply_blocks(std::move(blocks));

    if (hierarchy::has_violations(sections_)) {
        run_enforcement();
        return;
    }
    // Never overwrite a surface with edits still waiting to be persisted.
    if (content_task_->is_pending() || reparse_task_->is_pending()) return;
    push_content();
}

void SyncCoordinator::handle(const ContentEdited& msg) {
    if (msg.surface != active_kind()) {
        qCDebug(folioSyncLog) << "edit from inactive surface ignored";
        return;
    }

    auto& last = msg.surface == SurfaceKind::Structured ? last_structured_text_ : last_source_text_;
    if (msg.text == last) return;
    last = msg.text;
    pending_text_ = msg.text;

    auto& task = msg.surface == SurfaceKind::Structured ? content_task_ : reparse_task_;
    const int delay = msg.surface == SurfaceKind::Structured ? settings_.content_debounce_ms
                                                             : settings_.reparse_debounce_ms;
    task->schedule(delay, [this]() {
        if (!alive_) return;
        auto persisted = persist_pending();
        if (persisted.is_err()) {
            report_failure("persist edit", persisted.unwrap_err());
            return;
        }
        enforce_after_edit();
    });
}

void SyncCoordinator::handle(const BlockChangesReported& msg) {
    if (msg.changes.empty()) return;

    auto applied = session_.store().apply_editor_changes(msg.changes, session_.project_id());
    if (applied.is_err()) {
        report_failure("apply block changes", applied.unwrap_err());
        return;
    }
    const auto& mapping = applied.unwrap();
    if (!mapping.empty()) {
        structured_.confirm_block_ids(mapping);
    }

    auto refreshed = refresh_from_store();
    if (refreshed.is_err()) {
        report_failure("refresh", refreshed.unwrap_err());
        return;
    }
    last_structured_text_ = document_.text;
    enforce_after_edit();
}

void SyncCoordinator::handle(const CursorSaved& msg) {
    if (!switch_requested_ || msg.surface != active_kind()) return;
    switch_requested_ = false;

    const auto target = mode_ == EditorMode::Structured ? EditorMode::Source : EditorMode::Structured;
    switch_mode(target, msg.cursor);
}

void SyncCoordinator::handle(const ContentAcknowledged& msg) {
    if (state_ != SyncState::ZoomTransition || msg.surface != active_kind()) return;
    ack_task_->cancel();
    finish_transition();
}

void SyncCoordinator::handle(const SurfaceReady& msg) {
    if (msg.surface != active_kind()) return;
    push_content();
}

// ============================================================================
// Reorder and enforcement
// ============================================================================

void SyncCoordinator::reorder(const reorder::ReorderRequest& request) {
    if (state_ == SyncState::DragReorder) {
        // A newer drag supersedes the pending settle.
        drag_task_->cancel();
        set_state(SyncState::Idle);
    } else if (state_ != SyncState::Idle) {
        qCDebug(folioSyncLog) << "reorder ignored while" << state_name(state_);
        return;
    }

    auto flushed = flush();
    if (flushed.is_err()) {
        report_failure("flush before reorder", flushed.unwrap_err());
        return;
    }
    auto refreshed = refresh_from_store();
    if (refreshed.is_err()) {
        report_failure("refresh before reorder", refreshed.unwrap_err());
        return;
    }

    auto planned = reorder::plan_reorder(sections_, request);
    if (planned.is_err()) {
        const auto& error = planned.unwrap_err();
        if (error.kind == ErrorKind::InvalidRequest) {
            qCDebug(folioSyncLog) << "reorder rejected:" << qstr(error.message);
        } else {
            qCWarning(folioSyncLog) << "reorder aborted:" << qstr(error.message);
        }
        return;
    }
    const auto plan = std::move(planned).unwrap();
    if (!plan.promoted_ids.empty()) {
        qCDebug(folioSyncLog) << "promoted" << plan.promoted_ids.size() << "orphaned children";
    }

    StateGuard guard(*this, SyncState::DragReorder);

    auto persisted = storage::persist_section_order(session_.store(), session_.project_id(), plan.sections);
    if (persisted.is_err()) {
        report_failure("reorder", persisted.unwrap_err());
        return;
    }
    if (!plan.converged) {
        qCWarning(folioSyncLog) << "hierarchy enforcement stopped after" << plan.enforcement_passes
                                << "passes without converging";
        emit enforcementIncomplete(plan.enforcement_passes);
    }

    auto rebuilt = rebuild();
    if (rebuilt.is_err()) {
        report_failure("rebuild after reorder", rebuilt.unwrap_err());
        return;
    }

    guard.hand_off();
    drag_task_->schedule(settings_.drag_settle_ms, [this]() {
        if (!alive_) return;
        structured_.set_block_ids(document_.order);
        finish_transition();
    });
}

void SyncCoordinator::run_enforcement() {
    auto plan = reorder::finalize(sections_);

    StateGuard guard(*this, SyncState::HierarchyEnforcement);

    auto persisted = storage::persist_section_order(session_.store(), session_.project_id(), plan.sections);
    if (persisted.is_err()) {
        report_failure("hierarchy enforcement", persisted.unwrap_err());
        return;
    }
    if (!plan.converged) {
        qCWarning(folioSyncLog) << "hierarchy enforcement stopped after" << plan.enforcement_passes
                                << "passes without converging";
        emit enforcementIncomplete(plan.enforcement_passes);
    }
    qCInfo(folioSyncLog) << "hierarchy repaired in" << plan.enforcement_passes << "passes";

    auto rebuilt = rebuild();
    if (rebuilt.is_err()) {
        report_failure("rebuild after enforcement", rebuilt.unwrap_err());
    }
}

// The write from an edit is already in blocks_, so the StoreChanged it queues
// finds nothing new. Edits check the outline here instead.
void SyncCoordinator::enforce_after_edit() {
    if (state_ != SyncState::Idle || !hierarchy::has_violations(sections_)) return;
    qCDebug(folioSyncLog) << "edit left heading level violations, repairing";
    run_enforcement();
}

// ============================================================================
// Editor mode
// ============================================================================

void SyncCoordinator::request_mode_switch() {
    if (state_ != SyncState::Idle) {
        qCDebug(folioSyncLog) << "mode switch ignored while" << state_name(state_);
        return;
    }
    switch_requested_ = true;
    active_surface().request_cursor_save();
}

void SyncCoordinator::switch_mode(EditorMode target, std::optional<CursorPosition> cursor) {
    switch_requested_ = false;
    if (target == mode_) return;
    if (state_ != SyncState::Idle) {
        qCDebug(folioSyncLog) << "mode switch ignored while" << state_name(state_);
        return;
    }

    StateGuard guard(*this, SyncState::EditorTransition);

    auto flushed = flush();
    if (flushed.is_err()) {
        report_failure("flush before mode switch", flushed.unwrap_err());
        return;
    }

    if (target == EditorMode::Source) {
        mode_ = EditorMode::Source;
        auto rebuilt = rebuild();
        if (rebuilt.is_err()) {
            report_failure("rebuild for source mode", rebuilt.unwrap_err());
            return;
        }
        if (cursor) {
            const auto targets = anchor_targets(sections_, document_);
            source_.set_cursor(CursorPosition{.offset = to_raw_offset(targets, cursor->offset)});
        }
        return;
    }

    // Leaving source: its text is authoritative until it has been persisted.
    const auto raw = source_.raw_content();
    if (raw != last_source_text_) {
        auto persisted = persist_text(raw);
        if (persisted.is_err()) {
            report_failure("persist source text", persisted.unwrap_err());
            return;
        }
    }

    mode_ = EditorMode::Structured;
    auto rebuilt = rebuild();
    if (rebuilt.is_err()) {
        report_failure("rebuild for structured mode", rebuilt.unwrap_err());
        return;
    }
    if (cursor) {
        structured_.set_cursor(CursorPosition{.offset = to_clean_offset(raw, cursor->offset)});
    }

    // The structured surface echoes its new content; keep the inbox closed
    // until it settles.
    guard.hand_off();
    grace_task_->schedule(settings_.editor_grace_ms, [this]() { finish_transition(); });
}

// ============================================================================
// Zoom
// ============================================================================

void SyncCoordinator::zoom_in(const BlockId& heading_id, zoom::ZoomMode mode) {
    if (state_ != SyncState::Idle) {
        qCDebug(folioSyncLog) << "zoom ignored while" << state_name(state_);
        return;
    }

    auto flushed = flush();
    if (flushed.is_err()) {
        report_failure("flush before zoom", flushed.unwrap_err());
        return;
    }
    auto refreshed = refresh_from_store();
    if (refreshed.is_err()) {
        report_failure("refresh before zoom", refreshed.unwrap_err());
        return;
    }
    if (!find_section(sections_, heading_id)) {
        qCWarning(folioSyncLog) << "cannot zoom into unknown section" << qstr(heading_id);
        return;
    }

    StateGuard guard(*this, SyncState::ZoomTransition);

    zoomed_id_ = heading_id;
    zoom_mode_ = mode;
    recompute_zoom_range();
    document_ = assemble(visible_blocks());

    if (document_.order.empty()) {
        qCWarning(folioSyncLog) << "zoom into" << qstr(heading_id) << "shows nothing, staying unzoomed";
        zoomed_id_.reset();
        recompute_zoom_range();
        document_ = assemble(visible_blocks());
        return;
    }

    qCDebug(folioSyncLog) << "zoomed into" << qstr(heading_id) << "with" << document_.order.size() << "blocks";
    emit sectionsChanged();
    push_content();

    guard.hand_off();
    ack_task_->schedule(settings_.ack_timeout_ms, [this]() {
        qCDebug(folioSyncLog) << "no content acknowledgement, finishing zoom transition";
        finish_transition();
    });
}

void SyncCoordinator::zoom_out() {
    if (state_ != SyncState::Idle || !zoomed_id_) return;

    auto flushed = flush();
    if (flushed.is_err()) {
        report_failure("flush before zoom out", flushed.unwrap_err());
        return;
    }

    StateGuard guard(*this, SyncState::ZoomTransition);

    zoomed_id_.reset();
    auto rebuilt = rebuild();
    if (rebuilt.is_err()) {
        report_failure("rebuild after zoom out", rebuilt.unwrap_err());
        return;
    }

    guard.hand_off();
    ack_task_->schedule(settings_.ack_timeout_ms, [this]() { finish_transition(); });
}

std::optional<zoom::ZoomRange> SyncCoordinator::edit_range() const {
    if (zoom_range_) return zoom_range_;
    if (!zoomed_id_ || document_.order.empty()) return std::nullopt;

    // Id-based view: span from the first visible block to the block after the last.
    auto sorted = blocks_;
    sort_by_document_order(sorted);
    const auto& first_id = document_.order.front();
    const auto& last_id = document_.order.back();

    zoom::ZoomRange range;
    bool past_last = false;
    for (const auto& b : sorted) {
        if (b.id == first_id) range.start = b.sort_order;
        if (past_last) {
            range.end = b.sort_order;
            break;
        }
        if (b.id == last_id) past_last = true;
    }
    return range;
}

// ============================================================================
// Persistence
// ============================================================================

Result<void, Error> SyncCoordinator::flush() {
    content_task_->cancel();
    reparse_task_->cancel();
    return persist_pending();
}

Result<void, Error> SyncCoordinator::persist_pending() {
    if (!pending_text_) return Result<void, Error>::ok();
    auto text = std::move(*pending_text_);
    pending_text_.reset();
    return persist_text(text);
}

Result<void, Error> SyncCoordinator::persist_text(const std::string& text) {
    auto& store = session_.store();
    const auto& project = session_.project_id();

    auto extracted = anchors::extract(anchors::strip_zoom_notes(text));
    auto parsed = parser::parse(extracted.text, project, extracted.anchors);

    const auto range = edit_range();
    if (!range) {
        auto replaced = store.replace_blocks(std::move(parsed), project);
        if (replaced.is_err()) {
            return replaced;
        }
        return refresh_from_store();
    }

    const size_t count = parsed.size();
    const auto prefix = static_cast<size_t>(std::count_if(
        blocks_.begin(), blocks_.end(), [&](const Block& b) { return b.sort_order < range->start; }));

    auto replaced = store.replace_blocks_in_range(std::move(parsed), project, range->start, range->end);
    if (replaced.is_err()) {
        return replaced;
    }

    auto fetched = store.fetch_blocks(project);
    if (fetched.is_err()) {
        return Result<void, Error>::err(fetched.unwrap_err());
    }
    auto blocks = std::move(fetched).unwrap();
    sort_by_document_order(blocks);

    std::optional<double> start;
    auto root = std::find_if(blocks.begin(), blocks.end(), [&](const Block& b) { return b.id == *zoomed_id_; });
    if (root != blocks.end()) {
        start = root->sort_order;
    } else {
        // The zoom root was deleted; the first heading of the new text takes over.
        const size_t end = std::min(prefix + count, blocks.size());
        for (size_t i = prefix; i < end; ++i) {
            if (blocks[i].is_heading()) {
                zoomed_id_ = blocks[i].id;
                start = blocks[i].sort_order;
                break;
            }
        }
    }

    if (!start) {
        qCInfo(folioSyncLog) << "zoomed text has no heading left, leaving zoom";
        zoomed_id_.reset();
        apply_blocks(std::move(blocks));
        return Result<void, Error>::ok();
    }

    auto pinned = zoom::range_after_replace(blocks, *start, count);
    apply_blocks(std::move(blocks), pinned);
    return Result<void, Error>::ok();
}

Result<void, Error> SyncCoordinator::update_section_metadata(const Section& updated) {
    const Section* current = find_section(sections_, updated.id);
    if (!current) {
        return Result<void, Error>::err(Error::missing("no section " + updated.id));
    }
    auto& store = session_.store();

    if (updated.status != current->status) {
        auto r = store.update_block_status(updated.id, updated.status);
        if (r.is_err()) return r;
    }
    if (updated.word_goal != current->word_goal) {
        auto r = store.update_block_word_goal(updated.id, updated.word_goal);
        if (r.is_err()) return r;
    }
    if (updated.goal_type != current->goal_type) {
        auto r = store.update_block_goal_type(updated.id, updated.goal_type);
        if (r.is_err()) return r;
    }
    if (updated.tags != current->tags) {
        auto r = store.update_block_tags(updated.id, updated.tags);
        if (r.is_err()) return r;
    }
    return refresh_from_store();
}

// ============================================================================
// View state
// ============================================================================

Result<void, Error> SyncCoordinator::refresh_from_store() {
    auto fetched = session_.store().fetch_blocks(session_.project_id());
    if (fetched.is_err()) {
        return Result<void, Error>::err(fetched.unwrap_err());
    }
    apply_blocks(std::move(fetched).unwrap());
    return Result<void, Error>::ok();
}

Result<void, Error> SyncCoordinator::rebuild() {
    auto refreshed = refresh_from_store();
    if (refreshed.is_err()) {
        return refreshed;
    }
    push_content();
    return Result<void, Error>::ok();
}

void SyncCoordinator::apply_blocks(std::vector<Block> blocks, std::optional<zoom::ZoomRange> pinned) {
    blocks_ = std::move(blocks);
    sections_ = sections_from_blocks(blocks_);
    if (pinned && zoomed_id_) {
        zoom_range_ = pinned;
        zoomed_ids_ = zoom::descendant_ids(sections_, *zoomed_id_, zoom_mode_);
    } else {
        recompute_zoom_range();
    }
    document_ = assemble(visible_blocks());
    emit sectionsChanged();
}

void SyncCoordinator::recompute_zoom_range() {
    zoom_range_.reset();
    zoomed_ids_.clear();
    if (!zoomed_id_) return;

    if (!find_section(sections_, *zoomed_id_)) {
        qCInfo(folioSyncLog) << "zoomed section" << qstr(*zoomed_id_) << "is gone, leaving zoom";
        zoomed_id_.reset();
        return;
    }
    zoomed_ids_ = zoom::descendant_ids(sections_, *zoomed_id_, zoom_mode_);
    zoom_range_ = zoom::compute_zoom_range(blocks_, *zoomed_id_, zoom_mode_);
}

std::vector<Block> SyncCoordinator::visible_blocks() const {
    if (zoom_range_) return zoom::filter_by_range(blocks_, *zoom_range_);
    if (zoomed_id_) return zoom::filter_by_ids(blocks_, zoomed_ids_);
    return blocks_;
}

void SyncCoordinator::push_content() {
    if (mode_ == EditorMode::Structured) {
        last_structured_text_ = document_.text;
        structured_.set_content(document_.text);
        structured_.set_block_ids(document_.order);
    } else {
        auto text = anchors::inject(document_.text, anchor_targets(sections_, document_));
        last_source_text_ = text;
        source_.set_content(text);
    }
    emit contentRebuilt();
}

std::optional<size_t> SyncCoordinator::scroll_offset_of(const BlockId& id) const {
    return document_.offset_of(id);
}

void SyncCoordinator::apply_theme(const std::string& theme) {
    structured_.set_theme(theme);
    source_.set_theme(theme);
}

// ============================================================================
// Helpers
// ============================================================================

void SyncCoordinator::set_state(SyncState state) {
    if (state == state_) return;
    qCDebug(folioSyncLog) << "state" << state_name(state_) << "->" << state_name(state);
    state_ = state;
    emit stateChanged();
}

EditorSurface& SyncCoordinator::active_surface() {
    if (mode_ == EditorMode::Source) return source_;
    return structured_;
}

SurfaceKind SyncCoordinator::active_kind() const {
    return mode_ == EditorMode::Source ? SurfaceKind::Source : SurfaceKind::Structured;
}

void SyncCoordinator::report_failure(const char* operation, const Error& error) {
    qCWarning(folioSyncLog) << operation << "failed:" << qstr(error.message);
    emit storeWriteFailed(qstr(error.message));
}

void SyncCoordinator::finish_transition() {
    if (!alive_) return;
    set_state(SyncState::Idle);
}

} // namespace folio::sync
