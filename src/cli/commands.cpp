#include "cli/commands.hpp"
#include "cli/outline.hpp"
#include "core/anchor_codec.hpp"
#include "core/block_parser.hpp"
#include "core/content_assembler.hpp"
#include "core/hierarchy.hpp"
#include "core/reorder.hpp"
#include "core/zoom.hpp"
#include "sync/logging.hpp"

#include <QFile>

namespace folio::cli {

namespace {

[[nodiscard]] Result<SectionList> load_sections(storage::BlockStore& store, const ProjectId& project_id) {
    auto fetched = store.fetch_blocks(project_id);
    if (fetched.is_err()) {
        return Result<SectionList>::err(fetched.unwrap_err());
    }
    return Result<SectionList>::ok(sections_from_blocks(std::move(fetched).unwrap()));
}

[[nodiscard]] int changed_levels(const SectionList& before, const SectionList& after) {
    int changed = 0;
    for (const auto& s : after) {
        const auto* old = find_section(before, s.id);
        if (old && old->header_level != s.header_level) ++changed;
    }
    return changed;
}

// finalize + persist; returns the plan that was written.
[[nodiscard]] Result<reorder::ReorderPlan> repair(storage::BlockStore& store,
                                                  const ProjectId& project_id,
                                                  const SectionList& sections) {
    auto plan = reorder::finalize(sections);
    auto persisted = storage::persist_section_order(store, project_id, plan.sections);
    if (persisted.is_err()) {
        return Result<reorder::ReorderPlan>::err(persisted.unwrap_err());
    }
    if (!plan.converged) {
        qCWarning(folioCliLog) << "hierarchy enforcement stopped after" << plan.enforcement_passes << "passes";
    }
    return Result<reorder::ReorderPlan>::ok(std::move(plan));
}

} // anonymous namespace

Result<QString> import_markdown(storage::BlockStore& store,
                                const ProjectId& project_id,
                                const ImportOptions& options) {
    QFile file(options.path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<QString>::err(Error::invalid("cannot read " + options.path.toStdString() + ": " +
                                                   file.errorString().toStdString()));
    }
    const auto text = QString::fromUtf8(file.readAll()).toStdString();

    // Files exported with --anchors keep their block identities.
    auto extracted = anchors::extract(anchors::strip_zoom_notes(text));
    auto blocks = parser::parse(extracted.text, project_id, extracted.anchors);
    const auto block_count = blocks.size();

    auto replaced = store.replace_blocks(std::move(blocks), project_id);
    if (replaced.is_err()) {
        return Result<QString>::err(replaced.unwrap_err());
    }

    auto sections = load_sections(store, project_id);
    if (sections.is_err()) {
        return Result<QString>::err(sections.unwrap_err());
    }
    const auto& list = sections.unwrap();

    QString summary = QStringLiteral("imported %1 blocks, %2 sections").arg(block_count).arg(list.size());
    if (hierarchy::has_violations(list)) {
        auto repaired = repair(store, project_id, list);
        if (repaired.is_err()) {
            return Result<QString>::err(repaired.unwrap_err());
        }
        summary += QStringLiteral(", %1 heading levels repaired")
                       .arg(changed_levels(list, repaired.unwrap().sections));
    }
    qCInfo(folioCliLog) << summary;
    return Result<QString>::ok(summary + QLatin1Char('\n'));
}

Result<QString> export_document(storage::BlockStore& store,
                                const ProjectId& project_id,
                                const ExportOptions& options) {
    auto fetched = store.fetch_blocks(project_id);
    if (fetched.is_err()) {
        return Result<QString>::err(fetched.unwrap_err());
    }
    auto blocks = std::move(fetched).unwrap();
    auto document = assemble(blocks);
    if (document.text.empty()) {
        return Result<QString>::ok(QString());
    }

    std::string text = document.text;
    if (options.with_anchors) {
        // Section offsets come from the same full assembly.
        text = anchors::inject(document.text, sections_from_blocks(std::move(blocks)));
    }
    return Result<QString>::ok(QString::fromStdString(text) + QLatin1Char('\n'));
}

Result<QString> show_outline(storage::BlockStore& store, const ProjectId& project_id, bool include_ids) {
    return load_sections(store, project_id).map([include_ids](const SectionList& sections) {
        return format_outline(sections, OutlineOptions{.include_ids = include_ids});
    });
}

Result<QString> move_section(storage::BlockStore& store,
                             const ProjectId& project_id,
                             const MoveOptions& options) {
    auto loaded = load_sections(store, project_id);
    if (loaded.is_err()) {
        return Result<QString>::err(loaded.unwrap_err());
    }
    const auto& sections = loaded.unwrap();

    reorder::ReorderRequest request;
    request.section_id = options.section_id.toStdString();
    if (!options.after_id.isEmpty()) {
        request.target_section_id = options.after_id.toStdString();
    }
    request.new_level = options.level;

    if (!find_section(sections, request.section_id)) {
        return Result<QString>::err(Error::missing("no section " + request.section_id));
    }
    if (options.subtree) {
        const auto members = zoom::descendant_ids(sections, request.section_id);
        request.is_subtree_drag = true;
        for (const auto& s : sections) {
            if (s.id != request.section_id && members.count(s.id) > 0) {
                request.child_ids.push_back(s.id);
            }
        }
    }

    auto planned = reorder::plan_reorder(sections, request);
    if (planned.is_err()) {
        return Result<QString>::err(planned.unwrap_err());
    }
    const auto& plan = planned.unwrap();

    auto persisted = storage::persist_section_order(store, project_id, plan.sections);
    if (persisted.is_err()) {
        return Result<QString>::err(persisted.unwrap_err());
    }
    if (!plan.converged) {
        qCWarning(folioCliLog) << "hierarchy enforcement stopped after" << plan.enforcement_passes << "passes";
    }
    qCInfo(folioCliLog) << "moved" << options.section_id << "with" << request.child_ids.size() << "descendants";

    return show_outline(store, project_id);
}

Result<QString> show_zoomed(storage::BlockStore& store,
                            const ProjectId& project_id,
                            const ZoomOptions& options) {
    auto fetched = store.fetch_blocks(project_id);
    if (fetched.is_err()) {
        return Result<QString>::err(fetched.unwrap_err());
    }
    const auto blocks = std::move(fetched).unwrap();
    const auto id = options.section_id.toStdString();
    const auto mode = options.shallow ? zoom::ZoomMode::Shallow : zoom::ZoomMode::Full;

    std::vector<Block> visible;
    if (auto range = zoom::compute_zoom_range(blocks, id, mode)) {
        visible = zoom::filter_by_range(blocks, *range);
    } else {
        const auto sections = sections_from_blocks(blocks);
        if (!find_section(sections, id)) {
            return Result<QString>::err(Error::missing("no section " + id));
        }
        visible = zoom::filter_by_ids(blocks, zoom::descendant_ids(sections, id, mode));
    }

    auto document = assemble(std::move(visible));
    return Result<QString>::ok(QString::fromStdString(document.text) + QLatin1Char('\n'));
}

Result<CheckReport> check_hierarchy(storage::BlockStore& store, const ProjectId& project_id) {
    auto loaded = load_sections(store, project_id);
    if (loaded.is_err()) {
        return Result<CheckReport>::err(loaded.unwrap_err());
    }
    const auto& sections = loaded.unwrap();
    const auto problems = describe_violations(sections);

    CheckReport report;
    report.violations = static_cast<int>(problems.size());
    if (problems.isEmpty()) {
        report.text = QStringLiteral("%1 sections, no level violations\n").arg(sections.size());
    } else {
        report.text = problems.join(QLatin1Char('\n')) + QLatin1Char('\n');
    }
    return Result<CheckReport>::ok(std::move(report));
}

Result<QString> enforce_hierarchy(storage::BlockStore& store, const ProjectId& project_id) {
    auto loaded = load_sections(store, project_id);
    if (loaded.is_err()) {
        return Result<QString>::err(loaded.unwrap_err());
    }
    const auto& sections = loaded.unwrap();
    if (!hierarchy::has_violations(sections)) {
        return Result<QString>::ok(QStringLiteral("nothing to fix\n"));
    }

    auto repaired = repair(store, project_id, sections);
    if (repaired.is_err()) {
        return Result<QString>::err(repaired.unwrap_err());
    }
    const auto& plan = repaired.unwrap();
    return Result<QString>::ok(QStringLiteral("fixed %1 heading levels in %2 passes\n")
                                   .arg(changed_levels(sections, plan.sections))
                                   .arg(plan.enforcement_passes));
}

} // namespace folio::cli
