#include "core/reorder.hpp"
#include "core/content_assembler.hpp"
#include "core/markdown.hpp"

#include <algorithm>

namespace folio::reorder {

namespace {

void set_level(Section& s, int level) {
    s.header_level = level;
    s.markdown = markdown::with_heading_level(s.markdown, level);
}

size_t insertion_index(const SectionList& sections, const std::optional<BlockId>& target_id) {
    if (!target_id) return 0;
    auto idx = index_of(sections, *target_id);
    return idx ? std::min(*idx + 1, sections.size()) : sections.size();
}

} // anonymous namespace

Result<void, Error> validate(const ReorderRequest& request) {
    if (request.new_parent_id && *request.new_parent_id == request.section_id) {
        return Result<void, Error>::err(Error::invalid("section cannot be its own parent"));
    }
    if (request.target_section_id && *request.target_section_id == request.section_id) {
        return Result<void, Error>::err(Error::invalid("section dropped onto itself"));
    }
    return Result<void, Error>::ok();
}

std::vector<BlockId> promote_orphaned_children(SectionList& sections,
                                               size_t from_index,
                                               const std::optional<BlockId>& target_id) {
    std::vector<BlockId> promoted;
    if (from_index >= sections.size()) return promoted;

    const BlockId moved_id = sections[from_index].id;
    const int original_level = sections[from_index].header_level;

    // Index the moved section will occupy once removed and reinserted.
    size_t parent_final = 0;
    if (target_id) {
        auto target_index = index_of(sections, *target_id);
        if (target_index) {
            size_t t = *target_index > from_index ? *target_index - 1 : *target_index;
            parent_final = t + 1;
        } else {
            parent_final = sections.size() - 1;
        }
    }

    for (size_t i = 0; i < sections.size(); ++i) {
        auto& child = sections[i];
        if (!child.parent_id || *child.parent_id != moved_id) continue;

        size_t child_final = i > from_index ? i - 1 : i;
        if (child_final < parent_final) {
            set_level(child, original_level);
            promoted.push_back(child.id);
        }
    }
    return promoted;
}

Result<SectionList, Error> move_single(SectionList sections,
                                       const ReorderRequest& request,
                                       std::vector<BlockId>* promoted) {
    auto valid = validate(request);
    if (valid.is_err()) {
        return Result<SectionList, Error>::err(valid.unwrap_err());
    }

    auto from = index_of(sections, request.section_id);
    if (!from) {
        return Result<SectionList, Error>::err(Error::invalid("unknown section " + request.section_id));
    }
    if (request.target_section_id && !index_of(sections, *request.target_section_id)) {
        return Result<SectionList, Error>::err(
            Error::missing("drop target vanished: " + *request.target_section_id));
    }

    auto ids = promote_orphaned_children(sections, *from, request.target_section_id);
    if (promoted) *promoted = std::move(ids);

    // Promotion does not reorder, but the list is re-searched rather than
    // trusting the earlier index.
    auto current = index_of(sections, request.section_id);
    if (!current) {
        return Result<SectionList, Error>::err(
            Error::missing("moved section vanished: " + request.section_id));
    }

    Section moved = std::move(sections[*current]);
    sections.erase(sections.begin() + static_cast<std::ptrdiff_t>(*current));

    if (request.new_level > 0 && request.new_level != moved.header_level) {
        set_level(moved, request.new_level);
    }
    moved.parent_id = request.new_parent_id;

    auto at = insertion_index(sections, request.target_section_id);
    sections.insert(sections.begin() + static_cast<std::ptrdiff_t>(at), std::move(moved));
    return Result<SectionList, Error>::ok(std::move(sections));
}

Result<SectionList, Error> move_subtree(SectionList sections, const ReorderRequest& request) {
    auto valid = validate(request);
    if (valid.is_err()) {
        return Result<SectionList, Error>::err(valid.unwrap_err());
    }

    auto root = index_of(sections, request.section_id);
    if (!root) {
        return Result<SectionList, Error>::err(Error::invalid("unknown section " + request.section_id));
    }
    if (request.target_section_id) {
        const auto& target = *request.target_section_id;
        if (std::find(request.child_ids.begin(), request.child_ids.end(), target) !=
            request.child_ids.end()) {
            return Result<SectionList, Error>::err(Error::invalid("subtree dropped into itself"));
        }
        if (!index_of(sections, target)) {
            return Result<SectionList, Error>::err(Error::missing("drop target vanished: " + target));
        }
    }

    const int delta = request.new_level > 0 ? request.new_level - sections[*root].header_level : 0;

    std::vector<size_t> indices{*root};
    for (const auto& id : request.child_ids) {
        if (auto idx = index_of(sections, id); idx && *idx != *root) {
            indices.push_back(*idx);
        }
    }
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    // Extract highest index first so earlier indices stay valid.
    SectionList members(indices.size());
    for (size_t k = indices.size(); k-- > 0;) {
        members[k] = std::move(sections[indices[k]]);
        sections.erase(sections.begin() + static_cast<std::ptrdiff_t>(indices[k]));
    }

    for (auto& m : members) {
        if (delta != 0) {
            set_level(m, std::max(1, m.header_level + delta));
        }
        if (m.id == request.section_id) {
            m.parent_id = request.new_parent_id;
        }
    }

    auto at = insertion_index(sections, request.target_section_id);
    sections.insert(sections.begin() + static_cast<std::ptrdiff_t>(at),
                    std::make_move_iterator(members.begin()),
                    std::make_move_iterator(members.end()));
    return Result<SectionList, Error>::ok(std::move(sections));
}

void renumber(SectionList& sections) {
    size_t offset = 0;
    for (size_t i = 0; i < sections.size(); ++i) {
        if (i > 0) offset += kBlockSeparator.size();
        sections[i].sort_order = static_cast<double>(i);
        sections[i].start_offset = offset;
        offset += sections[i].markdown.size();
    }
    hierarchy::recalculate_parents(sections);
}

ReorderPlan finalize(SectionList sections) {
    renumber(sections);
    auto enforced = hierarchy::enforce(std::move(sections));

    ReorderPlan plan;
    plan.sections = std::move(enforced.sections);
    plan.enforcement_passes = enforced.passes;
    plan.converged = enforced.converged;
    if (enforced.changed) {
        hierarchy::recalculate_parents(plan.sections);
    }
    return plan;
}

Result<ReorderPlan, Error> plan_reorder(SectionList sections, const ReorderRequest& request) {
    std::vector<BlockId> promoted;
    auto moved = request.is_subtree_drag && !request.child_ids.empty()
        ? move_subtree(std::move(sections), request)
        : move_single(std::move(sections), request, &promoted);
    if (moved.is_err()) {
        return Result<ReorderPlan, Error>::err(moved.unwrap_err());
    }

    auto plan = finalize(std::move(moved).unwrap());
    plan.promoted_ids = std::move(promoted);
    return Result<ReorderPlan, Error>::ok(std::move(plan));
}

} // namespace folio::reorder
