#include "core/hierarchy.hpp"
#include "core/markdown.hpp"

namespace folio::hierarchy {

namespace {

// One left-to-right pass. Returns true if any level changed.
bool enforce_pass(const SectionList& input, SectionList& output) {
    output.clear();
    output.reserve(input.size());
    bool changed = false;

    for (size_t i = 0; i < input.size(); ++i) {
        Section s = input[i];
        int required = s.header_level;

        if (s.is_pseudo_section) {
            required = i == 0 ? 1 : output[i - 1].header_level;
        } else if (i == 0) {
            required = 1;
        } else {
            int cap = output[i - 1].header_level + 1;
            if (required > cap) required = cap;
        }

        if (required != s.header_level) {
            s.header_level = required;
            s.markdown = markdown::with_heading_level(s.markdown, required);
            changed = true;
        }
        output.push_back(std::move(s));
    }
    return changed;
}

} // anonymous namespace

EnforcementResult enforce(SectionList sections) {
    EnforcementResult result;
    const int bound = max_passes_for(sections.size());

    SectionList next;
    result.converged = false;
    while (result.passes < bound) {
        ++result.passes;
        bool changed = enforce_pass(sections, next);
        sections.swap(next);
        if (!changed) {
            result.converged = true;
            break;
        }
        result.changed = true;
    }

    result.sections = std::move(sections);
    return result;
}

bool has_violations(const SectionList& sections) noexcept {
    int previous = 0;
    for (size_t i = 0; i < sections.size(); ++i) {
        const auto& s = sections[i];
        if (s.is_pseudo_section) {
            int expected = i == 0 ? 1 : previous;
            if (s.header_level != expected) return true;
        } else if (i == 0) {
            if (s.header_level != 1) return true;
        } else if (s.header_level > previous + 1) {
            return true;
        }
        previous = s.header_level;
    }
    return false;
}

std::optional<BlockId> find_parent_by_level(const SectionList& sections, size_t index) {
    if (index >= sections.size()) return std::nullopt;
    int level = sections[index].header_level;
    if (level <= 1) return std::nullopt;

    for (size_t j = index; j-- > 0;) {
        if (sections[j].header_level < level) return sections[j].id;
    }
    return std::nullopt;
}

void recalculate_parents(SectionList& sections) {
    for (size_t i = 0; i < sections.size(); ++i) {
        sections[i].parent_id = find_parent_by_level(sections, i);
    }
}

} // namespace folio::hierarchy
