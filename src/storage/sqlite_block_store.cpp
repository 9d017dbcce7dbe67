#include "storage/sqlite_block_store.hpp"
#include "core/markdown.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace folio::storage {

namespace {

constexpr const char* kBlockColumns =
    "id, project_id, parent_id, sort_order, block_type, text_content, markdown_fragment, "
    "heading_level, status, tags, word_goal, goal_type, word_count, is_bibliography, "
    "is_pseudo_section, created_at, updated_at";

constexpr const char* kDocumentOrder =
    " ORDER BY sort_order ASC, CASE block_type WHEN 'heading' THEN 0 ELSE 1 END ASC";

/**
 * Binds consecutive parameters, remembering the first failure.
 */
class Binder {
public:
    explicit Binder(Statement& stmt) : stmt_(stmt) {}

    Binder& text(std::string_view v) { return keep(stmt_.bind_text(next_++, v)); }
    Binder& optional_text(const std::optional<std::string>& v) { return keep(stmt_.bind_optional_text(next_++, v)); }
    Binder& integer(int v) { return keep(stmt_.bind_int(next_++, v)); }
    Binder& optional_integer(std::optional<int> v) { return keep(stmt_.bind_optional_int(next_++, v)); }
    Binder& int64(int64_t v) { return keep(stmt_.bind_int64(next_++, v)); }
    Binder& real(double v) { return keep(stmt_.bind_double(next_++, v)); }

    [[nodiscard]] Result<void, Error> done() const {
        if (error_) return Result<void, Error>::err(*error_);
        return Result<void, Error>::ok();
    }

private:
    Binder& keep(Result<void, Error> r) {
        if (r.is_err() && !error_) error_ = r.unwrap_err();
        return *this;
    }

    Statement& stmt_;
    int next_ = 1;
    std::optional<Error> error_;
};

// Tags are stored as a JSON array of strings.
std::string encode_tags(const std::vector<std::string>& tags) {
    std::ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < tags.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '"';
        for (char c : tags[i]) {
            switch (c) {
                case '"': oss << "\\\""; break;
                case '\\': oss << "\\\\"; break;
                case '\n': oss << "\\n"; break;
                case '\t': oss << "\\t"; break;
                default: oss << c;
            }
        }
        oss << '"';
    }
    oss << ']';
    return oss.str();
}

std::vector<std::string> decode_tags(const std::string& json) {
    std::vector<std::string> tags;
    size_t pos = 0;
    while ((pos = json.find('"', pos)) != std::string::npos) {
        std::string tag;
        ++pos;
        while (pos < json.size() && json[pos] != '"') {
            if (json[pos] == '\\' && pos + 1 < json.size()) {
                ++pos;
                switch (json[pos]) {
                    case 'n': tag += '\n'; break;
                    case 't': tag += '\t'; break;
                    default: tag += json[pos];
                }
            } else {
                tag += json[pos];
            }
            ++pos;
        }
        tags.push_back(std::move(tag));
        ++pos;
    }
    return tags;
}

Block row_to_block(const Statement& stmt) {
    Block b;
    b.id = stmt.column_text(0);
    b.project_id = stmt.column_text(1);
    b.parent_id = stmt.column_optional_text(2);
    b.sort_order = stmt.column_double(3);
    b.type = parse_block_type(stmt.column_text(4)).value_or(BlockType::Paragraph);
    b.text_content = stmt.column_text(5);
    b.markdown_fragment = stmt.column_text(6);
    b.heading_level = stmt.column_optional_int(7);
    if (auto status = stmt.column_optional_text(8)) {
        b.status = parse_status(*status);
    }
    if (auto tags = stmt.column_optional_text(9)) {
        b.tags = decode_tags(*tags);
    }
    b.word_goal = stmt.column_optional_int(10);
    b.goal_type = parse_goal_type(stmt.column_text(11));
    b.word_count = stmt.column_int(12);
    b.is_bibliography = stmt.column_int(13) != 0;
    b.is_pseudo_section = stmt.column_int(14) != 0;
    b.created_at = Timestamp(stmt.column_int64(15));
    b.updated_at = Timestamp(stmt.column_int64(16));
    return b;
}

Result<void, Error> run(Statement& stmt) {
    auto step = stmt.step();
    if (step.is_err()) {
        return Result<void, Error>::err(step.unwrap_err());
    }
    return Result<void, Error>::ok();
}

void carry_metadata(Block& to, const Block& from) {
    to.status = from.status;
    to.tags = from.tags;
    to.word_goal = from.word_goal;
    to.goal_type = from.goal_type;
    to.created_at = from.created_at;
}

/**
 * Keep heading identity across a re-parse. Incoming blocks whose id matches a
 * replaceable block inherit its metadata; unknown headings adopt the id of
 * the first unclaimed replaceable heading with the same title. Ids that
 * belong to blocks which survive the write are replaced with fresh ones.
 */
void adopt_identities(std::vector<Block>& incoming,
                      const std::vector<Block>& replaceable,
                      const std::unordered_set<BlockId>& reserved) {
    std::unordered_set<BlockId> claimed;
    std::unordered_set<BlockId> seen;

    for (auto& b : incoming) {
        if (b.id.empty() || reserved.count(b.id) > 0 || seen.count(b.id) > 0) {
            b.id = generate_block_id();
        }
        seen.insert(b.id);
    }
    for (const auto& b : incoming) {
        claimed.insert(b.id);
    }

    for (auto& b : incoming) {
        auto match = std::find_if(replaceable.begin(), replaceable.end(),
                                  [&](const Block& e) { return e.id == b.id; });
        if (match != replaceable.end()) {
            if (match->is_section_root()) carry_metadata(b, *match);
            continue;
        }
        if (!b.is_heading()) continue;

        auto by_title = std::find_if(replaceable.begin(), replaceable.end(), [&](const Block& e) {
            return e.is_heading() && e.text_content == b.text_content && claimed.count(e.id) == 0;
        });
        if (by_title != replaceable.end()) {
            claimed.erase(b.id);
            b.id = by_title->id;
            claimed.insert(b.id);
            carry_metadata(b, *by_title);
        }
    }
}

} // anonymous namespace

// ============================================================================
// Reads
// ============================================================================

Result<std::vector<Block>, Error> SqliteBlockStore::load_blocks(const ProjectId& project_id) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + kBlockColumns +
                                   " FROM blocks WHERE project_id = ?" + kDocumentOrder + ";");
    if (stmt_result.is_err()) {
        return Result<std::vector<Block>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, project_id);
    if (bound.is_err()) {
        return Result<std::vector<Block>, Error>::err(bound.unwrap_err());
    }

    std::vector<Block> blocks;
    while (true) {
        auto step = stmt.step();
        if (step.is_err()) {
            return Result<std::vector<Block>, Error>::err(step.unwrap_err());
        }
        if (!step.unwrap()) break;
        blocks.push_back(row_to_block(stmt));
    }
    return Result<std::vector<Block>, Error>::ok(std::move(blocks));
}

Result<std::vector<Block>, Error> SqliteBlockStore::fetch_blocks(const ProjectId& project_id) {
    return load_blocks(project_id);
}

Result<std::optional<Block>, Error> SqliteBlockStore::fetch_block(const BlockId& id) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + kBlockColumns + " FROM blocks WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Block>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, id);
    if (bound.is_err()) {
        return Result<std::optional<Block>, Error>::err(bound.unwrap_err());
    }

    auto step = stmt.step();
    if (step.is_err()) {
        return Result<std::optional<Block>, Error>::err(step.unwrap_err());
    }
    if (!step.unwrap()) {
        return Result<std::optional<Block>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Block>, Error>::ok(row_to_block(stmt));
}

// ============================================================================
// Row helpers (no transaction of their own)
// ============================================================================

Result<void, Error> SqliteBlockStore::insert_block(const Block& b) {
    auto stmt_result = db_.prepare(std::string("INSERT INTO blocks (") + kBlockColumns +
                                   ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    std::optional<std::string> status;
    if (b.status) status = std::string(status_name(*b.status));
    std::optional<std::string> tags;
    if (!b.tags.empty()) tags = encode_tags(b.tags);

    auto bound = Binder(stmt)
        .text(b.id)
        .text(b.project_id)
        .optional_text(b.parent_id)
        .real(b.sort_order)
        .text(type_name(b.type))
        .text(b.text_content)
        .text(b.markdown_fragment)
        .optional_integer(b.heading_level)
        .optional_text(status)
        .optional_text(tags)
        .optional_integer(b.word_goal)
        .text(goal_type_name(b.goal_type))
        .integer(b.word_count)
        .integer(b.is_bibliography ? 1 : 0)
        .integer(b.is_pseudo_section ? 1 : 0)
        .int64(b.created_at.millis())
        .int64(b.updated_at.millis())
        .done();
    if (bound.is_err()) {
        return bound;
    }
    return run(stmt);
}

Result<void, Error> SqliteBlockStore::delete_block(const BlockId& id, const ProjectId& project_id) {
    auto stmt_result = db_.prepare("DELETE FROM blocks WHERE id = ? AND project_id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = Binder(stmt).text(id).text(project_id).done();
    if (bound.is_err()) {
        return bound;
    }
    return run(stmt);
}

Result<void, Error> SqliteBlockStore::set_sort_order(const BlockId& id, double sort_order) {
    auto stmt_result = db_.prepare("UPDATE blocks SET sort_order = ?, updated_at = ? WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = Binder(stmt).real(sort_order).int64(Timestamp::now().millis()).text(id).done();
    if (bound.is_err()) {
        return bound;
    }
    return run(stmt);
}

Result<void, Error> SqliteBlockStore::renumber(const ProjectId& project_id) {
    auto blocks = load_blocks(project_id);
    if (blocks.is_err()) {
        return Result<void, Error>::err(blocks.unwrap_err());
    }
    const auto& ordered = blocks.unwrap();
    for (size_t i = 0; i < ordered.size(); ++i) {
        const double target = static_cast<double>(i + 1);
        if (ordered[i].sort_order == target) continue;
        auto r = set_sort_order(ordered[i].id, target);
        if (r.is_err()) {
            return r;
        }
    }
    return Result<void, Error>::ok();
}

Result<double, Error> SqliteBlockStore::sort_order_after(const ProjectId& project_id,
                                                         const std::optional<BlockId>& after_id,
                                                         const std::optional<BlockId>& exclude_id) {
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto loaded = load_blocks(project_id);
        if (loaded.is_err()) {
            return Result<double, Error>::err(loaded.unwrap_err());
        }
        auto blocks = std::move(loaded).unwrap();
        if (exclude_id) {
            std::erase_if(blocks, [&](const Block& b) { return b.id == *exclude_id; });
        }

        double lo = 0.0;
        std::optional<double> hi;
        if (!after_id) {
            if (blocks.empty()) return Result<double, Error>::ok(1.0);
            hi = blocks.front().sort_order;
            lo = *hi - 1.0;
        } else {
            auto it = std::find_if(blocks.begin(), blocks.end(),
                                   [&](const Block& b) { return b.id == *after_id; });
            if (it == blocks.end()) {
                return Result<double, Error>::err(Error::missing("unknown block " + *after_id));
            }
            lo = it->sort_order;
            if (std::next(it) != blocks.end()) hi = std::next(it)->sort_order;
        }

        if (!hi) return Result<double, Error>::ok(lo + 1.0);
        if (*hi - lo >= kMinSortGap) return Result<double, Error>::ok(lo + (*hi - lo) / 2.0);

        auto renumbered = renumber(project_id);
        if (renumbered.is_err()) {
            return Result<double, Error>::err(renumbered.unwrap_err());
        }
    }
    return Result<double, Error>::err(Error::store("sort order space exhausted"));
}

// ============================================================================
// Writes
// ============================================================================

Result<void, Error> SqliteBlockStore::replace_blocks(std::vector<Block> blocks, const ProjectId& project_id) {
    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto existing = load_blocks(project_id);
        if (existing.is_err()) {
            return Result<void, Error>::err(existing.unwrap_err());
        }
        adopt_identities(blocks, existing.unwrap(), {});

        auto stmt_result = db_.prepare("DELETE FROM blocks WHERE project_id = ?;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto bound = stmt.bind_text(1, project_id);
        if (bound.is_err()) {
            return bound;
        }
        auto deleted = run(stmt);
        if (deleted.is_err()) {
            return deleted;
        }

        for (auto& b : blocks) {
            b.project_id = project_id;
            auto inserted = insert_block(b);
            if (inserted.is_err()) {
                return inserted;
            }
        }
        return Result<void, Error>::ok();
    });

    if (result.is_ok()) notify_changed(project_id);
    return result;
}

Result<void, Error> SqliteBlockStore::replace_blocks_in_range(std::vector<Block> blocks,
                                                              const ProjectId& project_id,
                                                              double start,
                                                              std::optional<double> end) {
    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto loaded = load_blocks(project_id);
        if (loaded.is_err()) {
            return Result<void, Error>::err(loaded.unwrap_err());
        }
        const auto& existing = loaded.unwrap();

        auto in_range = [&](const Block& b) {
            return !b.is_bibliography && b.sort_order >= start && (!end || b.sort_order < *end);
        };

        std::vector<Block> replaceable;
        std::unordered_set<BlockId> reserved;
        for (const auto& b : existing) {
            if (in_range(b)) {
                replaceable.push_back(b);
            } else {
                reserved.insert(b.id);
            }
        }
        adopt_identities(blocks, replaceable, reserved);

        for (const auto& b : replaceable) {
            auto r = delete_block(b.id, project_id);
            if (r.is_err()) {
                return r;
            }
        }

        // Shift everything at or after `end` when the new content needs more room.
        const double needed_end = start + static_cast<double>(blocks.size());
        if (end && needed_end > *end) {
            const double shift = needed_end - *end;
            for (const auto& b : existing) {
                if (in_range(b) || b.sort_order < *end) continue;
                auto r = set_sort_order(b.id, b.sort_order + shift);
                if (r.is_err()) {
                    return r;
                }
            }
        }

        for (size_t i = 0; i < blocks.size(); ++i) {
            blocks[i].project_id = project_id;
            blocks[i].sort_order = start + static_cast<double>(i);
            auto r = insert_block(blocks[i]);
            if (r.is_err()) {
                return r;
            }
        }
        return renumber(project_id);
    });

    if (result.is_ok()) notify_changed(project_id);
    return result;
}

Result<void, Error> SqliteBlockStore::reorder_all_blocks(const SectionList& sections,
                                                         const ProjectId& project_id,
                                                         const HeadingUpdates& heading_updates) {
    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto loaded = load_blocks(project_id);
        if (loaded.is_err()) {
            return Result<void, Error>::err(loaded.unwrap_err());
        }
        const auto& blocks = loaded.unwrap();

        std::unordered_set<BlockId> leaders;
        for (const auto& s : sections) leaders.insert(s.id);

        // Preamble, then one group per leader holding the leader and its body.
        std::vector<const Block*> preamble;
        std::unordered_map<BlockId, std::vector<const Block*>> groups;
        std::vector<const Block*>* current = &preamble;
        for (const auto& b : blocks) {
            if (leaders.count(b.id) > 0) {
                current = &groups[b.id];
            }
            current->push_back(&b);
        }

        std::vector<const Block*> ordered(preamble.begin(), preamble.end());
        for (const auto& s : sections) {
            auto it = groups.find(s.id);
            if (it == groups.end()) continue;
            ordered.insert(ordered.end(), it->second.begin(), it->second.end());
            groups.erase(it);
        }

        auto stmt_result = db_.prepare(
            "UPDATE blocks SET sort_order = ?, markdown_fragment = ?, heading_level = ?, "
            "updated_at = ? WHERE id = ?;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        const auto now = Timestamp::now().millis();

        for (size_t i = 0; i < ordered.size(); ++i) {
            const Block& b = *ordered[i];
            std::string fragment = b.markdown_fragment;
            std::optional<int> level = b.heading_level;
            if (auto u = heading_updates.find(b.id); u != heading_updates.end() && b.is_heading()) {
                fragment = u->second.markdown_fragment;
                level = u->second.heading_level;
            }

            auto reset = stmt.reset();
            if (reset.is_err()) {
                return reset;
            }
            auto bound = Binder(stmt)
                .real(static_cast<double>(i + 1))
                .text(fragment)
                .optional_integer(level)
                .int64(now)
                .text(b.id)
                .done();
            if (bound.is_err()) {
                return bound;
            }
            auto r = run(stmt);
            if (r.is_err()) {
                return r;
            }
        }
        return Result<void, Error>::ok();
    });

    if (result.is_ok()) notify_changed(project_id);
    return result;
}

Result<void, Error> SqliteBlockStore::update_section_metadata(
    const BlockId& id,
    const char* column,
    const std::function<Result<void, Error>(Statement&)>& bind_value) {
    auto stmt_result = db_.prepare(std::string("UPDATE blocks SET ") + column +
                                   " = ?, updated_at = ? WHERE id = ? AND "
                                   "(block_type = 'heading' OR is_pseudo_section = 1);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    auto bound = bind_value(stmt);
    if (bound.is_err()) {
        return bound;
    }
    auto ts = stmt.bind_int64(2, Timestamp::now().millis());
    if (ts.is_err()) {
        return ts;
    }
    auto id_bound = stmt.bind_text(3, id);
    if (id_bound.is_err()) {
        return id_bound;
    }

    auto r = run(stmt);
    if (r.is_err()) {
        return r;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(Error::missing("no section with id " + id));
    }

    auto block = fetch_block(id);
    if (block.is_ok() && block.unwrap()) {
        notify_changed(block.unwrap()->project_id);
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SqliteBlockStore::update_block_status(const BlockId& id,
                                                          std::optional<SectionStatus> status) {
    std::optional<std::string> value;
    if (status) value = std::string(status_name(*status));
    return update_section_metadata(id, "status", [&](Statement& stmt) {
        return stmt.bind_optional_text(1, value);
    });
}

Result<void, Error> SqliteBlockStore::update_block_word_goal(const BlockId& id, std::optional<int> goal) {
    return update_section_metadata(id, "word_goal", [&](Statement& stmt) {
        return stmt.bind_optional_int(1, goal);
    });
}

Result<void, Error> SqliteBlockStore::update_block_goal_type(const BlockId& id, GoalType type) {
    return update_section_metadata(id, "goal_type", [&](Statement& stmt) {
        return stmt.bind_text(1, goal_type_name(type));
    });
}

Result<void, Error> SqliteBlockStore::update_block_tags(const BlockId& id,
                                                        const std::vector<std::string>& tags) {
    std::optional<std::string> value;
    if (!tags.empty()) value = encode_tags(tags);
    return update_section_metadata(id, "tags", [&](Statement& stmt) {
        return stmt.bind_optional_text(1, value);
    });
}

Result<void, Error> SqliteBlockStore::apply_section_changes(const std::vector<SectionChange>& changes,
                                                            const ProjectId& project_id) {
    // The legacy mirror has no listener of its own; blocks are unchanged.
    return db_.transaction([&]() -> Result<void, Error> {
        const auto now = Timestamp::now().millis();

        for (const auto& change : changes) {
            if (change.kind == SectionChange::Kind::Delete) {
                auto stmt_result = db_.prepare("DELETE FROM sections WHERE id = ? AND project_id = ?;");
                if (stmt_result.is_err()) {
                    return Result<void, Error>::err(stmt_result.unwrap_err());
                }
                auto stmt = std::move(stmt_result).unwrap();
                auto bound = Binder(stmt).text(change.id).text(project_id).done();
                if (bound.is_err()) {
                    return bound;
                }
                auto r = run(stmt);
                if (r.is_err()) {
                    return r;
                }
                continue;
            }

            auto seed_result = db_.prepare(
                "INSERT OR IGNORE INTO sections (id, project_id, updated_at) VALUES (?, ?, ?);");
            if (seed_result.is_err()) {
                return Result<void, Error>::err(seed_result.unwrap_err());
            }
            auto seed = std::move(seed_result).unwrap();
            auto seed_bound = Binder(seed).text(change.id).text(project_id).int64(now).done();
            if (seed_bound.is_err()) {
                return seed_bound;
            }
            auto seeded = run(seed);
            if (seeded.is_err()) {
                return seeded;
            }

            const auto& u = change.updates;
            std::string sql = "UPDATE sections SET updated_at = ?";
            if (u.title) sql += ", title = ?";
            if (u.header_level) sql += ", header_level = ?";
            if (u.sort_order) sql += ", sort_order = ?";
            if (u.markdown) sql += ", markdown_content = ?";
            if (u.start_offset) sql += ", start_offset = ?";
            if (u.parent_id) sql += ", parent_id = ?";
            sql += " WHERE id = ?;";

            auto stmt_result = db_.prepare(sql);
            if (stmt_result.is_err()) {
                return Result<void, Error>::err(stmt_result.unwrap_err());
            }
            auto stmt = std::move(stmt_result).unwrap();

            Binder binder(stmt);
            binder.int64(now);
            if (u.title) binder.text(*u.title);
            if (u.header_level) binder.integer(*u.header_level);
            if (u.sort_order) binder.integer(*u.sort_order);
            if (u.markdown) binder.text(*u.markdown);
            if (u.start_offset) binder.int64(static_cast<int64_t>(*u.start_offset));
            if (u.parent_id) binder.optional_text(*u.parent_id);
            binder.text(change.id);
            auto bound = binder.done();
            if (bound.is_err()) {
                return bound;
            }
            auto r = run(stmt);
            if (r.is_err()) {
                return r;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<IdMapping, Error> SqliteBlockStore::apply_editor_changes(const BlockChanges& changes,
                                                                const ProjectId& project_id) {
    IdMapping mapping;
    auto result = db_.transaction([&]() -> Result<void, Error> {
        for (const auto& id : changes.deletes) {
            auto r = delete_block(id, project_id);
            if (r.is_err()) {
                return r;
            }
        }

        for (const auto& update : changes.updates) {
            auto fetched = fetch_block(update.id);
            if (fetched.is_err()) {
                return Result<void, Error>::err(fetched.unwrap_err());
            }
            if (!fetched.unwrap()) continue;  // deleted underneath the editor

            Block b = *fetched.unwrap();
            b.markdown_fragment = update.markdown_fragment;
            b.type = markdown::detect_block_type(b.markdown_fragment);
            b.heading_level = b.type == BlockType::Heading
                ? markdown::heading_level_of(b.markdown_fragment)
                : std::nullopt;
            b.is_pseudo_section = b.type == BlockType::SectionBreak;
            b.text_content = markdown::extract_text_content(b.markdown_fragment, b.type);
            b.word_count = markdown::word_count(b.markdown_fragment);
            b.updated_at = Timestamp::now();

            auto deleted = delete_block(b.id, project_id);
            if (deleted.is_err()) {
                return deleted;
            }
            auto inserted = insert_block(b);
            if (inserted.is_err()) {
                return inserted;
            }
        }

        for (const auto& insert : changes.inserts) {
            // Adjacent new blocks arrive chained through temp ids of this batch.
            std::optional<BlockId> after_id = insert.after_block_id;
            if (after_id) {
                auto mapped = mapping.find(*after_id);
                if (mapped != mapping.end()) after_id = mapped->second;
            }

            double sort_order = 1.0;
            bool placed_after = false;
            if (after_id) {
                auto placed = sort_order_after(project_id, after_id, std::nullopt);
                if (placed.is_ok()) {
                    sort_order = placed.unwrap();
                    placed_after = true;
                } else if (placed.unwrap_err().kind != ErrorKind::SectionMissing) {
                    return Result<void, Error>::err(placed.unwrap_err());
                }
            }
            // An anchor the store does not know appends instead of failing the batch.
            if (!placed_after) {
                auto loaded = load_blocks(project_id);
                if (loaded.is_err()) {
                    return Result<void, Error>::err(loaded.unwrap_err());
                }
                for (const auto& b : loaded.unwrap()) {
                    sort_order = std::max(sort_order, b.sort_order + 1.0);
                }
            }

            Block b;
            b.id = generate_block_id();
            b.project_id = project_id;
            b.sort_order = sort_order;
            b.markdown_fragment = insert.markdown_fragment;
            b.type = markdown::detect_block_type(b.markdown_fragment);
            if (b.type == BlockType::Heading) {
                b.heading_level = markdown::heading_level_of(b.markdown_fragment);
            }
            b.is_pseudo_section = b.type == BlockType::SectionBreak;
            b.text_content = markdown::extract_text_content(b.markdown_fragment, b.type);
            b.word_count = markdown::word_count(b.markdown_fragment);
            b.created_at = Timestamp::now();
            b.updated_at = b.created_at;

            auto inserted = insert_block(b);
            if (inserted.is_err()) {
                return inserted;
            }
            mapping[insert.temp_id] = b.id;
        }
        return Result<void, Error>::ok();
    });

    if (result.is_err()) {
        return Result<IdMapping, Error>::err(result.unwrap_err());
    }
    if (!changes.empty()) notify_changed(project_id);
    return Result<IdMapping, Error>::ok(std::move(mapping));
}

Result<void, Error> SqliteBlockStore::move_block(const BlockId& id, const std::optional<BlockId>& after_id) {
    if (after_id && *after_id == id) {
        return Result<void, Error>::err(Error::invalid("block moved after itself"));
    }

    auto fetched = fetch_block(id);
    if (fetched.is_err()) {
        return Result<void, Error>::err(fetched.unwrap_err());
    }
    if (!fetched.unwrap()) {
        return Result<void, Error>::err(Error::missing("unknown block " + id));
    }
    const auto project_id = fetched.unwrap()->project_id;

    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto placed = sort_order_after(project_id, after_id, id);
        if (placed.is_err()) {
            return Result<void, Error>::err(placed.unwrap_err());
        }
        return set_sort_order(id, placed.unwrap());
    });

    if (result.is_ok()) notify_changed(project_id);
    return result;
}

Result<void, Error> SqliteBlockStore::normalize_sort_orders(const ProjectId& project_id) {
    auto result = db_.transaction([&]() { return renumber(project_id); });
    if (result.is_ok()) notify_changed(project_id);
    return result;
}

} // namespace folio::storage
