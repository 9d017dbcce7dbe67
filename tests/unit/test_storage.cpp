#include <catch2/catch_test_macros.hpp>
#include "core/block_parser.hpp"
#include "core/content_assembler.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/sqlite_block_store.hpp"

using namespace folio;
using namespace folio::storage;

namespace {

const ProjectId kProject = "book";

struct StoreFixture {
    Database db = Database::open_memory().unwrap();
    SqliteBlockStore store{db};

    StoreFixture() {
        REQUIRE(initialize_database(db).is_ok());
    }

    std::vector<Block> load() {
        return store.fetch_blocks(kProject).unwrap();
    }

    std::string text() {
        return assemble(load()).text;
    }

    // Seeds "# A / a body / # B / b body" and returns the blocks as stored.
    std::vector<Block> seed() {
        REQUIRE(store.replace_blocks(parser::parse("# A\n\na body\n\n# B\n\nb body", kProject), kProject).is_ok());
        return load();
    }
};

std::vector<double> orders(const std::vector<Block>& blocks) {
    std::vector<double> out;
    for (const auto& b : blocks) out.push_back(b.sort_order);
    return out;
}

} // namespace

TEST_CASE("Database basic operations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());

    SECTION("Prepare and step") {
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 'Alice'), (2, 'Bob');").is_ok());
        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_text(1) == "Bob");
        REQUIRE_FALSE(stmt.step().unwrap());
    }

    SECTION("Transaction rollback on error") {
        auto result = db.transaction([&]() -> Result<void, Error> {
            auto inserted = db.execute("INSERT INTO test VALUES (3, 'Carol');");
            if (inserted.is_err()) return inserted;
            return Result<void, Error>::err(Error{"forced error"});
        });
        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 0);
    }

    SECTION("Bad SQL reports a store error") {
        auto result = db.execute("SELECT nonsense FROM nowhere;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::StoreIo);
    }
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    SECTION("Fresh database migrates to latest once") {
        REQUIRE(runner.current_version().unwrap() == 0);
        REQUIRE(runner.migrate().unwrap() == MigrationRunner::latest_version());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
        REQUIRE(runner.migrate().unwrap() == 0);
    }

    SECTION("Partial migration resumes") {
        REQUIRE(runner.migrate_to(1).unwrap() == 1);
        REQUIRE(runner.current_version().unwrap() == 1);
        REQUIRE(runner.migrate().unwrap() == MigrationRunner::latest_version() - 1);
    }

    SECTION("A newer schema is refused") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(db.execute("INSERT INTO folio_schema (version, name, applied_at) VALUES (99, 'future', 0);")
                    .is_ok());
        auto result = runner.migrate();
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::StoreIo);
    }
}

TEST_CASE("replace_blocks stores a parsed document", "[storage][blocks]") {
    StoreFixture f;
    auto blocks = f.seed();

    REQUIRE(blocks.size() == 4);
    REQUIRE(orders(blocks) == std::vector<double>{1, 2, 3, 4});
    REQUIRE(blocks[0].heading_level == 1);
    REQUIRE(f.text() == "# A\n\na body\n\n# B\n\nb body");
    REQUIRE(f.store.fetch_blocks("other-project").unwrap().empty());
}

TEST_CASE("replace_blocks keeps heading identity and metadata by title", "[storage][blocks]") {
    StoreFixture f;
    auto before = f.seed();
    const auto b_id = before[2].id;
    REQUIRE(f.store.update_block_status(b_id, SectionStatus::Review).is_ok());
    REQUIRE(f.store.update_block_tags(b_id, {"draft", "needs \"quotes\""}).is_ok());

    REQUIRE(f.store.replace_blocks(parser::parse("# B\n\nnew text\n\n# C", kProject), kProject).is_ok());
    auto after = f.load();

    REQUIRE(after.size() == 3);
    REQUIRE(after[0].id == b_id);
    REQUIRE(after[0].status == SectionStatus::Review);
    REQUIRE(after[0].tags == std::vector<std::string>{"draft", "needs \"quotes\""});
}

TEST_CASE("replace_blocks_in_range shifts later blocks and renumbers", "[storage][blocks]") {
    StoreFixture f;
    auto before = f.seed();
    const auto a_id = before[0].id;
    const auto b_id = before[2].id;

    auto replacement = parser::parse("# A\n\nfirst\n\nsecond", kProject);
    replacement[0].id = a_id;
    REQUIRE(f.store.replace_blocks_in_range(replacement, kProject, 1.0, 3.0).is_ok());

    auto after = f.load();
    REQUIRE(orders(after) == std::vector<double>{1, 2, 3, 4, 5});
    REQUIRE(after[0].id == a_id);
    REQUIRE(after[3].id == b_id);
    REQUIRE(f.text() == "# A\n\nfirst\n\nsecond\n\n# B\n\nb body");
}

TEST_CASE("replace_blocks_in_range leaves bibliography blocks alone", "[storage][blocks]") {
    StoreFixture f;
    REQUIRE(f.store.replace_blocks(parser::parse("# A\n\ntext\n\n# References\n\n[1] Ref.", kProject), kProject)
                .is_ok());

    REQUIRE(f.store.replace_blocks_in_range(parser::parse("# A\n\nrewritten", kProject), kProject, 1.0, std::nullopt)
                .is_ok());
    REQUIRE(f.text() == "# A\n\nrewritten\n\n# References\n\n[1] Ref.");
}

TEST_CASE("reorder_all_blocks moves sections with their bodies", "[storage][blocks]") {
    StoreFixture f;
    f.seed();
    auto sections = sections_from_blocks(f.load());
    REQUIRE(sections.size() == 2);

    SectionList swapped{sections[1], sections[0]};
    swapped[1].header_level = 2;
    swapped[1].markdown = "## A";
    REQUIRE(persist_section_order(f.store, kProject, swapped).is_ok());

    REQUIRE(f.text() == "# B\n\nb body\n\n## A\n\na body");
    auto after = f.load();
    REQUIRE(orders(after) == std::vector<double>{1, 2, 3, 4});
    REQUIRE(after[2].heading_level == 2);

    auto stmt = f.db.prepare("SELECT id, sort_order, header_level FROM sections ORDER BY sort_order;").unwrap();
    REQUIRE(stmt.step().unwrap());
    REQUIRE(stmt.column_text(0) == sections[1].id);
    REQUIRE(stmt.step().unwrap());
    REQUIRE(stmt.column_int(1) == 1);
    REQUIRE(stmt.column_int(2) == 2);
}

TEST_CASE("section metadata updates only touch section roots", "[storage][blocks]") {
    StoreFixture f;
    auto blocks = f.seed();

    REQUIRE(f.store.update_block_word_goal(blocks[0].id, 1500).is_ok());
    REQUIRE(f.store.update_block_goal_type(blocks[0].id, GoalType::Max).is_ok());

    auto stored = f.store.fetch_block(blocks[0].id).unwrap();
    REQUIRE(stored.has_value());
    REQUIRE(stored->word_goal == 1500);
    REQUIRE(stored->goal_type == GoalType::Max);

    auto on_body = f.store.update_block_status(blocks[1].id, SectionStatus::Final);
    REQUIRE(on_body.is_err());
    REQUIRE(on_body.unwrap_err().kind == ErrorKind::SectionMissing);
}

TEST_CASE("apply_editor_changes maps temporary ids", "[storage][blocks]") {
    StoreFixture f;
    auto blocks = f.seed();

    BlockChanges changes;
    changes.updates.push_back(BlockUpdate{.id = blocks[1].id, .markdown_fragment = "## a body"});
    changes.inserts.push_back(BlockInsert{.temp_id = "tmp-1", .markdown_fragment = "inserted",
                                          .after_block_id = blocks[0].id});
    changes.deletes.push_back(blocks[3].id);

    auto mapping = f.store.apply_editor_changes(changes, kProject).unwrap();
    REQUIRE(mapping.count("tmp-1") == 1);

    auto after = f.load();
    REQUIRE(after.size() == 4);
    REQUIRE(after[1].id == mapping["tmp-1"]);
    REQUIRE(after[2].id == blocks[1].id);
    REQUIRE(after[2].type == BlockType::Heading);
    REQUIRE(after[2].heading_level == 2);
    REQUIRE(f.text() == "# A\n\ninserted\n\n## a body\n\n# B");
}

TEST_CASE("apply_editor_changes chains inserts through temporary ids", "[storage][blocks]") {
    StoreFixture f;
    auto blocks = f.seed();

    BlockChanges changes;
    changes.updates.push_back(BlockUpdate{.id = blocks[1].id, .markdown_fragment = "a body edited"});
    changes.inserts.push_back(BlockInsert{.temp_id = "tmp-1", .markdown_fragment = "first new",
                                          .after_block_id = blocks[1].id});
    changes.inserts.push_back(BlockInsert{.temp_id = "tmp-2", .markdown_fragment = "second new",
                                          .after_block_id = "tmp-1"});
    changes.inserts.push_back(BlockInsert{.temp_id = "tmp-3", .markdown_fragment = "tail",
                                          .after_block_id = "tmp-unknown"});

    auto applied = f.store.apply_editor_changes(changes, kProject);
    REQUIRE(applied.is_ok());
    auto mapping = applied.unwrap();
    REQUIRE(mapping.size() == 3);

    REQUIRE(f.text() == "# A\n\na body edited\n\nfirst new\n\nsecond new\n\n# B\n\nb body\n\ntail");
    auto after = f.load();
    REQUIRE(after[2].id == mapping["tmp-1"]);
    REQUIRE(after[3].id == mapping["tmp-2"]);
    REQUIRE(after[6].id == mapping["tmp-3"]);
}

TEST_CASE("move_block places a block between its new neighbours", "[storage][blocks]") {
    StoreFixture f;
    auto blocks = f.seed();

    REQUIRE(f.store.move_block(blocks[3].id, blocks[0].id).is_ok());
    REQUIRE(f.text() == "# A\n\nb body\n\na body\n\n# B");

    REQUIRE(f.store.move_block(blocks[2].id, std::nullopt).is_ok());
    REQUIRE(f.text() == "# B\n\n# A\n\nb body\n\na body");

    REQUIRE(f.store.move_block(blocks[0].id, blocks[0].id).is_err());
    REQUIRE(f.store.move_block("missing", std::nullopt).unwrap_err().kind == ErrorKind::SectionMissing);
}

TEST_CASE("repeated midpoint moves renumber when the gap runs out", "[storage][blocks]") {
    StoreFixture f;
    auto blocks = f.seed();

    // Alternate two blocks into the same gap until it is exhausted.
    for (int i = 0; i < 80; ++i) {
        const auto& mover = i % 2 == 0 ? blocks[2] : blocks[3];
        REQUIRE(f.store.move_block(mover.id, blocks[0].id).is_ok());
    }

    auto after = f.load();
    for (size_t i = 1; i < after.size(); ++i) {
        REQUIRE(after[i - 1].sort_order < after[i].sort_order);
    }
    REQUIRE(f.store.normalize_sort_orders(kProject).is_ok());
    REQUIRE(orders(f.load()) == std::vector<double>{1, 2, 3, 4});
}

TEST_CASE("the change listener hears committed writes", "[storage][blocks]") {
    StoreFixture f;
    std::vector<ProjectId> heard;
    f.store.set_change_listener([&](const ProjectId& id) { heard.push_back(id); });

    f.seed();
    REQUIRE(heard == std::vector<ProjectId>{kProject});

    auto failed = f.store.update_block_status("missing", SectionStatus::Next);
    REQUIRE(failed.is_err());
    REQUIRE(heard.size() == 1);
}
