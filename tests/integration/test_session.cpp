#include <catch2/catch_test_macros.hpp>
#include "core/block_parser.hpp"
#include "sync/session.hpp"

#include <QTemporaryDir>

using namespace folio;
using namespace folio::sync;

TEST_CASE("DocumentSession opens and reopens a file database", "[integration][session]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("book.db")).toStdString();

    {
        auto opened = DocumentSession::open(path, "novel");
        REQUIRE(opened.is_ok());
        auto session = std::move(opened).unwrap();
        REQUIRE(session->project_id() == "novel");
        REQUIRE(session->store().replace_blocks(parser::parse("# A\n\nbody", "novel"), "novel").is_ok());
    }

    auto reopened = DocumentSession::open(path, "novel");
    REQUIRE(reopened.is_ok());
    auto blocks = reopened.unwrap()->store().fetch_blocks("novel");
    REQUIRE(blocks.is_ok());
    REQUIRE(blocks.unwrap().size() == 2);
}

TEST_CASE("DocumentSession reports a database it cannot open", "[integration][session]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("missing/dir/book.db")).toStdString();

    auto opened = DocumentSession::open(path, "novel");
    REQUIRE(opened.is_err());
    REQUIRE(opened.unwrap_err().kind == ErrorKind::StoreIo);
}
