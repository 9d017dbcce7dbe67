#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "cli/commands.hpp"
#include "sync/logging.hpp"
#include "sync/session.hpp"
#include "sync/settings.hpp"

namespace {

int fail(const folio::Error& error) {
    qCCritical(folioCliLog) << error.message.c_str();
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return 1;
}

int usage(const QCommandLineParser& parser, const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n') << parser.helpText();
    return 2;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("Folio");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Folio");
    app.setOrganizationDomain("folio.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Folio document outline tool"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets FOLIO_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption projectOption(
        QStringList{QStringLiteral("project")},
        QStringLiteral("Project to operate on."),
        QStringLiteral("id"),
        QStringLiteral("default"));
    parser.addOption(projectOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets FOLIO_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    const QCommandLineOption anchorsOption(
        QStringList{QStringLiteral("anchors")},
        QStringLiteral("Export with section identity anchors."));
    parser.addOption(anchorsOption);

    const QCommandLineOption includeIdsOption(
        QStringList{QStringLiteral("ids")},
        QStringLiteral("Include section IDs in outline output."));
    parser.addOption(includeIdsOption);

    const QCommandLineOption afterOption(
        QStringList{QStringLiteral("after")},
        QStringLiteral("Section to place the moved section after (default: start)."),
        QStringLiteral("id"));
    parser.addOption(afterOption);

    const QCommandLineOption levelOption(
        QStringList{QStringLiteral("level")},
        QStringLiteral("New heading level for the moved section."),
        QStringLiteral("n"));
    parser.addOption(levelOption);

    const QCommandLineOption subtreeOption(
        QStringList{QStringLiteral("subtree")},
        QStringLiteral("Move the section together with its descendants."));
    parser.addOption(subtreeOption);

    const QCommandLineOption shallowOption(
        QStringList{QStringLiteral("shallow")},
        QStringLiteral("Zoom into the section body only, without subsections."));
    parser.addOption(shallowOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("import FILE | export | outline | move ID | zoom ID | check | enforce"));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("FOLIO_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("FOLIO_DEBUG_SYNC", "1");
    }

    folio::sync::install_file_logging();
    if (folio::sync::sync_debug_requested()) {
        folio::sync::enable_sync_debug_logging();
        qCInfo(folioCliLog) << "sync debug enabled";
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usage(parser, QStringLiteral("missing command"));
    }
    const auto command = positional.first();
    const auto argument = positional.value(1);

    const auto db_path = folio::sync::resolve_database_path();
    qCInfo(folioCliLog) << "database" << db_path << "command" << command;

    auto opened = folio::sync::DocumentSession::open(db_path.toStdString(),
                                                     parser.value(projectOption).toStdString());
    if (opened.is_err()) {
        return fail(opened.unwrap_err());
    }
    auto session = std::move(opened).unwrap();
    auto& store = session->store();
    const auto& project = session->project_id();

    folio::Result<QString> output = folio::Result<QString>::ok(QString());

    if (command == QStringLiteral("import")) {
        if (argument.isEmpty()) return usage(parser, QStringLiteral("import needs a FILE"));
        output = folio::cli::import_markdown(store, project, folio::cli::ImportOptions{.path = argument});
    } else if (command == QStringLiteral("export")) {
        output = folio::cli::export_document(
            store, project, folio::cli::ExportOptions{.with_anchors = parser.isSet(anchorsOption)});
    } else if (command == QStringLiteral("outline")) {
        output = folio::cli::show_outline(store, project, parser.isSet(includeIdsOption));
    } else if (command == QStringLiteral("move")) {
        if (argument.isEmpty()) return usage(parser, QStringLiteral("move needs a section ID"));
        folio::cli::MoveOptions options;
        options.section_id = argument;
        options.after_id = parser.value(afterOption);
        options.subtree = parser.isSet(subtreeOption);
        if (parser.isSet(levelOption)) {
            bool ok = false;
            options.level = parser.value(levelOption).toInt(&ok);
            if (!ok || options.level < 1 || options.level > 6) {
                return usage(parser, QStringLiteral("--level must be between 1 and 6"));
            }
        }
        output = folio::cli::move_section(store, project, options);
    } else if (command == QStringLiteral("zoom")) {
        if (argument.isEmpty()) return usage(parser, QStringLiteral("zoom needs a section ID"));
        output = folio::cli::show_zoomed(
            store, project,
            folio::cli::ZoomOptions{.section_id = argument, .shallow = parser.isSet(shallowOption)});
    } else if (command == QStringLiteral("check")) {
        auto report = folio::cli::check_hierarchy(store, project);
        if (report.is_err()) {
            return fail(report.unwrap_err());
        }
        QTextStream(stdout) << report.unwrap().text;
        return report.unwrap().violations > 0 ? 3 : 0;
    } else if (command == QStringLiteral("enforce")) {
        output = folio::cli::enforce_hierarchy(store, project);
    } else {
        return usage(parser, QStringLiteral("unknown command: ") + command);
    }

    if (output.is_err()) {
        return fail(output.unwrap_err());
    }
    QTextStream(stdout) << output.unwrap();
    return 0;
}
