#include "cli/outline.hpp"

#include <QStringList>

#include <algorithm>

namespace folio::cli {

namespace {

[[nodiscard]] QString display_title(const Section& section) {
    if (section.is_pseudo_section) return QStringLiteral("(section break)");
    if (section.title.empty()) return QStringLiteral("(untitled)");
    return QString::fromStdString(section.title);
}

} // anonymous namespace

QString format_outline(const SectionList& sections, const OutlineOptions& options) {
    QStringList lines;
    lines.reserve(static_cast<qsizetype>(sections.size()));

    for (const auto& s : sections) {
        const auto indent = QString(std::max(0, s.header_level - 1) * 2, QLatin1Char(' '));
        auto line = indent + QStringLiteral("- ") + display_title(s) +
                    QStringLiteral(" [%1]").arg(s.header_level);
        if (s.is_bibliography) line += QStringLiteral(" {bibliography}");
        if (options.include_ids) line += QStringLiteral(" (") + QString::fromStdString(s.id) + QLatin1Char(')');
        lines.append(line);
    }

    if (lines.isEmpty()) return {};
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QStringList describe_violations(const SectionList& sections) {
    QStringList out;
    int previous = 0;
    for (size_t i = 0; i < sections.size(); ++i) {
        const auto& s = sections[i];
        const int level = s.header_level;
        if (i == 0 && level != 1) {
            out.append(QStringLiteral("%1: first section is level %2, expected 1").arg(display_title(s)).arg(level));
        } else if (i > 0 && level > previous + 1) {
            out.append(QStringLiteral("%1: level %2 follows level %3")
                           .arg(display_title(s))
                           .arg(level)
                           .arg(previous));
        }
        previous = level;
    }
    return out;
}

} // namespace folio::cli
