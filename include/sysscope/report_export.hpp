#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVector>

namespace sysscope {

struct ReportSection {
    QString label;
    QString text;
};

// system_info_YYYYMMDD_HHMMSS.txt
QString exportFileName(const QDateTime& when);

// One section per entry: blank line, '=' rule, upper-cased label, rule,
// blank line, text, newline.
QString formatReport(const QVector<ReportSection>& sections);

// Writes the formatted report and returns the path written. Throws
// std::runtime_error carrying the file error text.
QString writeReport(const QString& path, const QVector<ReportSection>& sections);

// Splits a formatted report back into sections, in file order. Only rules
// enclosing one of `labels` (upper-cased) start a section.
QVector<ReportSection> parseReport(const QString& contents, const QStringList& labels);

} // namespace sysscope
