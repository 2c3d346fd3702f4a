#include "sysscope/report_export.hpp"

#include "sysscope/logging.hpp"

#include <QFile>
#include <QTextStream>

#include <stdexcept>

namespace sysscope {
namespace {

const QString kRule = QString(60, QLatin1Char('='));

} // namespace

QString exportFileName(const QDateTime& when) {
    return QStringLiteral("system_info_%1.txt").arg(when.toString(QStringLiteral("yyyyMMdd_HHmmss")));
}

QString formatReport(const QVector<ReportSection>& sections) {
    QString out;
    for (const auto& section : sections) {
        out += QLatin1Char('\n') + kRule + QLatin1Char('\n');
        out += section.label.toUpper() + QLatin1Char('\n');
        out += kRule + QStringLiteral("\n\n");
        out += section.text + QLatin1Char('\n');
    }
    return out;
}

QString writeReport(const QString& path, const QVector<ReportSection>& sections) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        throw std::runtime_error(file.errorString().toStdString());
    }

    const QByteArray data = formatReport(sections).toUtf8();
    if (file.write(data) != data.size()) {
        throw std::runtime_error(file.errorString().toStdString());
    }
    file.close();
    if (file.error() != QFileDevice::NoError) {
        throw std::runtime_error(file.errorString().toStdString());
    }

    qCInfo(lcExport) << "wrote" << sections.size() << "sections to" << path;
    return path;
}

QVector<ReportSection> parseReport(const QString& contents, const QStringList& labels) {
    QStringList upper;
    for (const auto& label : labels) {
        upper << label.toUpper();
    }

    const QStringList lines = contents.split(QLatin1Char('\n'));
    QVector<ReportSection> sections;
    QStringList body;

    auto flush = [&]() {
        if (sections.isEmpty()) {
            return;
        }
        // Drop the newline the writer appends after each text.
        if (!body.isEmpty() && body.last().isEmpty()) {
            body.removeLast();
        }
        sections.last().text = body.join(QLatin1Char('\n'));
        body.clear();
    };

    int i = 0;
    while (i < lines.size()) {
        const bool header = i + 3 < lines.size() && lines[i] == kRule && lines[i + 2] == kRule
                            && lines[i + 3].isEmpty() && upper.contains(lines[i + 1]);
        if (header) {
            flush();
            const int index = upper.indexOf(lines[i + 1]);
            sections.push_back({labels[index], QString()});
            i += 4;
            continue;
        }
        if (!sections.isEmpty()) {
            body << lines[i];
        }
        ++i;
    }
    flush();

    return sections;
}

} // namespace sysscope
