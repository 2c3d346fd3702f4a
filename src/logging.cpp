#include "sysscope/logging.hpp"

#include "sysscope/config.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <cstdio>
#include <mutex>

Q_LOGGING_CATEGORY(lcScan, "sysscope.scan", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCollect, "sysscope.collect", QtInfoMsg)
Q_LOGGING_CATEGORY(lcProcess, "sysscope.process", QtInfoMsg)
Q_LOGGING_CATEGORY(lcExport, "sysscope.export", QtInfoMsg)

namespace sysscope::logging {
namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
QString g_logFile;

QString levelToString(QtMsgType type) {
    switch (type) {
    case QtDebugMsg:
        return QStringLiteral("DEBUG");
    case QtInfoMsg:
        return QStringLiteral("INFO");
    case QtWarningMsg:
        return QStringLiteral("WARN");
    case QtCriticalMsg:
        return QStringLiteral("ERROR");
    case QtFatalMsg:
        return QStringLiteral("FATAL");
    }
    return QStringLiteral("INFO");
}

void rotateIfNeeded(const QString& path) {
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeLine(const QString& path, const QString& line) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return;
    }
    file.write(line.toUtf8());
    file.write("\n");
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& message) {
    const QString line = QStringLiteral("%1 %2 %3: %4")
                             .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs),
                                  levelToString(type),
                                  QString::fromUtf8(context.category ? context.category : "default"),
                                  message);

    std::lock_guard<std::mutex> lock(g_logMutex);
    std::fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
    std::fflush(stderr);
    if (!g_logFile.isEmpty()) {
        writeLine(g_logFile, line);
    }
}

} // namespace

void initLogging(const Config& config) {
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        g_logFile = QString::fromStdString(config.logFile);
    }

    if (config.debugLogging) {
        QLoggingCategory::setFilterRules(QStringLiteral("sysscope.*.debug=true"));
    }
    qInstallMessageHandler(messageHandler);
}

QString logFilePath() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_logFile;
}

} // namespace sysscope::logging
