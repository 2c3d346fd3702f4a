#pragma once

#include <QLoggingCategory>
#include <QString>

namespace sysscope {

struct Config;

namespace logging {

// Installs the process-wide message handler. Call early in main().
void initLogging(const Config& config);

QString logFilePath();

} // namespace logging
} // namespace sysscope

Q_DECLARE_LOGGING_CATEGORY(lcScan)
Q_DECLARE_LOGGING_CATEGORY(lcCollect)
Q_DECLARE_LOGGING_CATEGORY(lcProcess)
Q_DECLARE_LOGGING_CATEGORY(lcExport)
