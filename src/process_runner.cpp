#include "sysscope/process_runner.hpp"

#include "sysscope/logging.hpp"

#include <QProcess>
#include <QStandardPaths>
#include <QStringList>

namespace sysscope {

std::optional<std::string> runTool(const std::string& program,
                                   const std::vector<std::string>& arguments,
                                   int timeoutMs) {
    const QString name = QString::fromStdString(program);
    if (!isToolAvailable(program)) {
        qCDebug(lcProcess) << "tool not found:" << name;
        return std::nullopt;
    }

    QStringList args;
    for (const auto& argument : arguments) {
        args << QString::fromStdString(argument);
    }

    QProcess proc;
    proc.start(name, args, QIODevice::ReadOnly);
    if (!proc.waitForStarted(timeoutMs)) {
        qCDebug(lcProcess) << "failed to start" << name << proc.errorString();
        return std::nullopt;
    }
    if (!proc.waitForFinished(timeoutMs)) {
        qCDebug(lcProcess) << name << "timed out after" << timeoutMs << "ms";
        proc.kill();
        proc.waitForFinished(1000);
        return std::nullopt;
    }
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        qCDebug(lcProcess) << name << "exited with code" << proc.exitCode();
        return std::nullopt;
    }

    const QString output = QString::fromLocal8Bit(proc.readAllStandardOutput());
    if (output.trimmed().isEmpty()) {
        return std::nullopt;
    }
    return output.toStdString();
}

bool isToolAvailable(const std::string& program) {
    return !QStandardPaths::findExecutable(QString::fromStdString(program)).isEmpty();
}

} // namespace sysscope
