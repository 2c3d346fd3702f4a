#include "sysscope/config.hpp"

#include <QtGlobal>

namespace sysscope {
namespace {

void overrideString(const char* name, std::string& target) {
    const QString value = qEnvironmentVariable(name);
    if (!value.isEmpty()) {
        target = value.toStdString();
    }
}

void overridePositiveInt(const char* name, int& target) {
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (ok && value > 0) {
        target = value;
    }
}

} // namespace

Config Config::fromEnvironment() {
    Config config;
    overrideString("SYSSCOPE_PROC_ROOT", config.procRoot);
    overrideString("SYSSCOPE_SYS_ROOT", config.sysRoot);
    overrideString("SYSSCOPE_OS_RELEASE", config.osReleasePath);
    overrideString("SYSSCOPE_EXPORT_DIR", config.exportDirectory);
    overrideString("SYSSCOPE_LOG_FILE", config.logFile);
    overridePositiveInt("SYSSCOPE_CPU_SAMPLE_MS", config.cpuSampleMs);
    config.debugLogging = qEnvironmentVariableIntValue("SYSSCOPE_DEBUG") == 1;
    return config;
}

} // namespace sysscope
