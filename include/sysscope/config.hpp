#pragma once

#include <string>

namespace sysscope {

struct Config {
    std::string procRoot = "/proc";
    std::string sysRoot = "/sys";
    std::string osReleasePath = "/etc/os-release";
    std::string exportDirectory = ".";
    std::string logFile;

    int cpuSampleMs = 1000;
    // Vendor and legacy query tools.
    int toolTimeoutMs = 5000;
    // Management-instrumentation shell queries.
    int shellTimeoutMs = 10000;

    bool debugLogging = false;

    // Defaults overridden by SYSSCOPE_* environment variables.
    static Config fromEnvironment();
};

} // namespace sysscope
