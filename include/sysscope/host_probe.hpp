#pragma once

#include "sysscope/config.hpp"
#include "sysscope/system_info.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sysscope {

namespace procfs {

// Jiffy totals of one "cpu" line of /proc/stat.
struct CpuTimes {
    std::uint64_t busy = 0;
    std::uint64_t total = 0;
};

// Index 0 is the aggregate "cpu" line, followed by cpu0, cpu1, ...
std::vector<CpuTimes> parseCpuTimes(const std::string& statText);

// Percent busy per line between two samples of the same machine.
std::vector<double> usageBetween(const std::vector<CpuTimes>& before, const std::vector<CpuTimes>& after);

} // namespace procfs

// Host-level queries: system calls plus procfs/sysfs reads rooted at the
// configured directories.
class HostProbe {
public:
    explicit HostProbe(Config config);

    OsInfo os() const;
    CpuInfo cpu() const;
    std::optional<std::string> cpuModelName() const;
    // Blocks for config.cpuSampleMs.
    std::optional<CpuUsage> sampleCpuUsage() const;
    MemoryInfo memory() const;
    std::vector<PartitionInfo> partitions() const;
    std::optional<DiskIoCounters> diskIo() const;
    std::optional<std::vector<TemperatureReading>> temperatures() const;
    // nullopt means no battery; throws std::runtime_error when the power
    // supply class exists but cannot be read.
    std::optional<BatteryInfo> battery() const;
    std::vector<NetworkInterfaceInfo> network() const;

private:
    std::string procPath(const std::string& name) const;
    std::string sysPath(const std::string& name) const;

    Config config_;
};

} // namespace sysscope
