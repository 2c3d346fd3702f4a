#pragma once

#include "sysscope/system_info.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sysscope {

struct MotherboardSection {
    std::optional<BoardInfo> board;
    std::string boardPlaceholder;
    std::optional<BiosInfo> bios;
    // Readings with an empty chip print as bare "label: value" lines.
    std::optional<std::vector<TemperatureReading>> temperatures;
    std::string temperatureNote;
    std::optional<BatteryInfo> battery;
    bool batteryReadable = true;
};

struct SummaryFacts {
    std::string scanDate;
    std::string system;
    std::string release;
    std::string processor;
    unsigned int physicalCores = 0;
    unsigned int logicalThreads = 0;
    std::uint64_t totalRam = 0;
    std::size_t partitionCount = 0;
};

struct OverviewFacts {
    std::string processor;
    unsigned int physicalCores = 0;
    unsigned int logicalThreads = 0;
    std::optional<double> maxFrequencyMHz;
    std::vector<std::string> gpuNames;
    std::uint64_t totalRam = 0;
    std::vector<MemoryModule> modules;
    std::optional<BoardInfo> board;
    std::string boardPlaceholder;
    std::vector<PhysicalDisk> disks;
    std::uint64_t totalPartitionStorage = 0;
    std::string system;
    std::string release;
    std::string version;
};

double percentOf(std::uint64_t part, std::uint64_t whole);

std::string renderOsReport(const OsInfo& os);
std::string renderCpuReport(const CpuInfo& cpu, const std::optional<CpuUsage>& usage);
std::string renderMemoryReport(const MemoryInfo& memory, const std::optional<std::vector<MemoryModule>>& modules);
std::string renderGpuReport(const GpuReport& report);
std::string renderStorageReport(const std::vector<PartitionInfo>& partitions,
                                const std::optional<DiskIoCounters>& io,
                                const std::optional<std::vector<PhysicalDisk>>& disks);
std::string renderMotherboardReport(const MotherboardSection& section);
std::string renderNetworkReport(const std::vector<NetworkInterfaceInfo>& interfaces);
std::string renderSummary(const SummaryFacts& facts);
std::string renderComponentsOverview(const OverviewFacts& facts);

} // namespace sysscope
