#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sysscope {

struct OsInfo {
    std::string system;
    std::string nodeName;
    std::string release;
    std::string version;
    std::string machine;
    std::string distro;
    // Seconds since the epoch, 0 when unknown.
    std::int64_t bootTime = 0;
};

struct CpuFrequency {
    double currentMHz = 0.0;
    double minMHz = 0.0;
    double maxMHz = 0.0;
};

struct CpuUsage {
    std::vector<double> perCore;
    double total = 0.0;
};

struct CpuInfo {
    std::string model;
    std::string architecture;
    unsigned int physicalCores = 0;
    unsigned int logicalThreads = 0;
    std::optional<CpuFrequency> frequency;
};

struct MemoryModule {
    std::uint64_t capacityBytes = 0;
    std::string manufacturer;
    std::string partNumber;
    std::string slot;
    unsigned int speedMHz = 0;
};

struct MemoryInfo {
    std::uint64_t total = 0;
    std::uint64_t available = 0;
    std::uint64_t used = 0;
    std::uint64_t free = 0;
    std::uint64_t swapTotal = 0;
    std::uint64_t swapUsed = 0;
    std::uint64_t swapFree = 0;
};

struct GpuInfo {
    std::string name;
    std::string driverVersion;
    std::optional<double> temperatureC;
    std::optional<std::uint64_t> memoryTotalMB;
    std::optional<std::uint64_t> memoryUsedMB;
    std::optional<std::uint64_t> memoryFreeMB;
    std::optional<double> utilizationPercent;
    std::optional<std::uint64_t> adapterRamBytes;
};

struct GpuReport {
    // Which source answered: "nvidia-smi" or the platform enumeration.
    std::string source;
    std::vector<GpuInfo> gpus;
};

struct PartitionUsage {
    std::uint64_t total = 0;
    std::uint64_t used = 0;
    std::uint64_t free = 0;
};

struct PartitionInfo {
    std::string device;
    std::string mountPoint;
    std::string filesystem;
    // Empty when the usage query was refused.
    std::optional<PartitionUsage> usage;
};

struct DiskIoCounters {
    std::uint64_t readBytes = 0;
    std::uint64_t writtenBytes = 0;
};

struct PhysicalDisk {
    std::string model;
    std::uint64_t sizeBytes = 0;
    std::string interfaceType;
};

struct BoardInfo {
    std::string manufacturer;
    std::string product;
    std::string version;
    std::string serialNumber;
};

struct BiosInfo {
    std::string manufacturer;
    std::string name;
    std::string version;
    std::string releaseDate;
};

struct TemperatureReading {
    std::string chip;
    std::string label;
    double currentC = 0.0;
    std::optional<double> highC;
    std::optional<double> criticalC;
};

struct BatteryInfo {
    double percent = 0.0;
    bool powerPlugged = false;
    // Seconds, unset when unknown or unlimited.
    std::optional<std::int64_t> secondsLeft;
};

struct InterfaceAddress {
    std::string address;
    std::string netmask;
};

struct NetworkInterfaceInfo {
    std::string name;
    std::string mac;
    std::vector<InterfaceAddress> ipv4;
    std::vector<std::string> ipv6;
    std::uint64_t rxBytes = 0;
    std::uint64_t txBytes = 0;
};

} // namespace sysscope
