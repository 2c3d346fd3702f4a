#include "sysscope/windows_provider.hpp"

#include "sysscope/fallback.hpp"
#include "sysscope/process_runner.hpp"
#include "sysscope/text_util.hpp"
#include "sysscope/tool_parsers.hpp"

#include <QSettings>
#include <QString>
#include <QVariant>

#include <utility>

namespace sysscope {
namespace {

std::string field(const ToolRecord& record, const std::string& key) {
    auto it = record.find(key);
    return it != record.end() ? it->second : std::string();
}

std::optional<std::string> registryCpuName() {
#if defined(Q_OS_WIN)
    QSettings key(QStringLiteral("HKEY_LOCAL_MACHINE\\HARDWARE\\DESCRIPTION\\System\\CentralProcessor\\0"),
                  QSettings::NativeFormat);
    const std::string name = trim(key.value(QStringLiteral("ProcessorNameString")).toString().toStdString());
    if (!name.empty()) {
        return name;
    }
#endif
    return std::nullopt;
}

MemoryModule moduleFromRecord(const ToolRecord& record) {
    MemoryModule module;
    module.capacityBytes = parseUint64(field(record, "Capacity")).value_or(0);
    module.manufacturer = field(record, "Manufacturer");
    module.partNumber = field(record, "PartNumber");
    module.slot = field(record, "DeviceLocator");
    module.speedMHz = static_cast<unsigned int>(parseUint64(field(record, "Speed")).value_or(0));
    return module;
}

std::optional<std::vector<MemoryModule>> modulesFromRecords(const std::vector<ToolRecord>& records) {
    std::vector<MemoryModule> modules;
    for (const auto& record : records) {
        MemoryModule module = moduleFromRecord(record);
        if (module.capacityBytes > 0) {
            modules.push_back(module);
        }
    }
    if (modules.empty()) {
        return std::nullopt;
    }
    return modules;
}

} // namespace

WindowsPlatformProvider::WindowsPlatformProvider(Config config)
    : config_(std::move(config)) {
}

std::optional<std::string> WindowsPlatformProvider::cimQuery(const std::string& command) const {
    return runTool("powershell", {"-NoProfile", "-NonInteractive", "-Command", command}, config_.shellTimeoutMs);
}

std::optional<std::string> WindowsPlatformProvider::wmic(const std::vector<std::string>& arguments) const {
    return runTool("wmic", arguments, config_.toolTimeoutMs);
}

std::optional<std::string> WindowsPlatformProvider::cpuModelName() const {
    const StrategyChain<std::string> chain = {
        {"registry", registryCpuName},
        {"wmic", [this]() -> std::optional<std::string> {
             auto output = wmic({"cpu", "get", "Name", "/format:list"});
             if (!output) {
                 return std::nullopt;
             }
             for (const auto& record : parseWmicList(*output)) {
                 const std::string name = field(record, "Name");
                 if (!name.empty()) {
                     return name;
                 }
             }
             return std::nullopt;
         }},
    };
    return firstAvailable(chain);
}

std::optional<std::vector<MemoryModule>> WindowsPlatformProvider::memoryModules() const {
    const StrategyChain<std::vector<MemoryModule>> chain = {
        {"cim", [this]() -> std::optional<std::vector<MemoryModule>> {
             auto output = cimQuery("Get-CimInstance Win32_PhysicalMemory | "
                                    "Select-Object Manufacturer, PartNumber, Capacity, Speed, DeviceLocator | ConvertTo-Json");
             if (!output) {
                 return std::nullopt;
             }
             return modulesFromRecords(parseCimJson(*output));
         }},
        {"wmic", [this]() -> std::optional<std::vector<MemoryModule>> {
             auto output = wmic({"memorychip", "get", "Capacity,Speed,Manufacturer,PartNumber,DeviceLocator", "/format:list"});
             if (!output) {
                 return std::nullopt;
             }
             return modulesFromRecords(parseWmicList(*output));
         }},
    };
    return firstAvailable(chain);
}

std::optional<std::vector<GpuInfo>> WindowsPlatformProvider::gpus() const {
    auto output = wmic({"path", "win32_videocontroller", "get", "Name,DriverVersion,AdapterRAM", "/format:list"});
    if (!output) {
        return std::nullopt;
    }

    std::vector<GpuInfo> gpus;
    for (const auto& record : parseWmicList(*output)) {
        GpuInfo gpu;
        gpu.name = field(record, "Name");
        if (gpu.name.empty()) {
            continue;
        }
        gpu.driverVersion = field(record, "DriverVersion");
        if (auto ram = parseUint64(field(record, "AdapterRAM"))) {
            gpu.adapterRamBytes = *ram;
        }
        gpus.push_back(gpu);
    }

    if (gpus.empty()) {
        return std::nullopt;
    }
    return gpus;
}

std::optional<std::vector<PhysicalDisk>> WindowsPlatformProvider::physicalDisks() const {
    auto output = wmic({"diskdrive", "get", "Model,Size,InterfaceType", "/format:list"});
    if (!output) {
        return std::nullopt;
    }

    std::vector<PhysicalDisk> disks;
    for (const auto& record : parseWmicList(*output)) {
        PhysicalDisk disk;
        disk.model = field(record, "Model");
        if (disk.model.empty()) {
            continue;
        }
        disk.sizeBytes = parseUint64(field(record, "Size")).value_or(0);
        disk.interfaceType = field(record, "InterfaceType");
        disks.push_back(disk);
    }

    if (disks.empty()) {
        return std::nullopt;
    }
    return disks;
}

std::optional<BoardInfo> WindowsPlatformProvider::board() const {
    auto output = cimQuery("Get-CimInstance Win32_BaseBoard | "
                           "Select-Object Manufacturer, Product, Version, SerialNumber | ConvertTo-Json");
    if (!output) {
        return std::nullopt;
    }

    const auto records = parseCimJson(*output);
    if (records.empty()) {
        return std::nullopt;
    }

    BoardInfo info;
    info.manufacturer = field(records.front(), "Manufacturer");
    info.product = field(records.front(), "Product");
    info.version = field(records.front(), "Version");
    info.serialNumber = field(records.front(), "SerialNumber");
    if (info.serialNumber == "Default string") {
        info.serialNumber.clear();
    }
    if (info.manufacturer.empty() && info.product.empty()) {
        return std::nullopt;
    }
    return info;
}

std::optional<BiosInfo> WindowsPlatformProvider::bios() const {
    auto output = cimQuery("Get-CimInstance Win32_BIOS | "
                           "Select-Object Manufacturer, Name, Version, ReleaseDate | ConvertTo-Json");
    if (!output) {
        return std::nullopt;
    }

    const auto records = parseCimJson(*output);
    if (records.empty()) {
        return std::nullopt;
    }

    BiosInfo info;
    info.manufacturer = field(records.front(), "Manufacturer");
    info.name = field(records.front(), "Name");
    info.version = field(records.front(), "Version");
    const std::string released = field(records.front(), "ReleaseDate");
    if (!released.empty()) {
        info.releaseDate = normalizeCimDate(released);
    }
    return info;
}

std::optional<std::vector<TemperatureReading>> WindowsPlatformProvider::temperatures() const {
    auto output = cimQuery("Get-CimInstance -Namespace root/wmi -ClassName MSAcpi_ThermalZoneTemperature | "
                           "Select-Object CurrentTemperature | ConvertTo-Json");
    if (!output) {
        return std::nullopt;
    }

    std::vector<TemperatureReading> readings;
    for (const auto& record : parseCimJson(*output)) {
        // Tenths of a kelvin.
        auto raw = parseDouble(field(record, "CurrentTemperature"));
        if (!raw) {
            continue;
        }
        TemperatureReading reading;
        reading.label = "CPU Temperature";
        reading.currentC = *raw / 10.0 - 273.15;
        readings.push_back(reading);
        // The first zone is the one reported as the CPU.
        break;
    }

    if (readings.empty()) {
        return std::nullopt;
    }
    return readings;
}

std::string WindowsPlatformProvider::temperatureNote() const {
    return "Note: Windows does not expose temperature sensors through standard APIs.\n"
           "For temperature monitoring on Windows, use:\n"
           "  - HWMonitor (https://www.cpuid.com/softwares/hwmonitor.html)\n"
           "  - Core Temp (https://www.alcpu.com/CoreTemp/)\n"
           "  - Open Hardware Monitor (https://openhardwaremonitor.org/)\n";
}

} // namespace sysscope
