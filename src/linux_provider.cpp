#include "sysscope/linux_provider.hpp"

#include "sysscope/process_runner.hpp"
#include "sysscope/text_util.hpp"
#include "sysscope/tool_parsers.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <utility>

namespace sysscope {

namespace fs = std::filesystem;

namespace {

std::string pciVendorName(const std::string& vendorId) {
    static const std::map<std::string, std::string> vendors = {
        {"0x10de", "NVIDIA"},
        {"0x1002", "AMD"},
        {"0x8086", "Intel"},
        {"0x1af4", "Red Hat VirtIO"},
        {"0x15ad", "VMware"},
        {"0x80ee", "VirtualBox"},
        {"0x1234", "QEMU"},
        {"0x5143", "Qualcomm"},
    };
    auto it = vendors.find(vendorId);
    return it != vendors.end() ? it->second : "Vendor " + vendorId;
}

std::string stripHexPrefix(const std::string& id) {
    return startsWith(id, "0x") ? id.substr(2) : id;
}

std::string diskInterface(const std::string& name) {
    if (startsWith(name, "nvme")) {
        return "NVMe";
    }
    if (startsWith(name, "mmcblk")) {
        return "MMC";
    }
    if (startsWith(name, "vd")) {
        return "VirtIO";
    }
    if (startsWith(name, "sd") || startsWith(name, "sr")) {
        return "SCSI";
    }
    return {};
}

} // namespace

LinuxPlatformProvider::LinuxPlatformProvider(Config config)
    : config_(std::move(config)) {
}

std::string LinuxPlatformProvider::dmiPath(const std::string& field) const {
    return config_.sysRoot + "/devices/virtual/dmi/id/" + field;
}

std::optional<std::string> LinuxPlatformProvider::cpuModelName() const {
    auto output = runTool("lscpu", {}, config_.toolTimeoutMs);
    if (!output) {
        return std::nullopt;
    }
    return parseLscpuModel(*output);
}

std::optional<std::vector<MemoryModule>> LinuxPlatformProvider::memoryModules() const {
    auto output = runTool("dmidecode", {"-t", "17"}, config_.toolTimeoutMs);
    if (!output) {
        return std::nullopt;
    }
    auto modules = parseDmidecodeMemory(*output);
    if (modules.empty()) {
        return std::nullopt;
    }
    return modules;
}

std::optional<std::vector<GpuInfo>> LinuxPlatformProvider::gpus() const {
    std::vector<GpuInfo> gpus;

    for (const auto& card : sortedDirectoryEntries(config_.sysRoot + "/class/drm")) {
        const std::string cardName = card.filename().string();
        // card0-HDMI-A-1 and friends are connectors, not adapters.
        if (!startsWith(cardName, "card") || cardName.find('-') != std::string::npos) {
            continue;
        }

        const fs::path device = card / "device";
        auto vendor = readSysfsValue((device / "vendor").string());
        if (!vendor) {
            continue;
        }
        const std::string deviceId = readFileFirstLine((device / "device").string());

        GpuInfo gpu;
        gpu.name = pciVendorName(*vendor) + " GPU [" + stripHexPrefix(*vendor) + ":" + stripHexPrefix(deviceId) + "]";

        std::error_code error;
        const fs::path driverLink = fs::read_symlink(device / "driver", error);
        if (!error) {
            const std::string driver = driverLink.filename().string();
            const std::string version = readFileFirstLine(config_.sysRoot + "/module/" + driver + "/version");
            gpu.driverVersion = version.empty() ? driver : driver + " " + version;
        }

        if (auto vram = parseUint64(readFileFirstLine((device / "mem_info_vram_total").string()))) {
            gpu.adapterRamBytes = *vram;
        }
        gpus.push_back(gpu);
    }

    if (gpus.empty()) {
        return std::nullopt;
    }
    return gpus;
}

std::optional<std::vector<PhysicalDisk>> LinuxPlatformProvider::physicalDisks() const {
    std::vector<PhysicalDisk> disks;

    for (const auto& block : sortedDirectoryEntries(config_.sysRoot + "/block")) {
        const std::string name = block.filename().string();
        if (startsWith(name, "loop") || startsWith(name, "ram") || startsWith(name, "zram") || startsWith(name, "dm-")) {
            continue;
        }

        auto sectors = parseUint64(readFileFirstLine((block / "size").string()));
        if (!sectors || *sectors == 0) {
            continue;
        }

        PhysicalDisk disk;
        disk.model = readFileFirstLine((block / "device" / "model").string());
        if (disk.model.empty()) {
            disk.model = readFileFirstLine((block / "device" / "name").string());
        }
        if (disk.model.empty()) {
            disk.model = name;
        }
        // The size attribute counts 512-byte sectors regardless of the
        // device's logical block size.
        disk.sizeBytes = *sectors * 512ULL;
        disk.interfaceType = diskInterface(name);
        disks.push_back(disk);
    }

    if (disks.empty()) {
        return std::nullopt;
    }
    return disks;
}

std::optional<BoardInfo> LinuxPlatformProvider::board() const {
    auto vendor = readSysfsValue(dmiPath("board_vendor"));
    auto name = readSysfsValue(dmiPath("board_name"));
    auto version = readSysfsValue(dmiPath("board_version"));
    if (!vendor || !name || !version) {
        return std::nullopt;
    }

    BoardInfo info;
    info.manufacturer = *vendor;
    info.product = *name;
    info.version = *version;
    // Root only on most distributions.
    info.serialNumber = readFileFirstLine(dmiPath("board_serial"));
    return info;
}

std::optional<BiosInfo> LinuxPlatformProvider::bios() const {
    BiosInfo info;
    info.manufacturer = readFileFirstLine(dmiPath("bios_vendor"));
    info.version = readFileFirstLine(dmiPath("bios_version"));
    info.releaseDate = readFileFirstLine(dmiPath("bios_date"));
    if (info.manufacturer.empty() && info.version.empty() && info.releaseDate.empty()) {
        return std::nullopt;
    }
    return info;
}

std::optional<std::vector<TemperatureReading>> LinuxPlatformProvider::temperatures() const {
    std::vector<TemperatureReading> readings;

    for (const auto& zone : sortedDirectoryEntries(config_.sysRoot + "/class/thermal")) {
        if (!startsWith(zone.filename().string(), "thermal_zone")) {
            continue;
        }
        auto milli = parseDouble(readFileFirstLine((zone / "temp").string()));
        if (!milli) {
            continue;
        }

        TemperatureReading reading;
        reading.chip = "thermal";
        reading.label = readFileFirstLine((zone / "type").string());
        reading.currentC = *milli / 1000.0;
        readings.push_back(reading);
    }

    if (readings.empty()) {
        return std::nullopt;
    }
    return readings;
}

} // namespace sysscope
