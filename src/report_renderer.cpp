#include "sysscope/report_renderer.hpp"

#include "sysscope/byte_format.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sysscope {
namespace {

const std::string kRule(50, '=');
const std::string kThinRule(50, '-');
const std::string kWideRule(60, '=');

std::string orUnknown(const std::string& value) {
    return value.empty() ? "Unknown" : value;
}

std::string fixed(double value, int decimals) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(decimals) << value;
    return out.str();
}

std::string localTimestamp(std::int64_t epochSeconds) {
    const std::time_t t = static_cast<std::time_t>(epochSeconds);
    std::tm local{};
    if (localtime_r(&t, &local) == nullptr) {
        return "Unknown";
    }
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

void heading(std::ostringstream& out, const std::string& title) {
    out << title << '\n' << kRule << "\n\n";
}

void usageLines(std::ostringstream& out, std::uint64_t total, std::uint64_t used, std::uint64_t free, const std::string& indent) {
    out << indent << "Total: " << formatSize(total) << '\n';
    out << indent << "Used: " << formatSize(used) << " (" << fixed(percentOf(used, used + free), 1) << "%)\n";
    out << indent << "Free: " << formatSize(free) << '\n';
}

std::string temperature(double celsius) {
    return fixed(celsius, 1) + "°C";
}

} // namespace

double percentOf(std::uint64_t part, std::uint64_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}

std::string renderOsReport(const OsInfo& os) {
    std::ostringstream out;
    heading(out, "OPERATING SYSTEM");

    out << "System: " << orUnknown(os.system) << '\n';
    out << "Distribution: " << orUnknown(os.distro) << '\n';
    out << "Node Name: " << orUnknown(os.nodeName) << '\n';
    out << "Release: " << orUnknown(os.release) << '\n';
    out << "Version: " << orUnknown(os.version) << '\n';
    out << "Machine: " << orUnknown(os.machine) << "\n\n";
    out << "Boot Time: " << (os.bootTime > 0 ? localTimestamp(os.bootTime) : std::string("Unknown")) << '\n';

    return out.str();
}

std::string renderCpuReport(const CpuInfo& cpu, const std::optional<CpuUsage>& usage) {
    std::ostringstream out;
    heading(out, "CPU INFORMATION");

    out << "Processor: " << (cpu.model.empty() ? "Unknown CPU" : cpu.model) << '\n';
    out << "Architecture: " << orUnknown(cpu.architecture) << '\n';
    out << "Physical Cores: " << (cpu.physicalCores > 0 ? std::to_string(cpu.physicalCores) : "unavailable") << '\n';
    out << "Total Cores: " << (cpu.logicalThreads > 0 ? std::to_string(cpu.logicalThreads) : "unavailable") << "\n\n";

    if (cpu.frequency) {
        if (cpu.frequency->maxMHz > 0.0) {
            out << "Max Frequency: " << fixed(cpu.frequency->maxMHz, 2) << " MHz\n";
        }
        if (cpu.frequency->minMHz > 0.0) {
            out << "Min Frequency: " << fixed(cpu.frequency->minMHz, 2) << " MHz\n";
        }
        out << "Current Frequency: " << fixed(cpu.frequency->currentMHz, 2) << " MHz\n\n";
    } else {
        out << "Frequency: unavailable\n\n";
    }

    if (!usage) {
        out << "CPU Usage: unavailable\n";
        return out.str();
    }

    out << "CPU Usage Per Core:\n";
    for (std::size_t i = 0; i < usage->perCore.size(); ++i) {
        out << "  Core " << i << ": " << fixed(usage->perCore[i], 1) << "%\n";
    }
    out << "\nTotal CPU Usage: " << fixed(usage->total, 1) << "%\n";

    return out.str();
}

std::string renderMemoryReport(const MemoryInfo& memory, const std::optional<std::vector<MemoryModule>>& modules) {
    std::ostringstream out;
    heading(out, "MEMORY INFORMATION");

    const std::uint64_t inUse = memory.total > memory.available ? memory.total - memory.available : 0;
    out << "Total RAM: " << formatSize(memory.total) << '\n';
    out << "Available: " << formatSize(memory.available) << '\n';
    out << "Used: " << formatSize(memory.used) << " (" << fixed(percentOf(inUse, memory.total), 1) << "%)\n";
    out << "Free: " << formatSize(memory.free) << '\n';

    out << '\n' << kRule << '\n' << "RAM MODULES:\n" << kRule << "\n\n";
    if (modules && !modules->empty()) {
        for (std::size_t i = 0; i < modules->size(); ++i) {
            const auto& module = (*modules)[i];
            out << "Module " << i + 1 << ":\n";
            out << "  Capacity: " << formatSize(module.capacityBytes) << '\n';
            if (!module.manufacturer.empty()) {
                out << "  Manufacturer: " << module.manufacturer << '\n';
            }
            if (!module.partNumber.empty()) {
                out << "  Part Number: " << module.partNumber << '\n';
            }
            if (module.speedMHz > 0) {
                out << "  Speed: " << module.speedMHz << " MHz\n";
            }
            if (!module.slot.empty()) {
                out << "  Slot: " << module.slot << '\n';
            }
            out << '\n';
        }
    } else {
        out << "RAM module details unavailable\n";
    }

    out << "\nSwap Memory:\n";
    usageLines(out, memory.swapTotal, memory.swapUsed, memory.swapFree, "  ");

    return out.str();
}

std::string renderGpuReport(const GpuReport& report) {
    std::ostringstream out;
    heading(out, "GPU INFORMATION");

    if (report.gpus.empty()) {
        out << "No GPU detected\n";
        return out.str();
    }

    if (report.source == "nvidia-smi") {
        out << "NVIDIA GPU(s):\n\n";
        for (std::size_t i = 0; i < report.gpus.size(); ++i) {
            const auto& gpu = report.gpus[i];
            out << "GPU " << i << ": " << gpu.name << '\n';
            out << "  Driver Version: " << orUnknown(gpu.driverVersion) << '\n';
            if (gpu.temperatureC) {
                out << "  Temperature: " << fixed(*gpu.temperatureC, 0) << "°C\n";
            }
            if (gpu.memoryTotalMB) {
                out << "  Memory Total: " << *gpu.memoryTotalMB << " MB\n";
            }
            if (gpu.memoryUsedMB) {
                out << "  Memory Used: " << *gpu.memoryUsedMB << " MB\n";
            }
            if (gpu.memoryFreeMB) {
                out << "  Memory Free: " << *gpu.memoryFreeMB << " MB\n";
            }
            if (gpu.utilizationPercent) {
                out << "  GPU Utilization: " << fixed(*gpu.utilizationPercent, 0) << "%\n";
            }
            out << '\n';
        }
        return out.str();
    }

    out << "Detected GPU(s):\n\n";
    for (const auto& gpu : report.gpus) {
        out << gpu.name << '\n';
        if (!gpu.driverVersion.empty()) {
            out << "  Driver: " << gpu.driverVersion << '\n';
        }
        if (gpu.adapterRamBytes) {
            out << "  Memory: " << formatSize(*gpu.adapterRamBytes) << '\n';
        }
        out << '\n';
    }
    return out.str();
}

std::string renderStorageReport(const std::vector<PartitionInfo>& partitions,
                                const std::optional<DiskIoCounters>& io,
                                const std::optional<std::vector<PhysicalDisk>>& disks) {
    std::ostringstream out;
    heading(out, "STORAGE INFORMATION");

    for (const auto& partition : partitions) {
        out << "Device: " << partition.device << '\n';
        out << "  Mountpoint: " << partition.mountPoint << '\n';
        out << "  File System: " << partition.filesystem << '\n';
        if (partition.usage) {
            usageLines(out, partition.usage->total, partition.usage->used, partition.usage->free, "  ");
        } else {
            out << "  (Permission denied)\n";
        }
        out << '\n';
    }
    if (partitions.empty()) {
        out << "No mounted partitions detected\n\n";
    }

    if (io) {
        out << "Total Disk I/O:\n";
        out << "  Read: " << formatSize(io->readBytes) << '\n';
        out << "  Written: " << formatSize(io->writtenBytes) << "\n\n";
    }

    if (disks && !disks->empty()) {
        out << "Physical Disks:\n";
        for (const auto& disk : *disks) {
            out << "\n  " << disk.model << '\n';
            if (disk.sizeBytes > 0) {
                out << "    Capacity: " << formatSize(disk.sizeBytes) << '\n';
            }
            if (!disk.interfaceType.empty()) {
                out << "    Interface: " << disk.interfaceType << '\n';
            }
        }
    }

    return out.str();
}

std::string renderMotherboardReport(const MotherboardSection& section) {
    std::ostringstream out;
    heading(out, "MOTHERBOARD INFORMATION");

    if (section.board) {
        const auto& board = *section.board;
        if (!board.manufacturer.empty()) {
            out << "Manufacturer: " << board.manufacturer << '\n';
        }
        if (!board.product.empty()) {
            out << "Model: " << board.product << '\n';
        }
        if (!board.version.empty()) {
            out << "Version: " << board.version << '\n';
        }
        if (!board.serialNumber.empty()) {
            out << "Serial Number: " << board.serialNumber << '\n';
        }
    } else {
        out << section.boardPlaceholder << '\n';
    }

    out << '\n' << kThinRule << '\n' << "BIOS Information:\n" << kThinRule << "\n\n";
    if (section.bios) {
        const auto& bios = *section.bios;
        if (!bios.manufacturer.empty()) {
            out << "Manufacturer: " << bios.manufacturer << '\n';
        }
        if (!bios.name.empty()) {
            out << "Name: " << bios.name << '\n';
        }
        if (!bios.version.empty()) {
            out << "Version: " << bios.version << '\n';
        }
        if (!bios.releaseDate.empty()) {
            out << "Release Date: " << bios.releaseDate << '\n';
        }
    } else {
        out << "BIOS information unavailable\n";
    }

    out << '\n' << kRule << '\n' << "TEMPERATURE SENSORS\n" << kRule << "\n\n";
    if (section.temperatures && !section.temperatures->empty()) {
        std::string chip;
        bool first = true;
        for (const auto& reading : *section.temperatures) {
            if (reading.chip.empty()) {
                out << (reading.label.empty() ? "Sensor" : reading.label) << ": " << temperature(reading.currentC) << '\n';
                continue;
            }
            if (first || reading.chip != chip) {
                if (!first) {
                    out << '\n';
                }
                chip = reading.chip;
                out << chip << ":\n";
                first = false;
            }
            out << "  " << (reading.label.empty() ? "Sensor" : reading.label) << ": " << temperature(reading.currentC);
            if (reading.highC) {
                out << " (High: " << temperature(*reading.highC) << ")";
            }
            if (reading.criticalC) {
                out << " (Critical: " << temperature(*reading.criticalC) << ")";
            }
            out << '\n';
        }
        out << '\n';
    } else {
        out << "Temperature sensors not available.\n";
        if (!section.temperatureNote.empty()) {
            out << '\n' << section.temperatureNote;
        }
        out << '\n';
    }

    out << kRule << '\n' << "POWER / BATTERY\n" << kRule << "\n\n";
    if (!section.batteryReadable) {
        out << "Battery info unavailable\n";
    } else if (section.battery) {
        const auto& battery = *section.battery;
        out << "Battery: " << fixed(battery.percent, 0) << "%\n";
        out << "Power Plugged: " << (battery.powerPlugged ? "Yes" : "No") << '\n';
        if (!battery.powerPlugged && battery.secondsLeft) {
            const std::int64_t hours = *battery.secondsLeft / 3600;
            const std::int64_t minutes = (*battery.secondsLeft % 3600) / 60;
            out << "Time Remaining: " << hours << "h " << minutes << "m\n";
        }
    } else {
        out << "No battery (desktop system)\n";
    }

    return out.str();
}

std::string renderNetworkReport(const std::vector<NetworkInterfaceInfo>& interfaces) {
    std::ostringstream out;
    heading(out, "NETWORK INFORMATION");

    std::uint64_t sent = 0;
    std::uint64_t received = 0;
    for (const auto& iface : interfaces) {
        out << iface.name << ":\n";
        if (!iface.mac.empty() && iface.mac != "00:00:00:00:00:00") {
            out << "  MAC: " << iface.mac << '\n';
        }
        for (const auto& address : iface.ipv4) {
            out << "  IPv4: " << address.address << '\n';
            if (!address.netmask.empty()) {
                out << "  Netmask: " << address.netmask << '\n';
            }
        }
        for (const auto& address : iface.ipv6) {
            out << "  IPv6: " << address << '\n';
        }
        out << "  Sent: " << formatSize(iface.txBytes) << '\n';
        out << "  Received: " << formatSize(iface.rxBytes) << "\n\n";
        sent += iface.txBytes;
        received += iface.rxBytes;
    }
    if (interfaces.empty()) {
        out << "No network interfaces detected\n\n";
    }

    out << "Total Network I/O:\n";
    out << "  Sent: " << formatSize(sent) << '\n';
    out << "  Received: " << formatSize(received) << '\n';

    return out.str();
}

std::string renderSummary(const SummaryFacts& facts) {
    std::ostringstream out;
    out << "Scan Date: " << facts.scanDate << "\n\n";
    out << "System: " << orUnknown(facts.system) << ' ' << facts.release << '\n';
    out << "Processor: " << (facts.processor.empty() ? "Unknown CPU" : facts.processor) << '\n';
    out << "CPU Cores: " << facts.physicalCores << " Physical, " << facts.logicalThreads << " Logical\n";
    out << "Total RAM: " << formatSize(facts.totalRam) << '\n';
    out << "Storage Devices: " << facts.partitionCount << '\n';
    out << '\n' << kRule << '\n';
    out << "Click other tabs for detailed information";
    return out.str();
}

std::string renderComponentsOverview(const OverviewFacts& facts) {
    std::ostringstream out;
    out << "ALL COMPONENTS - QUICK OVERVIEW\n" << kWideRule << "\n\n";

    out << "┌─ PROCESSOR\n│\n";
    out << "└─ " << (facts.processor.empty() ? "Unknown CPU" : facts.processor) << '\n';
    out << "   • Cores: " << facts.physicalCores << " Physical / " << facts.logicalThreads << " Logical\n";
    if (facts.maxFrequencyMHz) {
        out << "   • Frequency: " << fixed(*facts.maxFrequencyMHz, 0) << " MHz\n";
    }
    out << '\n';

    out << "┌─ GRAPHICS CARD(S)\n│\n";
    for (const auto& name : facts.gpuNames) {
        out << "└─ " << name << '\n';
    }
    if (facts.gpuNames.empty()) {
        out << "└─ No GPU detected\n";
    }
    out << '\n';

    out << "┌─ MEMORY (RAM)\n│\n";
    out << "└─ Total: " << formatSize(facts.totalRam) << '\n';
    for (std::size_t i = 0; i < facts.modules.size(); ++i) {
        const auto& module = facts.modules[i];
        out << "   • Module " << i + 1 << ": " << formatSize(module.capacityBytes);
        if (module.speedMHz > 0) {
            out << " @ " << module.speedMHz << "MHz";
        }
        if (!module.manufacturer.empty() && module.manufacturer != "Unknown") {
            out << " (" << module.manufacturer;
            if (!module.partNumber.empty()) {
                out << ' ' << module.partNumber;
            }
            out << ')';
        }
        out << '\n';
    }
    out << '\n';

    out << "┌─ MOTHERBOARD\n│\n";
    if (facts.board && !(facts.board->manufacturer.empty() && facts.board->product.empty())) {
        std::string name = facts.board->manufacturer;
        if (!facts.board->product.empty()) {
            name += name.empty() ? facts.board->product : " " + facts.board->product;
        }
        out << "└─ " << name << '\n';
    } else {
        out << "└─ " << facts.boardPlaceholder << '\n';
    }
    out << '\n';

    out << "┌─ STORAGE DEVICES\n│\n";
    for (const auto& disk : facts.disks) {
        out << "└─ " << disk.model;
        if (disk.sizeBytes > 0) {
            out << " (" << formatSize(disk.sizeBytes) << ')';
        }
        out << '\n';
    }
    if (facts.totalPartitionStorage > 0) {
        out << "   • Total Storage: " << formatSize(facts.totalPartitionStorage) << '\n';
    }
    out << '\n';

    out << "┌─ OPERATING SYSTEM\n│\n";
    out << "└─ " << orUnknown(facts.system) << ' ' << facts.release << '\n';
    out << "   • Version: " << orUnknown(facts.version) << '\n';

    out << '\n' << kWideRule << '\n';
    out << "\nClick other tabs for detailed specifications";
    return out.str();
}

} // namespace sysscope
