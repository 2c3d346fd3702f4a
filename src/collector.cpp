#include "sysscope/collector.hpp"

#include "sysscope/logging.hpp"
#include "sysscope/process_runner.hpp"
#include "sysscope/report_renderer.hpp"
#include "sysscope/tool_parsers.hpp"

#include <QDateTime>

#include <exception>
#include <utility>

namespace sysscope {
namespace {

const char* const kUnknownCpu = "Unknown CPU";

// Runs a host query, turning an unexpected exception into `fallback`.
template <typename T, typename Query>
T guarded(const char* what, Query query, T fallback) {
    try {
        return query();
    } catch (const std::exception& e) {
        qCDebug(lcCollect) << what << "failed:" << e.what();
        return fallback;
    }
}

} // namespace

Collector::Collector(Config config, const PlatformProvider& provider)
    : config_(std::move(config)),
      provider_(provider),
      probe_(config_) {
}

StrategyChain<std::string> Collector::cpuModelChain() const {
    return {
        {"procfs", [this]() { return probe_.cpuModelName(); }},
        {provider_.name(), [this]() { return provider_.cpuModelName(); }},
        {"machine", [this]() -> std::optional<std::string> {
             const std::string machine = probe_.os().machine;
             if (machine.empty()) {
                 return std::nullopt;
             }
             return machine;
         }},
    };
}

StrategyChain<GpuReport> Collector::gpuChain() const {
    return {
        {"nvidia-smi", [this]() -> std::optional<GpuReport> {
             auto output = runTool("nvidia-smi",
                                   {"--query-gpu=name,driver_version,temperature.gpu,memory.total,memory.used,memory.free,utilization.gpu",
                                    "--format=csv,noheader,nounits"},
                                   config_.toolTimeoutMs);
             if (!output) {
                 return std::nullopt;
             }
             GpuReport report{"nvidia-smi", parseNvidiaSmiCsv(*output)};
             if (report.gpus.empty()) {
                 return std::nullopt;
             }
             return report;
         }},
        {provider_.name(), [this]() -> std::optional<GpuReport> {
             auto gpus = provider_.gpus();
             if (!gpus || gpus->empty()) {
                 return std::nullopt;
             }
             return GpuReport{provider_.name(), std::move(*gpus)};
         }},
    };
}

StrategyChain<std::vector<TemperatureReading>> Collector::temperatureChain() const {
    return {
        {"hwmon", [this]() { return probe_.temperatures(); }},
        {provider_.name(), [this]() { return provider_.temperatures(); }},
    };
}

std::string Collector::cpuModel() const {
    std::string winner;
    auto model = firstAvailable(cpuModelChain(), &winner);
    if (!model) {
        qCDebug(lcCollect) << "no source knows the CPU model";
        return kUnknownCpu;
    }
    qCDebug(lcCollect) << "CPU model from" << winner.c_str();
    return *model;
}

std::vector<GpuInfo> Collector::detectedGpus() const {
    auto report = firstAvailable(gpuChain());
    return report ? report->gpus : std::vector<GpuInfo>{};
}

std::string Collector::osReport() const {
    return renderOsReport(guarded("os", [this]() { return probe_.os(); }, OsInfo{}));
}

std::string Collector::cpuReport() const {
    CpuInfo cpu = guarded("cpu", [this]() { return probe_.cpu(); }, CpuInfo{});
    cpu.model = cpuModel();
    auto usage = guarded("cpu usage", [this]() { return probe_.sampleCpuUsage(); }, std::optional<CpuUsage>{});
    return renderCpuReport(cpu, usage);
}

std::string Collector::memoryReport() const {
    const MemoryInfo memory = guarded("memory", [this]() { return probe_.memory(); }, MemoryInfo{});
    auto modules = guarded("memory modules", [this]() { return provider_.memoryModules(); },
                           std::optional<std::vector<MemoryModule>>{});
    return renderMemoryReport(memory, modules);
}

std::string Collector::gpuReport() const {
    std::string winner;
    auto report = firstAvailable(gpuChain(), &winner);
    if (!report) {
        qCDebug(lcCollect) << "no GPU source answered";
        return renderGpuReport(GpuReport{});
    }
    qCDebug(lcCollect) << "GPU list from" << winner.c_str();
    return renderGpuReport(*report);
}

std::string Collector::storageReport() const {
    const auto partitions = guarded("partitions", [this]() { return probe_.partitions(); }, std::vector<PartitionInfo>{});
    const auto io = guarded("disk io", [this]() { return probe_.diskIo(); }, std::optional<DiskIoCounters>{});
    const auto disks = guarded("physical disks", [this]() { return provider_.physicalDisks(); },
                               std::optional<std::vector<PhysicalDisk>>{});
    return renderStorageReport(partitions, io, disks);
}

std::string Collector::motherboardReport() const {
    MotherboardSection section;
    section.board = guarded("board", [this]() { return provider_.board(); }, std::optional<BoardInfo>{});
    section.boardPlaceholder = provider_.boardPlaceholder();
    section.bios = guarded("bios", [this]() { return provider_.bios(); }, std::optional<BiosInfo>{});
    section.temperatures = firstAvailable(temperatureChain());
    section.temperatureNote = provider_.temperatureNote();

    try {
        section.battery = probe_.battery();
    } catch (const std::exception& e) {
        qCDebug(lcCollect) << "battery read failed:" << e.what();
        section.batteryReadable = false;
    }

    return renderMotherboardReport(section);
}

std::string Collector::networkReport() const {
    return renderNetworkReport(
        guarded("network", [this]() { return probe_.network(); }, std::vector<NetworkInterfaceInfo>{}));
}

std::string Collector::summaryReport() const {
    const OsInfo os = guarded("os", [this]() { return probe_.os(); }, OsInfo{});
    const CpuInfo cpu = guarded("cpu", [this]() { return probe_.cpu(); }, CpuInfo{});

    SummaryFacts facts;
    facts.scanDate = QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")).toStdString();
    facts.system = os.system;
    facts.release = os.release;
    facts.processor = cpuModel();
    facts.physicalCores = cpu.physicalCores;
    facts.logicalThreads = cpu.logicalThreads;
    facts.totalRam = guarded("memory", [this]() { return probe_.memory(); }, MemoryInfo{}).total;
    facts.partitionCount =
        guarded("partitions", [this]() { return probe_.partitions(); }, std::vector<PartitionInfo>{}).size();
    return renderSummary(facts);
}

std::string Collector::componentsOverview() const {
    const OsInfo os = guarded("os", [this]() { return probe_.os(); }, OsInfo{});
    const CpuInfo cpu = guarded("cpu", [this]() { return probe_.cpu(); }, CpuInfo{});

    OverviewFacts facts;
    facts.processor = cpuModel();
    facts.physicalCores = cpu.physicalCores;
    facts.logicalThreads = cpu.logicalThreads;
    if (cpu.frequency && cpu.frequency->maxMHz > 0.0) {
        facts.maxFrequencyMHz = cpu.frequency->maxMHz;
    }

    for (const auto& gpu : detectedGpus()) {
        facts.gpuNames.push_back(gpu.name);
    }

    facts.totalRam = guarded("memory", [this]() { return probe_.memory(); }, MemoryInfo{}).total;
    facts.modules = guarded("memory modules", [this]() { return provider_.memoryModules(); },
                            std::optional<std::vector<MemoryModule>>{})
                        .value_or(std::vector<MemoryModule>{});

    facts.board = guarded("board", [this]() { return provider_.board(); }, std::optional<BoardInfo>{});
    facts.boardPlaceholder = provider_.boardPlaceholder();

    facts.disks = guarded("physical disks", [this]() { return provider_.physicalDisks(); },
                          std::optional<std::vector<PhysicalDisk>>{})
                      .value_or(std::vector<PhysicalDisk>{});
    for (const auto& partition : guarded("partitions", [this]() { return probe_.partitions(); }, std::vector<PartitionInfo>{})) {
        if (partition.usage) {
            facts.totalPartitionStorage += partition.usage->total;
        }
    }

    facts.system = os.system;
    facts.release = os.release;
    facts.version = os.version;
    return renderComponentsOverview(facts);
}

std::string Collector::report(Slot slot) const {
    switch (slot) {
    case Slot::Summary:
        return summaryReport();
    case Slot::AllComponents:
        return componentsOverview();
    case Slot::Cpu:
        return cpuReport();
    case Slot::Memory:
        return memoryReport();
    case Slot::Gpu:
        return gpuReport();
    case Slot::Storage:
        return storageReport();
    case Slot::Motherboard:
        return motherboardReport();
    case Slot::Network:
        return networkReport();
    case Slot::Os:
        return osReport();
    }
    return {};
}

std::vector<SlotText> Collector::scanAll() const {
    std::vector<SlotText> results;
    results.reserve(kAllSlots.size());
    for (Slot slot : kAllSlots) {
        qCDebug(lcScan) << "collecting" << slotLabel(slot).c_str();
        results.push_back({slot, report(slot)});
    }
    qCInfo(lcScan) << "collected" << results.size() << "sections";
    return results;
}

} // namespace sysscope
