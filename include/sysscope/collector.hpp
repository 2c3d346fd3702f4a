#pragma once

#include "sysscope/config.hpp"
#include "sysscope/fallback.hpp"
#include "sysscope/host_probe.hpp"
#include "sysscope/platform_provider.hpp"
#include "sysscope/slots.hpp"
#include "sysscope/system_info.hpp"

#include <string>
#include <vector>

namespace sysscope {

// Gathers one text block per report slot. Category methods never throw for
// missing data; unavailable fields turn into placeholder lines.
class Collector {
public:
    Collector(Config config, const PlatformProvider& provider);

    std::string osReport() const;
    std::string cpuReport() const;
    std::string memoryReport() const;
    std::string gpuReport() const;
    std::string storageReport() const;
    std::string motherboardReport() const;
    std::string networkReport() const;
    std::string summaryReport() const;
    std::string componentsOverview() const;

    std::string report(Slot slot) const;

    // Every slot, in kAllSlots order.
    std::vector<SlotText> scanAll() const;

    StrategyChain<std::string> cpuModelChain() const;
    StrategyChain<GpuReport> gpuChain() const;
    StrategyChain<std::vector<TemperatureReading>> temperatureChain() const;

private:
    std::string cpuModel() const;
    std::vector<GpuInfo> detectedGpus() const;

    Config config_;
    const PlatformProvider& provider_;
    HostProbe probe_;
};

} // namespace sysscope
