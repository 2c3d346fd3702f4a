#pragma once

#include "sysscope/platform_provider.hpp"

#include <string>
#include <vector>

namespace sysscope {

// Registry, CIM (through powershell) and wmic queries. Only Qt is needed
// to build it, so it compiles everywhere; away from Windows the tools are
// missing and every query comes back empty.
class WindowsPlatformProvider : public PlatformProvider {
public:
    explicit WindowsPlatformProvider(Config config);

    std::string name() const override { return "windows"; }

    std::optional<std::string> cpuModelName() const override;
    std::optional<std::vector<MemoryModule>> memoryModules() const override;
    std::optional<std::vector<GpuInfo>> gpus() const override;
    std::optional<std::vector<PhysicalDisk>> physicalDisks() const override;
    std::optional<BoardInfo> board() const override;
    std::optional<BiosInfo> bios() const override;
    std::optional<std::vector<TemperatureReading>> temperatures() const override;
    std::string temperatureNote() const override;

    std::string boardPlaceholder() const override { return "Motherboard information unavailable"; }

private:
    std::optional<std::string> cimQuery(const std::string& command) const;
    std::optional<std::string> wmic(const std::vector<std::string>& arguments) const;

    Config config_;
};

} // namespace sysscope
