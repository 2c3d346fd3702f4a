#pragma once

#include "sysscope/platform_provider.hpp"

namespace sysscope {

// sysfs/DMI reads plus lscpu and dmidecode.
class LinuxPlatformProvider : public PlatformProvider {
public:
    explicit LinuxPlatformProvider(Config config);

    std::string name() const override { return "linux"; }

    std::optional<std::string> cpuModelName() const override;
    std::optional<std::vector<MemoryModule>> memoryModules() const override;
    std::optional<std::vector<GpuInfo>> gpus() const override;
    std::optional<std::vector<PhysicalDisk>> physicalDisks() const override;
    std::optional<BoardInfo> board() const override;
    std::optional<BiosInfo> bios() const override;
    std::optional<std::vector<TemperatureReading>> temperatures() const override;

    std::string boardPlaceholder() const override { return "Unavailable (may need root)"; }

private:
    std::string dmiPath(const std::string& field) const;

    Config config_;
};

} // namespace sysscope
