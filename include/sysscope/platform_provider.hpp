#pragma once

#include "sysscope/config.hpp"
#include "sysscope/system_info.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sysscope {

// Best-effort source of platform-specific inventory detail, usually backed
// by external tools. Every query answers nullopt when it has nothing.
class PlatformProvider {
public:
    virtual ~PlatformProvider() = default;

    virtual std::string name() const = 0;

    virtual std::optional<std::string> cpuModelName() const = 0;
    virtual std::optional<std::vector<MemoryModule>> memoryModules() const = 0;
    virtual std::optional<std::vector<GpuInfo>> gpus() const = 0;
    virtual std::optional<std::vector<PhysicalDisk>> physicalDisks() const = 0;
    virtual std::optional<BoardInfo> board() const = 0;
    virtual std::optional<BiosInfo> bios() const = 0;
    virtual std::optional<std::vector<TemperatureReading>> temperatures() const = 0;

    // Shown in place of the motherboard block when board() has nothing.
    virtual std::string boardPlaceholder() const = 0;

    // Extra lines after "Temperature sensors not available.", if any.
    virtual std::string temperatureNote() const { return {}; }
};

class NullPlatformProvider : public PlatformProvider {
public:
    std::string name() const override { return "none"; }

    std::optional<std::string> cpuModelName() const override { return std::nullopt; }
    std::optional<std::vector<MemoryModule>> memoryModules() const override { return std::nullopt; }
    std::optional<std::vector<GpuInfo>> gpus() const override { return std::nullopt; }
    std::optional<std::vector<PhysicalDisk>> physicalDisks() const override { return std::nullopt; }
    std::optional<BoardInfo> board() const override { return std::nullopt; }
    std::optional<BiosInfo> bios() const override { return std::nullopt; }
    std::optional<std::vector<TemperatureReading>> temperatures() const override { return std::nullopt; }

    std::string boardPlaceholder() const override { return "Not available on this platform"; }
};

// Picks the implementation for the platform this binary was built for.
std::unique_ptr<PlatformProvider> makePlatformProvider(const Config& config);

} // namespace sysscope
