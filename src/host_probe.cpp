#include "sysscope/host_probe.hpp"

#include "sysscope/logging.hpp"
#include "sysscope/text_util.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <ifaddrs.h>
#include <map>
#include <netdb.h>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/statvfs.h>
#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace sysscope {

namespace fs = std::filesystem;

namespace procfs {

std::vector<CpuTimes> parseCpuTimes(const std::string& statText) {
    std::vector<CpuTimes> out;
    std::istringstream stream(statText);
    std::string line;
    while (std::getline(stream, line)) {
        if (!startsWith(line, "cpu")) {
            continue;
        }

        const auto tokens = splitWhitespace(line);
        if (tokens.size() < 5) {
            continue;
        }

        // user nice system idle iowait irq softirq steal; guest time is
        // already part of user.
        std::array<std::uint64_t, 8> fields{};
        for (std::size_t i = 0; i < fields.size() && i + 1 < tokens.size(); ++i) {
            fields[i] = parseUint64(tokens[i + 1]).value_or(0);
        }

        CpuTimes times;
        for (auto value : fields) {
            times.total += value;
        }
        const std::uint64_t idle = fields[3] + fields[4];
        times.busy = times.total >= idle ? times.total - idle : 0;
        out.push_back(times);
    }
    return out;
}

std::vector<double> usageBetween(const std::vector<CpuTimes>& before, const std::vector<CpuTimes>& after) {
    std::vector<double> out;
    const std::size_t count = std::min(before.size(), after.size());
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint64_t totalDelta = after[i].total > before[i].total ? after[i].total - before[i].total : 0;
        const std::uint64_t busyDelta = after[i].busy > before[i].busy ? after[i].busy - before[i].busy : 0;
        if (totalDelta == 0) {
            out.push_back(0.0);
            continue;
        }
        const double percent = 100.0 * static_cast<double>(busyDelta) / static_cast<double>(totalDelta);
        out.push_back(std::clamp(percent, 0.0, 100.0));
    }
    return out;
}

} // namespace procfs

namespace {

std::optional<std::string> readWholeFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// "Key:   1234 kB" lines of /proc/meminfo, converted to bytes.
std::map<std::string, std::uint64_t> readMeminfo(const std::string& path) {
    std::map<std::string, std::uint64_t> values;
    std::ifstream meminfo(path);
    std::string line;
    while (std::getline(meminfo, line)) {
        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        const auto tokens = splitWhitespace(line.substr(pos + 1));
        if (tokens.empty()) {
            continue;
        }
        if (auto value = parseUint64(tokens[0])) {
            const bool kilobytes = tokens.size() > 1 && tokens[1] == "kB";
            values[line.substr(0, pos)] = kilobytes ? *value * 1024ULL : *value;
        }
    }
    return values;
}

std::uint64_t valueOr(const std::map<std::string, std::uint64_t>& values, const std::string& key, std::uint64_t fallback) {
    auto it = values.find(key);
    return it != values.end() ? it->second : fallback;
}

std::optional<double> readScaled(const fs::path& path, double divisor) {
    auto raw = readSysfsValue(path.string());
    if (!raw) {
        return std::nullopt;
    }
    auto value = parseDouble(*raw);
    if (!value) {
        return std::nullopt;
    }
    return *value / divisor;
}

std::string numericHost(const sockaddr* address, socklen_t length) {
    std::array<char, NI_MAXHOST> host{};
    const int rc = getnameinfo(address, length, host.data(), static_cast<socklen_t>(host.size()), nullptr, 0, NI_NUMERICHOST);
    return rc == 0 ? std::string(host.data()) : std::string();
}

} // namespace

HostProbe::HostProbe(Config config)
    : config_(std::move(config)) {
}

std::string HostProbe::procPath(const std::string& name) const {
    return config_.procRoot + "/" + name;
}

std::string HostProbe::sysPath(const std::string& name) const {
    return config_.sysRoot + "/" + name;
}

OsInfo HostProbe::os() const {
    OsInfo info;
    struct utsname uts {};

    if (uname(&uts) == 0) {
        info.system = uts.sysname;
        info.nodeName = uts.nodename;
        info.release = uts.release;
        info.version = uts.version;
        info.machine = uts.machine;
    }

    std::ifstream osRelease(config_.osReleasePath);
    std::string line;
    while (std::getline(osRelease, line)) {
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (key == "PRETTY_NAME") {
            info.distro = value;
        }
    }

    std::ifstream stat(procPath("stat"));
    while (std::getline(stat, line)) {
        if (startsWith(line, "btime ")) {
            info.bootTime = static_cast<std::int64_t>(parseUint64(line.substr(6)).value_or(0));
            break;
        }
    }

    return info;
}

std::optional<std::string> HostProbe::cpuModelName() const {
    std::ifstream cpuInfoFile(procPath("cpuinfo"));
    std::string line;
    while (std::getline(cpuInfoFile, line)) {
        auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, pos));
        const std::string value = trim(line.substr(pos + 1));
        if ((key == "model name" || key == "cpu model") && !value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

CpuInfo HostProbe::cpu() const {
    CpuInfo info;
    info.model = cpuModelName().value_or(std::string());

    struct utsname uts {};
    if (uname(&uts) == 0) {
        info.architecture = uts.machine;
    }

    std::set<std::pair<std::string, std::string>> cores;
    std::set<std::string> packages;
    unsigned int processors = 0;
    unsigned int coresPerPackage = 0;
    std::optional<double> cpuinfoMHz;

    std::ifstream cpuInfoFile(procPath("cpuinfo"));
    std::string line;
    std::string physicalId;
    while (std::getline(cpuInfoFile, line)) {
        auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }

        const std::string key = trim(line.substr(0, pos));
        const std::string value = trim(line.substr(pos + 1));

        if (key == "processor") {
            ++processors;
        } else if (key == "physical id") {
            physicalId = value;
            packages.insert(value);
        } else if (key == "core id") {
            cores.emplace(physicalId, value);
        } else if (key == "cpu cores" && coresPerPackage == 0) {
            coresPerPackage = static_cast<unsigned int>(parseUint64(value).value_or(0));
        } else if (key == "cpu MHz" && !cpuinfoMHz) {
            cpuinfoMHz = parseDouble(value);
        }
    }

    info.logicalThreads = processors > 0 ? processors : std::thread::hardware_concurrency();
    if (!cores.empty()) {
        info.physicalCores = static_cast<unsigned int>(cores.size());
    } else if (coresPerPackage > 0) {
        info.physicalCores = coresPerPackage * static_cast<unsigned int>(std::max<std::size_t>(packages.size(), 1));
    }

    const fs::path cpufreq = fs::path(sysPath("devices/system/cpu/cpu0/cpufreq"));
    auto current = readScaled(cpufreq / "scaling_cur_freq", 1000.0);
    if (current) {
        CpuFrequency frequency;
        frequency.currentMHz = *current;
        frequency.minMHz = readScaled(cpufreq / "cpuinfo_min_freq", 1000.0).value_or(0.0);
        frequency.maxMHz = readScaled(cpufreq / "cpuinfo_max_freq", 1000.0).value_or(0.0);
        info.frequency = frequency;
    } else if (cpuinfoMHz) {
        info.frequency = CpuFrequency{*cpuinfoMHz, 0.0, 0.0};
    }

    return info;
}

std::optional<CpuUsage> HostProbe::sampleCpuUsage() const {
    auto before = readWholeFile(procPath("stat"));
    if (!before) {
        return std::nullopt;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.cpuSampleMs));
    auto after = readWholeFile(procPath("stat"));
    if (!after) {
        return std::nullopt;
    }

    const auto usage = procfs::usageBetween(procfs::parseCpuTimes(*before), procfs::parseCpuTimes(*after));
    if (usage.empty()) {
        return std::nullopt;
    }

    CpuUsage result;
    result.total = usage.front();
    result.perCore.assign(usage.begin() + 1, usage.end());
    return result;
}

MemoryInfo HostProbe::memory() const {
    MemoryInfo info;
    const auto values = readMeminfo(procPath("meminfo"));

    if (values.count("MemTotal") != 0) {
        info.total = values.at("MemTotal");
        info.free = valueOr(values, "MemFree", 0);
        const std::uint64_t buffers = valueOr(values, "Buffers", 0);
        const std::uint64_t cached = valueOr(values, "Cached", 0) + valueOr(values, "SReclaimable", 0);
        info.available = valueOr(values, "MemAvailable", info.free + buffers + cached);

        const std::uint64_t reclaimable = info.free + buffers + cached;
        info.used = info.total > reclaimable ? info.total - reclaimable : info.total - std::min(info.total, info.free);

        info.swapTotal = valueOr(values, "SwapTotal", 0);
        info.swapFree = std::min(valueOr(values, "SwapFree", 0), info.swapTotal);
        info.swapUsed = info.swapTotal - info.swapFree;
        return info;
    }

    struct sysinfo data {};
    if (sysinfo(&data) != 0) {
        qCDebug(lcCollect) << "sysinfo() failed";
        return info;
    }

    const std::uint64_t unit = data.mem_unit;
    info.total = data.totalram * unit;
    info.free = data.freeram * unit;
    info.available = (data.freeram + data.bufferram) * unit;
    info.used = info.total - std::min(info.total, info.available);
    info.swapTotal = data.totalswap * unit;
    info.swapFree = data.freeswap * unit;
    info.swapUsed = info.swapTotal - std::min(info.swapTotal, info.swapFree);
    return info;
}

std::vector<PartitionInfo> HostProbe::partitions() const {
    std::vector<PartitionInfo> out;
    std::ifstream mounts(procPath("mounts"));
    if (!mounts) {
        qCDebug(lcCollect) << "cannot read" << procPath("mounts").c_str();
        return out;
    }

    static const std::set<std::string> pseudo = {
        "proc", "sysfs", "tmpfs", "devtmpfs", "cgroup", "cgroup2", "overlay", "squashfs", "devpts", "securityfs", "pstore", "mqueue", "tracefs", "fusectl"};

    std::set<std::string> seen;
    std::string line;
    while (std::getline(mounts, line)) {
        auto parts = splitWhitespace(line);
        if (parts.size() < 4) {
            continue;
        }

        const std::string source = unescapeMountField(parts[0]);
        const std::string mountPoint = unescapeMountField(parts[1]);
        const std::string& fsType = parts[2];
        const std::string& options = parts[3];

        if (pseudo.count(fsType) != 0 || seen.count(mountPoint) != 0) {
            continue;
        }
        if (!startsWith(source, "/dev/")) {
            continue;
        }
        if (options.find("bind") != std::string::npos) {
            continue;
        }

        seen.insert(mountPoint);
        PartitionInfo partition;
        partition.device = source;
        partition.mountPoint = mountPoint;
        partition.filesystem = fsType;

        struct statvfs stat {};
        if (statvfs(mountPoint.c_str(), &stat) == 0) {
            PartitionUsage usage;
            const std::uint64_t frsize = stat.f_frsize;
            usage.total = static_cast<std::uint64_t>(stat.f_blocks) * frsize;
            usage.free = static_cast<std::uint64_t>(stat.f_bavail) * frsize;
            usage.used = static_cast<std::uint64_t>(stat.f_blocks - stat.f_bfree) * frsize;
            partition.usage = usage;
        } else {
            qCDebug(lcCollect) << "statvfs failed for" << mountPoint.c_str();
        }
        out.push_back(partition);
    }

    std::sort(out.begin(), out.end(), [](const PartitionInfo& a, const PartitionInfo& b) {
        return a.mountPoint < b.mountPoint;
    });

    return out;
}

std::optional<DiskIoCounters> HostProbe::diskIo() const {
    std::ifstream diskstats(procPath("diskstats"));
    if (!diskstats) {
        return std::nullopt;
    }

    constexpr std::uint64_t sectorSize = 512;
    DiskIoCounters counters;
    bool any = false;
    std::string line;
    while (std::getline(diskstats, line)) {
        const auto tokens = splitWhitespace(line);
        if (tokens.size() < 10) {
            continue;
        }
        // Whole disks only; partitions would count twice.
        std::error_code error;
        if (!fs::exists(fs::path(sysPath("block")) / tokens[2], error)) {
            continue;
        }
        counters.readBytes += parseUint64(tokens[5]).value_or(0) * sectorSize;
        counters.writtenBytes += parseUint64(tokens[9]).value_or(0) * sectorSize;
        any = true;
    }

    if (!any) {
        return std::nullopt;
    }
    return counters;
}

std::optional<std::vector<TemperatureReading>> HostProbe::temperatures() const {
    std::vector<TemperatureReading> readings;

    for (const auto& hwmon : sortedDirectoryEntries(sysPath("class/hwmon"))) {
        std::string chip = readFileFirstLine((hwmon / "name").string());
        if (chip.empty()) {
            chip = hwmon.filename().string();
        }

        std::vector<std::pair<int, TemperatureReading>> chipReadings;
        for (const auto& entry : sortedDirectoryEntries(hwmon)) {
            const std::string file = entry.filename().string();
            if (!startsWith(file, "temp") || file.size() <= 10 || file.compare(file.size() - 6, 6, "_input") != 0) {
                continue;
            }
            const std::string index = file.substr(4, file.size() - 10);
            auto current = readScaled(entry, 1000.0);
            if (!current) {
                continue;
            }

            TemperatureReading reading;
            reading.chip = chip;
            reading.label = readFileFirstLine((hwmon / ("temp" + index + "_label")).string());
            reading.currentC = *current;
            reading.highC = readScaled(hwmon / ("temp" + index + "_max"), 1000.0);
            reading.criticalC = readScaled(hwmon / ("temp" + index + "_crit"), 1000.0);
            chipReadings.emplace_back(static_cast<int>(parseUint64(index).value_or(0)), reading);
        }

        std::sort(chipReadings.begin(), chipReadings.end(), [](const auto& a, const auto& b) {
            return a.first < b.first;
        });
        for (auto& item : chipReadings) {
            readings.push_back(std::move(item.second));
        }
    }

    if (readings.empty()) {
        return std::nullopt;
    }
    return readings;
}

std::optional<BatteryInfo> HostProbe::battery() const {
    const fs::path supplies(sysPath("class/power_supply"));
    std::error_code error;
    if (!fs::is_directory(supplies, error)) {
        return std::nullopt;
    }

    std::optional<BatteryInfo> battery;
    bool acOnline = false;
    std::string status;
    std::optional<double> energyNow;
    std::optional<double> powerNow;

    for (const auto& supply : sortedDirectoryEntries(supplies)) {
        const std::string type = readFileFirstLine((supply / "type").string());
        if (type == "Mains" || type == "USB") {
            acOnline = acOnline || readFileFirstLine((supply / "online").string()) == "1";
            continue;
        }
        if (type != "Battery" || battery) {
            continue;
        }

        auto capacity = readSysfsValue((supply / "capacity").string());
        if (!capacity) {
            throw std::runtime_error("cannot read " + (supply / "capacity").string());
        }

        BatteryInfo info;
        info.percent = parseDouble(*capacity).value_or(0.0);
        battery = info;
        status = readFileFirstLine((supply / "status").string());

        energyNow = readScaled(supply / "energy_now", 1.0);
        powerNow = readScaled(supply / "power_now", 1.0);
        if (!energyNow || !powerNow) {
            energyNow = readScaled(supply / "charge_now", 1.0);
            powerNow = readScaled(supply / "current_now", 1.0);
        }
    }

    if (!battery) {
        return std::nullopt;
    }

    battery->powerPlugged = acOnline || status == "Charging" || status == "Full";
    if (!battery->powerPlugged && energyNow && powerNow && *powerNow > 0.0) {
        battery->secondsLeft = static_cast<std::int64_t>(*energyNow / *powerNow * 3600.0);
    }
    return battery;
}

std::vector<NetworkInterfaceInfo> HostProbe::network() const {
    std::vector<NetworkInterfaceInfo> list;
    std::map<std::string, NetworkInterfaceInfo> byName;

    ifaddrs* ifAddrList = nullptr;
    if (getifaddrs(&ifAddrList) != 0) {
        qCDebug(lcCollect) << "getifaddrs() failed";
        return list;
    }

    for (ifaddrs* it = ifAddrList; it != nullptr; it = it->ifa_next) {
        if (!it->ifa_name) {
            continue;
        }

        std::string ifaceName = it->ifa_name;
        auto& entry = byName[ifaceName];
        entry.name = ifaceName;

        if (!it->ifa_addr) {
            continue;
        }

        const int family = it->ifa_addr->sa_family;
        if (family == AF_INET) {
            InterfaceAddress address;
            address.address = numericHost(it->ifa_addr, sizeof(sockaddr_in));
            if (it->ifa_netmask) {
                address.netmask = numericHost(it->ifa_netmask, sizeof(sockaddr_in));
            }
            if (!address.address.empty()) {
                entry.ipv4.push_back(address);
            }
        } else if (family == AF_INET6) {
            const std::string address = numericHost(it->ifa_addr, sizeof(sockaddr_in6));
            if (!address.empty()) {
                entry.ipv6.push_back(address);
            }
        }
    }
    freeifaddrs(ifAddrList);

    for (auto& [name, entry] : byName) {
        const std::string base = sysPath("class/net/" + name);
        entry.mac = readFileFirstLine(base + "/address");
        entry.rxBytes = parseUint64(readFileFirstLine(base + "/statistics/rx_bytes")).value_or(0);
        entry.txBytes = parseUint64(readFileFirstLine(base + "/statistics/tx_bytes")).value_or(0);
        list.push_back(entry);
    }

    return list;
}

} // namespace sysscope
