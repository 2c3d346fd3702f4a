#include "sysscope/byte_format.hpp"

#include <array>
#include <cmath>
#include <cstdio>

namespace sysscope {

ScaledSize scaleBytes(std::uint64_t bytes) {
    static const std::array<const char*, 7> prefixes = {"", "K", "M", "G", "T", "P", "E"};
    constexpr double factor = 1024.0;

    double value = static_cast<double>(bytes);
    std::size_t index = 0;
    while (value >= factor && index + 1 < prefixes.size()) {
        value /= factor;
        ++index;
    }
    // 1023.999 would print as 1024.00; move to the next prefix instead.
    if (std::round(value * 100.0) / 100.0 >= factor && index + 1 < prefixes.size()) {
        value /= factor;
        ++index;
    }
    return ScaledSize{value, prefixes[index]};
}

std::string formatSize(std::uint64_t bytes, const std::string& suffix) {
    const ScaledSize scaled = scaleBytes(bytes);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", scaled.value);
    return std::string(buffer) + scaled.prefix + suffix;
}

} // namespace sysscope
