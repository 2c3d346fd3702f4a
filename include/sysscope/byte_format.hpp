#pragma once

#include <cstdint>
#include <string>

namespace sysscope {

struct ScaledSize {
    double value = 0.0;
    // Binary prefix: "", "K", "M", "G", "T", "P" or "E".
    std::string prefix;
};

// Divides by 1024 until the value, rounded to two decimals, drops below 1024.
ScaledSize scaleBytes(std::uint64_t bytes);

// "1.50GB" style, two decimals, factor 1024.
std::string formatSize(std::uint64_t bytes, const std::string& suffix = "B");

} // namespace sysscope
