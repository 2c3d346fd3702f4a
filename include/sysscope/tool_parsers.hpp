#pragma once

#include "sysscope/system_info.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sysscope {

using ToolRecord = std::map<std::string, std::string>;

// ConvertTo-Json output of a Get-CimInstance query: a single object or an
// array of objects. Null properties are left out; numbers are rendered
// without exponent.
std::vector<ToolRecord> parseCimJson(const std::string& json);

// "wmic ... /format:list" output: Key=Value lines, records separated by
// blank lines. Empty values are dropped.
std::vector<ToolRecord> parseWmicList(const std::string& output);

// nvidia-smi --query-gpu=name,driver_version,temperature.gpu,memory.total,
// memory.used,memory.free,utilization.gpu --format=csv,noheader,nounits
std::vector<GpuInfo> parseNvidiaSmiCsv(const std::string& csv);

// "dmidecode -t 17" memory device blocks; empty slots are skipped.
std::vector<MemoryModule> parseDmidecodeMemory(const std::string& output);

std::optional<std::string> parseLscpuModel(const std::string& output);

// CIM dates arrive as "/Date(ms)/" or ISO 8601; both become YYYY-MM-DD.
std::string normalizeCimDate(const std::string& value);

} // namespace sysscope
