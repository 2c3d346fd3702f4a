#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sysscope {

std::string trim(std::string value);

std::vector<std::string> split(const std::string& input, char delimiter);

// Splits on runs of whitespace, dropping empty tokens.
std::vector<std::string> splitWhitespace(const std::string& input);

bool startsWith(const std::string& value, const std::string& prefix);

// First line of a small procfs/sysfs file, trimmed. Empty when unreadable.
std::string readFileFirstLine(const std::string& path);

// Like readFileFirstLine, but distinguishes "missing" from "empty".
std::optional<std::string> readSysfsValue(const std::string& path);

std::optional<std::uint64_t> parseUint64(const std::string& value);
std::optional<double> parseDouble(const std::string& value);

// Directory listing sorted by path; empty when the directory is missing.
std::vector<std::filesystem::path> sortedDirectoryEntries(const std::filesystem::path& directory);

// Decodes the \040-style octal escapes used in /proc/mounts.
std::string unescapeMountField(const std::string& field);

} // namespace sysscope
