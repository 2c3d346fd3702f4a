#include "sysscope/text_util.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sysscope {

std::string trim(std::string value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

std::vector<std::string> split(const std::string& input, char delimiter) {
    std::vector<std::string> out;
    std::stringstream ss(input);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        out.push_back(token);
    }
    return out;
}

std::vector<std::string> splitWhitespace(const std::string& input) {
    std::vector<std::string> out;
    std::istringstream ss(input);
    std::string token;
    while (ss >> token) {
        out.push_back(token);
    }
    return out;
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string readFileFirstLine(const std::string& path) {
    return readSysfsValue(path).value_or(std::string());
}

std::optional<std::string> readSysfsValue(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }

    std::string line;
    std::getline(file, line);
    if (file.bad()) {
        return std::nullopt;
    }
    return trim(line);
}

std::optional<std::uint64_t> parseUint64(const std::string& value) {
    const std::string text = trim(value);
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<double> parseDouble(const std::string& value) {
    const std::string text = trim(value);
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(text, &consumed);
        if (consumed == 0) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::vector<std::filesystem::path> sortedDirectoryEntries(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> entries;
    std::error_code error;
    std::filesystem::directory_iterator it(directory, error);
    if (error) {
        return entries;
    }
    for (const auto& entry : it) {
        entries.push_back(entry.path());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

std::string unescapeMountField(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const std::string octal = field.substr(i + 1, 3);
            if (std::all_of(octal.begin(), octal.end(), [](char c) { return c >= '0' && c <= '7'; })) {
                out.push_back(static_cast<char>(std::stoi(octal, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        out.push_back(field[i]);
    }
    return out;
}

} // namespace sysscope
