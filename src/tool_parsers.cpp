#include "sysscope/tool_parsers.hpp"

#include "sysscope/text_util.hpp"

#include <QByteArray>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QRegularExpression>
#include <QString>

#include <cmath>
#include <sstream>

namespace sysscope {
namespace {

std::optional<std::string> jsonValueText(const QJsonValue& value) {
    switch (value.type()) {
    case QJsonValue::String: {
        const std::string text = trim(value.toString().toStdString());
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }
    case QJsonValue::Double: {
        const double number = value.toDouble();
        if (std::floor(number) == number && std::fabs(number) < 9.0e15) {
            return QString::number(static_cast<qint64>(number)).toStdString();
        }
        return QString::number(number, 'f', 2).toStdString();
    }
    case QJsonValue::Bool:
        return std::string(value.toBool() ? "True" : "False");
    default:
        return std::nullopt;
    }
}

ToolRecord recordFromObject(const QJsonObject& object) {
    ToolRecord record;
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (auto text = jsonValueText(it.value())) {
            record[it.key().toStdString()] = *text;
        }
    }
    return record;
}

std::optional<double> nvidiaField(const std::string& field) {
    const std::string text = trim(field);
    if (text.empty() || text.front() == '[') {
        return std::nullopt;
    }
    return parseDouble(text);
}

std::optional<std::uint64_t> nvidiaMegabytes(const std::string& field) {
    auto value = nvidiaField(field);
    if (!value || *value < 0.0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(*value);
}

std::uint64_t parseDmidecodeSize(const std::string& value) {
    const auto tokens = splitWhitespace(value);
    if (tokens.size() < 2) {
        return 0;
    }
    auto amount = parseUint64(tokens[0]);
    if (!amount) {
        return 0;
    }

    const std::string& unit = tokens[1];
    if (unit == "kB" || unit == "KB" || unit == "KiB") {
        return *amount * 1024ULL;
    }
    if (unit == "MB" || unit == "MiB") {
        return *amount * 1024ULL * 1024ULL;
    }
    if (unit == "GB" || unit == "GiB") {
        return *amount * 1024ULL * 1024ULL * 1024ULL;
    }
    if (unit == "TB" || unit == "TiB") {
        return *amount * 1024ULL * 1024ULL * 1024ULL * 1024ULL;
    }
    return 0;
}

std::string dmidecodeText(const std::string& value) {
    static const char* const placeholders[] = {"Unknown", "Not Specified", "Not Provided", "Undefined"};
    for (const char* placeholder : placeholders) {
        if (value == placeholder) {
            return {};
        }
    }
    return value;
}

} // namespace

std::vector<ToolRecord> parseCimJson(const std::string& json) {
    std::vector<ToolRecord> records;
    QJsonParseError error{};
    const QJsonDocument document = QJsonDocument::fromJson(QByteArray::fromStdString(json), &error);
    if (error.error != QJsonParseError::NoError) {
        return records;
    }

    if (document.isObject()) {
        records.push_back(recordFromObject(document.object()));
    } else if (document.isArray()) {
        for (const QJsonValue& item : document.array()) {
            if (item.isObject()) {
                records.push_back(recordFromObject(item.toObject()));
            }
        }
    }
    return records;
}

std::vector<ToolRecord> parseWmicList(const std::string& output) {
    std::vector<ToolRecord> records;
    ToolRecord current;

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        const auto pos = line.find('=');
        if (pos != std::string::npos) {
            const std::string key = trim(line.substr(0, pos));
            const std::string value = trim(line.substr(pos + 1));
            if (!value.empty()) {
                current[key] = value;
            }
        } else if (line.empty() && !current.empty()) {
            records.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        records.push_back(current);
    }
    return records;
}

std::vector<GpuInfo> parseNvidiaSmiCsv(const std::string& csv) {
    std::vector<GpuInfo> gpus;
    std::istringstream stream(csv);
    std::string line;
    while (std::getline(stream, line)) {
        if (trim(line).empty()) {
            continue;
        }
        auto parts = split(line, ',');
        if (parts.size() < 7) {
            continue;
        }

        GpuInfo gpu;
        gpu.name = trim(parts[0]);
        gpu.driverVersion = trim(parts[1]);
        gpu.temperatureC = nvidiaField(parts[2]);
        gpu.memoryTotalMB = nvidiaMegabytes(parts[3]);
        gpu.memoryUsedMB = nvidiaMegabytes(parts[4]);
        gpu.memoryFreeMB = nvidiaMegabytes(parts[5]);
        gpu.utilizationPercent = nvidiaField(parts[6]);
        gpus.push_back(gpu);
    }
    return gpus;
}

std::vector<MemoryModule> parseDmidecodeMemory(const std::string& output) {
    std::vector<MemoryModule> modules;
    std::optional<MemoryModule> current;

    auto flush = [&]() {
        if (current && current->capacityBytes > 0) {
            modules.push_back(*current);
        }
        current.reset();
    };

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        const std::string text = trim(line);
        if (text == "Memory Device") {
            flush();
            current = MemoryModule{};
            continue;
        }
        if (!current) {
            continue;
        }
        if (text.empty()) {
            flush();
            continue;
        }

        const auto pos = text.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        const std::string key = trim(text.substr(0, pos));
        const std::string value = trim(text.substr(pos + 1));

        if (key == "Size") {
            current->capacityBytes = parseDmidecodeSize(value);
        } else if (key == "Locator") {
            current->slot = dmidecodeText(value);
        } else if (key == "Manufacturer") {
            current->manufacturer = dmidecodeText(value);
        } else if (key == "Part Number") {
            current->partNumber = dmidecodeText(value);
        } else if (key == "Speed") {
            current->speedMHz = static_cast<unsigned int>(parseUint64(value).value_or(0));
        }
    }
    flush();
    return modules;
}

std::optional<std::string> parseLscpuModel(const std::string& output) {
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        if (trim(line.substr(0, pos)) == "Model name") {
            std::string value = trim(line.substr(pos + 1));
            if (!value.empty() && value != "-") {
                return value;
            }
        }
    }
    return std::nullopt;
}

std::string normalizeCimDate(const std::string& value) {
    const QString text = QString::fromStdString(trim(value));

    static const QRegularExpression epochPattern(QStringLiteral(R"(^/?\\?/?Date\((-?\d+)[^)]*\)\\?/?$)"));
    const auto epoch = epochPattern.match(text);
    if (epoch.hasMatch()) {
        const qint64 ms = epoch.captured(1).toLongLong();
        return QDateTime::fromMSecsSinceEpoch(ms, Qt::UTC).toString(QStringLiteral("yyyy-MM-dd")).toStdString();
    }

    const QDateTime iso = QDateTime::fromString(text, Qt::ISODate);
    if (iso.isValid()) {
        return iso.toString(QStringLiteral("yyyy-MM-dd")).toStdString();
    }

    // DMTF datetime, e.g. 20200115000000.000000+000
    static const QRegularExpression dmtfPattern(QStringLiteral(R"(^(\d{4})(\d{2})(\d{2})\d{6}\.)"));
    const auto dmtf = dmtfPattern.match(text);
    if (dmtf.hasMatch()) {
        return QStringLiteral("%1-%2-%3").arg(dmtf.captured(1), dmtf.captured(2), dmtf.captured(3)).toStdString();
    }

    return text.toStdString();
}

} // namespace sysscope
