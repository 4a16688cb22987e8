#include "esplink/wire_codec.hpp"
#include <sstream>
#include <ctime>

namespace esplink {
namespace codec {

namespace {

int hexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

uint64_t sizeField(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) {
        int64_t v = it->get<int64_t>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    return 0;
}

} // namespace

bool decode(const std::string& frame, nlohmann::json& message, std::string& error) {
    nlohmann::json parsed = nlohmann::json::parse(frame, nullptr, false);
    if (parsed.is_discarded()) {
        error = "Malformed JSON";
        return false;
    }
    if (!parsed.is_object()) {
        error = std::string("Expected JSON object, got ") + parsed.type_name();
        return false;
    }
    message = std::move(parsed);
    return true;
}

std::string messageType(const nlohmann::json& message) {
    return stringField(message, "type");
}

std::string encode(const nlohmann::ordered_json& command) {
    // Device-supplied text may carry invalid UTF-8; never throw on dump
    return command.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace) + "\n";
}

nlohmann::ordered_json command(const char* type) {
    return nlohmann::ordered_json{{"type", type}};
}

std::string bytesToHex(const std::vector<uint8_t>& data) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(data.size() * 2);
    for (uint8_t b : data) {
        hex.push_back(digits[b >> 4]);
        hex.push_back(digits[b & 0x0F]);
    }
    return hex;
}

bool hexToBytes(const std::string& hex, std::vector<uint8_t>& out) {
    out.clear();
    if (hex.size() % 2 != 0) {
        return false;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexDigitValue(hex[i]);
        int lo = hexDigitValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    out.swap(bytes);
    return true;
}

std::string stringField(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) return std::string();
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
}

bool boolField(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) return false;
    auto it = object.find(key);
    if (it == object.end() || !it->is_boolean()) return false;
    return it->get<bool>();
}

std::vector<std::string> stringListField(const nlohmann::json& object, const char* key) {
    std::vector<std::string> items;
    if (!object.is_object()) return items;
    auto it = object.find(key);
    if (it == object.end() || !it->is_array()) return items;
    for (const auto& item : *it) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

nlohmann::ordered_json configToJson(const DeviceConfig& config) {
    return nlohmann::ordered_json{
        {"board_serial", config.board_serial},
        {"Machine", config.machine_name},
        {"last_updated", config.last_updated},
        {"Driver", config.drivers},
        {"Jobs", config.jobs}
    };
}

DeviceConfig configFromJson(const nlohmann::json& config) {
    DeviceConfig result;
    result.board_serial = stringField(config, "board_serial");
    result.machine_name = stringField(config, "Machine");
    result.last_updated = stringField(config, "last_updated");
    result.drivers = stringListField(config, "Driver");
    result.jobs = stringListField(config, "Jobs");
    return result;
}

std::vector<FileSystemEntry> fileListFromJson(const nlohmann::json& files,
                                              const std::string& parent_path) {
    std::vector<FileSystemEntry> entries;
    if (!files.is_array()) return entries;

    for (const auto& item : files) {
        FileSystemEntry entry;
        entry.parent_path = parent_path;
        if (item.is_object()) {
            entry.name = stringField(item, "name");
            entry.kind = stringField(item, "type") == wire::KIND_DIRECTORY
                ? EntryKind::DIRECTORY : EntryKind::FILE;
            entry.size_bytes = sizeField(item, "size");
        } else if (item.is_string()) {
            entry.name = item.get<std::string>();
        } else {
            continue;
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

DeviceTimeInfo timeInfoFromJson(const nlohmann::json& message) {
    DeviceTimeInfo info;
    info.rtc_time = stringField(message, "rtc");
    info.esp_time = stringField(message, "esp");
    info.local_time = stringField(message, "local");
    info.rtc_available = boolField(message, "m5_available");
    return info;
}

std::string formatSyncTime(const std::tm& time) {
    std::ostringstream ss;
    ss << (time.tm_year + 1900) << ','
       << (time.tm_mon + 1) << ','
       << time.tm_mday << ','
       << time.tm_hour << ','
       << time.tm_min << ','
       << time.tm_sec;
    return ss.str();
}

std::string formatSyncTimeUtc(std::chrono::system_clock::time_point time) {
    std::time_t tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    #ifdef _WIN32
    if (gmtime_s(&tm, &tt) != 0) return std::string();
    #else
    if (gmtime_r(&tt, &tm) == nullptr) return std::string();
    #endif
    return formatSyncTime(tm);
}

} // namespace codec
} // namespace esplink
