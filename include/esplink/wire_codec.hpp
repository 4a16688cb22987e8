#ifndef ESPLINK_WIRE_CODEC_HPP
#define ESPLINK_WIRE_CODEC_HPP

#include "device_types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <string>
#include <vector>
#include <cstdint>

namespace esplink {

// Wire message type discriminators (the "type" field)
namespace wire {

// Client -> device
constexpr const char* HANDSHAKE = "HANDSHAKE";
constexpr const char* PING = "PING";
constexpr const char* LIST_FILES = "LIST_FILES";
constexpr const char* UPLOAD_FILE = "UPLOAD_FILE";
constexpr const char* DOWNLOAD_FILE = "DOWNLOAD_FILE";
constexpr const char* DELETE_FILE = "DELETE_FILE";
constexpr const char* READ_CONFIG = "READ_CONFIG";
constexpr const char* WRITE_CONFIG = "WRITE_CONFIG";
constexpr const char* GET_SERIAL = "GET_SERIAL";
constexpr const char* FETCH_TIME = "FETCH_TIME";
constexpr const char* SYNC_TIME = "SYNC_TIME";
constexpr const char* CLEAR_CSV = "CLEAR_CSV";

// Device -> client (HANDSHAKE is reused for the acceptance)
constexpr const char* PONG = "PONG";
constexpr const char* ACK = "ACK";
constexpr const char* NAK = "NAK";
constexpr const char* ERROR_REPORT = "ERROR";
constexpr const char* SERIAL = "SERIAL";
constexpr const char* FILE_LIST = "FILE_LIST";
constexpr const char* CONFIG = "CONFIG";
constexpr const char* TIME = "TIME";
constexpr const char* FILE_DATA = "FILE_DATA";
constexpr const char* STATUS = "STATUS";

constexpr const char* STATUS_DISCONNECTED = "disconnected";
constexpr const char* KIND_DIRECTORY = "dir";

} // namespace wire

/**
 * @brief JSON-lines wire codec for the ESP32 protocol
 *
 * Every message is one compact JSON object terminated by '\n'. Binary file
 * contents travel as lowercase hex, two digits per byte.
 */
namespace codec {

/**
 * @brief Parse one frame into a wire message
 * @param frame Text of one line, without terminator
 * @param message Output object (left untouched on failure)
 * @param error Reason on failure
 * @return false if the frame is not a JSON object
 */
bool decode(const std::string& frame, nlohmann::json& message, std::string& error);

// "type" of a decoded message, empty if absent or not a string
std::string messageType(const nlohmann::json& message);

// Compact JSON plus '\n'. Commands keep insertion order, "type" first.
std::string encode(const nlohmann::ordered_json& command);

// {"type": type}
nlohmann::ordered_json command(const char* type);

std::string bytesToHex(const std::vector<uint8_t>& data);

/**
 * @brief Inverse of bytesToHex
 * Accepts either case. Fails on odd length or any non-hex digit and leaves
 * @p out empty in that case.
 */
bool hexToBytes(const std::string& hex, std::vector<uint8_t>& out);

// Lenient field access: missing or mistyped fields yield the default
std::string stringField(const nlohmann::json& object, const char* key);
bool boolField(const nlohmann::json& object, const char* key);
std::vector<std::string> stringListField(const nlohmann::json& object, const char* key);

nlohmann::ordered_json configToJson(const DeviceConfig& config);
DeviceConfig configFromJson(const nlohmann::json& config);

/**
 * @brief Entries of a FILE_LIST "files" array
 * Items are either {"name","type","size"} objects or bare file names. Items
 * of any other JSON type are skipped.
 */
std::vector<FileSystemEntry> fileListFromJson(const nlohmann::json& files,
                                              const std::string& parent_path);

DeviceTimeInfo timeInfoFromJson(const nlohmann::json& message);

// "Y,M,D,h,m,s" as expected by SYNC_TIME
std::string formatSyncTime(const std::tm& time);
// Empty if the time cannot be represented as a UTC calendar date
std::string formatSyncTimeUtc(std::chrono::system_clock::time_point time);

} // namespace codec

} // namespace esplink

#endif // ESPLINK_WIRE_CODEC_HPP
