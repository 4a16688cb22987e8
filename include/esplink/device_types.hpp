#ifndef ESPLINK_DEVICE_TYPES_HPP
#define ESPLINK_DEVICE_TYPES_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace esplink {

// Connection lifecycle
enum class ConnectionState {
    DISCONNECTED = 0,
    CONNECTING = 1,
    CONNECTED = 2
};

const char* toString(ConnectionState state);

// File system entry kinds
enum class EntryKind {
    FILE = 0,
    DIRECTORY = 1
};

// One entry of a FILE_LIST report
struct FileSystemEntry {
    std::string parent_path;
    std::string name;
    EntryKind kind = EntryKind::FILE;
    uint64_t size_bytes = 0;

    std::string fullPath() const { return parent_path + "/" + name; }
    bool isDirectory() const { return kind == EntryKind::DIRECTORY; }
    bool isFile() const { return kind == EntryKind::FILE; }
};

// Device configuration (drivers/jobs keep their display order)
struct DeviceConfig {
    std::string board_serial;
    std::string machine_name;
    std::string last_updated;
    std::vector<std::string> drivers;
    std::vector<std::string> jobs;
};

// Clock snapshot from a TIME report
struct DeviceTimeInfo {
    std::string rtc_time;
    std::string esp_time;
    std::string local_time;
    bool rtc_available = false;
};

// Error categories published on the error channel
enum class ErrorKind {
    TRANSPORT_OPEN,
    TRANSPORT_READ,
    TRANSPORT_WRITE,
    PROTOCOL_TIMEOUT,
    DEVICE_REPORTED
};

const char* toString(ErrorKind kind);

struct LinkError {
    ErrorKind kind;
    std::string message;
};

} // namespace esplink

#endif // ESPLINK_DEVICE_TYPES_HPP
