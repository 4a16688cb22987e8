#include "esplink/command_router.hpp"
#include "esplink/wire_codec.hpp"
#include <iostream>

namespace esplink {

CommandRouter::CommandRouter(EspSession& session, EventBus& events,
                             const std::string& parent_path)
    : session_(session)
    , events_(events)
    , parent_path_(parent_path)
{
    session_.setMessageHandler([this](const nlohmann::json& message) { dispatch(message); });
}

CommandRouter::~CommandRouter() {
    session_.setMessageHandler(nullptr);
}

//=============================================================================
// Commands
//=============================================================================

bool CommandRouter::send(const nlohmann::ordered_json& command) {
    // Closed port: drop silently, callers gate on the connection state
    if (!session_.isTransportOpen()) {
        return false;
    }
    return session_.sendJson(command);
}

bool CommandRouter::sendWithFilename(const char* type, const std::string& remote_name) {
    nlohmann::ordered_json command = codec::command(type);
    command["filename"] = remote_name;
    return send(command);
}

bool CommandRouter::sendPing() {
    return send(codec::command(wire::PING));
}

bool CommandRouter::listFiles() {
    return send(codec::command(wire::LIST_FILES));
}

bool CommandRouter::uploadFile(const std::string& remote_name, const std::vector<uint8_t>& data) {
    nlohmann::ordered_json command = codec::command(wire::UPLOAD_FILE);
    command["filename"] = remote_name;
    command["hexdata"] = codec::bytesToHex(data);
    return send(command);
}

bool CommandRouter::downloadFile(const std::string& remote_name, const std::string& destination) {
    if (!session_.isTransportOpen()) {
        return false;
    }
    session_.setPendingDownload(destination);
    return sendWithFilename(wire::DOWNLOAD_FILE, remote_name);
}

bool CommandRouter::deleteFile(const std::string& remote_name) {
    return sendWithFilename(wire::DELETE_FILE, remote_name);
}

bool CommandRouter::readConfig() {
    return send(codec::command(wire::READ_CONFIG));
}

bool CommandRouter::writeConfig(const DeviceConfig& config) {
    nlohmann::ordered_json command = codec::command(wire::WRITE_CONFIG);
    command["config"] = codec::configToJson(config);
    return send(command);
}

bool CommandRouter::getBoardSerial() {
    return send(codec::command(wire::GET_SERIAL));
}

bool CommandRouter::fetchDeviceTime() {
    return send(codec::command(wire::FETCH_TIME));
}

bool CommandRouter::syncTime(const std::tm& time) {
    nlohmann::ordered_json command = codec::command(wire::SYNC_TIME);
    command["time"] = codec::formatSyncTime(time);
    return send(command);
}

bool CommandRouter::syncTimeUtc(std::chrono::system_clock::time_point time) {
    const std::string formatted = codec::formatSyncTimeUtc(time);
    if (formatted.empty()) return false;

    nlohmann::ordered_json command = codec::command(wire::SYNC_TIME);
    command["time"] = formatted;
    return send(command);
}

bool CommandRouter::clearDataFile(const std::string& remote_name) {
    return sendWithFilename(wire::CLEAR_CSV, remote_name);
}

bool CommandRouter::sendRaw(const std::string& text) {
    return session_.sendLine(text);
}

void CommandRouter::initializeDevice() {
    if (!session_.isConnected()) return;

    bool ok = syncTimeUtc(std::chrono::system_clock::now());
    ok = listFiles() && ok;
    ok = readConfig() && ok;
    ok = getBoardSerial() && ok;
    if (!ok) {
        session_.setStatus("Device initialization incomplete: " + session_.getLastError());
    }
}

//=============================================================================
// Inbound dispatch
//=============================================================================

void CommandRouter::dispatch(const nlohmann::json& message) {
    const std::string type = codec::messageType(message);

    #ifdef ESPLINK_DEBUG_PROTOCOL
    std::cout << "[RX] Message type: " << type << std::endl;
    #endif

    events_.message(message);

    if (type == wire::HANDSHAKE) {
        handleHandshake(message);
    } else if (type == wire::PONG) {
        session_.refreshLiveness();
    } else if (type == wire::ACK) {
        events_.operation("ACK: " + codec::stringField(message, "cmd"));
    } else if (type == wire::NAK) {
        events_.error(LinkError{ErrorKind::DEVICE_REPORTED,
            "NAK: " + codec::stringField(message, "cmd") +
            " (" + codec::stringField(message, "error_msg") + ")"});
    } else if (type == wire::ERROR_REPORT) {
        events_.error(LinkError{ErrorKind::DEVICE_REPORTED,
            "Device error: " + codec::stringField(message, "error_msg")});
    } else if (type == wire::SERIAL) {
        events_.serial_number(codec::stringField(message, "serial"));
        session_.setStatus("Board serial received");
    } else if (type == wire::FILE_LIST) {
        handleFileList(message);
    } else if (type == wire::CONFIG) {
        auto it = message.find("config");
        events_.config(codec::configFromJson(it != message.end() ? *it : nlohmann::json::object()));
        session_.setStatus("Configuration loaded");
    } else if (type == wire::TIME) {
        events_.time(codec::timeInfoFromJson(message));
        session_.setStatus("Device time updated");
    } else if (type == wire::FILE_DATA) {
        handleFileData(message);
    } else if (type == wire::STATUS) {
        handleStatus(message);
    }
    // Unknown types only go out on the message channel
}

void CommandRouter::handleHandshake(const nlohmann::json& message) {
    const std::string device = codec::stringField(message, "device");
    if (device != session_.getConfig().expected_device) {
        return;
    }

    bool was_connected = session_.isConnected();
    session_.acceptHandshake();
    if (!was_connected && session_.isConnected()) {
        events_.operation("Handshake complete: " + device);
    }
}

void CommandRouter::handleFileList(const nlohmann::json& message) {
    auto it = message.find("files");
    std::vector<FileSystemEntry> entries;
    if (it != message.end()) {
        entries = codec::fileListFromJson(*it, parent_path_);
    }
    events_.file_list(entries);
    session_.setStatus("File list updated");
}

void CommandRouter::handleFileData(const nlohmann::json& message) {
    const std::string hex = codec::stringField(message, "hexdata");
    if (!session_.hasPendingDownload() || hex.empty()) {
        return;
    }

    std::vector<uint8_t> data;
    if (!codec::hexToBytes(hex, data)) {
        events_.error(LinkError{ErrorKind::DEVICE_REPORTED,
            "Invalid file data for " + session_.getPendingDownload()});
        return;
    }

    // Clear first so a subscriber may start the next download
    const std::string destination = session_.getPendingDownload();
    session_.clearPendingDownload();
    last_downloaded_ = data;

    events_.download_complete(destination, last_downloaded_);
    events_.operation("File downloaded: " + destination);
}

void CommandRouter::handleStatus(const nlohmann::json& message) {
    if (codec::stringField(message, "status") == wire::STATUS_DISCONNECTED &&
        session_.isConnected()) {
        session_.forceDisconnect(ErrorKind::DEVICE_REPORTED, "Device reported disconnect");
    }
}

} // namespace esplink
