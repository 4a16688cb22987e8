#ifndef ESPLINK_COMMAND_ROUTER_HPP
#define ESPLINK_COMMAND_ROUTER_HPP

#include "device_types.hpp"
#include "esp_session.hpp"
#include "event_bus.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <string>
#include <vector>
#include <cstdint>

namespace esplink {

/**
 * @brief Commands to the ESP32 and dispatch of its reports
 *
 * Every command is fire-and-forget: the reply arrives later on the event
 * bus. Commands return false and send nothing while the port is closed.
 */
class CommandRouter {
public:
    CommandRouter(EspSession& session, EventBus& events,
                  const std::string& parent_path = "/flash");
    ~CommandRouter();

    CommandRouter(const CommandRouter&) = delete;
    CommandRouter& operator=(const CommandRouter&) = delete;

    // Liveness probe, answered with PONG
    bool sendPing();

    bool listFiles();
    bool uploadFile(const std::string& remote_name, const std::vector<uint8_t>& data);

    /**
     * @brief Request a file from the device
     * @param remote_name File name on the device
     * @param destination Opaque token returned with the contents on
     *        download_complete (usually a local path)
     *
     * Only one download is tracked. A second call before the first
     * FILE_DATA arrives replaces the token.
     */
    bool downloadFile(const std::string& remote_name, const std::string& destination);

    bool deleteFile(const std::string& remote_name);
    bool readConfig();
    bool writeConfig(const DeviceConfig& config);
    bool getBoardSerial();
    bool fetchDeviceTime();

    bool syncTime(const std::tm& time);
    bool syncTimeUtc(std::chrono::system_clock::time_point time);

    // Truncate a CSV data file on the device, keeping its header row
    bool clearDataFile(const std::string& remote_name);

    // Terminal input, sent as-is plus '\n'
    bool sendRaw(const std::string& text);

    /**
     * @brief First requests after the handshake
     * Syncs the device clock to UTC, then asks for the file list, the
     * configuration and the board serial. Does nothing unless connected.
     */
    void initializeDevice();

    // Inbound message entry point (installed on the session)
    void dispatch(const nlohmann::json& message);

    const std::vector<uint8_t>& getLastDownloadedData() const { return last_downloaded_; }
    const std::string& getParentPath() const { return parent_path_; }

private:
    EspSession& session_;
    EventBus& events_;
    std::string parent_path_;
    std::vector<uint8_t> last_downloaded_;

    bool send(const nlohmann::ordered_json& command);
    bool sendWithFilename(const char* type, const std::string& remote_name);

    void handleHandshake(const nlohmann::json& message);
    void handleFileList(const nlohmann::json& message);
    void handleFileData(const nlohmann::json& message);
    void handleStatus(const nlohmann::json& message);
};

} // namespace esplink

#endif // ESPLINK_COMMAND_ROUTER_HPP
