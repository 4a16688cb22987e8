#ifndef ESPLINK_ESP_SESSION_HPP
#define ESPLINK_ESP_SESSION_HPP

#include "device_types.hpp"
#include "event_bus.hpp"
#include "line_framer.hpp"
#include "transport.hpp"
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <cstdint>

namespace esplink {

/**
 * @brief Connection lifecycle of one ESP32 link
 *
 * DISCONNECTED -> CONNECTING on connect(), CONNECTING -> CONNECTED when the
 * device accepts the handshake, back to DISCONNECTED on disconnect(), on
 * handshake timeout, on heartbeat liveness loss, on a read error or when the
 * device reports that it is disconnecting.
 *
 * The connect timer runs only while CONNECTING and the heartbeat timer only
 * while CONNECTED. All members must be called on the io_context thread.
 */
class EspSession {
public:
    struct Config {
        unsigned int connect_timeout_ms;
        unsigned int heartbeat_interval_ms;
        unsigned int pong_timeout_ms;
        unsigned int settle_delay_ms;     // ESP32 boot noise after the port opens
        std::string client_name;          // "device" field of our handshake
        int protocol_version;
        std::string expected_device;      // "device" field of the acceptance
        size_t output_log_limit;
        SerialSettings serial;

        Config()
            : connect_timeout_ms(5000)
            , heartbeat_interval_ms(3000)
            , pong_timeout_ms(10000)
            , settle_delay_ms(1000)
            , client_name("esplink")
            , protocol_version(1)
            , expected_device("ESP32")
            , output_log_limit(1000)
        {}
    };

    using MessageHandler = std::function<void(const nlohmann::json&)>;

    EspSession(boost::asio::io_context& io_context,
               std::unique_ptr<Transport> transport,
               EventBus& events,
               const Config& config = Config());
    ~EspSession();

    EspSession(const EspSession&) = delete;
    EspSession& operator=(const EspSession&) = delete;

    /**
     * @brief Open @p port and send the handshake
     *
     * Tears down any existing session first. Blocks for the settle delay,
     * then returns without waiting for the acceptance; watch state_changed
     * for CONNECTED.
     * @return false if the port could not be opened
     */
    bool connect(const std::string& port);

    // Idempotent; emits no error
    void disconnect();

    // Receives every decoded message (the command router)
    void setMessageHandler(MessageHandler handler) { message_handler_ = std::move(handler); }

    // State queries
    ConnectionState getState() const { return state_; }
    bool isConnected() const { return state_ == ConnectionState::CONNECTED; }
    bool isTransportOpen() const { return transport_->isOpen(); }
    const std::string& getCurrentPort() const { return current_port_; }
    const std::string& getStatusMessage() const { return status_message_; }
    const std::deque<std::string>& getOutputLog() const { return output_log_; }
    std::chrono::steady_clock::time_point getLastLiveness() const { return last_liveness_; }
    bool isConnectTimerActive() const { return connect_timer_active_; }
    bool isHeartbeatActive() const { return heartbeat_active_; }
    std::string getLastError() const { return last_error_; }
    const Config& getConfig() const { return config_; }

    //=========================================================================
    // Used by the command router
    //=========================================================================

    /**
     * @brief Write one line to the device
     * Appends '\n' if missing and mirrors the line to the raw log.
     * @return false if the port is closed or the write failed
     */
    bool sendLine(const std::string& line);
    bool sendJson(const nlohmann::ordered_json& message);

    // CONNECTING -> CONNECTED; refreshes liveness in any live state
    void acceptHandshake();
    void refreshLiveness();

    // Publish the error, then tear down
    void forceDisconnect(ErrorKind kind, const std::string& reason);

    void setStatus(const std::string& message);

    // Destination token of the single outstanding download (any string, "" included)
    void setPendingDownload(const std::string& token) { pending_download_ = token; }
    bool hasPendingDownload() const { return pending_download_.has_value(); }
    std::string getPendingDownload() const { return pending_download_.value_or(std::string()); }
    void clearPendingDownload() { pending_download_.reset(); }

private:
    std::unique_ptr<Transport> transport_;
    EventBus& events_;
    Config config_;

    ConnectionState state_;
    std::string current_port_;
    std::string status_message_;
    std::string last_error_;
    std::optional<std::string> pending_download_;
    LineFramer framer_;
    std::deque<std::string> output_log_;
    std::chrono::steady_clock::time_point last_liveness_;
    MessageHandler message_handler_;

    boost::asio::steady_timer connect_timer_;
    boost::asio::steady_timer heartbeat_timer_;
    bool connect_timer_active_;
    bool heartbeat_active_;
    uint64_t timer_epoch_;   // bumped on cancel, stale completions compare against it

    void setState(ConnectionState state);

    void startConnectTimer();
    void onConnectTimeout(const boost::system::error_code& ec);
    void startHeartbeat();
    void scheduleHeartbeat();
    void onHeartbeat(const boost::system::error_code& ec);
    void cancelTimers();

    void onRead(const boost::system::error_code& ec, const uint8_t* data, size_t size);
    void processFrame(const std::string& line);
    bool sendHandshake();
    void appendOutput(const std::string& text);
    void clearBuffers();
};

} // namespace esplink

#endif // ESPLINK_ESP_SESSION_HPP
