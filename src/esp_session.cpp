#include "esplink/esp_session.hpp"
#include "esplink/wire_codec.hpp"
#include <iostream>
#include <thread>

namespace esplink {

EspSession::EspSession(boost::asio::io_context& io_context,
                       std::unique_ptr<Transport> transport,
                       EventBus& events,
                       const Config& config)
    : transport_(std::move(transport))
    , events_(events)
    , config_(config)
    , state_(ConnectionState::DISCONNECTED)
    , status_message_("Ready")
    , last_liveness_(std::chrono::steady_clock::now())
    , connect_timer_(io_context)
    , heartbeat_timer_(io_context)
    , connect_timer_active_(false)
    , heartbeat_active_(false)
    , timer_epoch_(0)
{
}

EspSession::~EspSession() {
    cancelTimers();
    transport_->close();
}

bool EspSession::connect(const std::string& port) {
    if (state_ != ConnectionState::DISCONNECTED || transport_->isOpen()) {
        disconnect();
    }

    if (!transport_->open(port, config_.serial)) {
        last_error_ = "Failed to open " + port + ": " + transport_->getLastError();
        setStatus(last_error_);
        events_.error(LinkError{ErrorKind::TRANSPORT_OPEN, last_error_});
        return false;
    }

    current_port_ = port;
    last_error_.clear();
    clearBuffers();
    startConnectTimer();
    setState(ConnectionState::CONNECTING);
    setStatus("Connecting to " + port + "...");

    // Opening the port may reset the board; its ROM prints at 74880 baud
    // which shows up as garbage at 115200. Let it finish, then drop it.
    if (config_.settle_delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.settle_delay_ms));
    }
    transport_->flush();
    clearBuffers();

    transport_->startReading(
        [this](const boost::system::error_code& ec, const uint8_t* data, size_t size) {
            onRead(ec, data, size);
        });

    if (!sendHandshake()) {
        setStatus("Handshake not sent: " + last_error_);
    }
    return true;
}

void EspSession::disconnect() {
    cancelTimers();
    transport_->close();
    framer_.clear();
    current_port_.clear();
    pending_download_.reset();
    setState(ConnectionState::DISCONNECTED);
    setStatus("Disconnected");
}

void EspSession::forceDisconnect(ErrorKind kind, const std::string& reason) {
    #ifdef ESPLINK_DEBUG_PROTOCOL
    std::cout << "[ESP] " << toString(kind) << ": " << reason << std::endl;
    #endif
    last_error_ = reason;
    events_.error(LinkError{kind, reason});
    disconnect();
}

void EspSession::setState(ConnectionState state) {
    if (state_ == state) return;

    state_ = state;

    switch (state) {
        case ConnectionState::DISCONNECTED:
            cancelTimers();
            break;
        case ConnectionState::CONNECTING:
            // connect() arms the connect timer
            break;
        case ConnectionState::CONNECTED:
            connect_timer_.cancel();
            connect_timer_active_ = false;
            last_liveness_ = std::chrono::steady_clock::now();
            startHeartbeat();
            break;
    }

    events_.state_changed(state);
}

void EspSession::setStatus(const std::string& message) {
    status_message_ = message;
    events_.status_changed(message);
}

void EspSession::acceptHandshake() {
    if (state_ == ConnectionState::DISCONNECTED) return;

    refreshLiveness();
    if (state_ == ConnectionState::CONNECTING) {
        setState(ConnectionState::CONNECTED);
        // A state_changed slot may already have torn the session down
        if (state_ == ConnectionState::CONNECTED) {
            setStatus("Connected");
        }
    }
}

void EspSession::refreshLiveness() {
    last_liveness_ = std::chrono::steady_clock::now();
}

//=============================================================================
// Timers
//=============================================================================

void EspSession::startConnectTimer() {
    connect_timer_.expires_after(std::chrono::milliseconds(config_.connect_timeout_ms));
    connect_timer_active_ = true;
    uint64_t epoch = timer_epoch_;
    connect_timer_.async_wait([this, epoch](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || epoch != timer_epoch_) return;
        onConnectTimeout(ec);
    });
}

void EspSession::onConnectTimeout(const boost::system::error_code& ec) {
    connect_timer_active_ = false;
    if (ec || state_ != ConnectionState::CONNECTING) return;

    forceDisconnect(ErrorKind::PROTOCOL_TIMEOUT, "Connection timeout - no response from device");
}

void EspSession::startHeartbeat() {
    heartbeat_timer_.expires_after(std::chrono::milliseconds(config_.heartbeat_interval_ms));
    heartbeat_active_ = true;
    scheduleHeartbeat();
}

void EspSession::scheduleHeartbeat() {
    uint64_t epoch = timer_epoch_;
    heartbeat_timer_.async_wait([this, epoch](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || epoch != timer_epoch_) return;
        onHeartbeat(ec);
    });
}

void EspSession::onHeartbeat(const boost::system::error_code& ec) {
    if (ec || state_ != ConnectionState::CONNECTED) {
        heartbeat_active_ = false;
        return;
    }

    auto elapsed = std::chrono::steady_clock::now() - last_liveness_;
    if (elapsed > std::chrono::milliseconds(config_.pong_timeout_ms)) {
        #ifdef ESPLINK_DEBUG_PROTOCOL
        std::cout << "[Heartbeat] TIMEOUT - disconnecting" << std::endl;
        #endif
        forceDisconnect(ErrorKind::PROTOCOL_TIMEOUT, "Connection lost - no response from device");
        return;
    }

    // Fixed period, measured from the previous expiry
    heartbeat_timer_.expires_at(heartbeat_timer_.expiry() +
                                std::chrono::milliseconds(config_.heartbeat_interval_ms));
    scheduleHeartbeat();

    #ifdef ESPLINK_DEBUG_PROTOCOL
    std::cout << "[Heartbeat] Sending PING" << std::endl;
    #endif
    if (!sendJson(codec::command(wire::PING))) {
        setStatus("Heartbeat not sent: " + last_error_);
    }
}

void EspSession::cancelTimers() {
    timer_epoch_++;
    connect_timer_.cancel();
    heartbeat_timer_.cancel();
    connect_timer_active_ = false;
    heartbeat_active_ = false;
}

//=============================================================================
// Receive path
//=============================================================================

void EspSession::onRead(const boost::system::error_code& ec, const uint8_t* data, size_t size) {
    if (state_ == ConnectionState::DISCONNECTED) return;

    if (ec) {
        forceDisconnect(ErrorKind::TRANSPORT_READ, "Read error: " + ec.message());
        return;
    }

    std::string text = LineFramer::printable(data, size);
    if (!text.empty()) {
        #ifdef ESPLINK_DEBUG_PROTOCOL
        std::cout << "[SERIAL IN] " << text << std::endl;
        #endif
        appendOutput(text);
        events_.raw_log(text);
    }

    for (const auto& line : framer_.feed(data, size)) {
        processFrame(line);
        // A frame can end the session (STATUS disconnected)
        if (state_ == ConnectionState::DISCONNECTED) break;
    }
}

void EspSession::processFrame(const std::string& line) {
    #ifdef ESPLINK_DEBUG_PROTOCOL
    std::cout << "[RX] Complete line: " << line << std::endl;
    #endif

    // Any complete line from the device counts, JSON or not
    refreshLiveness();

    nlohmann::json message;
    std::string error;
    if (!codec::decode(line, message, error)) {
        #ifdef ESPLINK_DEBUG_PROTOCOL
        std::cout << "[RX] JSON parse error: " << error << std::endl;
        #endif
        events_.frame_rejected(line, error);
        return;
    }

    if (message_handler_) {
        message_handler_(message);
    }
}

//=============================================================================
// Transmit path
//=============================================================================

bool EspSession::sendLine(const std::string& line) {
    if (!transport_->isOpen()) return false;

    std::string out = line;
    if (out.empty() || out.back() != '\n') {
        out.push_back('\n');
    }

    #ifdef ESPLINK_DEBUG_PROTOCOL
    std::cout << "[SERIAL OUT] " << out;
    #endif

    if (!transport_->write(out)) {
        last_error_ = transport_->getLastError();
        events_.error(LinkError{ErrorKind::TRANSPORT_WRITE, last_error_});
        return false;
    }

    appendOutput("> " + out);
    events_.raw_log("> " + out);
    return true;
}

bool EspSession::sendJson(const nlohmann::ordered_json& message) {
    return sendLine(codec::encode(message));
}

bool EspSession::sendHandshake() {
    nlohmann::ordered_json handshake = codec::command(wire::HANDSHAKE);
    handshake["device"] = config_.client_name;
    handshake["version"] = config_.protocol_version;
    return sendJson(handshake);
}

void EspSession::appendOutput(const std::string& text) {
    output_log_.push_back(text);
    while (output_log_.size() > config_.output_log_limit) {
        output_log_.pop_front();
    }
}

void EspSession::clearBuffers() {
    framer_.clear();
    output_log_.clear();
}

} // namespace esplink
