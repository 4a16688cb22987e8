#ifndef ESPLINK_TESTS_LINK_FIXTURE_HPP
#define ESPLINK_TESTS_LINK_FIXTURE_HPP

#include "fake_transport.hpp"
#include "esplink/esp_link.hpp"
#include <boost/asio.hpp>
#include <boost/signals2/connection.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace esplink {
namespace testing {

constexpr const char* kPort = "/dev/ttyUSB0";
constexpr const char* kHandshakeAccept = "{\"type\":\"HANDSHAKE\",\"device\":\"ESP32\"}\n";

// Millisecond-scale timeouts so timer tests run quickly
inline EspLink::Config fastConfig() {
    EspLink::Config config;
    config.session.connect_timeout_ms = 50;
    config.session.heartbeat_interval_ms = 20;
    config.session.pong_timeout_ms = 100;
    config.session.settle_delay_ms = 0;
    return config;
}

// EspLink over a FakeTransport, recording every event
struct LinkFixture {
    boost::asio::io_context io;
    std::shared_ptr<FakePort> port;
    std::shared_ptr<EspLink> link;

    std::vector<ConnectionState> states;
    std::vector<std::string> statuses;
    std::vector<LinkError> errors;
    std::vector<std::string> operations;
    std::vector<std::vector<FileSystemEntry>> file_lists;
    std::vector<DeviceConfig> configs;
    std::vector<DeviceTimeInfo> times;
    std::vector<std::string> serials;
    std::vector<std::pair<std::string, std::vector<uint8_t>>> downloads;
    std::vector<std::string> raw_log;
    std::vector<nlohmann::json> messages;
    std::vector<std::string> rejected;
    std::vector<boost::signals2::scoped_connection> connections;

    explicit LinkFixture(const EspLink::Config& config = fastConfig())
        : port(std::make_shared<FakePort>())
    {
        link = std::make_shared<EspLink>(io, std::make_unique<FakeTransport>(port), config);
        EventBus& ev = link->events();
        connections.emplace_back(ev.state_changed.connect([this](ConnectionState s) { states.push_back(s); }));
        connections.emplace_back(ev.status_changed.connect([this](const std::string& s) { statuses.push_back(s); }));
        connections.emplace_back(ev.error.connect([this](const LinkError& e) { errors.push_back(e); }));
        connections.emplace_back(ev.operation.connect([this](const std::string& s) { operations.push_back(s); }));
        connections.emplace_back(ev.file_list.connect(
            [this](const std::vector<FileSystemEntry>& f) { file_lists.push_back(f); }));
        connections.emplace_back(ev.config.connect([this](const DeviceConfig& c) { configs.push_back(c); }));
        connections.emplace_back(ev.time.connect([this](const DeviceTimeInfo& t) { times.push_back(t); }));
        connections.emplace_back(ev.serial_number.connect([this](const std::string& s) { serials.push_back(s); }));
        connections.emplace_back(ev.download_complete.connect(
            [this](const std::string& token, const std::vector<uint8_t>& data) {
                downloads.emplace_back(token, data);
            }));
        connections.emplace_back(ev.raw_log.connect([this](const std::string& s) { raw_log.push_back(s); }));
        connections.emplace_back(ev.message.connect([this](const nlohmann::json& m) { messages.push_back(m); }));
        connections.emplace_back(ev.frame_rejected.connect(
            [this](const std::string& line, const std::string&) { rejected.push_back(line); }));
    }

    bool connectAndHandshake() {
        bool opened = link->connect(kPort);
        port->inject(kHandshakeAccept);
        return opened;
    }

    void runFor(int ms) {
        io.restart();
        io.run_for(std::chrono::milliseconds(ms));
    }
};

} // namespace testing
} // namespace esplink

#endif // ESPLINK_TESTS_LINK_FIXTURE_HPP
