#ifndef ESPLINK_ESP_LINK_HPP
#define ESPLINK_ESP_LINK_HPP

#include "command_router.hpp"
#include "esp_session.hpp"
#include "event_bus.hpp"
#include "transport.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <string>

namespace esplink {

/**
 * @brief One shared, observable connection to an ESP32
 *
 * Owns the event bus, the session and the command router. Create one per
 * process and hand it out as a std::shared_ptr to everything that needs
 * the device.
 */
class EspLink {
public:
    struct Config {
        EspSession::Config session;
        std::string parent_path;   // parent of FILE_LIST entries

        Config() : parent_path("/flash") {}
    };

    // Talks to a real serial port
    explicit EspLink(boost::asio::io_context& io_context, const Config& config = Config());

    // Talks through the given transport (tests, bridges)
    EspLink(boost::asio::io_context& io_context,
            std::unique_ptr<Transport> transport,
            const Config& config = Config());

    ~EspLink();

    EspLink(const EspLink&) = delete;
    EspLink& operator=(const EspLink&) = delete;

    // Connection
    bool connect(const std::string& port) { return session_->connect(port); }
    void disconnect() { session_->disconnect(); }

    // Queries
    ConnectionState getState() const { return session_->getState(); }
    bool isConnected() const { return session_->isConnected(); }
    const std::string& getCurrentPort() const { return session_->getCurrentPort(); }
    const std::string& getStatusMessage() const { return session_->getStatusMessage(); }
    const std::deque<std::string>& getOutputLog() const { return session_->getOutputLog(); }
    std::string getLastError() const { return session_->getLastError(); }
    const Config& getConfig() const { return config_; }

    /** @brief Event channels */
    EventBus& events() { return events_; }

    /** @brief Device commands */
    CommandRouter& commands() { return *router_; }

    /** @brief Lifecycle details (timers, liveness) */
    EspSession& session() { return *session_; }
    const EspSession& session() const { return *session_; }

private:
    Config config_;
    EventBus events_;
    std::unique_ptr<EspSession> session_;
    std::unique_ptr<CommandRouter> router_;
};

} // namespace esplink

#endif // ESPLINK_ESP_LINK_HPP
