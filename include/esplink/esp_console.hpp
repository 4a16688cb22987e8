#ifndef ESPLINK_ESP_CONSOLE_HPP
#define ESPLINK_ESP_CONSOLE_HPP

#include "esp_link.hpp"
#include <boost/signals2/connection.hpp>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace esplink {

/**
 * @brief Line-oriented command console for an EspLink
 *
 * Turns typed commands into device commands and prints the events that
 * come back. Downloads are written to the local path used as the
 * destination token; uploads read a local file.
 */
class EspConsole {
public:
    struct Options {
        std::string port;
        bool initialize_on_connect;   // initializeDevice() after the handshake
        bool monitor;                 // echo the raw serial log

        Options() : initialize_on_connect(true), monitor(false) {}
    };

    EspConsole(std::shared_ptr<EspLink> link, std::ostream& out, std::ostream& err,
               const Options& options = Options());

    // Returns false once the user asked to quit
    bool handleCommand(const std::string& line);

    void printHelp();

    // Last configuration received from the device, with local edits
    const DeviceConfig& getConfig() const { return config_; }

private:
    std::shared_ptr<EspLink> link_;
    std::ostream& out_;
    std::ostream& err_;
    Options options_;
    DeviceConfig config_;
    std::vector<boost::signals2::scoped_connection> connections_;

    void subscribe();
    void printStatus();
    void printOutputLog();
    void reportNotSent(const std::string& what);

    void uploadLocalFile(const std::string& local, const std::string& remote);
    bool saveDownload(const std::string& path, const std::vector<uint8_t>& data);
};

} // namespace esplink

#endif // ESPLINK_ESP_CONSOLE_HPP
