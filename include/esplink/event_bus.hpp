#ifndef ESPLINK_EVENT_BUS_HPP
#define ESPLINK_EVENT_BUS_HPP

#include "device_types.hpp"
#include <boost/signals2/signal.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace esplink {

/**
 * @brief Typed event channels published by the protocol core
 *
 * Subscribers connect slots to the channel they care about. Keep the
 * returned connection in a boost::signals2::scoped_connection to detach
 * when the subscriber is destroyed. Slots run on the io_context thread.
 */
struct EventBus {
    boost::signals2::signal<void(ConnectionState)> state_changed;
    boost::signals2::signal<void(const std::string&)> status_changed;
    boost::signals2::signal<void(const LinkError&)> error;

    // Successful operations (handshake, ACKs, downloads)
    boost::signals2::signal<void(const std::string&)> operation;

    boost::signals2::signal<void(const std::vector<FileSystemEntry>&)> file_list;
    boost::signals2::signal<void(const DeviceConfig&)> config;
    boost::signals2::signal<void(const DeviceTimeInfo&)> time;
    boost::signals2::signal<void(const std::string&)> serial_number;

    // Destination token handed to downloadFile() and the decoded contents
    boost::signals2::signal<void(const std::string&, const std::vector<uint8_t>&)> download_complete;

    // Terminal text: printable input verbatim, output prefixed with "> "
    boost::signals2::signal<void(const std::string&)> raw_log;

    // Every decoded message, whatever its type
    boost::signals2::signal<void(const nlohmann::json&)> message;

    // Lines that were not a JSON object (line, reason)
    boost::signals2::signal<void(const std::string&, const std::string&)> frame_rejected;
};

} // namespace esplink

#endif // ESPLINK_EVENT_BUS_HPP
