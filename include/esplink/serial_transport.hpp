#ifndef ESPLINK_SERIAL_TRANSPORT_HPP
#define ESPLINK_SERIAL_TRANSPORT_HPP

#include "transport.hpp"
#include <boost/asio.hpp>
#include <array>
#include <memory>
#include <string>
#include <cstdint>

namespace esplink {

/**
 * @brief Serial transport for ESP32 boards on a USB-UART bridge
 *
 * Wraps boost::asio::serial_port. Reads run as an async_read_some loop on
 * the owning io_context; writes are synchronous.
 */
class SerialTransport : public Transport {
public:
    explicit SerialTransport(boost::asio::io_context& io_context);
    ~SerialTransport() override;

    bool open(const std::string& device, const SerialSettings& settings) override;
    void close() override;
    bool isOpen() const override;

    void startReading(ReadHandler handler) override;
    bool write(const std::string& data) override;
    void flush() override;

    std::string getLastError() const override { return last_error_; }

private:
    boost::asio::io_context& io_context_;
    std::unique_ptr<boost::asio::serial_port> serial_port_;
    ReadHandler handler_;
    std::array<uint8_t, 1024> read_buffer_;
    uint64_t generation_;
    std::string last_error_;

    bool configure(const SerialSettings& settings);
    bool applyModemPolicy(ModemSignalPolicy policy);
    void doRead(uint64_t generation);
};

} // namespace esplink

#endif // ESPLINK_SERIAL_TRANSPORT_HPP
