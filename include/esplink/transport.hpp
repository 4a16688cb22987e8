#ifndef ESPLINK_TRANSPORT_HPP
#define ESPLINK_TRANSPORT_HPP

#include <boost/system/error_code.hpp>
#include <functional>
#include <string>
#include <cstddef>
#include <cstdint>

namespace esplink {

// What the port does with DTR/RTS after opening
enum class ModemSignalPolicy {
    PASSIVE = 0,     // DTR and RTS low, the ESP32 auto-reset circuit stays idle
    ASSERT_DTR = 1   // DTR high as a presence signal, RTS low
};

// Platform default: passive on POSIX, DTR asserted elsewhere
ModemSignalPolicy platformModemPolicy();

enum class Parity {
    NONE = 0,
    ODD = 1,
    EVEN = 2
};

enum class StopBits {
    ONE = 0,
    TWO = 1
};

struct SerialSettings {
    unsigned int baudrate;
    unsigned int data_bits;
    Parity parity;
    StopBits stop_bits;
    ModemSignalPolicy modem_policy;

    SerialSettings()
        : baudrate(115200)
        , data_bits(8)
        , parity(Parity::NONE)
        , stop_bits(StopBits::ONE)
        , modem_policy(platformModemPolicy())
    {}
};

/**
 * @brief Byte-stream boundary between the protocol core and a physical port
 *
 * Read completions are delivered on the io_context the implementation was
 * built with. Port enumeration is not part of this interface.
 */
class Transport {
public:
    // Receives each chunk in order; a non-zero error code ends the stream
    using ReadHandler = std::function<void(const boost::system::error_code& ec,
                                           const uint8_t* data, size_t size)>;

    virtual ~Transport() = default;

    virtual bool open(const std::string& device, const SerialSettings& settings) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Start the read loop; chunks already completed for an earlier open are dropped
    virtual void startReading(ReadHandler handler) = 0;

    virtual bool write(const std::string& data) = 0;

    // Discard unread input and unsent output
    virtual void flush() = 0;

    virtual std::string getLastError() const = 0;
};

} // namespace esplink

#endif // ESPLINK_TRANSPORT_HPP
