#include "esplink/serial_transport.hpp"
#if defined(__unix__) || defined(__APPLE__)
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace esplink {

ModemSignalPolicy platformModemPolicy() {
#if defined(_WIN32)
    return ModemSignalPolicy::ASSERT_DTR;
#else
    return ModemSignalPolicy::PASSIVE;
#endif
}

SerialTransport::SerialTransport(boost::asio::io_context& io_context)
    : io_context_(io_context)
    , serial_port_(nullptr)
    , read_buffer_{}
    , generation_(0)
{
}

SerialTransport::~SerialTransport() {
    close();
}

bool SerialTransport::open(const std::string& device, const SerialSettings& settings) {
    close();

    try {
        serial_port_ = std::make_unique<boost::asio::serial_port>(io_context_);
        serial_port_->open(device);
    } catch (const std::exception& e) {
        last_error_ = std::string("Failed to open ") + device + ": " + e.what();
        serial_port_.reset();
        return false;
    }

    if (!configure(settings)) {
        close();
        return false;
    }

    last_error_.clear();
    return true;
}

bool SerialTransport::configure(const SerialSettings& settings) {
    using boost::asio::serial_port_base;

    try {
        serial_port_->set_option(serial_port_base::baud_rate(settings.baudrate));
        serial_port_->set_option(serial_port_base::character_size(settings.data_bits));

        serial_port_base::parity::type parity = serial_port_base::parity::none;
        if (settings.parity == Parity::ODD) {
            parity = serial_port_base::parity::odd;
        } else if (settings.parity == Parity::EVEN) {
            parity = serial_port_base::parity::even;
        }
        serial_port_->set_option(serial_port_base::parity(parity));

        serial_port_->set_option(serial_port_base::stop_bits(
            settings.stop_bits == StopBits::TWO ? serial_port_base::stop_bits::two
                                                : serial_port_base::stop_bits::one));
        serial_port_->set_option(serial_port_base::flow_control(
            serial_port_base::flow_control::none));
    } catch (const std::exception& e) {
        last_error_ = std::string("Failed to configure port: ") + e.what();
        return false;
    }

    #if defined(__unix__) || defined(__APPLE__)
    int fd = serial_port_->native_handle();
    struct termios tio;
    if (tcgetattr(fd, &tio) == 0) {
        // Raw mode: no line discipline, no echo, no CR/LF translation
        tio.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG);
        tio.c_iflag &= ~(IXON | IXOFF | IXANY | INLCR | IGNCR | ICRNL);
        tio.c_oflag &= ~OPOST;
        tio.c_cflag |= CREAD | CLOCAL;
        // Keep DTR where the policy puts it when the port is closed
        tio.c_cflag &= ~HUPCL;
        if (tcsetattr(fd, TCSANOW, &tio) != 0) {
            last_error_ = "Failed to configure serial port termios";
            return false;
        }
    }
    #endif

    return applyModemPolicy(settings.modem_policy);
}

bool SerialTransport::applyModemPolicy(ModemSignalPolicy policy) {
    #if defined(__unix__) || defined(__APPLE__)
    int fd = serial_port_->native_handle();
    int rts = TIOCM_RTS;
    int dtr = TIOCM_DTR;
    if (ioctl(fd, TIOCMBIC, &rts) != 0) {
        last_error_ = "Failed to clear RTS";
        return false;
    }
    if (ioctl(fd, policy == ModemSignalPolicy::ASSERT_DTR ? TIOCMBIS : TIOCMBIC, &dtr) != 0) {
        last_error_ = "Failed to set DTR";
        return false;
    }
    #elif defined(_WIN32)
    HANDLE handle = serial_port_->native_handle();
    if (!EscapeCommFunction(handle, CLRRTS) ||
        !EscapeCommFunction(handle, policy == ModemSignalPolicy::ASSERT_DTR ? SETDTR : CLRDTR)) {
        last_error_ = "Failed to set modem control lines";
        return false;
    }
    #endif
    return true;
}

void SerialTransport::close() {
    // Completions still queued for this port must not reach the next one
    generation_++;
    handler_ = nullptr;

    if (serial_port_ && serial_port_->is_open()) {
        boost::system::error_code ec;
        serial_port_->cancel(ec);
        serial_port_->close(ec);
        if (ec) {
            last_error_ = std::string("Close failed: ") + ec.message();
        }
    }
    serial_port_.reset();
}

bool SerialTransport::isOpen() const {
    return serial_port_ && serial_port_->is_open();
}

void SerialTransport::startReading(ReadHandler handler) {
    if (!isOpen()) {
        last_error_ = "Not connected";
        return;
    }
    handler_ = std::move(handler);
    doRead(generation_);
}

void SerialTransport::doRead(uint64_t generation) {
    serial_port_->async_read_some(boost::asio::buffer(read_buffer_),
        [this, generation](const boost::system::error_code& ec, std::size_t bytes) {
            if (generation != generation_ || ec == boost::asio::error::operation_aborted) {
                return;
            }

            // The handler may close the port, so keep our own copy
            ReadHandler handler = handler_;
            if (ec) {
                last_error_ = std::string("Read failed: ") + ec.message();
                if (handler) handler(ec, nullptr, 0);
                return;
            }

            if (handler) handler(ec, read_buffer_.data(), bytes);

            if (generation == generation_ && isOpen()) {
                doRead(generation);
            }
        });
}

bool SerialTransport::write(const std::string& data) {
    if (!isOpen()) {
        last_error_ = "Not connected";
        return false;
    }

    boost::system::error_code ec;
    size_t bytes_written = boost::asio::write(*serial_port_, boost::asio::buffer(data), ec);

    if (ec) {
        last_error_ = std::string("Write failed: ") + ec.message();
        return false;
    }

    if (bytes_written != data.size()) {
        last_error_ = "Incomplete write: " + std::to_string(bytes_written) + " of " +
                      std::to_string(data.size()) + " bytes";
        return false;
    }

    return true;
}

void SerialTransport::flush() {
    if (!isOpen()) return;

    #if defined(__unix__) || defined(__APPLE__)
    if (::tcflush(serial_port_->native_handle(), TCIOFLUSH) != 0) {
        last_error_ = "tcflush() failed";
    }
    #elif defined(_WIN32)
    if (!PurgeComm(serial_port_->native_handle(), PURGE_RXCLEAR | PURGE_TXCLEAR)) {
        last_error_ = "PurgeComm() failed";
    }
    #endif
}

} // namespace esplink
