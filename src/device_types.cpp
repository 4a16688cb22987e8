#include "esplink/device_types.hpp"

namespace esplink {

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING:   return "CONNECTING";
        case ConnectionState::CONNECTED:    return "CONNECTED";
    }
    return "UNKNOWN";
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TRANSPORT_OPEN:   return "TRANSPORT_OPEN";
        case ErrorKind::TRANSPORT_READ:   return "TRANSPORT_READ";
        case ErrorKind::TRANSPORT_WRITE:  return "TRANSPORT_WRITE";
        case ErrorKind::PROTOCOL_TIMEOUT: return "PROTOCOL_TIMEOUT";
        case ErrorKind::DEVICE_REPORTED:  return "DEVICE_REPORTED";
    }
    return "UNKNOWN";
}

} // namespace esplink
