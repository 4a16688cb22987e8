#include "esplink/esp_link.hpp"
#include "esplink/serial_transport.hpp"

namespace esplink {

EspLink::EspLink(boost::asio::io_context& io_context, const Config& config)
    : EspLink(io_context, std::make_unique<SerialTransport>(io_context), config)
{
}

EspLink::EspLink(boost::asio::io_context& io_context,
                 std::unique_ptr<Transport> transport,
                 const Config& config)
    : config_(config)
{
    session_ = std::make_unique<EspSession>(io_context, std::move(transport), events_, config_.session);
    router_ = std::make_unique<CommandRouter>(*session_, events_, config_.parent_path);
}

EspLink::~EspLink() {
    // Router first: it unhooks itself from the session. The session then
    // closes the port without publishing anything.
    router_.reset();
    session_.reset();
}

} // namespace esplink
