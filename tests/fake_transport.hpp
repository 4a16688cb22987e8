#ifndef ESPLINK_TESTS_FAKE_TRANSPORT_HPP
#define ESPLINK_TESTS_FAKE_TRANSPORT_HPP

#include "esplink/transport.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace esplink {
namespace testing {

// Shared with the test so it stays reachable after the transport is moved
struct FakePort {
    bool open = false;
    bool fail_open = false;
    bool fail_write = false;
    std::string device;
    SerialSettings settings;
    int open_count = 0;
    int close_count = 0;
    int flush_count = 0;
    std::vector<std::string> written;
    Transport::ReadHandler handler;

    // Deliver a chunk as if the device had sent it
    void inject(const std::string& chunk) {
        if (!handler) return;
        Transport::ReadHandler h = handler;
        h(boost::system::error_code(), reinterpret_cast<const uint8_t*>(chunk.data()), chunk.size());
    }

    void injectError(const boost::system::error_code& ec) {
        if (!handler) return;
        Transport::ReadHandler h = handler;
        h(ec, nullptr, 0);
    }

    // Outbound frames decoded back to JSON (non-JSON lines are skipped)
    std::vector<nlohmann::json> frames() const {
        std::vector<nlohmann::json> out;
        for (const auto& w : written) {
            auto j = nlohmann::json::parse(w, nullptr, false);
            if (!j.is_discarded()) out.push_back(j);
        }
        return out;
    }

    std::vector<std::string> types() const {
        std::vector<std::string> out;
        for (const auto& f : frames()) {
            out.push_back(f.value("type", ""));
        }
        return out;
    }
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakePort> port) : port_(std::move(port)) {}

    bool open(const std::string& device, const SerialSettings& settings) override {
        port_->open_count++;
        if (port_->fail_open) {
            last_error_ = "No such file or directory";
            return false;
        }
        port_->open = true;
        port_->device = device;
        port_->settings = settings;
        return true;
    }

    void close() override {
        if (port_->open) port_->close_count++;
        port_->open = false;
        port_->handler = nullptr;
    }

    bool isOpen() const override { return port_->open; }

    void startReading(ReadHandler handler) override { port_->handler = std::move(handler); }

    bool write(const std::string& data) override {
        if (port_->fail_write) {
            last_error_ = "Write failed: Input/output error";
            return false;
        }
        port_->written.push_back(data);
        return true;
    }

    void flush() override { port_->flush_count++; }

    std::string getLastError() const override { return last_error_; }

private:
    std::shared_ptr<FakePort> port_;
    std::string last_error_;
};

} // namespace testing
} // namespace esplink

#endif // ESPLINK_TESTS_FAKE_TRANSPORT_HPP
