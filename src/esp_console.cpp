#include "esplink/esp_console.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

namespace esplink {

namespace {

std::string baseName(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

bool eraseItem(std::vector<std::string>& items, const std::string& item) {
    auto it = std::find(items.begin(), items.end(), item);
    if (it == items.end()) return false;
    items.erase(it);
    return true;
}

} // namespace

EspConsole::EspConsole(std::shared_ptr<EspLink> link, std::ostream& out, std::ostream& err,
                       const Options& options)
    : link_(std::move(link))
    , out_(out)
    , err_(err)
    , options_(options)
{
    subscribe();
}

void EspConsole::subscribe() {
    EventBus& events = link_->events();

    connections_.emplace_back(events.state_changed.connect([this](ConnectionState state) {
        out_ << "[state] " << toString(state) << std::endl;
        if (state == ConnectionState::CONNECTED && options_.initialize_on_connect) {
            link_->commands().initializeDevice();
        }
    }));

    connections_.emplace_back(events.status_changed.connect([this](const std::string& message) {
        out_ << "[status] " << message << std::endl;
    }));

    connections_.emplace_back(events.error.connect([this](const LinkError& error) {
        err_ << "[error] " << toString(error.kind) << ": " << error.message << std::endl;
    }));

    connections_.emplace_back(events.operation.connect([this](const std::string& message) {
        out_ << "[ok] " << message << std::endl;
    }));

    connections_.emplace_back(events.file_list.connect(
        [this](const std::vector<FileSystemEntry>& entries) {
            out_ << "Files (" << entries.size() << "):" << std::endl;
            for (const auto& entry : entries) {
                out_ << "  " << (entry.isDirectory() ? "d " : "- ")
                     << std::setw(10) << entry.size_bytes << "  "
                     << entry.fullPath() << std::endl;
            }
        }));

    connections_.emplace_back(events.config.connect([this](const DeviceConfig& config) {
        config_ = config;
        out_ << "Configuration:" << std::endl
             << "  Board serial: " << config.board_serial << std::endl
             << "  Machine:      " << config.machine_name << std::endl
             << "  Last updated: " << config.last_updated << std::endl
             << "  Drivers:      " << joinList(config.drivers) << std::endl
             << "  Jobs:         " << joinList(config.jobs) << std::endl;
    }));

    connections_.emplace_back(events.time.connect([this](const DeviceTimeInfo& info) {
        out_ << "Device time:" << std::endl
             << "  RTC:   " << info.rtc_time << (info.rtc_available ? "" : " (unavailable)") << std::endl
             << "  ESP:   " << info.esp_time << std::endl
             << "  Local: " << info.local_time << std::endl;
    }));

    connections_.emplace_back(events.serial_number.connect([this](const std::string& serial) {
        out_ << "Board serial: " << serial << std::endl;
    }));

    connections_.emplace_back(events.download_complete.connect(
        [this](const std::string& destination, const std::vector<uint8_t>& data) {
            if (saveDownload(destination, data)) {
                out_ << "Saved " << data.size() << " bytes to " << destination << std::endl;
            }
        }));

    connections_.emplace_back(events.raw_log.connect([this](const std::string& text) {
        if (options_.monitor) {
            out_ << text;
            if (!text.empty() && text.back() != '\n') out_ << std::endl;
        }
    }));

    connections_.emplace_back(events.frame_rejected.connect(
        [this](const std::string& line, const std::string& reason) {
            if (options_.monitor) {
                err_ << "[rx] ignored line (" << reason << "): " << line << std::endl;
            }
        }));
}

bool EspConsole::handleCommand(const std::string& line) {
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd)) {
        return true;
    }

    std::string arg1;
    std::string arg2;
    in >> arg1 >> arg2;

    CommandRouter& commands = link_->commands();

    if (cmd == "quit" || cmd == "exit") {
        return false;
    } else if (cmd == "help" || cmd == "?") {
        printHelp();
    } else if (cmd == "connect") {
        std::string port = arg1.empty() ? options_.port : arg1;
        if (port.empty()) {
            err_ << "No port given (connect DEVICE)" << std::endl;
        } else if (link_->connect(port)) {
            options_.port = port;
        }
    } else if (cmd == "disconnect") {
        link_->disconnect();
    } else if (cmd == "status") {
        printStatus();
    } else if (cmd == "log") {
        printOutputLog();
    } else if (cmd == "monitor") {
        options_.monitor = (arg1 != "off");
        out_ << "Monitor " << (options_.monitor ? "on" : "off") << std::endl;
    } else if (cmd == "ping") {
        if (!commands.sendPing()) reportNotSent(cmd);
    } else if (cmd == "ls") {
        if (!commands.listFiles()) reportNotSent(cmd);
    } else if (cmd == "get" && !arg1.empty()) {
        std::string local = arg2.empty() ? baseName(arg1) : arg2;
        if (!commands.downloadFile(arg1, local)) reportNotSent(cmd);
    } else if (cmd == "put" && !arg1.empty()) {
        uploadLocalFile(arg1, arg2.empty() ? baseName(arg1) : arg2);
    } else if (cmd == "rm" && !arg1.empty()) {
        if (!commands.deleteFile(arg1)) reportNotSent(cmd);
    } else if (cmd == "clear" && !arg1.empty()) {
        if (!commands.clearDataFile(arg1)) reportNotSent(cmd);
    } else if (cmd == "config") {
        if (!commands.readConfig()) reportNotSent(cmd);
    } else if (cmd == "set-machine" && !arg1.empty()) {
        config_.machine_name = arg1;
    } else if (cmd == "add-driver" && !arg1.empty()) {
        config_.drivers.push_back(arg1);
    } else if (cmd == "add-job" && !arg1.empty()) {
        config_.jobs.push_back(arg1);
    } else if (cmd == "remove-driver" && !arg1.empty()) {
        if (!eraseItem(config_.drivers, arg1)) err_ << "No driver " << arg1 << std::endl;
    } else if (cmd == "remove-job" && !arg1.empty()) {
        if (!eraseItem(config_.jobs, arg1)) err_ << "No job " << arg1 << std::endl;
    } else if (cmd == "write-config") {
        if (!commands.writeConfig(config_)) reportNotSent(cmd);
    } else if (cmd == "serial") {
        if (!commands.getBoardSerial()) reportNotSent(cmd);
    } else if (cmd == "time") {
        if (!commands.fetchDeviceTime()) reportNotSent(cmd);
    } else if (cmd == "sync") {
        if (!commands.syncTimeUtc(std::chrono::system_clock::now())) reportNotSent(cmd);
    } else if (cmd == "init") {
        commands.initializeDevice();
    } else if (cmd == "raw") {
        size_t pos = line.find("raw");
        std::string text = line.substr(pos + 3);
        if (!text.empty() && text.front() == ' ') text.erase(0, 1);
        if (!commands.sendRaw(text)) reportNotSent(cmd);
    } else {
        err_ << "Unknown command: " << line << " (try help)" << std::endl;
    }

    return true;
}

void EspConsole::printHelp() {
    out_ << "Commands:\n"
         << "  connect [DEVICE]        Open the port and send the handshake\n"
         << "  disconnect              Close the port\n"
         << "  status                  Connection state and last status\n"
         << "  log                     Serial output since connect\n"
         << "  monitor [on|off]        Echo raw serial traffic\n"
         << "  ping                    Liveness probe\n"
         << "  ls                      List files on the device\n"
         << "  get REMOTE [LOCAL]      Download a file\n"
         << "  put LOCAL [REMOTE]      Upload a file\n"
         << "  rm REMOTE               Delete a file\n"
         << "  clear REMOTE            Clear a CSV data file, keep its header\n"
         << "  config                  Read the device configuration\n"
         << "  set-machine NAME        Edit the machine name\n"
         << "  add-driver NAME         Append a driver\n"
         << "  remove-driver NAME      Remove a driver\n"
         << "  add-job NAME            Append a job\n"
         << "  remove-job NAME         Remove a job\n"
         << "  write-config            Send the edited configuration\n"
         << "  serial                  Read the board serial\n"
         << "  time                    Read the device clocks\n"
         << "  sync                    Set the device clock to UTC now\n"
         << "  init                    Sync time and fetch files, config, serial\n"
         << "  raw TEXT                Send a raw line\n"
         << "  quit                    Exit\n";
    out_.flush();
}

void EspConsole::printStatus() {
    out_ << "State:  " << toString(link_->getState()) << std::endl
         << "Port:   " << (link_->getCurrentPort().empty() ? "-" : link_->getCurrentPort()) << std::endl
         << "Status: " << link_->getStatusMessage() << std::endl;
    if (!link_->getLastError().empty()) {
        out_ << "Last error: " << link_->getLastError() << std::endl;
    }
}

void EspConsole::printOutputLog() {
    for (const auto& entry : link_->getOutputLog()) {
        out_ << entry;
        if (!entry.empty() && entry.back() != '\n') out_ << '\n';
    }
    out_.flush();
}

void EspConsole::reportNotSent(const std::string& what) {
    if (!link_->session().isTransportOpen()) {
        err_ << what << ": not connected" << std::endl;
    } else {
        err_ << what << ": " << link_->getLastError() << std::endl;
    }
}

void EspConsole::uploadLocalFile(const std::string& local, const std::string& remote) {
    std::ifstream file(local, std::ios::binary);
    if (!file) {
        err_ << "Cannot read " << local << std::endl;
        return;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (!link_->commands().uploadFile(remote, data)) {
        reportNotSent("put");
    }
}

bool EspConsole::saveDownload(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        err_ << "Cannot write " << path << std::endl;
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        err_ << "Write to " << path << " failed" << std::endl;
        return false;
    }
    return true;
}

} // namespace esplink
