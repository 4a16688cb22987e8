#include <catch2/catch.hpp>
#include "link_fixture.hpp"
#include <algorithm>

using namespace esplink;
using namespace esplink::testing;

namespace {

bool contains(const std::vector<std::string>& items, const std::string& item) {
    return std::find(items.begin(), items.end(), item) != items.end();
}

} // namespace

TEST_CASE("commands are dropped silently while the port is closed") {
    LinkFixture f;
    CommandRouter& cmd = f.link->commands();

    REQUIRE_FALSE(cmd.sendPing());
    REQUIRE_FALSE(cmd.listFiles());
    REQUIRE_FALSE(cmd.uploadFile("a.txt", {0x41}));
    REQUIRE_FALSE(cmd.downloadFile("a.txt", "/tmp/a.txt"));
    REQUIRE_FALSE(cmd.deleteFile("a.txt"));
    REQUIRE_FALSE(cmd.readConfig());
    REQUIRE_FALSE(cmd.writeConfig(DeviceConfig()));
    REQUIRE_FALSE(cmd.getBoardSerial());
    REQUIRE_FALSE(cmd.fetchDeviceTime());
    REQUIRE_FALSE(cmd.syncTimeUtc(std::chrono::system_clock::now()));
    REQUIRE_FALSE(cmd.clearDataFile("data.csv"));
    REQUIRE_FALSE(cmd.sendRaw("hello"));
    cmd.initializeDevice();

    REQUIRE(f.port->written.empty());
    REQUIRE(f.errors.empty());
    REQUIRE(f.raw_log.empty());
    REQUIRE_FALSE(f.link->session().hasPendingDownload());
}

TEST_CASE("commands produce one frame each") {
    LinkFixture f;
    REQUIRE(f.connectAndHandshake());
    f.port->written.clear();
    CommandRouter& cmd = f.link->commands();

    SECTION("upload hex-encodes the payload in field order") {
        REQUIRE(cmd.uploadFile("a.txt", {0x41, 0x42}));
        REQUIRE(f.port->written ==
                std::vector<std::string>{"{\"type\":\"UPLOAD_FILE\",\"filename\":\"a.txt\",\"hexdata\":\"4142\"}\n"});
    }

    SECTION("file commands carry the filename") {
        REQUIRE(cmd.downloadFile("log.csv", "/tmp/log.csv"));
        REQUIRE(cmd.deleteFile("old.csv"));
        REQUIRE(cmd.clearDataFile("data.csv"));

        auto frames = f.port->frames();
        REQUIRE(frames.size() == 3);
        REQUIRE(frames[0] == nlohmann::json{{"type", "DOWNLOAD_FILE"}, {"filename", "log.csv"}});
        REQUIRE(frames[1] == nlohmann::json{{"type", "DELETE_FILE"}, {"filename", "old.csv"}});
        REQUIRE(frames[2] == nlohmann::json{{"type", "CLEAR_CSV"}, {"filename", "data.csv"}});
    }

    SECTION("queries are bare type objects") {
        REQUIRE(cmd.sendPing());
        REQUIRE(cmd.listFiles());
        REQUIRE(cmd.readConfig());
        REQUIRE(cmd.getBoardSerial());
        REQUIRE(cmd.fetchDeviceTime());

        REQUIRE(f.port->written == std::vector<std::string>{
            "{\"type\":\"PING\"}\n",
            "{\"type\":\"LIST_FILES\"}\n",
            "{\"type\":\"READ_CONFIG\"}\n",
            "{\"type\":\"GET_SERIAL\"}\n",
            "{\"type\":\"FETCH_TIME\"}\n"});
    }

    SECTION("write config nests the wire keys") {
        DeviceConfig config;
        config.board_serial = "SN-7";
        config.machine_name = "Press 3";
        config.last_updated = "2024-03-05";
        config.drivers = {"Zoe", "Adam"};
        config.jobs = {"J1"};
        REQUIRE(cmd.writeConfig(config));

        auto frames = f.port->frames();
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0]["type"] == "WRITE_CONFIG");
        const auto& body = frames[0]["config"];
        REQUIRE(body["board_serial"] == "SN-7");
        REQUIRE(body["Machine"] == "Press 3");
        REQUIRE(body["last_updated"] == "2024-03-05");
        REQUIRE(body["Driver"] == nlohmann::json({"Zoe", "Adam"}));
        REQUIRE(body["Jobs"] == nlohmann::json({"J1"}));
    }

    SECTION("sync time sends the calendar fields") {
        std::tm tm{};
        tm.tm_year = 2024 - 1900;
        tm.tm_mon = 11;
        tm.tm_mday = 31;
        tm.tm_hour = 23;
        tm.tm_min = 59;
        tm.tm_sec = 58;
        REQUIRE(cmd.syncTime(tm));
        REQUIRE(f.port->written == std::vector<std::string>{
            "{\"type\":\"SYNC_TIME\",\"time\":\"2024,12,31,23,59,58\"}\n"});
    }

    SECTION("sync time from a time point is formatted as UTC") {
        REQUIRE(cmd.syncTimeUtc(std::chrono::system_clock::from_time_t(1000000000)));
        REQUIRE(cmd.syncTimeUtc(std::chrono::system_clock::from_time_t(86399)));
        REQUIRE(f.port->written == std::vector<std::string>{
            "{\"type\":\"SYNC_TIME\",\"time\":\"2001,9,9,1,46,40\"}\n",
            "{\"type\":\"SYNC_TIME\",\"time\":\"1970,1,1,23,59,59\"}\n"});
    }

    SECTION("raw text gets exactly one newline") {
        REQUIRE(cmd.sendRaw("help"));
        REQUIRE(cmd.sendRaw("status\n"));
        REQUIRE(f.port->written == std::vector<std::string>{"help\n", "status\n"});
    }

    SECTION("outgoing lines are raw-logged with a marker") {
        f.raw_log.clear();
        REQUIRE(cmd.sendPing());
        REQUIRE(f.raw_log == std::vector<std::string>{"> {\"type\":\"PING\"}\n"});
        REQUIRE(f.link->getOutputLog().back() == "> {\"type\":\"PING\"}\n");
    }
}

TEST_CASE("initializeDevice syncs time then asks for files, config and serial") {
    LinkFixture f;

    SECTION("not before the handshake") {
        REQUIRE(f.link->connect(kPort));
        f.link->commands().initializeDevice();
        REQUIRE(f.port->types() == std::vector<std::string>{"HANDSHAKE"});
    }

    SECTION("in order once connected") {
        REQUIRE(f.connectAndHandshake());
        f.link->commands().initializeDevice();
        REQUIRE(f.port->types() == std::vector<std::string>{
            "HANDSHAKE", "SYNC_TIME", "LIST_FILES", "READ_CONFIG", "GET_SERIAL"});
    }
}

TEST_CASE("a download completes with its token and bytes") {
    LinkFixture f;
    REQUIRE(f.connectAndHandshake());
    CommandRouter& cmd = f.link->commands();

    REQUIRE(cmd.downloadFile("log.csv", "/tmp/log.csv"));
    REQUIRE(f.link->session().getPendingDownload() == "/tmp/log.csv");

    f.port->inject("{\"type\":\"FILE_DATA\",\"hexdata\":\"48690a\"}\n");

    REQUIRE(f.downloads.size() == 1);
    REQUIRE(f.downloads[0].first == "/tmp/log.csv");
    REQUIRE(f.downloads[0].second == std::vector<uint8_t>{'H', 'i', '\n'});
    REQUIRE(contains(f.operations, "File downloaded: /tmp/log.csv"));
    REQUIRE(cmd.getLastDownloadedData() == std::vector<uint8_t>{'H', 'i', '\n'});
    REQUIRE_FALSE(f.link->session().hasPendingDownload());

    // Nothing pending any more
    f.port->inject("{\"type\":\"FILE_DATA\",\"hexdata\":\"00\"}\n");
    REQUIRE(f.downloads.size() == 1);
    REQUIRE(f.errors.empty());
}

TEST_CASE("file data is ignored without a pending download") {
    LinkFixture f;
    REQUIRE(f.connectAndHandshake());

    f.port->inject("{\"type\":\"FILE_DATA\",\"hexdata\":\"4142\"}\n");

    REQUIRE(f.downloads.empty());
    REQUIRE(f.errors.empty());
    REQUIRE(f.link->commands().getLastDownloadedData().empty());
    REQUIRE(f.messages.size() == 2);
}

TEST_CASE("empty file data leaves the download pending") {
    LinkFixture f;
    REQUIRE(f.connectAndHandshake());
    REQUIRE(f.link->commands().downloadFile("log.csv", "tok"));

    f.port->inject("{\"type\":\"FILE_DATA\",\"hexdata\":\"\"}\n");
    f.port->inject("{\"type\":\"FILE_DATA\"}\n");

    REQUIRE(f.downloads.empty());
    REQUIRE(f.link->session().getPendingDownload() == "tok");
}

TEST_CASE("invalid hex reports an error and keeps the download pending") {
    LinkFixture f;
    REQUIRE(f.connectAndHandshake());
    REQUIRE(f.link->commands().downloadFile("log.csv", "tok"));

    f.port->inject("{\"type\":\"FILE_DATA\",\"hexdata\":\"4g\"}\n");

    REQUIRE(f.downloads.empty());
    REQUIRE(f.errors.size() == 1);
    REQUIRE(f.errors[0].kind == ErrorKind::DEVICE_REPORTED);
    REQUIRE(f.link->session().getPendingDownload() == "tok");
    REQUIRE(f.link->isConnected());

    f.port->inject("{\"type\":\"FILE_DATA\",\"hexdata\":\"FF\"}\n");
    REQUIRE(f.downloads.size() == 1);
    REQUIRE(f.downloads[0].second == std::vector<uint8_t>{0xff});
}

TEST_CASE("the latest download request owns the next file data") {
    LinkFixture f;
    REQUIRE(f.connectAndHandshake());
    CommandRouter& cmd = f.link->commands();

    REQUIRE(cmd.downloadFile("a.csv", "first"));
    REQUIRE(cmd.downloadFile("b.csv", "second"));
    f.port->inject("{\"type\":\"FILE_DATA\",\"hexdata\":\"61\"}\n");
    f.port->inject("{\"type\":\"FILE_DATA\",\"hexdata\":\"62\"}\n");

    REQUIRE(f.downloads.size() == 1);
    REQUIRE(f.downloads[0].first == "second");
    REQUIRE(f.downloads[0].second == std::vector<uint8_t>{'a'});
}

TEST_CASE("an empty destination token still completes the download") {
    LinkFixture f;
    REQUIRE(f.connectAndHandshake());

    REQUIRE(f.link->commands().downloadFile("data.csv", ""));
    REQUIRE(f.link->session().hasPendingDownload());

    f.port->inject("{\"type\":\"FILE_DATA\",\"hexdata\":\"4142\"}\n");

    REQUIRE(f.downloads.size() == 1);
    REQUIRE(f.downloads[0].first.empty());
    REQUIRE(f.downloads[0].second == std::vector<uint8_t>{'A', 'B'});
    REQUIRE_FALSE(f.link->session().hasPendingDownload());
}

TEST_CASE("a pending download does not survive a disconnect") {
    LinkFixture f;
    REQUIRE(f.connectAndHandshake());
    REQUIRE(f.link->commands().downloadFile("log.csv", "tok"));

    f.link->disconnect();
    REQUIRE_FALSE(f.link->session().hasPendingDownload());

    REQUIRE(f.connectAndHandshake());
    f.port->inject("{\"type\":\"FILE_DATA\",\"hexdata\":\"4142\"}\n");
    REQUIRE(f.downloads.empty());
}

TEST_CASE("device reports are published on their channels") {
    LinkFixture f;
    REQUIRE(f.connectAndHandshake());
    f.operations.clear();
    f.statuses.clear();

    SECTION("ACK is an operation") {
        f.port->inject("{\"type\":\"ACK\",\"cmd\":\"DELETE_FILE\"}\n");
        REQUIRE(f.operations == std::vector<std::string>{"ACK: DELETE_FILE"});
        REQUIRE(f.errors.empty());
    }

    SECTION("NAK is a device error with its reason") {
        f.port->inject("{\"type\":\"NAK\",\"cmd\":\"WRITE_CONFIG\",\"error_msg\":\"bad json\"}\n");
        REQUIRE(f.errors.size() == 1);
        REQUIRE(f.errors[0].kind == ErrorKind::DEVICE_REPORTED);
        REQUIRE(f.errors[0].message == "NAK: WRITE_CONFIG (bad json)");
        REQUIRE(f.link->isConnected());
    }

    SECTION("ERROR is a device error") {
        f.port->inject("{\"type\":\"ERROR\",\"error_msg\":\"SD card missing\"}\n");
        REQUIRE(f.errors.size() == 1);
        REQUIRE(f.errors[0].message == "Device error: SD card missing");
        REQUIRE(f.link->isConnected());
    }

    SECTION("SERIAL") {
        f.port->inject("{\"type\":\"SERIAL\",\"serial\":\"A1B2C3\"}\n");
        REQUIRE(f.serials == std::vector<std::string>{"A1B2C3"});
        REQUIRE(f.statuses == std::vector<std::string>{"Board serial received"});
    }

    SECTION("FILE_LIST under the parent path") {
        f.port->inject("{\"type\":\"FILE_LIST\",\"files\":[\"x.csv\",{\"name\":\"d\",\"type\":\"dir\",\"size\":0}]}\n");
        REQUIRE(f.file_lists.size() == 1);
        const auto& entries = f.file_lists[0];
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].name == "x.csv");
        REQUIRE(entries[0].isFile());
        REQUIRE(entries[0].fullPath() == "/flash/x.csv");
        REQUIRE(entries[1].name == "d");
        REQUIRE(entries[1].isDirectory());
        REQUIRE(f.statuses == std::vector<std::string>{"File list updated"});
    }

    SECTION("FILE_LIST without files is an empty list") {
        f.port->inject("{\"type\":\"FILE_LIST\"}\n");
        REQUIRE(f.file_lists.size() == 1);
        REQUIRE(f.file_lists[0].empty());
    }

    SECTION("CONFIG") {
        f.port->inject("{\"type\":\"CONFIG\",\"config\":{\"board_serial\":\"SN1\",\"Machine\":\"Lathe\","
                       "\"last_updated\":\"2024-01-02\",\"Driver\":[\"Ann\"],\"Jobs\":[\"J7\",\"J8\"]}}\n");
        REQUIRE(f.configs.size() == 1);
        REQUIRE(f.configs[0].board_serial == "SN1");
        REQUIRE(f.configs[0].machine_name == "Lathe");
        REQUIRE(f.configs[0].drivers == std::vector<std::string>{"Ann"});
        REQUIRE(f.configs[0].jobs == std::vector<std::string>{"J7", "J8"});
        REQUIRE(f.statuses == std::vector<std::string>{"Configuration loaded"});
    }

    SECTION("TIME") {
        f.port->inject("{\"type\":\"TIME\",\"rtc\":\"2024-01-02 03:04:05\",\"esp\":\"2024-01-02 03:04:06\","
                       "\"local\":\"2024-01-02 04:04:05\",\"m5_available\":true}\n");
        REQUIRE(f.times.size() == 1);
        REQUIRE(f.times[0].rtc_time == "2024-01-02 03:04:05");
        REQUIRE(f.times[0].esp_time == "2024-01-02 03:04:06");
        REQUIRE(f.times[0].local_time == "2024-01-02 04:04:05");
        REQUIRE(f.times[0].rtc_available);
        REQUIRE(f.statuses == std::vector<std::string>{"Device time updated"});
    }

    SECTION("unknown types only reach the message channel") {
        f.port->inject("{\"type\":\"BATTERY\",\"level\":87}\n");
        REQUIRE(f.messages.size() == 2);
        REQUIRE(f.messages[1]["level"] == 87);
        REQUIRE(f.operations.empty());
        REQUIRE(f.statuses.empty());
        REQUIRE(f.errors.empty());
        REQUIRE(f.link->isConnected());
    }
}

TEST_CASE("the router stops dispatching once destroyed") {
    boost::asio::io_context io;
    auto port = std::make_shared<FakePort>();
    EventBus events;
    EspSession::Config config;
    config.settle_delay_ms = 0;
    EspSession session(io, std::make_unique<FakeTransport>(port), events, config);

    std::vector<std::string> operations;
    boost::signals2::scoped_connection c =
        events.operation.connect([&](const std::string& s) { operations.push_back(s); });

    {
        CommandRouter router(session, events);
        REQUIRE(session.connect(kPort));
        port->inject(kHandshakeAccept);
        REQUIRE(session.isConnected());
        REQUIRE(operations == std::vector<std::string>{"Handshake complete: ESP32"});
    }

    port->inject("{\"type\":\"ACK\",\"cmd\":\"PING\"}\n");
    REQUIRE(operations.size() == 1);
    session.disconnect();
}
