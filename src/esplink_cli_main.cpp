#include "esplink/esp_console.hpp"
#include "esplink/esp_link.hpp"
#include <boost/asio.hpp>
#include <iostream>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]\n"
              << "\n"
              << "ESP32 link console.\n"
              << "Talks to the data logger firmware over its JSON-lines serial protocol.\n"
              << "\n"
              << "Options:\n"
              << "  -p, --port DEVICE    Serial device to connect to on start (e.g. /dev/ttyUSB0)\n"
              << "  -b, --baud RATE      Baud rate (default: 115200)\n"
              << "  --settle MS          Boot settle delay after opening (default: 1000)\n"
              << "  --no-init            Don't sync time and fetch files/config after connecting\n"
              << "  --monitor            Echo raw serial traffic\n"
              << "  -h, --help           Show this help message\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " -p /dev/ttyUSB0\n"
              << "  " << program << " --port /dev/ttyACM0 --monitor\n"
              << "\n"
              << "Type 'help' at the prompt for the command list.\n";
}

int main(int argc, char** argv) {
    esplink::EspLink::Config config;
    esplink::EspConsole::Options options;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        }
        else if ((strcmp(argv[i], "-p") == 0 || strcmp(argv[i], "--port") == 0) && i + 1 < argc) {
            options.port = argv[++i];
        }
        else if ((strcmp(argv[i], "-b") == 0 || strcmp(argv[i], "--baud") == 0) && i + 1 < argc) {
            config.session.serial.baudrate = static_cast<unsigned int>(std::strtoul(argv[++i], nullptr, 10));
        }
        else if (strcmp(argv[i], "--settle") == 0 && i + 1 < argc) {
            config.session.settle_delay_ms = static_cast<unsigned int>(std::strtoul(argv[++i], nullptr, 10));
        }
        else if (strcmp(argv[i], "--no-init") == 0) {
            options.initialize_on_connect = false;
        }
        else if (strcmp(argv[i], "--monitor") == 0) {
            options.monitor = true;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            std::cerr << "Use --help for usage information.\n";
            return EXIT_FAILURE;
        }
    }

    if (config.session.serial.baudrate == 0) {
        std::cerr << "Invalid baud rate\n";
        return EXIT_FAILURE;
    }

    // Shared with the stdin thread, which may outlive this scope
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto work = boost::asio::make_work_guard(*io_context);

    auto link = std::make_shared<esplink::EspLink>(*io_context, config);
    auto console = std::make_shared<esplink::EspConsole>(link, std::cout, std::cerr, options);

    // Clean exit on Ctrl-C
    boost::asio::signal_set signals(*io_context, SIGINT, SIGTERM);
    boost::asio::io_context* io = io_context.get();
    signals.async_wait([io](const boost::system::error_code& ec, int /*signum*/) {
        if (!ec) io->stop();
    });

    if (!options.port.empty()) {
        boost::asio::post(*io_context, [console, port = options.port]() {
            console->handleCommand("connect " + port);
        });
    }

    // stdin blocks, so it gets its own thread; lines are handed to the io_context.
    // It holds shared ownership, so a line typed after run() returns is queued
    // on a stopped context and never executed. Queued handlers only get the raw
    // pointer; they can only run inside run().
    std::thread input([io_context, io, console]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            bool quit = (line == "quit" || line == "exit");
            boost::asio::post(*io_context, [io, console, line]() {
                if (!console->handleCommand(line)) io->stop();
            });
            if (quit) return;
        }
        boost::asio::post(*io_context, [io]() { io->stop(); });
    });
    input.detach();

    std::cout << "esplink console - type 'help' for commands\n";

    try {
        io_context->run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    work.reset();
    link->disconnect();

    return EXIT_SUCCESS;
}
