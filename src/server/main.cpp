/*
 * AdaTP server entry point
 */

#include "config.hpp"
#include "server.hpp"
#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace adatp;

namespace {
std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running = false;
}
} // namespace

int main(int argc, char** argv) {
    try {
        ServerConfig config = parse_command_line(argc, argv);
        set_log_level(config.log_level);
        set_log_file(config.log_file);

        AdatpServer server(config);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        std::signal(SIGPIPE, SIG_IGN);

        server.start();
        std::cout << "AdaTP server running on " << (config.bind_address.empty() ? "0.0.0.0" : config.bind_address)
                  << ":" << server.port() << std::endl;

        // Block until termination signal.
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        server.stop();
    } catch (const std::exception& ex) {
        log_error(std::string("Server error: ") + ex.what());
        return 1;
    }

    return 0;
}
