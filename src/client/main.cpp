/*
 * AdaTP client entry point
 */

#include "client.hpp"
#include "utils.hpp"

#include <iostream>

using namespace adatp;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: adatp_client <server-host> [port] [room]\n";
        return 1;
    }

    std::string host = argv[1];
    uint16_t port = 8444;
    try {
        if (argc >= 3) {
            port = static_cast<uint16_t>(std::stoi(argv[2]));
        }
    } catch (const std::exception&) {
        std::cerr << "Invalid port: " << argv[2] << "\n";
        return 1;
    }

    set_log_level(LogLevel::Warn);

    AdatpClient client;
    if (!client.connect_to_server(host, port)) {
        std::cerr << "Could not connect to server.\n";
        return 1;
    }

    std::cout << "Connected to " << host << ":" << port << " as " << format_session_id(client.session_id())
              << std::endl;
    if (argc >= 4) {
        client.join_room(argv[3]);
    }
    std::cout << "Type /help for commands.\n";
    client.run();
    return 0;
}
