/*
 * AdaTP - transport server
 */

#pragma once

#include "auth.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "file_transfer.hpp"
#include "room_registry.hpp"
#include "router.hpp"
#include "stats.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace adatp {

class AdatpServer {
public:
    explicit AdatpServer(ServerConfig config);
    // Uses a custom authorization backend instead of the config's user table.
    AdatpServer(ServerConfig config, std::unique_ptr<Authorizer> authorizer);
    ~AdatpServer();

    AdatpServer(const AdatpServer&) = delete;
    AdatpServer& operator=(const AdatpServer&) = delete;

    // Throws std::runtime_error when the listening socket cannot be set up.
    void start();
    void stop();

    bool running() const { return running_.load(); }

    // The bound port; differs from config().port when that was 0.
    uint16_t port() const { return bound_port_; }

    const ServerConfig& config() const { return config_; }
    StatsSnapshot stats() const { return stats_.snapshot(); }
    RoomRegistry& rooms() { return rooms_; }
    std::size_t connection_count() const;

private:
    void accept_loop();
    void on_connection_closed(const std::shared_ptr<Connection>& connection);

    ServerConfig config_;
    ServerStats stats_;
    RoomRegistry rooms_;
    Router router_;
    FileTransferCoordinator transfers_;
    std::unique_ptr<Authorizer> authorizer_;

    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    mutable std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    std::unordered_map<Connection*, std::shared_ptr<Connection>> connections_;
};

} // namespace adatp
