/*
 * AdaTP - transport server implementation
 */

#include "server.hpp"

#include "utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace adatp {

namespace {
constexpr int kListenBacklog = 128;

std::string describe_peer(const sockaddr_in& addr) {
    char buffer[INET_ADDRSTRLEN] = {0};
    if (::inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) == nullptr) {
        return "unknown";
    }
    return std::string(buffer) + ":" + std::to_string(ntohs(addr.sin_port));
}
} // namespace

AdatpServer::AdatpServer(ServerConfig config)
    : AdatpServer(config, std::make_unique<StaticAuthorizer>(config.users)) {}

AdatpServer::AdatpServer(ServerConfig config, std::unique_ptr<Authorizer> authorizer)
    : config_(std::move(config)),
      rooms_(config_.persist_empty_rooms),
      router_(rooms_, stats_),
      transfers_(stats_, config_.max_transfers_per_session, config_.max_transfer_chunks),
      authorizer_(std::move(authorizer)) {
    if (!authorizer_) {
        throw std::invalid_argument("AdatpServer requires an authorizer");
    }
}

AdatpServer::~AdatpServer() {
    stop();
}

void AdatpServer::start() {
    if (running_) {
        return;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error("Failed to create socket: " + std::string(std::strerror(errno)));
    }

    int opt = 1;
    if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        log_warn("Failed to set SO_REUSEADDR: " + std::string(std::strerror(errno)));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (config_.bind_address.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (::inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Invalid bind address: " + config_.bind_address);
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Failed to bind: " + std::string(std::strerror(errno)));
    }

    if (::listen(listen_fd_, kListenBacklog) < 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Failed to listen: " + std::string(std::strerror(errno)));
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    log_info("AdaTP server listening on " + (config_.bind_address.empty() ? std::string("0.0.0.0")
                                                                            : config_.bind_address) +
             ":" + std::to_string(bound_port_) + " (max " + std::to_string(config_.max_connections) +
             " connections, queue " + std::to_string(config_.outbound_queue_capacity) + ", drop " +
             drop_policy_name(config_.drop_policy) + ")");
    running_ = true;

    accept_thread_ = std::thread(&AdatpServer::accept_loop, this);
}

void AdatpServer::stop() {
    bool was_running = running_.exchange(false);
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (!was_running) {
        return;
    }

    std::vector<std::shared_ptr<Connection>> to_close;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& [key, connection] : connections_) {
            to_close.push_back(connection);
        }
    }
    for (auto& connection : to_close) {
        connection->close("server shutting down");
    }
    to_close.clear();

    {
        std::unique_lock<std::mutex> lock(connections_mutex_);
        connections_cv_.wait(lock, [this] { return connections_.empty(); });
    }

    router_.clear();
    transfers_.clear();
    rooms_.clear();

    log_info("AdaTP server stopped: " + format_stats(stats_.snapshot()));
}

std::size_t AdatpServer::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void AdatpServer::accept_loop() {
    while (running_) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (!running_) {
                break;
            }
            log_warn("Accept failed: " + std::string(std::strerror(errno)));
            continue;
        }

        std::string peer = describe_peer(client_addr);
        if (connection_count() >= config_.max_connections) {
            ++stats_.connections_rejected;
            log_warn("Rejecting " + peer + ": connection limit reached");
            ::close(client_fd);
            continue;
        }

        ServerContext context{config_, rooms_, router_, transfers_, *authorizer_, stats_};
        std::shared_ptr<Connection> connection;
        try {
            connection = std::make_shared<Connection>(client_fd, peer, context);
        } catch (const std::exception& ex) {
            log_error("Failed to set up connection for " + peer + ": " + ex.what());
            ::close(client_fd);
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_[connection.get()] = connection;
        }
        ++stats_.connections_accepted;
        ++stats_.active_connections;

        try {
            connection->start([this](const std::shared_ptr<Connection>& closed) { on_connection_closed(closed); });
        } catch (const std::system_error& ex) {
            log_error("Failed to start connection threads for " + peer + ": " + ex.what());
            connection->close("thread start failed");
            on_connection_closed(connection);
        }
    }
}

void AdatpServer::on_connection_closed(const std::shared_ptr<Connection>& connection) {
    ConnectionCounters counters = connection->counters();
    log_debug("Released " + connection->peer() + (connection->authenticated() ? " user=" + connection->user_id() : "") +
              " in=" + std::to_string(counters.packets_in) + "/" + std::to_string(counters.bytes_in) + "B out=" +
              std::to_string(counters.packets_out) + "/" + std::to_string(counters.bytes_out) +
              "B anomalies=" + std::to_string(counters.anomalies));
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (connections_.erase(connection.get()) == 0) {
            return;
        }
        --stats_.active_connections;
    }
    connections_cv_.notify_all();
}

} // namespace adatp
