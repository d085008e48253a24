/*
 * AdaTP - server configuration
 *
 * Config files hold one `key = value` per line; `#` starts a comment.
 * Users for the static authorizer are declared as
 * `user.<name> = <password>:<role>`.
 */

#pragma once

#include "protocol.hpp"
#include "utils.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace adatp {

enum class DropPolicy {
    DropNewest,
    DropOldest
};

const char* drop_policy_name(DropPolicy policy);

struct UserRecord {
    std::string password;
    std::string role;
};

struct ServerConfig {
    std::string bind_address;
    uint16_t port = 8444;
    std::size_t max_connections = 1024;
    uint32_t max_payload_size = kDefaultMaxPayload;
    std::size_t outbound_queue_capacity = 256;
    DropPolicy drop_policy = DropPolicy::DropNewest;
    uint32_t anomaly_threshold = 8;
    uint32_t handshake_timeout_ms = 10000;
    uint32_t write_timeout_ms = 5000;
    bool require_auth = false;
    uint32_t max_auth_attempts = 3;
    bool persist_empty_rooms = false;
    std::string default_room;
    std::size_t max_transfers_per_session = 8;
    std::size_t max_transfer_chunks = 1u << 20;
    LogLevel log_level = LogLevel::Info;
    std::string log_file = "logs/server.log";
    std::map<std::string, UserRecord> users;
};

// Throws std::invalid_argument for unknown keys or bad values.
void apply_config_entry(ServerConfig& config, const std::string& key, const std::string& value);

ServerConfig parse_config(const std::string& text, ServerConfig base = {});

// Throws std::runtime_error when the file cannot be read.
ServerConfig load_config_file(const std::string& path, ServerConfig base = {});

// adatp_server [--config <path>] [port] [bind_address]
ServerConfig parse_command_line(int argc, char** argv);

} // namespace adatp
