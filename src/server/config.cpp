/*
 * AdaTP - server configuration implementation
 */

#include "config.hpp"

#include "messages.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace adatp {

namespace {
uint64_t parse_unsigned(const std::string& key, const std::string& value, uint64_t min, uint64_t max) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("config: " + key + " expects a non-negative integer, got '" + value + "'");
    }
    uint64_t parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("config: " + key + " is out of range");
    }
    if (parsed < min || parsed > max) {
        throw std::invalid_argument("config: " + key + " must be between " + std::to_string(min) +
                                    " and " + std::to_string(max));
    }
    return parsed;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    throw std::invalid_argument("config: " + key + " expects a boolean, got '" + value + "'");
}
} // namespace

const char* drop_policy_name(DropPolicy policy) {
    switch (policy) {
        case DropPolicy::DropNewest:
            return "newest";
        case DropPolicy::DropOldest:
            return "oldest";
    }
    return "unknown";
}

void apply_config_entry(ServerConfig& config, const std::string& key, const std::string& value) {
    if (key == "bind_address") {
        config.bind_address = value;
    } else if (key == "port") {
        config.port = static_cast<uint16_t>(parse_unsigned(key, value, 0, 65535));
    } else if (key == "max_connections") {
        config.max_connections = parse_unsigned(key, value, 1, 1000000);
    } else if (key == "max_payload_size") {
        config.max_payload_size = static_cast<uint32_t>(parse_unsigned(key, value, 1024, kMaxPayloadCeiling));
    } else if (key == "outbound_queue_capacity") {
        config.outbound_queue_capacity = parse_unsigned(key, value, 1, 1000000);
    } else if (key == "drop_policy") {
        if (value == "newest") {
            config.drop_policy = DropPolicy::DropNewest;
        } else if (value == "oldest") {
            config.drop_policy = DropPolicy::DropOldest;
        } else {
            throw std::invalid_argument("config: drop_policy must be 'newest' or 'oldest'");
        }
    } else if (key == "anomaly_threshold") {
        config.anomaly_threshold = static_cast<uint32_t>(parse_unsigned(key, value, 1, 1000000));
    } else if (key == "handshake_timeout_ms") {
        config.handshake_timeout_ms = static_cast<uint32_t>(parse_unsigned(key, value, 0, 3600000));
    } else if (key == "write_timeout_ms") {
        config.write_timeout_ms = static_cast<uint32_t>(parse_unsigned(key, value, 0, 3600000));
    } else if (key == "require_auth") {
        config.require_auth = parse_bool(key, value);
    } else if (key == "max_auth_attempts") {
        config.max_auth_attempts = static_cast<uint32_t>(parse_unsigned(key, value, 1, 1000));
    } else if (key == "persist_empty_rooms") {
        config.persist_empty_rooms = parse_bool(key, value);
    } else if (key == "default_room") {
        if (!value.empty() && !is_valid_room_name(value)) {
            throw std::invalid_argument("config: default_room '" + value + "' is not a valid room name");
        }
        config.default_room = value;
    } else if (key == "max_transfers_per_session") {
        config.max_transfers_per_session = parse_unsigned(key, value, 1, 10000);
    } else if (key == "max_transfer_chunks") {
        config.max_transfer_chunks = parse_unsigned(key, value, 1, 1u << 24);
    } else if (key == "log_level") {
        auto level = parse_log_level(value);
        if (!level.has_value()) {
            throw std::invalid_argument("config: unknown log_level '" + value + "'");
        }
        config.log_level = level.value();
    } else if (key == "log_file") {
        config.log_file = value;
    } else if (key.rfind("user.", 0) == 0 && key.size() > 5) {
        auto sep = value.rfind(':');
        UserRecord record;
        if (sep == std::string::npos) {
            record.password = value;
            record.role = "user";
        } else {
            record.password = value.substr(0, sep);
            record.role = value.substr(sep + 1);
        }
        if (record.password.empty()) {
            throw std::invalid_argument("config: " + key + " has an empty password");
        }
        config.users[key.substr(5)] = record;
    } else {
        throw std::invalid_argument("config: unknown key '" + key + "'");
    }
}

ServerConfig parse_config(const std::string& text, ServerConfig base) {
    std::istringstream iss(text);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(iss, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("config line " + std::to_string(line_no) + ": expected key = value");
        }
        apply_config_entry(base, trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
    }
    return base;
}

ServerConfig load_config_file(const std::string& path, ServerConfig base) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return parse_config(contents.str(), std::move(base));
}

ServerConfig parse_command_line(int argc, char** argv) {
    ServerConfig config;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--config requires a path");
            }
            config = load_config_file(argv[++i], std::move(config));
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() > 2) {
        throw std::invalid_argument("Usage: adatp_server [--config <path>] [port] [bind_address]");
    }
    if (!positional.empty()) {
        apply_config_entry(config, "port", positional[0]);
    }
    if (positional.size() == 2) {
        config.bind_address = positional[1];
    }
    return config;
}

} // namespace adatp
