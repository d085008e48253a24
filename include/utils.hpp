/*
 * AdaTP - utility helpers
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace adatp {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level);

std::optional<LogLevel> parse_log_level(const std::string& name);

// Mirror every log line into the given file (empty path disables it).
void set_log_file(const std::string& path);

void log(LogLevel level, const std::string& message);

inline void log_info(const std::string& message) {
    log(LogLevel::Info, message);
}

inline void log_warn(const std::string& message) {
    log(LogLevel::Warn, message);
}

inline void log_error(const std::string& message) {
    log(LogLevel::Error, message);
}

inline void log_debug(const std::string& message) {
    log(LogLevel::Debug, message);
}

std::vector<uint8_t> random_bytes(std::size_t count);

std::string hex_encode(const uint8_t* data, std::size_t len);

inline std::string hex_encode(const std::vector<uint8_t>& data) {
    return hex_encode(data.data(), data.size());
}

uint64_t wall_clock_millis();

std::string trim(const std::string& input);

std::vector<std::string> split(const std::string& input, char delimiter);

class FileLogger {
public:
    explicit FileLogger(std::string path);
    ~FileLogger();

    void write(const std::string& line);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace adatp
