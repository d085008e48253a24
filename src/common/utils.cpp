/*
 * AdaTP - utility helpers implementation
 */

#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

namespace adatp {

namespace {
std::mutex g_log_mutex;
LogLevel g_current_level = LogLevel::Info;
std::unique_ptr<FileLogger> g_file_logger;

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "LOG";
    }
}
} // namespace

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_current_level = level;
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lowered = trim(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "error" || lowered == "err") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

void set_log_file(const std::string& path) {
    std::unique_ptr<FileLogger> logger;
    if (!path.empty()) {
        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        logger = std::make_unique<FileLogger>(path);
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_file_logger = std::move(logger);
}

void log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(level) < static_cast<int>(g_current_level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now {};
    localtime_r(&now_time, &tm_now);

    std::ostringstream oss;
    oss << "[" << level_to_string(level) << " "
        << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S") << "] " << message;
    std::cerr << oss.str() << std::endl;

    if (g_file_logger) {
        try {
            g_file_logger->write(oss.str());
        } catch (const std::exception& ex) {
            std::cerr << "[ERROR] file logging disabled: " << ex.what() << std::endl;
            g_file_logger.reset();
        }
    }
}

std::vector<uint8_t> random_bytes(std::size_t count) {
    std::vector<uint8_t> buffer(count);
    if (count == 0) {
        return buffer;
    }
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return buffer;
}

std::string hex_encode(const uint8_t* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

uint64_t wall_clock_millis() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::string trim(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char ch) {
        return std::isspace(ch);
    });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char ch) {
        return std::isspace(ch);
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::vector<std::string> split(const std::string& input, char delimiter) {
    std::vector<std::string> parts;
    std::string token;
    std::istringstream iss(input);
    while (std::getline(iss, token, delimiter)) {
        parts.push_back(token);
    }
    return parts;
}

FileLogger::FileLogger(std::string path) : path_(std::move(path)) {}

FileLogger::~FileLogger() = default;

void FileLogger::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open log file: " + path_);
    }
    out << line << '\n';
    out.flush();
}

} // namespace adatp
