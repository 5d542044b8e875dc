/*
 * logger.cpp - Process-wide logging implementation
 */

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace logger {

namespace {

std::mutex log_mutex;
Level min_level = Level::INFO;
bool console_enabled = true;
std::ofstream log_file;

const char* level_tag(Level level) {
    switch (level) {
        case Level::DEBUG: return "[DEBUG]";
        case Level::INFO: return "[INFO]";
        case Level::WARN: return "[WARN]";
        case Level::ERROR: return "[ERROR]";
    }
    return "[?]";
}

std::string now_str() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace

void set_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
}

Level get_level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return min_level;
}

std::optional<Level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

bool set_log_file(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (log_file.is_open()) {
        log_file.close();
    }
    if (filepath.empty()) {
        return true;
    }

    log_file.open(filepath, std::ios::app);
    return log_file.is_open();
}

void set_console_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex);
    console_enabled = enabled;
}

void write(Level level, std::string_view msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level) {
        return;
    }

    std::ostringstream line;
    line << now_str() << " " << level_tag(level) << " " << msg;

    if (console_enabled) {
        std::cerr << line.str() << std::endl;
    }
    if (log_file.is_open()) {
        log_file << line.str() << std::endl;
    }
}

}  // namespace logger
