/*
 * config.cpp - Configuration file utilities implementation
 *
 * Handles XDG-compliant config directory resolution and file operations.
 * Supports reading line-based config files with comments and field parsing,
 * and maps sniff.conf keys onto Settings.
 */

#include "config.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <pwd.h>

std::optional<std::string> Config::cached_config_dir_;

// --- buffer profiles ---

BufferProfileSpec profile_spec(BufferProfile profile) {
    switch (profile) {
        case BufferProfile::Low:
            return {1 * 1024 * 1024, 5000, "Low memory, may drop under load"};
        case BufferProfile::Balanced:
            return {2 * 1024 * 1024, 10000, "Balanced (default)"};
        case BufferProfile::Fast:
            return {4 * 1024 * 1024, 20000, "High throughput"};
        case BufferProfile::Max:
            return {8 * 1024 * 1024, 50000, "Maximum buffering"};
    }
    return {2 * 1024 * 1024, 10000, "Balanced (default)"};
}

std::string buffer_profile_name(BufferProfile profile) {
    switch (profile) {
        case BufferProfile::Low: return "low";
        case BufferProfile::Balanced: return "balanced";
        case BufferProfile::Fast: return "fast";
        case BufferProfile::Max: return "max";
    }
    return "balanced";
}

std::optional<BufferProfile> parse_buffer_profile(const std::string& name) {
    if (name == "low") return BufferProfile::Low;
    if (name == "balanced") return BufferProfile::Balanced;
    if (name == "fast") return BufferProfile::Fast;
    if (name == "max") return BufferProfile::Max;
    return std::nullopt;
}

// --- Settings ---

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

template <typename T>
bool parse_unsigned(const std::string& value, T& out) {
    if (value.empty() || value[0] == '-') return false;
    T parsed{};
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    if (ec != std::errc() || ptr != end) return false;
    out = parsed;
    return true;
}

bool parse_int(const std::string& value, int& out) {
    int parsed = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    if (value.empty() || ec != std::errc() || ptr != end) return false;
    out = parsed;
    return true;
}

bool parse_double(const std::string& value, double& out) {
    if (value.empty()) return false;
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size()) return false;
    out = parsed;
    return true;
}

bool parse_bool(const std::string& value, bool& out) {
    std::string v = to_lower(value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        out = true;
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        out = false;
        return true;
    }
    return false;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

}

std::string Settings::raw_dir() const {
    return data_dir + "/raw";
}

std::string Settings::modules_dir() const {
    return data_dir + "/modules";
}

size_t Settings::effective_queue_size() const {
    return queue_size ? *queue_size : profile_spec(buffer_profile).queue_size;
}

bool Settings::set(const std::string& raw_key, const std::string& raw_value, std::string& error) {
    std::string key = to_lower(trim(raw_key));
    std::string value = trim(raw_value);

    auto bad_value = [&](const char* expected) {
        error = "invalid value '" + value + "' for " + key + " (expected " + expected + ")";
        return false;
    };

    if (key == "interface") {
        interface_name = value;
    } else if (key == "data_dir") {
        if (value.empty()) return bad_value("a directory");
        data_dir = value;
    } else if (key == "filter" || key == "bpf_filter") {
        bpf_filter = value;
    } else if (key == "snaplen") {
        uint32_t v = 0;
        if (!parse_unsigned(value, v) || v == 0 || v > 262144) return bad_value("1-262144");
        snaplen = v;
    } else if (key == "promisc") {
        if (!parse_bool(value, promisc)) return bad_value("a boolean");
    } else if (key == "buffer_profile") {
        auto profile = parse_buffer_profile(to_lower(value));
        if (!profile) return bad_value("low, balanced, fast or max");
        buffer_profile = *profile;
    } else if (key == "queue_size") {
        size_t v = 0;
        if (!parse_unsigned(value, v) || v == 0) return bad_value("a positive integer");
        queue_size = v;
    } else if (key == "retention_days") {
        int v = 0;
        if (!parse_int(value, v) || v < 0) return bad_value("a non-negative integer");
        retention_days = v;
    } else if (key == "batch_size") {
        size_t v = 0;
        if (!parse_unsigned(value, v) || v == 0) return bad_value("a positive integer");
        batch_size = v;
    } else if (key == "stats_interval") {
        double v = 0.0;
        if (!parse_double(value, v) || v <= 0.0) return bad_value("a positive number of seconds");
        stats_interval = v;
    } else if (key == "print_packets") {
        if (!parse_bool(value, print_packets)) return bad_value("a boolean");
    } else if (key == "modules") {
        if (!parse_bool(value, modules_enabled)) return bad_value("a boolean");
    } else if (key == "enabled_modules") {
        if (value.empty() || to_lower(value) == "all") {
            enabled_modules.reset();
        } else {
            enabled_modules = split_list(value);
        }
    } else if (key == "analysis_workers") {
        size_t v = 0;
        if (!parse_unsigned(value, v) || v == 0) return bad_value("a positive integer");
        analysis_workers = v;
    } else if (key == "analysis_queue_size") {
        size_t v = 0;
        if (!parse_unsigned(value, v) || v == 0) return bad_value("a positive integer");
        analysis_queue_size = v;
    } else if (key == "log_level") {
        if (!logger::parse_level(value)) return bad_value("debug, info, warn or error");
        log_level = to_lower(value);
    } else if (key == "log_file") {
        log_file = value;
    } else {
        error = "unknown setting '" + key + "'";
        return false;
    }

    error.clear();
    return true;
}

// --- Config ---

std::string Config::get_config_dir() {
    if (cached_config_dir_) {
        return *cached_config_dir_;
    }

    std::string config_dir;

    // Check XDG_CONFIG_HOME first
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        config_dir = std::string(xdg_config) + "/sniff";
    } else {
        // Fall back to ~/.config/sniff
        const char* home = std::getenv("HOME");
        if (!home || home[0] == '\0') {
            // Last resort: use passwd entry
            struct passwd* pw = getpwuid(getuid());
            if (pw) {
                home = pw->pw_dir;
            }
        }
        if (home) {
            config_dir = std::string(home) + "/.config/sniff";
        } else {
            config_dir = ".";
        }
    }

    cached_config_dir_ = config_dir;
    return config_dir;
}

std::string Config::get_config_path(const std::string& filename) {
    return get_config_dir() + "/" + filename;
}

std::vector<std::string> Config::read_config_lines(const std::string& filepath) {
    std::vector<std::string> lines;
    std::ifstream file(filepath);

    if (!file.is_open()) {
        return lines;
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip blank lines and # comments
        size_t first_non_space = line.find_first_not_of(" \t\r");
        if (first_non_space == std::string::npos) {
            continue;
        }
        if (line[first_non_space] == '#') {
            continue;
        }

        size_t last_non_space = line.find_last_not_of(" \t\r\n");
        line = line.substr(first_non_space, last_non_space - first_non_space + 1);

        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    return lines;
}

std::vector<std::string> Config::parse_fields(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    bool escaped = false;

    for (size_t i = 0; i < line.length(); ++i) {
        char c = line[i];

        if (escaped) {
            current += c;
            escaped = false;
        } else if (c == '\\') {
            escaped = true;
        } else if (c == delimiter) {
            fields.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }

    fields.push_back(current);

    return fields;
}

bool Config::load_settings(const std::string& filepath, Settings& settings) {
    std::ifstream existing(filepath);
    if (!existing.is_open()) {
        return false;
    }
    existing.close();

    int line_no = 0;
    for (const auto& line : read_config_lines(filepath)) {
        line_no++;
        std::vector<std::string> fields = parse_fields(line);
        if (fields.size() < 2) {
            logger::warn(filepath + ": ignoring line without ':' (" + line + ")");
            continue;
        }

        // Unescaped colons after the key belong to the value
        std::string value = fields[1];
        for (size_t i = 2; i < fields.size(); i++) {
            value += ":" + fields[i];
        }

        std::string error;
        if (!settings.set(fields[0], value, error)) {
            logger::warn(filepath + ": " + error);
        }
    }

    logger::debug("loaded settings from " + filepath + " (" + std::to_string(line_no) +
                  " entries)");
    return true;
}
