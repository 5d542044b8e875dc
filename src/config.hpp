/*
 * config.hpp - Configuration file utilities and recorder settings
 *
 * Provides functions for locating and reading configuration files.
 * Follows XDG Base Directory specification for config file locations.
 * Uses a simple line-based format with colon-separated fields.
 *
 * Recorder settings live in sniff.conf as `key: value` lines:
 *
 *     # capture
 *     interface: eth0
 *     buffer_profile: fast
 *     retention_days: 14
 *     enabled_modules: protocol_stats
 *
 * Command-line flags are applied on top with Settings::set().
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

constexpr const char* SETTINGS_FILENAME = "sniff.conf";
constexpr const char* DEFAULT_DATA_DIR = "./sniff_data";

// Kernel buffer / delivery queue presets
enum class BufferProfile { Low, Balanced, Fast, Max };

struct BufferProfileSpec {
    int buffer_bytes;
    size_t queue_size;
    const char* description;
};

BufferProfileSpec profile_spec(BufferProfile profile);
std::string buffer_profile_name(BufferProfile profile);

// "low", "balanced", "fast", "max"; anything else is nullopt
std::optional<BufferProfile> parse_buffer_profile(const std::string& name);

struct Settings {
    std::string interface_name;
    std::string data_dir = DEFAULT_DATA_DIR;
    std::string bpf_filter;
    uint32_t snaplen = 1518;
    bool promisc = true;
    BufferProfile buffer_profile = BufferProfile::Balanced;
    std::optional<size_t> queue_size;       // Overrides the profile's queue size
    int retention_days = 7;                 // 0 keeps files forever
    size_t batch_size = 100;
    double stats_interval = 2.0;
    bool print_packets = false;             // Echo decoded frames to stdout

    bool modules_enabled = true;
    std::optional<std::vector<std::string>> enabled_modules;   // nullopt = all
    size_t analysis_workers = 2;
    size_t analysis_queue_size = 100;

    std::string log_level = "info";
    std::string log_file;

    // {data_dir}/raw and {data_dir}/modules
    std::string raw_dir() const;
    std::string modules_dir() const;

    size_t effective_queue_size() const;
    int kernel_buffer_bytes() const { return profile_spec(buffer_profile).buffer_bytes; }

    // Apply one setting. On a bad key or value the setting is unchanged,
    // `error` describes the problem and false is returned.
    bool set(const std::string& key, const std::string& value, std::string& error);
};

class Config {
public:
    // Get the configuration directory path
    // Checks $XDG_CONFIG_HOME first, falls back to ~/.config/sniff
    static std::string get_config_dir();

    // Get the full path to a config file
    static std::string get_config_path(const std::string& filename);

    // Read lines from a config file, stripping comments and empty lines
    // Returns empty vector if file doesn't exist
    static std::vector<std::string> read_config_lines(const std::string& filepath);

    // Parse a colon-separated line into fields
    // Handles escaped colons (\:) within fields
    static std::vector<std::string> parse_fields(const std::string& line, char delimiter = ':');

    // Apply `key: value` lines from `filepath` to `settings`. Bad lines are
    // logged and skipped. Returns false if the file cannot be read.
    static bool load_settings(const std::string& filepath, Settings& settings);

    // Drop the cached config directory (after changing the environment)
    static void reset_cache() { cached_config_dir_.reset(); }

private:
    static std::optional<std::string> cached_config_dir_;
};
