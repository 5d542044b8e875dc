/*
 * test_config.cpp - Unit tests for config file parsing, settings and logging
 */

#define ATTEST_IMPLEMENTATION
#include "attest.h"

#include <fstream>
#include <iterator>
#include <stdlib.h>
#include <string>
#include <vector>

#include "../src/config.hpp"
#include "../src/logger.hpp"
#include "test_helpers.hpp"

using namespace testutil;

static std::string write_text(const TempDir& dir, const std::string& name,
                              const std::string& text) {
    std::string path = dir.file(name);
    std::ofstream out(path);
    out << text;
    return path;
}

// =============================================================================
// Config::parse_fields Tests
// =============================================================================

REGISTER_TEST(config_parse_fields_basic)
{
    std::vector<std::string> fields = Config::parse_fields("a:b:c", ':');
    ATTEST_EQUAL(fields.size(), 3u);
    ATTEST_EQUAL(fields[0], "a");
    ATTEST_EQUAL(fields[1], "b");
    ATTEST_EQUAL(fields[2], "c");
}

REGISTER_TEST(config_parse_fields_empty)
{
    std::vector<std::string> fields = Config::parse_fields("", ':');
    ATTEST_EQUAL(fields.size(), 1u);
    ATTEST_EQUAL(fields[0], "");
}

REGISTER_TEST(config_parse_fields_escaped_delimiter)
{
    // "a\:b:c" should give ["a:b", "c"]
    std::vector<std::string> fields = Config::parse_fields("a\\:b:c", ':');
    ATTEST_EQUAL(fields.size(), 2u);
    ATTEST_EQUAL(fields[0], "a:b");
    ATTEST_EQUAL(fields[1], "c");
}

REGISTER_TEST(config_parse_fields_trailing_delimiter)
{
    std::vector<std::string> fields = Config::parse_fields("a:b:", ':');
    ATTEST_EQUAL(fields.size(), 3u);
    ATTEST_EQUAL(fields[2], "");
}

REGISTER_TEST(config_parse_fields_custom_delimiter)
{
    std::vector<std::string> fields = Config::parse_fields("a,b,c", ',');
    ATTEST_EQUAL(fields.size(), 3u);
    ATTEST_EQUAL(fields[1], "b");
}

// =============================================================================
// Config file locations
// =============================================================================

REGISTER_TEST(config_dir_follows_xdg)
{
    setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    Config::reset_cache();
    ATTEST_EQUAL(Config::get_config_dir(), "/tmp/xdg-test/sniff");
    ATTEST_EQUAL(Config::get_config_path(SETTINGS_FILENAME), "/tmp/xdg-test/sniff/sniff.conf");

    // Cached until reset
    setenv("XDG_CONFIG_HOME", "/elsewhere", 1);
    ATTEST_EQUAL(Config::get_config_dir(), "/tmp/xdg-test/sniff");

    unsetenv("XDG_CONFIG_HOME");
    setenv("HOME", "/home/tester", 1);
    Config::reset_cache();
    ATTEST_EQUAL(Config::get_config_dir(), "/home/tester/.config/sniff");
    Config::reset_cache();
}

REGISTER_TEST(config_read_lines_skips_comments)
{
    TempDir dir;
    std::string path = write_text(dir, "x.conf",
        "# header\n"
        "\n"
        "   \t\n"
        "  interface: eth0   \n"
        "   # indented comment\n"
        "retention_days: 3\n");

    std::vector<std::string> lines = Config::read_config_lines(path);
    ATTEST_EQUAL(lines.size(), 2u);
    ATTEST_EQUAL(lines[0], "interface: eth0");
    ATTEST_EQUAL(lines[1], "retention_days: 3");

    ATTEST_TRUE(Config::read_config_lines(dir.file("missing.conf")).empty());
}

// =============================================================================
// Buffer profiles
// =============================================================================

REGISTER_TEST(buffer_profile_presets)
{
    ATTEST_EQUAL(profile_spec(BufferProfile::Low).buffer_bytes, 1 * 1024 * 1024);
    ATTEST_EQUAL(profile_spec(BufferProfile::Low).queue_size, 5000u);
    ATTEST_EQUAL(profile_spec(BufferProfile::Balanced).buffer_bytes, 2 * 1024 * 1024);
    ATTEST_EQUAL(profile_spec(BufferProfile::Balanced).queue_size, 10000u);
    ATTEST_EQUAL(profile_spec(BufferProfile::Fast).buffer_bytes, 4 * 1024 * 1024);
    ATTEST_EQUAL(profile_spec(BufferProfile::Fast).queue_size, 20000u);
    ATTEST_EQUAL(profile_spec(BufferProfile::Max).buffer_bytes, 8 * 1024 * 1024);
    ATTEST_EQUAL(profile_spec(BufferProfile::Max).queue_size, 50000u);
}

REGISTER_TEST(buffer_profile_names)
{
    ATTEST_TRUE(parse_buffer_profile("fast") == BufferProfile::Fast);
    ATTEST_TRUE(parse_buffer_profile("max") == BufferProfile::Max);
    ATTEST_FALSE(parse_buffer_profile("turbo").has_value());
    ATTEST_EQUAL(buffer_profile_name(BufferProfile::Low), "low");
    ATTEST_EQUAL(buffer_profile_name(BufferProfile::Balanced), "balanced");
}

// =============================================================================
// Settings
// =============================================================================

REGISTER_TEST(settings_defaults)
{
    Settings s;
    ATTEST_EQUAL(s.data_dir, std::string(DEFAULT_DATA_DIR));
    ATTEST_EQUAL(s.raw_dir(), "./sniff_data/raw");
    ATTEST_EQUAL(s.modules_dir(), "./sniff_data/modules");
    ATTEST_EQUAL(s.snaplen, 1518u);
    ATTEST_EQUAL(s.retention_days, 7);
    ATTEST_TRUE(s.promisc);
    ATTEST_TRUE(s.modules_enabled);
    ATTEST_FALSE(s.enabled_modules.has_value());
    ATTEST_EQUAL(s.effective_queue_size(), 10000u);
    ATTEST_EQUAL(s.kernel_buffer_bytes(), 2 * 1024 * 1024);
}

REGISTER_TEST(settings_set_valid_values)
{
    Settings s;
    std::string error;

    ATTEST_TRUE(s.set("interface", "eth1", error));
    ATTEST_TRUE(s.set("Data_Dir", " /var/lib/sniff ", error));
    ATTEST_TRUE(s.set("filter", "tcp port 443", error));
    ATTEST_TRUE(s.set("snaplen", "96", error));
    ATTEST_TRUE(s.set("promisc", "no", error));
    ATTEST_TRUE(s.set("buffer_profile", "FAST", error));
    ATTEST_TRUE(s.set("retention_days", "0", error));
    ATTEST_TRUE(s.set("stats_interval", "0.5", error));
    ATTEST_TRUE(s.set("enabled_modules", "protocol_stats, other ,", error));
    ATTEST_TRUE(s.set("analysis_workers", "4", error));
    ATTEST_TRUE(s.set("log_level", "WARN", error));
    ATTEST_TRUE(error.empty());

    ATTEST_EQUAL(s.interface_name, "eth1");
    ATTEST_EQUAL(s.raw_dir(), "/var/lib/sniff/raw");
    ATTEST_EQUAL(s.bpf_filter, "tcp port 443");
    ATTEST_EQUAL(s.snaplen, 96u);
    ATTEST_FALSE(s.promisc);
    ATTEST_TRUE(s.buffer_profile == BufferProfile::Fast);
    ATTEST_EQUAL(s.effective_queue_size(), 20000u);
    ATTEST_EQUAL(s.retention_days, 0);
    ATTEST_TRUE(s.stats_interval == 0.5);
    ATTEST_TRUE(s.enabled_modules.has_value());
    ATTEST_TRUE(*s.enabled_modules == std::vector<std::string>({"protocol_stats", "other"}));
    ATTEST_EQUAL(s.analysis_workers, 4u);
    ATTEST_EQUAL(s.log_level, "warn");

    // Explicit queue size wins over the profile
    ATTEST_TRUE(s.set("queue_size", "123", error));
    ATTEST_EQUAL(s.effective_queue_size(), 123u);

    ATTEST_TRUE(s.set("enabled_modules", "all", error));
    ATTEST_FALSE(s.enabled_modules.has_value());
}

REGISTER_TEST(settings_set_rejects_bad_values)
{
    Settings s;
    std::string error;

    ATTEST_FALSE(s.set("snaplen", "0", error));
    ATTEST_FALSE(error.empty());
    ATTEST_FALSE(s.set("snaplen", "99999999", error));
    ATTEST_FALSE(s.set("snaplen", "12abc", error));
    ATTEST_FALSE(s.set("retention_days", "-1", error));
    ATTEST_FALSE(s.set("buffer_profile", "turbo", error));
    ATTEST_FALSE(s.set("promisc", "maybe", error));
    ATTEST_FALSE(s.set("stats_interval", "0", error));
    ATTEST_FALSE(s.set("analysis_workers", "-2", error));
    ATTEST_FALSE(s.set("log_level", "loud", error));
    ATTEST_FALSE(s.set("data_dir", "", error));

    // Nothing changed
    ATTEST_EQUAL(s.snaplen, 1518u);
    ATTEST_EQUAL(s.retention_days, 7);
    ATTEST_TRUE(s.buffer_profile == BufferProfile::Balanced);
    ATTEST_EQUAL(s.log_level, "info");
    ATTEST_EQUAL(s.data_dir, std::string(DEFAULT_DATA_DIR));

    ATTEST_FALSE(s.set("colour", "blue", error));
    ATTEST_EQUAL(error, "unknown setting 'colour'");
}

REGISTER_TEST(settings_load_from_file)
{
    TempDir dir;
    std::string path = write_text(dir, "sniff.conf",
        "# capture\n"
        "interface: wlan0\n"
        "filter: host 10.0.0.1 and port 8080\n"
        "data_dir: /srv/captures\\:2024\n"
        "buffer_profile: max\n"
        "snaplen: not-a-number\n"
        "bogus line\n"
        "retention_days: 30\n");

    Settings s;
    ATTEST_TRUE(Config::load_settings(path, s));
    ATTEST_EQUAL(s.interface_name, "wlan0");
    ATTEST_EQUAL(s.bpf_filter, "host 10.0.0.1 and port 8080");
    ATTEST_EQUAL(s.data_dir, "/srv/captures:2024");
    ATTEST_TRUE(s.buffer_profile == BufferProfile::Max);
    ATTEST_EQUAL(s.snaplen, 1518u);
    ATTEST_EQUAL(s.retention_days, 30);
}

REGISTER_TEST(settings_value_keeps_unescaped_colons)
{
    TempDir dir;
    std::string path = write_text(dir, "sniff.conf", "log_file: /tmp/a:b:c.log\n");

    Settings s;
    ATTEST_TRUE(Config::load_settings(path, s));
    ATTEST_EQUAL(s.log_file, "/tmp/a:b:c.log");
}

REGISTER_TEST(settings_missing_file)
{
    TempDir dir;
    Settings s;
    ATTEST_FALSE(Config::load_settings(dir.file("absent.conf"), s));
    ATTEST_EQUAL(s.interface_name, "");
}

// =============================================================================
// Logger
// =============================================================================

REGISTER_TEST(logger_parse_level)
{
    ATTEST_TRUE(logger::parse_level("debug") == logger::Level::DEBUG);
    ATTEST_TRUE(logger::parse_level("INFO") == logger::Level::INFO);
    ATTEST_TRUE(logger::parse_level("warning") == logger::Level::WARN);
    ATTEST_TRUE(logger::parse_level("Error") == logger::Level::ERROR);
    ATTEST_FALSE(logger::parse_level("trace").has_value());
}

REGISTER_TEST(logger_file_respects_level)
{
    TempDir dir;
    std::string path = dir.file("sniff.log");

    logger::set_console_enabled(false);
    logger::set_level(logger::Level::WARN);
    ATTEST_TRUE(logger::set_log_file(path));

    logger::info("quiet line");
    logger::warn("loud line");
    logger::error("louder line");
    ATTEST_TRUE(logger::set_log_file(""));

    std::ifstream in(path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ATTEST_TRUE(text.find("quiet line") == std::string::npos);
    ATTEST_TRUE(text.find("loud line") != std::string::npos);
    ATTEST_TRUE(text.find("louder line") != std::string::npos);
    ATTEST_TRUE(text.find("WARN") != std::string::npos);

    logger::set_level(logger::Level::INFO);
    logger::set_console_enabled(true);
    ATTEST_FALSE(logger::set_log_file("/nonexistent-dir/x.log"));
}
