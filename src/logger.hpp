/*
 * logger.hpp - Process-wide logging
 *
 * Level-filtered, timestamped log lines written to stderr and optionally
 * appended to a log file. Safe to call from the capture thread, the stats
 * timer and the analysis workers concurrently.
 */

#pragma once

#include <string>
#include <string_view>
#include <optional>

namespace logger {

enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

void set_level(Level level);
Level get_level();

// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive)
std::optional<Level> parse_level(const std::string& name);

// Append log lines to this file as well as stderr. Empty path disables.
bool set_log_file(const std::string& filepath);

// Silence stderr output (file output is unaffected)
void set_console_enabled(bool enabled);

void write(Level level, std::string_view msg);

inline void debug(std::string_view msg) { write(Level::DEBUG, msg); }
inline void info(std::string_view msg) { write(Level::INFO, msg); }
inline void warn(std::string_view msg) { write(Level::WARN, msg); }
inline void error(std::string_view msg) { write(Level::ERROR, msg); }

}  // namespace logger
