/*
 * rotator.hpp - Hourly capture file rotation
 *
 * HourlyRotator owns the active PcapWriter and switches to a new file when the
 * wall clock crosses an hour boundary. Files are laid out as
 *
 *     {base_dir}/{YYYY-MM-DD}/{interface}_{YYYY-MM-DD}_{HH}.pcap
 *
 * An existing file is never truncated. If the file for the hour is already on
 * disk (forced rotation, restart within the hour) the next free segment
 * {interface}_{YYYY-MM-DD}_{HH}.{N}.pcap is opened instead.
 *
 * Every closed file is reported once through the rotation callback with the
 * time window (YYYY-MM-DD_HH) of the hour it covers, including the last file
 * closed at shutdown. After each rotation, date directories older than the
 * retention period are removed; today's directory is always kept.
 *
 * All writes and rotation decisions happen under one mutex, so rotation
 * events are emitted in the order hours close.
 */

#pragma once

#include "packet.hpp"
#include "pcap_file.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

constexpr int DEFAULT_RETENTION_DAYS = 7;

// (closed file path, interface name, time window of the closed hour)
using RotateCallback = std::function<void(const std::string&, const std::string&,
                                          const std::string&)>;

using WallClock = std::function<std::chrono::system_clock::time_point()>;

struct RotatorStatus {
    std::string current_file;
    std::string current_hour;   // YYYY-MM-DD_HH, empty when no file is open
    std::string next_rotate;    // HH:MM:SS, empty when no file is open
    uint64_t packet_count = 0;
    uint64_t byte_count = 0;
    uint64_t file_count = 0;
};

class HourlyRotator {
public:
    HourlyRotator(const std::string& base_dir,
                  const std::string& interface_name,
                  uint32_t snaplen = DEFAULT_SNAPLEN,
                  int retention_days = DEFAULT_RETENTION_DAYS,
                  RotateCallback on_rotate = nullptr,
                  size_t batch_size = DEFAULT_BATCH_SIZE);
    ~HourlyRotator();

    // Non-copyable
    HourlyRotator(const HourlyRotator&) = delete;
    HourlyRotator& operator=(const HourlyRotator&) = delete;

    // Replace the wall clock (defaults to system_clock::now)
    void set_clock(WallClock clock);
    void set_on_rotate(RotateCallback on_rotate);

    // Write one frame, rotating first if the hour has changed.
    // Returns false if the frame could not be persisted.
    bool write_packet(uint32_t ts_sec, uint32_t ts_usec, const uint8_t* data,
                      size_t len, std::optional<uint32_t> origlen = std::nullopt);
    bool write_frame(const RawFrame& frame);

    void flush();

    // Close the active file now and report it. When `terminating` is false a
    // replacement file for the current hour is opened.
    void force_rotate(bool terminating = false);

    // Close the active file and issue the final rotation callback
    void close();

    // Remove expired date directories under base_dir
    void cleanup_old_files();

    // State queries
    std::optional<std::string> current_filepath() const;
    std::optional<std::chrono::system_clock::time_point> current_hour() const;
    std::optional<std::chrono::system_clock::time_point> next_rotate_time() const;
    uint64_t packet_count() const;
    uint64_t byte_count() const;
    uint64_t file_count() const;
    RotatorStatus get_status() const;

    std::string get_interface_name() const { return interface_; }
    std::string get_base_dir() const { return base_dir_; }
    int get_retention_days() const { return retention_days_; }

    // Path for the file covering the hour that contains `tp`. Segment 0 is
    // the plain hourly name, later segments carry a ".N" suffix.
    std::string filepath_for(std::chrono::system_clock::time_point tp,
                             unsigned segment = 0) const;

    // Calendar helpers (local time)
    static std::chrono::system_clock::time_point hour_start(std::chrono::system_clock::time_point tp);
    static std::chrono::system_clock::time_point next_hour(std::chrono::system_clock::time_point tp);
    static std::string format_date(std::chrono::system_clock::time_point tp);
    static std::string format_time_window(std::chrono::system_clock::time_point tp);
    static bool is_date_partition(const std::string& name);

    // A partition is expired when it sorts before the cutoff date, but the
    // partition for today never is
    static bool should_remove_partition(const std::string& name,
                                        const std::string& cutoff_date,
                                        const std::string& today);

private:
    void open_new_file_unlocked(std::chrono::system_clock::time_point now);
    std::optional<std::string> close_current_file_unlocked();
    void notify_rotation_unlocked(const std::string& closed_path,
                                  std::chrono::system_clock::time_point closed_hour);
    void rotate_unlocked(std::chrono::system_clock::time_point now, bool reopen);
    void cleanup_old_files_unlocked(std::chrono::system_clock::time_point now);

    std::string base_dir_;
    std::string interface_;
    uint32_t snaplen_;
    int retention_days_;
    RotateCallback on_rotate_;
    size_t batch_size_;
    WallClock clock_;

    mutable std::mutex mutex_;
    std::unique_ptr<PcapWriter> writer_;
    std::string current_filepath_;
    std::optional<std::chrono::system_clock::time_point> current_hour_;
    std::optional<std::chrono::system_clock::time_point> next_rotate_time_;

    uint64_t packet_count_ = 0;
    uint64_t byte_count_ = 0;
    uint64_t file_count_ = 0;
    uint64_t open_failures_ = 0;
    bool closed_ = false;
};

struct PcapFileEntry {
    std::string filepath;
    std::string interface_name;
    std::string date;
    std::string hour;
    unsigned segment = 0;
    uint64_t size_bytes = 0;
};

// Capture files under base_dir, optionally filtered by interface and date,
// ordered by date, interface, hour and segment
std::vector<PcapFileEntry> list_pcap_files(const std::string& base_dir,
                                           const std::string& interface_name = "",
                                           const std::string& date = "");

// Date partitions (YYYY-MM-DD) present under base_dir, sorted
std::vector<std::string> get_available_dates(const std::string& base_dir);
