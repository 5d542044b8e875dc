/*
 * rotator.cpp - Hourly capture file rotation implementation
 */

#include "rotator.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <tuple>

namespace fs = std::filesystem;

namespace {

std::tm to_local_tm(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string format_tm(const std::tm& tm, const char* fmt) {
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

}

HourlyRotator::HourlyRotator(const std::string& base_dir,
                             const std::string& interface_name,
                             uint32_t snaplen,
                             int retention_days,
                             RotateCallback on_rotate,
                             size_t batch_size)
    : base_dir_(base_dir),
      interface_(interface_name),
      snaplen_(snaplen),
      retention_days_(retention_days),
      on_rotate_(std::move(on_rotate)),
      batch_size_(batch_size),
      clock_([]() { return std::chrono::system_clock::now(); }) {}

HourlyRotator::~HourlyRotator() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_ && writer_) {
        // Destroyed without close(): persist buffered records, skip the callback
        writer_->close();
    }
}

void HourlyRotator::set_clock(WallClock clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = std::move(clock);
}

void HourlyRotator::set_on_rotate(RotateCallback on_rotate) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_rotate_ = std::move(on_rotate);
}

// --- calendar helpers ---

std::chrono::system_clock::time_point HourlyRotator::hour_start(
        std::chrono::system_clock::time_point tp) {
    std::tm tm = to_local_tm(tp);
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::chrono::system_clock::time_point HourlyRotator::next_hour(
        std::chrono::system_clock::time_point tp) {
    std::tm tm = to_local_tm(tp);
    tm.tm_hour += 1;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::string HourlyRotator::format_date(std::chrono::system_clock::time_point tp) {
    return format_tm(to_local_tm(tp), "%Y-%m-%d");
}

std::string HourlyRotator::format_time_window(std::chrono::system_clock::time_point tp) {
    return format_tm(to_local_tm(tp), "%Y-%m-%d_%H");
}

bool HourlyRotator::is_date_partition(const std::string& name) {
    if (name.size() != 10) return false;
    for (size_t i = 0; i < name.size(); i++) {
        if (i == 4 || i == 7) {
            if (name[i] != '-') return false;
        } else if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
            return false;
        }
    }
    return true;
}

bool HourlyRotator::should_remove_partition(const std::string& name,
                                            const std::string& cutoff_date,
                                            const std::string& today) {
    if (name == today) return false;
    if (!is_date_partition(name)) return false;
    return name < cutoff_date;
}

std::string HourlyRotator::filepath_for(std::chrono::system_clock::time_point tp,
                                       unsigned segment) const {
    std::tm tm = to_local_tm(tp);
    std::string date = format_tm(tm, "%Y-%m-%d");
    std::string name = interface_ + "_" + date + "_" + format_tm(tm, "%H");
    if (segment > 0) {
        name += "." + std::to_string(segment);
    }
    fs::path path = fs::path(base_dir_) / date / (name + ".pcap");
    return path.string();
}

// --- writing ---

bool HourlyRotator::write_packet(uint32_t ts_sec, uint32_t ts_usec, const uint8_t* data,
                                 size_t len, std::optional<uint32_t> origlen) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }

    auto now = clock_();

    if (!writer_) {
        open_new_file_unlocked(now);
    } else if (next_rotate_time_ && now >= *next_rotate_time_) {
        rotate_unlocked(now, true);
    }

    if (!writer_) {
        return false;
    }

    if (!writer_->write_packet(ts_sec, ts_usec, data, len, origlen)) {
        logger::error("write to " + current_filepath_ + " failed: " + writer_->get_error());
        return false;
    }

    packet_count_++;
    byte_count_ += std::min<size_t>(len, snaplen_);
    return true;
}

bool HourlyRotator::write_frame(const RawFrame& frame) {
    return write_packet(frame.ts_sec, frame.ts_usec, frame.data.data(), frame.data.size(),
                        frame.origlen);
}

void HourlyRotator::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (writer_ && !writer_->flush()) {
        logger::error("flush of " + current_filepath_ + " failed: " + writer_->get_error());
    }
}

void HourlyRotator::force_rotate(bool terminating) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !writer_) {
        return;
    }
    rotate_unlocked(clock_(), !terminating);
}

void HourlyRotator::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    auto closed_hour = current_hour_;
    auto closed_path = close_current_file_unlocked();
    if (closed_path && closed_hour) {
        notify_rotation_unlocked(*closed_path, *closed_hour);
    }
}

void HourlyRotator::cleanup_old_files() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_old_files_unlocked(clock_());
}

// --- internals (mutex_ held) ---

void HourlyRotator::open_new_file_unlocked(std::chrono::system_clock::time_point now) {
    std::string path = filepath_for(now);

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        if (open_failures_++ % 1000 == 0) {
            logger::error("cannot create " + fs::path(path).parent_path().string() + ": " +
                          ec.message());
        }
        return;
    }

    // Earlier segments of this hour may still be waiting for analysis
    for (unsigned segment = 1; fs::exists(path, ec) || ec; segment++) {
        if (ec) {
            if (open_failures_++ % 1000 == 0) {
                logger::error("cannot stat " + path + ": " + ec.message());
            }
            return;
        }
        path = filepath_for(now, segment);
    }

    auto writer = std::make_unique<PcapWriter>(path, snaplen_, batch_size_);
    if (!writer->open()) {
        if (open_failures_++ % 1000 == 0) {
            logger::error("cannot open capture file: " + writer->get_error());
        }
        return;
    }

    open_failures_ = 0;
    writer_ = std::move(writer);
    current_filepath_ = path;
    current_hour_ = hour_start(now);
    next_rotate_time_ = next_hour(now);
    file_count_++;
    logger::info("recording to " + path);
}

std::optional<std::string> HourlyRotator::close_current_file_unlocked() {
    if (!writer_) {
        return std::nullopt;
    }

    if (!writer_->close()) {
        logger::error("close of " + current_filepath_ + " failed: " + writer_->get_error());
    }

    std::string path = current_filepath_;
    writer_.reset();
    current_filepath_.clear();
    current_hour_.reset();
    next_rotate_time_.reset();
    return path;
}

void HourlyRotator::notify_rotation_unlocked(const std::string& closed_path,
                                             std::chrono::system_clock::time_point closed_hour) {
    std::string window = format_time_window(closed_hour);
    logger::info("rotated " + closed_path + " (" + window + ")");

    if (!on_rotate_) {
        return;
    }
    try {
        on_rotate_(closed_path, interface_, window);
    } catch (const std::exception& e) {
        logger::error(std::string("rotation callback failed: ") + e.what());
    } catch (...) {
        logger::error("rotation callback failed with unknown exception");
    }
}

void HourlyRotator::rotate_unlocked(std::chrono::system_clock::time_point now, bool reopen) {
    auto closed_hour = current_hour_;
    auto closed_path = close_current_file_unlocked();

    if (reopen) {
        open_new_file_unlocked(now);
    }

    if (closed_path && closed_hour) {
        notify_rotation_unlocked(*closed_path, *closed_hour);
    }

    cleanup_old_files_unlocked(now);
}

void HourlyRotator::cleanup_old_files_unlocked(std::chrono::system_clock::time_point now) {
    if (retention_days_ <= 0) {
        return;
    }

    std::error_code ec;
    if (!fs::is_directory(base_dir_, ec)) {
        return;
    }

    std::string today = format_date(now);
    std::string cutoff = format_date(now - std::chrono::hours(24 * retention_days_));

    fs::directory_iterator it(base_dir_, ec);
    if (ec) {
        logger::warn("cannot scan " + base_dir_ + ": " + ec.message());
        return;
    }

    std::vector<fs::path> expired;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec)) continue;
        std::string name = it->path().filename().string();
        if (should_remove_partition(name, cutoff, today)) {
            expired.push_back(it->path());
        }
    }
    if (ec) {
        logger::warn("scan of " + base_dir_ + " stopped early: " + ec.message());
    }

    for (const auto& path : expired) {
        std::error_code rm_ec;
        fs::remove_all(path, rm_ec);
        if (rm_ec) {
            logger::warn("cannot remove " + path.string() + ": " + rm_ec.message());
        } else {
            logger::info("removed expired partition " + path.string());
        }
    }
}

// --- state queries ---

std::optional<std::string> HourlyRotator::current_filepath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!writer_) return std::nullopt;
    return current_filepath_;
}

std::optional<std::chrono::system_clock::time_point> HourlyRotator::current_hour() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_hour_;
}

std::optional<std::chrono::system_clock::time_point> HourlyRotator::next_rotate_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_rotate_time_;
}

uint64_t HourlyRotator::packet_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return packet_count_;
}

uint64_t HourlyRotator::byte_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return byte_count_;
}

uint64_t HourlyRotator::file_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_count_;
}

RotatorStatus HourlyRotator::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RotatorStatus status;
    if (writer_) {
        status.current_file = current_filepath_;
    }
    if (current_hour_) {
        status.current_hour = format_time_window(*current_hour_);
    }
    if (next_rotate_time_) {
        status.next_rotate = format_tm(to_local_tm(*next_rotate_time_), "%H:%M:%S");
    }
    status.packet_count = packet_count_;
    status.byte_count = byte_count_;
    status.file_count = file_count_;
    return status;
}

// --- directory listing ---

std::vector<PcapFileEntry> list_pcap_files(const std::string& base_dir,
                                           const std::string& interface_name,
                                           const std::string& date) {
    std::vector<PcapFileEntry> files;
    std::error_code ec;

    for (const std::string& day : get_available_dates(base_dir)) {
        if (!date.empty() && day != date) continue;

        fs::path day_dir = fs::path(base_dir) / day;
        fs::directory_iterator it(day_dir, ec);
        if (ec) continue;

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            if (!it->is_regular_file(entry_ec)) continue;
            if (it->path().extension() != ".pcap") continue;

            // {iface}_{YYYY-MM-DD}_{HH} or {iface}_{YYYY-MM-DD}_{HH}.{N}
            std::string stem = it->path().stem().string();
            std::string marker = "_" + day + "_";
            size_t pos = stem.rfind(marker);
            if (pos == std::string::npos) continue;

            std::string hour = stem.substr(pos + marker.size());
            unsigned segment = 0;
            size_t dot = hour.find('.');
            if (dot != std::string::npos) {
                std::string suffix = hour.substr(dot + 1);
                if (suffix.empty() || suffix.size() > 6 ||
                    !std::all_of(suffix.begin(), suffix.end(),
                                 [](unsigned char c) { return std::isdigit(c); })) {
                    continue;
                }
                segment = static_cast<unsigned>(std::stoul(suffix));
                hour.resize(dot);
            }
            if (hour.size() != 2) continue;

            PcapFileEntry file;
            file.filepath = it->path().string();
            file.interface_name = stem.substr(0, pos);
            file.date = day;
            file.hour = hour;
            file.segment = segment;
            file.size_bytes = it->file_size(entry_ec);

            if (!interface_name.empty() && file.interface_name != interface_name) continue;
            files.push_back(std::move(file));
        }
        if (ec) {
            logger::warn("scan of " + day_dir.string() + " stopped early: " + ec.message());
            ec.clear();
        }
    }

    std::sort(files.begin(), files.end(), [](const PcapFileEntry& a, const PcapFileEntry& b) {
        return std::tie(a.date, a.interface_name, a.hour, a.segment) <
               std::tie(b.date, b.interface_name, b.hour, b.segment);
    });
    return files;
}

std::vector<std::string> get_available_dates(const std::string& base_dir) {
    std::vector<std::string> dates;
    std::error_code ec;
    fs::directory_iterator it(base_dir, ec);
    if (ec) {
        return dates;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec)) continue;
        std::string name = it->path().filename().string();
        if (HourlyRotator::is_date_partition(name)) {
            dates.push_back(name);
        }
    }
    if (ec) {
        logger::warn("scan of " + base_dir + " stopped early: " + ec.message());
    }

    std::sort(dates.begin(), dates.end());
    return dates;
}
