/*
 * capture.hpp - Capture engine
 *
 * Bridges a CaptureSource to the rest of the pipeline. Each delivered frame is
 * sequenced, counted, persisted through the HourlyRotator (when one is
 * attached), shown to an optional live observer callback, and offered to a
 * bounded delivery queue. A full queue drops the frame and counts it; the
 * capture thread never blocks on a consumer.
 *
 * A separate timer thread recomputes packet/byte rates and refreshes the
 * kernel drop counter every stats interval.
 *
 * Usage: construct with a source, optionally set_rotator() and
 * set_packet_callback(), then setup() to acquire the source and start().
 * stop() is idempotent and flushes the rotator.
 */

#pragma once

#include "bounded_queue.hpp"
#include "capture_source.hpp"
#include "packet.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

class HourlyRotator;

constexpr size_t DEFAULT_QUEUE_SIZE = 10000;
constexpr double DEFAULT_STATS_INTERVAL = 2.0;

// Live observer, called on the capture thread for every accepted frame
using PacketCallback = std::function<void(const RawFrame&)>;

struct CaptureStats {
    uint64_t packets = 0;
    uint64_t bytes = 0;
    uint64_t queue_dropped = 0;

    // -1 until the first successful kernel counter read of the session
    int64_t kernel_drops_base = -1;
    int64_t kernel_drops_current = 0;

    double pps = 0.0;
    double bps = 0.0;

    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point last_rate_time;
    uint64_t last_packets = 0;
    uint64_t last_bytes = 0;

    void reset(std::chrono::steady_clock::time_point now);

    // Record a cumulative kernel counter value; the first one becomes the baseline
    void observe_kernel_drops(uint64_t value);

    // Recompute pps/bps from the counter deltas since the previous call
    void update_rates(std::chrono::steady_clock::time_point now);

    uint64_t kernel_dropped() const;
    uint64_t dropped() const { return kernel_dropped() + queue_dropped; }
    double uptime(std::chrono::steady_clock::time_point now) const;
};

struct CaptureStatus {
    std::string interface_name;
    bool running = false;
    bool paused = false;
    double uptime_sec = 0.0;
    uint64_t packets = 0;
    uint64_t bytes = 0;
    uint64_t dropped = 0;
    uint64_t queue_dropped = 0;
    uint64_t kernel_dropped = 0;
    double pps = 0.0;
    double bps = 0.0;
    size_t queue_depth = 0;
    size_t queue_capacity = 0;
};

class CaptureEngine {
public:
    explicit CaptureEngine(std::unique_ptr<CaptureSource> source,
                           size_t queue_size = DEFAULT_QUEUE_SIZE,
                           double stats_interval = DEFAULT_STATS_INTERVAL);
    ~CaptureEngine();

    // Non-copyable
    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    // Optional integrations, set before start()
    void set_rotator(HourlyRotator* rotator) { rotator_ = rotator; }
    void set_packet_callback(PacketCallback callback) { callback_ = std::move(callback); }

    // Acquire the capture source. The only place acquisition errors surface.
    bool setup();

    // Capture control
    bool start();
    void stop();
    void pause();
    void resume();
    bool toggle_pause();

    // State queries
    // Started and the source is still delivering
    bool is_running() const;
    bool is_paused() const { return paused_.load(); }
    std::string get_error() const;
    std::string get_interface_name() const;

    // Per-frame entry point, called on the source thread
    void handle_frame(uint32_t ts_sec, uint32_t ts_usec, const uint8_t* data,
                      uint32_t caplen, uint32_t origlen);

    // Consumer side of the delivery queue
    std::optional<RawFrame> get_packet(std::chrono::milliseconds timeout);
    void clear_queue();
    size_t queue_depth() const { return queue_.size(); }

    CaptureStats get_stats() const;
    CaptureStatus get_status() const;

    // One timer tick: rates and kernel drops
    void refresh_stats();

private:
    void timer_loop();
    void refresh_kernel_drops();

    std::unique_ptr<CaptureSource> source_;
    HourlyRotator* rotator_ = nullptr;
    PacketCallback callback_;
    BoundedQueue<RawFrame> queue_;
    std::chrono::duration<double> stats_interval_;
    std::string error_;

    mutable std::mutex mutex_;
    uint64_t next_seq_ = 1;
    CaptureStats stats_;

    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};

    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool timer_stop_ = false;
    std::thread timer_thread_;
};
