/*
 * capture.cpp - Capture engine implementation
 */

#include "capture.hpp"
#include "logger.hpp"
#include "rotator.hpp"
#include <algorithm>

// --- CaptureStats ---

void CaptureStats::reset(std::chrono::steady_clock::time_point now) {
    *this = CaptureStats();
    start_time = now;
    last_rate_time = now;
}

void CaptureStats::observe_kernel_drops(uint64_t value) {
    int64_t v = static_cast<int64_t>(value);
    if (kernel_drops_base < 0) {
        kernel_drops_base = v;
    }
    // Counter reset under us (interface re-created): keep the reported value monotonic
    kernel_drops_current = std::max(kernel_drops_current, v);
}

void CaptureStats::update_rates(std::chrono::steady_clock::time_point now) {
    double elapsed = std::chrono::duration<double>(now - last_rate_time).count();
    if (elapsed <= 0.0) {
        return;
    }
    pps = static_cast<double>(packets - last_packets) / elapsed;
    bps = static_cast<double>(bytes - last_bytes) / elapsed;
    last_packets = packets;
    last_bytes = bytes;
    last_rate_time = now;
}

uint64_t CaptureStats::kernel_dropped() const {
    if (kernel_drops_base < 0 || kernel_drops_current < kernel_drops_base) {
        return 0;
    }
    return static_cast<uint64_t>(kernel_drops_current - kernel_drops_base);
}

double CaptureStats::uptime(std::chrono::steady_clock::time_point now) const {
    return std::chrono::duration<double>(now - start_time).count();
}

// --- CaptureEngine ---

CaptureEngine::CaptureEngine(std::unique_ptr<CaptureSource> source, size_t queue_size,
                             double stats_interval)
    : source_(std::move(source)),
      queue_(queue_size),
      stats_interval_(stats_interval) {
    stats_.reset(std::chrono::steady_clock::now());
}

CaptureEngine::~CaptureEngine() {
    stop();
    if (source_) {
        source_->close();
    }
}

std::string CaptureEngine::get_interface_name() const {
    return source_ ? source_->get_interface_name() : std::string();
}

bool CaptureEngine::setup() {
    if (!source_) {
        error_ = "no capture source";
        return false;
    }
    if (source_->is_open()) {
        return true;
    }
    if (!source_->open()) {
        error_ = source_->get_error();
        logger::error("cannot open " + source_->get_interface_name() + ": " + error_);
        return false;
    }
    error_.clear();
    logger::info("capture source ready on " + source_->get_interface_name());
    return true;
}

bool CaptureEngine::start() {
    if (running_.load()) {
        return true;
    }
    if (!source_ || !source_->is_open()) {
        error_ = "capture not set up";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        next_seq_ = 1;
        stats_.reset(std::chrono::steady_clock::now());
    }
    queue_.clear();
    paused_.store(false);
    refresh_kernel_drops();

    running_.store(true);
    bool ok = source_->start([this](uint32_t ts_sec, uint32_t ts_usec, const uint8_t* data,
                                    uint32_t caplen, uint32_t origlen) {
        handle_frame(ts_sec, ts_usec, data, caplen, origlen);
    });
    if (!ok) {
        running_.store(false);
        error_ = source_->get_error();
        logger::error("cannot start capture: " + error_);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer_stop_ = false;
    }
    timer_thread_ = std::thread([this]() {
        timer_loop();
    });

    logger::info("capture started on " + source_->get_interface_name());
    return true;
}

void CaptureEngine::stop() {
    bool was_running = running_.exchange(false);

    if (was_running) {
        if (source_) {
            source_->stop();
        }
        {
            std::lock_guard<std::mutex> lock(timer_mutex_);
            timer_stop_ = true;
        }
        timer_cv_.notify_all();
    }

    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }

    if (rotator_) {
        rotator_->flush();
    }

    if (was_running) {
        CaptureStats stats = get_stats();
        logger::info("capture stopped: " + std::to_string(stats.packets) + " packets, " +
                     std::to_string(stats.dropped()) + " dropped");
    }
}

void CaptureEngine::pause() {
    if (!paused_.exchange(true)) {
        logger::info("capture paused");
    }
}

void CaptureEngine::resume() {
    if (paused_.exchange(false)) {
        logger::info("capture resumed");
    }
}

bool CaptureEngine::toggle_pause() {
    if (paused_.load()) {
        resume();
    } else {
        pause();
    }
    return paused_.load();
}

void CaptureEngine::handle_frame(uint32_t ts_sec, uint32_t ts_usec, const uint8_t* data,
                                 uint32_t caplen, uint32_t origlen) {
    // Paused frames are consumed from the source but leave no trace
    if (paused_.load()) {
        return;
    }

    RawFrame frame;
    frame.ts_sec = ts_sec;
    frame.ts_usec = ts_usec;
    frame.caplen = caplen;
    frame.origlen = std::max(origlen, caplen);
    frame.data.assign(data, data + caplen);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        frame.seq = next_seq_++;
        stats_.packets++;
        stats_.bytes += frame.caplen;
    }

    if (rotator_) {
        rotator_->write_frame(frame);
    }

    if (callback_) {
        try {
            callback_(frame);
        } catch (const std::exception& e) {
            logger::warn(std::string("packet callback failed: ") + e.what());
        } catch (...) {
            logger::warn("packet callback failed with unknown exception");
        }
    }

    if (!queue_.try_push(std::move(frame))) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.queue_dropped++;
    }
}

std::optional<RawFrame> CaptureEngine::get_packet(std::chrono::milliseconds timeout) {
    return queue_.pop(timeout);
}

void CaptureEngine::clear_queue() {
    queue_.clear();
}

bool CaptureEngine::is_running() const {
    // The source loop can end by itself after a device error
    return running_.load() && source_ && source_->is_capturing();
}

std::string CaptureEngine::get_error() const {
    if (running_.load() && source_ && !source_->is_capturing()) {
        return source_->get_error();
    }
    return error_;
}

CaptureStats CaptureEngine::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

CaptureStatus CaptureEngine::get_status() const {
    CaptureStatus status;
    status.interface_name = get_interface_name();
    status.running = is_running();
    status.paused = paused_.load();
    status.queue_depth = queue_.size();
    status.queue_capacity = queue_.capacity();

    CaptureStats stats = get_stats();
    status.uptime_sec = status.running ? stats.uptime(std::chrono::steady_clock::now()) : 0.0;
    status.packets = stats.packets;
    status.bytes = stats.bytes;
    status.dropped = stats.dropped();
    status.queue_dropped = stats.queue_dropped;
    status.kernel_dropped = stats.kernel_dropped();
    status.pps = stats.pps;
    status.bps = stats.bps;
    return status;
}

void CaptureEngine::refresh_stats() {
    refresh_kernel_drops();
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.update_rates(std::chrono::steady_clock::now());
}

void CaptureEngine::refresh_kernel_drops() {
    if (!source_) {
        return;
    }
    // File read happens outside the hot-path lock
    std::optional<uint64_t> drops = source_->read_kernel_drops();
    if (!drops) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.observe_kernel_drops(*drops);
}

void CaptureEngine::timer_loop() {
    auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(stats_interval_);
    if (interval.count() <= 0) {
        interval = std::chrono::milliseconds(100);
    }

    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (!timer_stop_) {
        if (timer_cv_.wait_for(lock, interval, [this] { return timer_stop_; })) {
            break;
        }
        lock.unlock();
        refresh_stats();
        lock.lock();
    }
}
