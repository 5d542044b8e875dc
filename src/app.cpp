/*
 * app.cpp - Recorder application controller implementation
 */

#include "app.hpp"
#include "logger.hpp"
#include <cstdio>
#include <ctime>
#include <iostream>

App::App(Settings settings)
    : settings_(std::move(settings)),
      last_stats_log_(std::chrono::steady_clock::now()) {}

App::~App() {
    shutdown();
}

bool App::init() {
    if (settings_.interface_name.empty()) {
        error_ = "no capture interface given";
        return false;
    }

    CaptureOptions options;
    options.interface_name = settings_.interface_name;
    options.bpf_filter = settings_.bpf_filter;
    options.snaplen = settings_.snaplen;
    options.promisc = settings_.promisc;
    options.buffer_size = settings_.kernel_buffer_bytes();

    return init_with_source(std::make_unique<PcapCaptureSource>(options));
}

bool App::init_with_source(std::unique_ptr<CaptureSource> source) {
    if (settings_.modules_enabled) {
        registry_ = create_builtin_registry();
        scheduler_ = std::make_unique<AnalysisScheduler>(
            settings_.modules_dir(), registry_, settings_.enabled_modules,
            settings_.analysis_workers, settings_.analysis_queue_size);
    }

    RotateCallback on_rotate;
    if (scheduler_) {
        AnalysisScheduler* scheduler = scheduler_.get();
        on_rotate = [scheduler](const std::string& path, const std::string& iface,
                                const std::string& window) {
            scheduler->queue_analysis(path, iface, window);
        };
    }

    rotator_ = std::make_unique<HourlyRotator>(
        settings_.raw_dir(), source->get_interface_name(), settings_.snaplen,
        settings_.retention_days, on_rotate, settings_.batch_size);

    engine_ = std::make_unique<CaptureEngine>(std::move(source),
                                              settings_.effective_queue_size(),
                                              settings_.stats_interval);
    engine_->set_rotator(rotator_.get());

    if (!engine_->setup()) {
        error_ = engine_->get_error();
        return false;
    }

    if (scheduler_ && !scheduler_->start()) {
        error_ = "cannot start analysis scheduler";
        return false;
    }

    if (!engine_->start()) {
        error_ = engine_->get_error();
        return false;
    }

    started_ = true;
    logger::info("recording " + engine_->get_interface_name() + " to " + settings_.raw_dir() +
                 " (profile " + buffer_profile_name(settings_.buffer_profile) +
                 ", queue " + std::to_string(settings_.effective_queue_size()) +
                 ", retention " + std::to_string(settings_.retention_days) + " days)");
    return true;
}

bool App::run(const std::atomic<bool>& stop_requested) {
    if (!started_) {
        return false;
    }

    while (!stop_requested.load()) {
        if (!engine_->is_running()) {
            logger::error("capture on " + engine_->get_interface_name() + " ended: " +
                          engine_->get_error());
            std::cout.flush();
            return false;
        }

        // Keep the delivery queue moving; frames are already on disk
        auto frame = engine_->get_packet(std::chrono::milliseconds(200));
        if (frame && settings_.print_packets) {
            std::cout << format_frame_line(*frame) << "\n";
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_stats_log_ >= STATS_LOG_INTERVAL) {
            log_stats();
            last_stats_log_ = now;
        }
    }
    std::cout.flush();
    return true;
}

void App::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    if (engine_) {
        engine_->stop();
    }
    if (rotator_) {
        rotator_->close();
    }
    if (scheduler_) {
        scheduler_->stop(true, DEFAULT_STOP_TIMEOUT);
    }

    if (started_) {
        log_stats();
    }
}

void App::log_stats() {
    CaptureStatus status = engine_->get_status();
    RotatorStatus rot = rotator_->get_status();

    char buf[256];
    snprintf(buf, sizeof(buf),
             "stats: %llu packets, %llu bytes, %.1f pps, %.1f B/s, %llu dropped "
             "(kernel %llu, queue %llu), %llu files",
             static_cast<unsigned long long>(status.packets),
             static_cast<unsigned long long>(status.bytes),
             status.pps, status.bps,
             static_cast<unsigned long long>(status.dropped),
             static_cast<unsigned long long>(status.kernel_dropped),
             static_cast<unsigned long long>(status.queue_dropped),
             static_cast<unsigned long long>(rot.file_count));
    std::string line = buf;

    if (scheduler_) {
        SchedulerStatus sched = scheduler_->get_status();
        line += ", analysis " + std::to_string(sched.jobs_completed) + " done / " +
                std::to_string(sched.jobs_failed) + " failed / " +
                std::to_string(sched.queue_size) + " queued";
    }
    logger::info(line);
}

// --- read-only modes ---

std::string format_frame_line(const RawFrame& frame) {
    std::time_t t = static_cast<std::time_t>(frame.ts_sec);
    std::tm tm{};
    localtime_r(&t, &tm);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm);

    char prefix[64];
    snprintf(prefix, sizeof(prefix), "%6llu %s.%06u %5u  ",
             static_cast<unsigned long long>(frame.seq), ts, frame.ts_usec, frame.origlen);

    return std::string(prefix) + decode_packet(frame).summary();
}

int list_interfaces(std::ostream& out) {
    std::vector<NetworkInterface> interfaces = PcapCaptureSource::get_all_interfaces();
    if (interfaces.empty()) {
        out << "No interfaces found (insufficient privileges?)\n";
        return 1;
    }

    for (const auto& iface : interfaces) {
        out << iface.name;
        if (iface.is_loopback) out << " [loopback]";
        out << (iface.is_up ? " up" : " down");
        for (const auto& addr : iface.addresses) {
            out << " " << addr;
        }
        if (!iface.description.empty()) {
            out << "  (" << iface.description << ")";
        }
        out << "\n";
    }
    return 0;
}

int dump_capture_file(const std::string& filepath, std::ostream& out) {
    PcapReader reader(filepath);
    if (!reader.open()) {
        logger::error(reader.get_error());
        return 1;
    }

    while (auto frame = reader.read_packet()) {
        out << format_frame_line(*frame) << "\n";
    }
    return 0;
}

int print_capture_info(const std::string& filepath, std::ostream& out) {
    std::optional<PcapFileInfo> info = get_pcap_info(filepath);
    if (!info) {
        logger::error("not a readable capture file: " + filepath);
        return 1;
    }

    char buf[512];
    snprintf(buf, sizeof(buf),
             "file:        %s\n"
             "size:        %llu bytes\n"
             "snaplen:     %u\n"
             "packets:     %llu\n"
             "data bytes:  %llu\n"
             "first:       %.6f\n"
             "last:        %.6f\n"
             "duration:    %.3f s\n",
             info->filepath.c_str(),
             static_cast<unsigned long long>(info->size_bytes),
             info->snaplen,
             static_cast<unsigned long long>(info->packet_count),
             static_cast<unsigned long long>(info->total_bytes),
             info->first_timestamp, info->last_timestamp, info->duration);
    out << buf;
    return 0;
}
