/*
 * app.hpp - Recorder application controller
 *
 * Wires the recording pipeline for one interface:
 *
 *     libpcap source -> CaptureEngine -> HourlyRotator -> AnalysisScheduler
 *
 * The rotator's callback hands each closed hour to the scheduler. run()
 * drains the engine's delivery queue (optionally printing each frame) and
 * logs a statistics line periodically until the stop flag is raised.
 * shutdown() stops the engine, closes the rotator (which reports the last
 * file) and then lets the scheduler drain.
 *
 * The read-only modes (interface listing, file dump, file info) are free
 * functions so they do not need a pipeline.
 */

#pragma once

#include "capture.hpp"
#include "config.hpp"
#include "module_registry.hpp"
#include "rotator.hpp"
#include "scheduler.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <ostream>
#include <string>

class App {
public:
    explicit App(Settings settings);
    ~App();

    // Non-copyable
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Main lifecycle
    bool init();
    // Returns false if capture ended before a stop was requested
    bool run(const std::atomic<bool>& stop_requested);
    void shutdown();

    std::string get_error() const { return error_; }

    // Components, valid after init()
    CaptureEngine* engine() { return engine_.get(); }
    HourlyRotator* rotator() { return rotator_.get(); }
    AnalysisScheduler* scheduler() { return scheduler_.get(); }

    // Construct the pipeline around an arbitrary source
    bool init_with_source(std::unique_ptr<CaptureSource> source);

private:
    void log_stats();

    Settings settings_;
    std::shared_ptr<ModuleRegistry> registry_;
    std::unique_ptr<AnalysisScheduler> scheduler_;
    std::unique_ptr<HourlyRotator> rotator_;
    std::unique_ptr<CaptureEngine> engine_;

    bool started_ = false;
    bool shut_down_ = false;
    std::string error_;
    std::chrono::steady_clock::time_point last_stats_log_;
};

constexpr std::chrono::seconds STATS_LOG_INTERVAL{30};

// --list-interfaces
int list_interfaces(std::ostream& out);

// --read FILE: one decoded summary line per frame
int dump_capture_file(const std::string& filepath, std::ostream& out);

// --info FILE
int print_capture_info(const std::string& filepath, std::ostream& out);

// One line per frame as printed by dump_capture_file and -v
std::string format_frame_line(const RawFrame& frame);
