/*
 * scheduler.hpp - Analysis job scheduler
 *
 * Rotation events become AnalysisJobs on a bounded priority queue (lower
 * priority value first, FIFO among equals). A fixed pool of worker threads
 * takes jobs with a bounded wait and runs every enabled module against the
 * job's file in registration order. A module that throws is logged and the
 * remaining modules still run.
 *
 * queue_analysis() never blocks: when the queue is full the job is dropped
 * with a warning, so a slow analysis backlog cannot stall capture.
 *
 * Each finished job yields a JobResult holding the ModuleResult of every
 * module that returned. The most recent ones are kept for inspection and each
 * is also handed to an optional result callback on the worker thread.
 *
 * Worker state is shared through a shared_ptr so a worker that misses its
 * join deadline at shutdown can be detached safely.
 */

#pragma once

#include "module_registry.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

constexpr size_t DEFAULT_ANALYSIS_WORKERS = 2;
constexpr size_t DEFAULT_ANALYSIS_QUEUE_SIZE = 100;
constexpr double DEFAULT_STOP_TIMEOUT = 10.0;
constexpr size_t RECENT_RESULTS_LIMIT = 32;

struct AnalysisJob {
    std::string pcap_path;
    std::string interface_name;
    std::string time_window;
    int priority = 0;           // Lower runs first
    uint64_t arrival = 0;       // Assigned on enqueue, breaks priority ties
};

struct JobResult {
    AnalysisJob job;
    bool completed = false;                     // False for missing file or shutdown
    std::vector<ModuleResult> results;          // Registration order
    std::vector<std::string> failed_modules;    // Modules that threw
};

using JobResultCallback = std::function<void(const JobResult&)>;

struct SchedulerStatus {
    bool running = false;
    size_t workers = 0;
    size_t queue_size = 0;
    size_t active_jobs = 0;
    uint64_t jobs_completed = 0;
    uint64_t jobs_failed = 0;
    uint64_t jobs_dropped = 0;
    std::vector<std::string> enabled_modules;
    std::vector<std::string> available_modules;
};

class AnalysisScheduler {
public:
    // `enabled_modules` nullopt runs every registered module
    AnalysisScheduler(const std::string& output_dir,
                      std::shared_ptr<const ModuleRegistry> registry,
                      std::optional<std::vector<std::string>> enabled_modules = std::nullopt,
                      size_t num_workers = DEFAULT_ANALYSIS_WORKERS,
                      size_t max_queue_size = DEFAULT_ANALYSIS_QUEUE_SIZE);
    ~AnalysisScheduler();

    // Non-copyable
    AnalysisScheduler(const AnalysisScheduler&) = delete;
    AnalysisScheduler& operator=(const AnalysisScheduler&) = delete;

    // How long an idle worker waits for a job before re-checking for shutdown
    void set_poll_interval(std::chrono::milliseconds interval);

    // Called on the worker thread after each job; exceptions are logged
    void set_result_callback(JobResultCallback on_result);

    // Non-blocking enqueue; false if the queue is full
    bool queue_analysis(const std::string& pcap_path,
                        const std::string& interface_name,
                        const std::string& time_window,
                        int priority = 0);

    bool start();

    // With `wait`, first let queued jobs finish. The whole call is bounded by
    // `timeout_sec`; workers still busy after their share are detached.
    void stop(bool wait = true, double timeout_sec = DEFAULT_STOP_TIMEOUT);

    // Block until the queue is empty and no job is running
    bool wait_idle(std::chrono::milliseconds timeout);

    bool is_running() const;
    size_t queue_size() const;
    uint64_t jobs_completed() const;
    uint64_t jobs_failed() const;
    uint64_t jobs_dropped() const;

    // Last RECENT_RESULTS_LIMIT finished jobs, oldest first
    std::vector<JobResult> recent_results() const;
    std::vector<std::string> enabled_module_names() const;
    SchedulerStatus get_status() const;

    const std::string& output_dir() const { return output_dir_; }

private:
    struct JobOrder {
        bool operator()(const AnalysisJob& a, const AnalysisJob& b) const {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.arrival > b.arrival;
        }
    };

    struct State {
        std::mutex mutex;
        std::condition_variable job_ready;
        std::condition_variable idle;
        std::priority_queue<AnalysisJob, std::vector<AnalysisJob>, JobOrder> queue;
        uint64_t next_arrival = 0;
        uint64_t generation = 0;
        bool stopping = false;
        size_t active = 0;
        uint64_t completed = 0;
        uint64_t failed = 0;
        uint64_t dropped = 0;
        std::deque<JobResult> recent;
        JobResultCallback on_result;
        std::chrono::milliseconds poll_interval{1000};
    };

    struct Worker {
        std::thread thread;
        std::future<void> exited;
    };

    static void worker_loop(std::shared_ptr<State> state,
                            std::shared_ptr<const ModuleRegistry> registry,
                            std::vector<AnalysisModule*> modules,
                            std::string output_dir,
                            uint64_t generation,
                            size_t worker_id,
                            std::promise<void> exited);

    static bool process_job(State& state, const std::vector<AnalysisModule*>& modules,
                            const std::string& output_dir, const AnalysisJob& job,
                            size_t worker_id, uint64_t generation, JobResult& result);

    std::string output_dir_;
    std::shared_ptr<const ModuleRegistry> registry_;
    std::optional<std::vector<std::string>> enabled_names_;
    size_t num_workers_;
    size_t max_queue_size_;

    std::shared_ptr<State> state_;
    std::vector<Worker> workers_;
    bool running_ = false;
    mutable std::mutex control_mutex_;
};
