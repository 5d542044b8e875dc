/*
 * scheduler.cpp - Analysis job scheduler implementation
 */

#include "scheduler.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

std::string format_seconds(double seconds) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2fs", seconds);
    return buf;
}

}

AnalysisScheduler::AnalysisScheduler(const std::string& output_dir,
                                     std::shared_ptr<const ModuleRegistry> registry,
                                     std::optional<std::vector<std::string>> enabled_modules,
                                     size_t num_workers,
                                     size_t max_queue_size)
    : output_dir_(output_dir),
      registry_(std::move(registry)),
      enabled_names_(std::move(enabled_modules)),
      num_workers_(std::max<size_t>(num_workers, 1)),
      max_queue_size_(std::max<size_t>(max_queue_size, 1)),
      state_(std::make_shared<State>()) {}

AnalysisScheduler::~AnalysisScheduler() {
    stop(false, DEFAULT_STOP_TIMEOUT);
}

void AnalysisScheduler::set_poll_interval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->poll_interval = interval;
}

void AnalysisScheduler::set_result_callback(JobResultCallback on_result) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->on_result = std::move(on_result);
}

bool AnalysisScheduler::queue_analysis(const std::string& pcap_path,
                                       const std::string& interface_name,
                                       const std::string& time_window,
                                       int priority) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->queue.size() >= max_queue_size_) {
            state_->dropped++;
            logger::warn("analysis queue full, dropping " + pcap_path);
            return false;
        }

        AnalysisJob job;
        job.pcap_path = pcap_path;
        job.interface_name = interface_name;
        job.time_window = time_window;
        job.priority = priority;
        job.arrival = state_->next_arrival++;
        state_->queue.push(std::move(job));
    }
    state_->job_ready.notify_one();
    logger::info("queued analysis of " + pcap_path);
    return true;
}

bool AnalysisScheduler::start() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (running_) {
        return true;
    }

    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        logger::error("cannot create " + output_dir_ + ": " + ec.message());
        return false;
    }

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = false;
        generation = ++state_->generation;
    }

    std::vector<AnalysisModule*> modules = registry_ ? registry_->enabled(enabled_names_)
                                                     : std::vector<AnalysisModule*>();
    if (modules.empty()) {
        logger::warn("no analysis modules enabled");
    }

    for (size_t i = 0; i < num_workers_; i++) {
        std::promise<void> exited;
        Worker worker;
        worker.exited = exited.get_future();
        worker.thread = std::thread(worker_loop, state_, registry_, modules, output_dir_,
                                    generation, i, std::move(exited));
        workers_.push_back(std::move(worker));
    }

    running_ = true;
    logger::info("analysis scheduler started with " + std::to_string(num_workers_) +
                 " workers");
    return true;
}

void AnalysisScheduler::stop(bool wait, double timeout_sec) {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (!running_) {
        return;
    }
    running_ = false;

    auto budget = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(std::max(timeout_sec, 0.0)));
    auto deadline = std::chrono::steady_clock::now() + budget;

    if (wait) {
        std::unique_lock<std::mutex> lock(state_->mutex);
        bool drained = state_->idle.wait_until(lock, deadline, [this] {
            return state_->queue.empty() && state_->active == 0;
        });
        if (!drained) {
            logger::warn("analysis queue not drained before shutdown (" +
                         std::to_string(state_->queue.size()) + " pending)");
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
    }
    state_->job_ready.notify_all();

    // Each worker gets an equal share of whatever budget is left
    auto remaining = std::max(deadline - std::chrono::steady_clock::now(),
                              std::chrono::steady_clock::duration::zero());
    auto share = remaining / static_cast<long>(workers_.size());

    for (auto& worker : workers_) {
        if (worker.exited.wait_for(share) == std::future_status::ready) {
            worker.thread.join();
        } else {
            logger::warn("analysis worker still busy at shutdown, detaching");
            worker.thread.detach();
        }
    }
    workers_.clear();

    logger::info("analysis scheduler stopped");
}

bool AnalysisScheduler::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->idle.wait_for(lock, timeout, [this] {
        return state_->queue.empty() && state_->active == 0;
    });
}

void AnalysisScheduler::worker_loop(std::shared_ptr<State> state,
                                    std::shared_ptr<const ModuleRegistry> registry,
                                    std::vector<AnalysisModule*> modules,
                                    std::string output_dir,
                                    uint64_t generation,
                                    size_t worker_id,
                                    std::promise<void> exited) {
    // Keeps the modules alive even if this worker outlives the scheduler
    std::shared_ptr<const ModuleRegistry> keep_alive = std::move(registry);
    logger::debug("analysis worker " + std::to_string(worker_id) + " started");

    std::unique_lock<std::mutex> lock(state->mutex);
    while (!state->stopping && state->generation == generation) {
        // Bounded wait so an idle worker still notices shutdown
        state->job_ready.wait_for(lock, state->poll_interval, [&state, generation] {
            return !state->queue.empty() || state->stopping || state->generation != generation;
        });
        if (state->stopping || state->generation != generation || state->queue.empty()) {
            continue;
        }

        JobResult result;
        result.job = state->queue.top();
        state->queue.pop();
        state->active++;
        JobResultCallback on_result = state->on_result;
        lock.unlock();

        result.completed = process_job(*state, modules, output_dir, result.job, worker_id,
                                       generation, result);

        // Before the job stops counting as active, so wait_idle() covers it
        if (on_result) {
            try {
                on_result(result);
            } catch (const std::exception& e) {
                logger::error(std::string("analysis result callback failed: ") + e.what());
            } catch (...) {
                logger::error("analysis result callback failed with unknown exception");
            }
        }

        lock.lock();
        state->active--;
        if (result.completed) {
            state->completed++;
        } else {
            state->failed++;
        }
        state->recent.push_back(std::move(result));
        while (state->recent.size() > RECENT_RESULTS_LIMIT) {
            state->recent.pop_front();
        }
        if (state->queue.empty() && state->active == 0) {
            state->idle.notify_all();
        }
    }
    lock.unlock();

    logger::debug("analysis worker " + std::to_string(worker_id) + " stopped");
    exited.set_value();
}

bool AnalysisScheduler::process_job(State& state, const std::vector<AnalysisModule*>& modules,
                                    const std::string& output_dir, const AnalysisJob& job,
                                    size_t worker_id, uint64_t generation, JobResult& result) {
    logger::info("worker " + std::to_string(worker_id) + " analyzing " + job.pcap_path);

    std::error_code ec;
    if (!fs::exists(job.pcap_path, ec)) {
        logger::warn("capture file not found: " + job.pcap_path);
        return false;
    }

    for (size_t i = 0; i < modules.size(); i++) {
        AnalysisModule* module = modules[i];

        if (i > 0) {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (state.stopping || state.generation != generation) {
                logger::warn("analysis of " + job.pcap_path + " interrupted by shutdown");
                return false;
            }
        }

        auto started = std::chrono::steady_clock::now();
        try {
            ModuleResult module_result = module->analyze(job.pcap_path, output_dir,
                                                         job.interface_name, job.time_window);
            double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - started).count();
            logger::info("module " + module->name() + " completed: " +
                         std::to_string(module_result.detections.size()) + " hits in " +
                         format_seconds(elapsed));
            result.results.push_back(std::move(module_result));
        } catch (const std::exception& e) {
            logger::error("module " + module->name() + " failed: " + e.what());
            result.failed_modules.push_back(module->name());
        } catch (...) {
            logger::error("module " + module->name() + " failed with unknown exception");
            result.failed_modules.push_back(module->name());
        }
    }

    return true;
}

bool AnalysisScheduler::is_running() const {
    std::lock_guard<std::mutex> control(control_mutex_);
    return running_;
}

size_t AnalysisScheduler::queue_size() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

uint64_t AnalysisScheduler::jobs_completed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->completed;
}

uint64_t AnalysisScheduler::jobs_failed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->failed;
}

uint64_t AnalysisScheduler::jobs_dropped() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->dropped;
}

std::vector<JobResult> AnalysisScheduler::recent_results() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return std::vector<JobResult>(state_->recent.begin(), state_->recent.end());
}

std::vector<std::string> AnalysisScheduler::enabled_module_names() const {
    std::vector<std::string> names;
    if (!registry_) return names;
    for (const AnalysisModule* module : registry_->enabled(enabled_names_)) {
        names.push_back(module->name());
    }
    return names;
}

SchedulerStatus AnalysisScheduler::get_status() const {
    SchedulerStatus status;
    {
        std::lock_guard<std::mutex> control(control_mutex_);
        status.running = running_;
        status.workers = workers_.size();
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        status.queue_size = state_->queue.size();
        status.active_jobs = state_->active;
        status.jobs_completed = state_->completed;
        status.jobs_failed = state_->failed;
        status.jobs_dropped = state_->dropped;
    }
    status.enabled_modules = enabled_module_names();
    if (registry_) {
        status.available_modules = registry_->available_names();
    }
    return status;
}
