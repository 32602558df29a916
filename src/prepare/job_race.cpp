/*
 * pvfworker C++ - Job Race Executor Implementation
 */
#include <pvfworker/prepare/job_race.hpp>
#include <pvfworker/prepare/allocation_tracker.hpp>
#include <pvfworker/prepare/oom_sentinel.hpp>
#include <pvfworker/prepare/resource_usage.hpp>
#include <pvfworker/core/logger.hpp>
#include <pvfworker/core/utils.hpp>

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

namespace pvfworker {

namespace {

// Longest the monitor sleeps between CPU clock reads. Several busy threads
// can burn CPU time faster than wall time passes.
const std::chrono::milliseconds MAX_MONITOR_POLL(100);

struct RaceState {
    std::mutex mutex;
    std::condition_variable cv;
    WaitOutcome outcome;
    bool work_done;     // Closed by the work thread; the monitor exits on it

    RaceState() : outcome(WaitOutcome::Pending), work_done(false) {}
};

struct WorkResult {
    bool success;
    PrepareError error;
    std::vector<uint8_t> artifact;
    std::chrono::nanoseconds cpu_time_elapsed;
    std::optional<uint64_t> max_rss;

    WorkResult() : success(false), cpu_time_elapsed(0) {}
};

typedef std::optional<std::chrono::nanoseconds> MonitorResult;

WorkResult run_work(Preparer& preparer, const PrepJob& job, std::chrono::nanoseconds cpu_start) {
    WorkResult r;

    BackendResult blob = preparer.prevalidate(job.code);
    if (!blob.success) {
        r.error = PrepareError::prevalidation(blob.error);
        return r;
    }

    BackendResult compiled = preparer.prepare(blob.data, job.executor_params);
    if (!compiled.success) {
        r.error = PrepareError::preparation(compiled.error);
        return r;
    }

    if (job.kind == JobKind::Prechecking) {
        BackendResult runtime = preparer.instantiate(compiled.data, job.executor_params);
        if (!runtime.success) {
            r.error = PrepareError::runtime_construction(runtime.error);
            return r;
        }
    }

    r.success = true;
    r.artifact.swap(compiled.data);
    r.cpu_time_elapsed = process_cpu_time() - cpu_start;
    r.max_rss = get_max_rss_thread();
    return r;
}

void cpu_time_monitor(std::shared_ptr<RaceState> state,
                      std::chrono::nanoseconds cpu_start,
                      std::chrono::nanoseconds cpu_limit,
                      std::chrono::nanoseconds wall_limit,
                      std::promise<MonitorResult> result) {
    std::chrono::steady_clock::time_point wall_start = std::chrono::steady_clock::now();

    std::unique_lock<std::mutex> lock(state->mutex);
    for (;;) {
        if (state->work_done || state->outcome != WaitOutcome::Pending) {
            lock.unlock();
            result.set_value(std::nullopt);
            return;
        }

        std::chrono::nanoseconds cpu_elapsed = process_cpu_time() - cpu_start;
        std::chrono::nanoseconds wall_elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - wall_start);

        if (cpu_elapsed > cpu_limit || wall_elapsed > wall_limit) {
            state->outcome = WaitOutcome::TimedOut;
            lock.unlock();
            state->cv.notify_all();
            LOG_DEBUG("[Race] Deadline passed after %lld ms cpu / %lld ms wall",
                      static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(cpu_elapsed).count()),
                      static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(wall_elapsed).count()));
            result.set_value(cpu_elapsed);
            return;
        }

        std::chrono::nanoseconds remaining = std::min(cpu_limit - cpu_elapsed, wall_limit - wall_elapsed);
        std::chrono::nanoseconds wait = std::min<std::chrono::nanoseconds>(remaining, MAX_MONITOR_POLL);
        wait = std::max<std::chrono::nanoseconds>(wait, std::chrono::milliseconds(1));
        state->cv.wait_for(lock, wait);
    }
}

void close_race(const std::shared_ptr<RaceState>& state) {
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->work_done = true;
        if (state->outcome == WaitOutcome::Pending) {
            state->outcome = WaitOutcome::Finished;
        }
    }
    state->cv.notify_all();
}

const double MAX_NS = static_cast<double>(std::chrono::nanoseconds::max().count());

// Saturates instead of overflowing for timeouts near the clock's range
std::chrono::nanoseconds to_ns(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) return std::chrono::nanoseconds(0);
    if (static_cast<double>(timeout.count()) * 1e6 >= MAX_NS) return std::chrono::nanoseconds::max();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(timeout);
}

std::chrono::nanoseconds scale_limit(std::chrono::nanoseconds limit, double factor) {
    double scaled = static_cast<double>(limit.count()) * factor;
    if (scaled >= MAX_NS) return std::chrono::nanoseconds::max();
    return std::chrono::nanoseconds(static_cast<int64_t>(scaled));
}

long long to_ms(std::chrono::nanoseconds d) {
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
}

} // namespace

JobRaceExecutor::JobRaceExecutor(Preparer& preparer, int channel_fd, const RaceSettings& settings)
    : preparer_(preparer)
    , channel_fd_(channel_fd)
    , settings_(settings)
    , abandoned_work_(false)
{}

PrepareOutcome JobRaceExecutor::execute(const PrepJob& job, const std::string& temp_artifact_path) {
    LOG_DEBUG("[Race] Starting %s job: %zu bytes of code, timeout %lld ms, memory limit %lld",
              job_kind_name(job.kind), job.code.size(),
              static_cast<long long>(job.prep_timeout.count()),
              job.memory_limit ? static_cast<long long>(*job.memory_limit) : -1LL);

    // Everything the racing threads share is allocated before tracking is armed.
    std::shared_ptr<RaceState> state = std::make_shared<RaceState>();
    std::shared_ptr<const PrepJob> job_ptr = std::make_shared<PrepJob>(job);
    if (!oom_sentinel::install(channel_fd_)) {
        return PrepareOutcome::fail(PrepareError::io("cannot reserve the out-of-memory payload"));
    }

    std::chrono::nanoseconds cpu_limit = to_ns(job.prep_timeout);
    double lenience = settings_.wall_clock_lenience >= 1.0 ? settings_.wall_clock_lenience : 1.0;
    std::chrono::nanoseconds wall_limit = scale_limit(cpu_limit, lenience);

    MemorySampler sampler(settings_.memory_sample_interval);
    std::promise<MonitorResult> monitor_promise;
    std::future<MonitorResult> monitor_future = monitor_promise.get_future();
    std::chrono::nanoseconds cpu_start = process_cpu_time();

    std::thread monitor;
    try {
        sampler.start();
        monitor = std::thread(cpu_time_monitor, state, cpu_start, cpu_limit, wall_limit,
                              std::move(monitor_promise));
    } catch (const std::system_error& e) {
        sampler.stop();
        oom_sentinel::clear();
        return PrepareOutcome::fail(PrepareError::io(std::string("cannot spawn monitor threads: ") + e.what()));
    }

    AllocationTracker::start_tracking(job.memory_limit, &oom_sentinel::hook);

    std::promise<WorkResult> work_promise;
    std::future<WorkResult> work_future = work_promise.get_future();
    Preparer* preparer = &preparer_;

    std::thread worker;
    try {
        worker = std::thread([state, job_ptr, preparer, cpu_start](std::promise<WorkResult> promise) {
            try {
                promise.set_value(run_work(*preparer, *job_ptr, cpu_start));
            } catch (...) {
                // Rethrown and reported on the joining side
                promise.set_exception(std::current_exception());
            }
            close_race(state);
        }, std::move(work_promise));
    } catch (const std::system_error& e) {
        AllocationTracker::end_tracking();
        close_race(state);
        monitor.join();
        sampler.stop();
        oom_sentinel::clear();
        return PrepareOutcome::fail(PrepareError::io(std::string("cannot spawn work thread: ") + e.what()));
    }

    WaitOutcome outcome;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait(lock, [&state] { return state->outcome != WaitOutcome::Pending; });
        outcome = state->outcome;
    }

    std::optional<MemoryAllocationStats> tracker_stats = sampler.stop();
    int64_t peak_alloc = AllocationTracker::end_tracking();
    oom_sentinel::clear();

    if (outcome == WaitOutcome::TimedOut) {
        worker.detach();
        abandoned_work_.store(true);
        monitor.join();

        MonitorResult elapsed = monitor_future.get();
        if (elapsed) {
            LOG_WARN("[Race] Prepare job took %lld ms of cpu time, exceeding the timeout of %lld ms",
                     to_ms(*elapsed), static_cast<long long>(job.prep_timeout.count()));
            return PrepareOutcome::fail(PrepareError::timed_out());
        }
        return PrepareOutcome::fail(PrepareError::io("cpu time monitor stopped without reporting a timeout"));
    }

    worker.join();
    monitor.join();

    WorkResult result;
    try {
        result = work_future.get();
    } catch (const std::exception& e) {
        LOG_ERROR("[Race] Work thread raised: %s", e.what());
        return PrepareOutcome::fail(PrepareError::panic(e.what()));
    } catch (...) {
        LOG_ERROR("[Race] Work thread raised a non-standard exception");
        return PrepareOutcome::fail(PrepareError::panic("non-standard exception payload"));
    }

    if (!result.success) {
        LOG_DEBUG("[Race] Job failed: %s", result.error.to_string().c_str());
        return PrepareOutcome::fail(result.error);
    }

    CompiledArtifact artifact(std::move(result.artifact));
    std::string write_error;
    if (!write_file(temp_artifact_path, artifact.bytes(), write_error)) {
        LOG_ERROR("[Race] %s", write_error.c_str());
        return PrepareOutcome::fail(PrepareError::io(write_error));
    }

    PrepareStats stats;
    stats.cpu_time_elapsed = result.cpu_time_elapsed;
    stats.memory_stats.memory_tracker_stats = tracker_stats;
    stats.memory_stats.max_rss = result.max_rss;
    stats.memory_stats.peak_tracked_alloc = peak_alloc < 0 ? 0 : static_cast<uint64_t>(peak_alloc);

    LOG_DEBUG("[Race] Prepared %zu byte artifact in %lld ms cpu, peak tracked %llu bytes",
              artifact.size(), to_ms(stats.cpu_time_elapsed),
              static_cast<unsigned long long>(stats.memory_stats.peak_tracked_alloc));

    return PrepareOutcome::ok(stats, sha256_hex(artifact.bytes()));
}

} // namespace pvfworker
