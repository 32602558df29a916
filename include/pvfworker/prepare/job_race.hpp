/*
 * pvfworker C++ - Job Race Executor
 *
 * Runs one preparation job as a race between three threads:
 *   - a memory sampler recording peak usage,
 *   - a CPU-time monitor that signals TimedOut once the deadline passes,
 *   - the work thread calling into the compiler backend.
 * The caller blocks until either the work finishes or the monitor fires.
 * Memory exhaustion is not part of the race: the allocation tracker's OOM
 * hook writes the sentinel and terminates the process directly.
 *
 * A timed-out work thread is not killed, the compiler call is not
 * preemptible. It is detached and left to finish or die with the process.
 */
#ifndef pvfworker_PREPARE_JOB_RACE_HPP
#define pvfworker_PREPARE_JOB_RACE_HPP

#include <pvfworker/core/types.hpp>
#include <pvfworker/prepare/preparer.hpp>

#include <atomic>
#include <chrono>
#include <string>

namespace pvfworker {

enum class WaitOutcome {
    Pending,
    Finished,
    TimedOut
};

struct RaceSettings {
    std::chrono::milliseconds memory_sample_interval;
    // Wall-clock deadline is this factor times prep_timeout, for work that
    // blocks without burning CPU
    double wall_clock_lenience;

    RaceSettings()
        : memory_sample_interval(500)
        , wall_clock_lenience(3.0) {}
};

class JobRaceExecutor {
public:
    // `channel_fd` is only written by the OOM hook.
    JobRaceExecutor(Preparer& preparer, int channel_fd, const RaceSettings& settings);

    // Run `job` and, on success, write the artifact to `temp_artifact_path`.
    PrepareOutcome execute(const PrepJob& job, const std::string& temp_artifact_path);

    // Whether a timed-out work thread may still be running in the backend
    bool has_abandoned_work() const { return abandoned_work_.load(); }

private:
    Preparer& preparer_;
    int channel_fd_;
    RaceSettings settings_;
    std::atomic<bool> abandoned_work_;
};

} // namespace pvfworker

#endif // pvfworker_PREPARE_JOB_RACE_HPP
