/*
 * pvfworker C++ - Preparation Worker Loop
 *
 * Serves preparation jobs from one host connection: receive a framed job,
 * race it, reply with a framed outcome. Jobs run strictly one at a time.
 */
#ifndef pvfworker_PREPARE_WORKER_LOOP_HPP
#define pvfworker_PREPARE_WORKER_LOOP_HPP

#include <pvfworker/prepare/job_race.hpp>
#include <pvfworker/prepare/preparer.hpp>

#include <cstddef>
#include <string>

namespace pvfworker {

class PreparationWorkerLoop {
public:
    PreparationWorkerLoop(Preparer& preparer, const RaceSettings& settings, size_t max_frame_size);

    // Serve jobs on `fd` until the host closes it. Returns false when the
    // loop ended on an I/O error or an undecodable job.
    bool run(int fd, const std::string& temp_artifact_path);

    size_t jobs_served() const { return jobs_served_; }

    // A timed-out job left its work thread running inside the backend.
    // The backend must stay loaded until the process exits.
    bool has_abandoned_work() const { return abandoned_work_; }

private:
    Preparer& preparer_;
    RaceSettings settings_;
    size_t max_frame_size_;
    size_t jobs_served_;
    bool abandoned_work_;
};

} // namespace pvfworker

#endif // pvfworker_PREPARE_WORKER_LOOP_HPP
