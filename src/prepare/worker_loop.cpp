/*
 * pvfworker C++ - Preparation Worker Loop Implementation
 */
#include <pvfworker/prepare/worker_loop.hpp>
#include <pvfworker/ipc/codec.hpp>
#include <pvfworker/ipc/framed.hpp>
#include <pvfworker/core/logger.hpp>

#include <vector>

namespace pvfworker {

PreparationWorkerLoop::PreparationWorkerLoop(Preparer& preparer, const RaceSettings& settings,
                                             size_t max_frame_size)
    : preparer_(preparer)
    , settings_(settings)
    , max_frame_size_(max_frame_size)
    , jobs_served_(0)
    , abandoned_work_(false)
{}

bool PreparationWorkerLoop::run(int fd, const std::string& temp_artifact_path) {
    JobRaceExecutor executor(preparer_, fd, settings_);

    LOG_INFO("[Worker] Serving jobs with backend '%s'", preparer_.name());

    for (;;) {
        std::vector<uint8_t> frame;
        std::string error;
        RecvStatus status = framed_recv(fd, frame, max_frame_size_, error);
        if (status == RecvStatus::Closed) {
            LOG_INFO("[Worker] Host closed the connection after %zu job(s)", jobs_served_);
            return true;
        }
        if (status == RecvStatus::Error) {
            LOG_ERROR("[Worker] Failed to read job: %s", error.c_str());
            return false;
        }

        PrepJob job;
        if (!decode_job(frame, job, error)) {
            LOG_ERROR("[Worker] Cannot decode job: %s", error.c_str());
            return false;
        }
        frame.clear();
        frame.shrink_to_fit();

        PrepareOutcome outcome = executor.execute(job, temp_artifact_path);
        abandoned_work_ = executor.has_abandoned_work();
        ++jobs_served_;

        if (outcome.success) {
            LOG_INFO("[Worker] %s job done: cpu %lld ms, artifact %s",
                     job_kind_name(job.kind),
                     static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                         outcome.stats.cpu_time_elapsed).count()),
                     outcome.artifact_checksum.c_str());
        } else {
            LOG_INFO("[Worker] %s job failed: %s", job_kind_name(job.kind),
                     outcome.error.to_string().c_str());
        }

        if (!framed_send(fd, encode_outcome(outcome), error)) {
            LOG_ERROR("[Worker] Failed to send outcome: %s", error.c_str());
            return false;
        }
    }
}

} // namespace pvfworker
