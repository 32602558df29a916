/*
 * pvfworker C++ - Core Types
 *
 * Data exchanged between the host and a preparation worker, plus the
 * security posture record computed once per host process.
 */
#ifndef pvfworker_CORE_TYPES_HPP
#define pvfworker_CORE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pvfworker {

// ============================================================================
// Jobs
// ============================================================================

enum class JobKind {
    Prepare = 0,
    // Additionally instantiates the artifact once to surface construction errors
    Prechecking = 1
};

const char* job_kind_name(JobKind kind);

struct PrepJob {
    std::vector<uint8_t> code;
    std::vector<uint8_t> executor_params;   // Opaque to the worker, handed to the backend
    std::chrono::milliseconds prep_timeout;
    JobKind kind;
    std::optional<int64_t> memory_limit;    // Bytes; no limit means track peak only

    PrepJob() : prep_timeout(0), kind(JobKind::Prepare) {}
};

// Compiled bytes produced by a successful job. Never mutated after creation.
class CompiledArtifact {
public:
    explicit CompiledArtifact(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    size_t size() const { return bytes_.size(); }

private:
    std::vector<uint8_t> bytes_;
};

// ============================================================================
// Outcomes
// ============================================================================

struct MemoryAllocationStats {
    uint64_t resident;      // Peak resident bytes sampled during the job
    uint64_t allocated;     // Peak live bytes seen by the allocation tracker

    MemoryAllocationStats() : resident(0), allocated(0) {}
};

struct MemoryStats {
    std::optional<MemoryAllocationStats> memory_tracker_stats;
    std::optional<uint64_t> max_rss;    // Bytes, as reported by the OS for the work thread
    uint64_t peak_tracked_alloc;

    MemoryStats() : peak_tracked_alloc(0) {}
};

struct PrepareStats {
    std::chrono::nanoseconds cpu_time_elapsed;
    MemoryStats memory_stats;

    PrepareStats() : cpu_time_elapsed(0) {}
};

enum class PrepareErrorKind {
    Prevalidation = 0,
    Preparation = 1,
    Panic = 2,
    TimedOut = 3,
    IoErr = 4,
    RuntimeConstruction = 5,
    // Only ever produced through the OOM sentinel written by a dying worker
    OutOfMemory = 6
};

const char* prepare_error_kind_name(PrepareErrorKind kind);

struct PrepareError {
    PrepareErrorKind kind;
    std::string detail;

    PrepareError() : kind(PrepareErrorKind::IoErr) {}
    PrepareError(PrepareErrorKind k, const std::string& d) : kind(k), detail(d) {}

    static PrepareError prevalidation(const std::string& d) { return PrepareError(PrepareErrorKind::Prevalidation, d); }
    static PrepareError preparation(const std::string& d) { return PrepareError(PrepareErrorKind::Preparation, d); }
    static PrepareError panic(const std::string& d) { return PrepareError(PrepareErrorKind::Panic, d); }
    static PrepareError timed_out() { return PrepareError(PrepareErrorKind::TimedOut, ""); }
    static PrepareError io(const std::string& d) { return PrepareError(PrepareErrorKind::IoErr, d); }
    static PrepareError runtime_construction(const std::string& d) { return PrepareError(PrepareErrorKind::RuntimeConstruction, d); }
    static PrepareError out_of_memory() { return PrepareError(PrepareErrorKind::OutOfMemory, ""); }

    std::string to_string() const;
};

// Result<PrepareStats, PrepareError>
struct PrepareOutcome {
    bool success;
    PrepareStats stats;
    std::string artifact_checksum;  // SHA-256 hex of the persisted artifact
    PrepareError error;

    PrepareOutcome() : success(false) {}

    static PrepareOutcome ok(const PrepareStats& stats, const std::string& checksum) {
        PrepareOutcome r;
        r.success = true;
        r.stats = stats;
        r.artifact_checksum = checksum;
        return r;
    }

    static PrepareOutcome fail(const PrepareError& error) {
        PrepareOutcome r;
        r.success = false;
        r.error = error;
        return r;
    }
};

// ============================================================================
// Security posture
// ============================================================================

struct SecurityStatus {
    bool can_enable_landlock;
    bool can_enable_seccomp;
    bool can_unshare_user_namespace_and_change_root;

    SecurityStatus()
        : can_enable_landlock(false)
        , can_enable_seccomp(false)
        , can_unshare_user_namespace_and_change_root(false) {}
};

// ============================================================================
// Worker exit statuses
// ============================================================================

namespace exit_status {
    const int OK = 0;
    const int CHECK_FAILED = 1;
    const int USAGE = 2;
    const int VERSION_MISMATCH = 3;
    const int STARTUP_FAILED = 4;
    const int OUT_OF_MEMORY = 5;
    const int CHANNEL_FAILED = 6;
}

} // namespace pvfworker

#endif // pvfworker_CORE_TYPES_HPP
