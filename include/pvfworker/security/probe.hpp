/*
 * pvfworker C++ - Security Probe
 *
 * Determines once, at host startup, which kernel confinement primitives
 * the worker can use. Each capability is checked by spawning the worker
 * binary with a single-purpose flag, so a check that crashes or is killed
 * by the kernel cannot take the host down with it. The three checks run
 * concurrently.
 */
#ifndef pvfworker_SECURITY_PROBE_HPP
#define pvfworker_SECURITY_PROBE_HPP

#include <pvfworker/core/types.hpp>

#include <string>
#include <vector>

namespace pvfworker {

class Config;

// ============================================================================
// Errors
// ============================================================================

enum class SecureModeErrorKind {
    CannotEnableLandlock,
    CannotEnableSeccomp,
    CannotUnshareUserNamespaceAndChangeRoot
};

struct SecureModeError {
    SecureModeErrorKind kind;
    std::string detail;
    int landlock_abi;       // Only meaningful for CannotEnableLandlock

    SecureModeError(SecureModeErrorKind k, const std::string& d, int abi = -1)
        : kind(k), detail(d), landlock_abi(abi) {}

    // Landlock is not yet widespread enough to be mandatory.
    bool is_allowed_in_secure_mode() const {
        return kind == SecureModeErrorKind::CannotEnableLandlock;
    }

    std::string message() const;
};

// ============================================================================
// Check processes
// ============================================================================

struct CheckResult {
    bool spawned;
    int exit_code;          // -1 unless the process exited normally
    int term_signal;        // 0 unless the process was killed
    std::string stderr_output;
    std::string error;      // Spawn failure

    CheckResult() : spawned(false), exit_code(-1), term_signal(0) {}

    bool success() const { return spawned && exit_code == 0; }

    // "exit status 1", "killed by signal 31" or the spawn failure
    std::string describe() const;
};

// Run `program` with `args`, capture its stderr and wait for it.
CheckResult run_check_process(const std::string& program, const std::vector<std::string>& args);

// ============================================================================
// Probe
// ============================================================================

struct SecurityProbeReport {
    SecurityStatus status;
    std::vector<SecureModeError> errors;

    bool has_mandatory_failure() const;
};

class SecurityProbe {
public:
    // `cache_path` holds the scratch directory the namespace check pivots into.
    SecurityProbe(const std::string& worker_program, const std::string& cache_path);

    SecurityProbeReport run() const;

private:
    CheckResult check_landlock() const;
    CheckResult check_seccomp() const;
    CheckResult check_unshare() const;

    std::string worker_program_;
    std::string cache_path_;
};

// Log the failures of `report`. Returns true when an error occurred: a
// mandatory capability is missing and secure validator mode is on.
bool log_security_report(const SecurityProbeReport& report, bool secure_validator_mode);

// Probe with the settings from `config` ("security.*") and log the result.
SecurityStatus check_security_status(const Config& config, const std::string& worker_program,
                                     bool& error_occurred);

} // namespace pvfworker

#endif // pvfworker_SECURITY_PROBE_HPP
