/*
 * pvfworker C++ - Security Probe Implementation
 */
#include <pvfworker/security/probe.hpp>
#include <pvfworker/security/sandbox.hpp>
#include <pvfworker/core/config.hpp>
#include <pvfworker/core/logger.hpp>
#include <pvfworker/core/utils.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <future>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace pvfworker {

// ============================================================================
// SecureModeError
// ============================================================================

std::string SecureModeError::message() const {
    switch (kind) {
        case SecureModeErrorKind::CannotEnableLandlock:
            return "Cannot enable landlock (ABI " + std::to_string(landlock_abi) +
                   "), a Linux 5.13+ kernel security feature: " + detail;
        case SecureModeErrorKind::CannotEnableSeccomp:
            return "Cannot enable seccomp, a Linux-specific kernel security feature: " + detail;
        case SecureModeErrorKind::CannotUnshareUserNamespaceAndChangeRoot:
            return "Cannot unshare user namespace and change root, which are Linux-specific "
                   "kernel security features: " + detail;
    }
    return detail;
}

bool SecurityProbeReport::has_mandatory_failure() const {
    for (size_t i = 0; i < errors.size(); ++i) {
        if (!errors[i].is_allowed_in_secure_mode()) return true;
    }
    return false;
}

// ============================================================================
// Check processes
// ============================================================================

std::string CheckResult::describe() const {
    if (!spawned) return error;
    if (term_signal != 0) return "killed by signal " + std::to_string(term_signal);
    return "exit status " + std::to_string(exit_code);
}

CheckResult run_check_process(const std::string& program, const std::vector<std::string>& args) {
    CheckResult result;

    // argv is built before fork; the child only makes async-signal-safe calls
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (size_t i = 0; i < args.size(); ++i) {
        argv.push_back(const_cast<char*>(args[i].c_str()));
    }
    argv.push_back(NULL);

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) < 0) {
        result.error = "cannot create pipe: " + errno_string(errno);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.error = "cannot fork: " + errno_string(errno);
        close(pipefd[0]);
        close(pipefd[1]);
        return result;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
        }
        dup2(pipefd[1], STDERR_FILENO);
        execv(program.c_str(), argv.data());
        static const char msg[] = "cannot execute worker program\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    close(pipefd[1]);
    char buf[4096];
    for (;;) {
        ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        result.stderr_output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);

    int status = 0;
    pid_t w;
    do {
        w = waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w < 0) {
        result.error = "cannot wait for check process: " + errno_string(errno);
        return result;
    }

    result.spawned = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    return result;
}

// ============================================================================
// SecurityProbe
// ============================================================================

SecurityProbe::SecurityProbe(const std::string& worker_program, const std::string& cache_path)
    : worker_program_(worker_program)
    , cache_path_(cache_path)
{}

CheckResult SecurityProbe::check_landlock() const {
    std::vector<std::string> args;
    args.push_back("--check-can-enable-landlock");
    return run_check_process(worker_program_, args);
}

CheckResult SecurityProbe::check_seccomp() const {
#if defined(__x86_64__)
    std::vector<std::string> args;
    args.push_back("--check-can-enable-seccomp");
    return run_check_process(worker_program_, args);
#else
    CheckResult r;
    r.error = "only supported on CPUs from the x86_64 family (usually Intel or AMD)";
    return r;
#endif
}

CheckResult SecurityProbe::check_unshare() const {
    CheckResult r;

    std::string pattern = join_path(cache_path_, "pvfworker-probe-XXXXXX");
    std::vector<char> tmpl(pattern.begin(), pattern.end());
    tmpl.push_back('\0');
    if (mkdtemp(tmpl.data()) == NULL) {
        r.error = "cannot create scratch directory in " + cache_path_ + ": " + errno_string(errno);
        return r;
    }
    std::string worker_dir(tmpl.data());

    std::vector<std::string> args;
    args.push_back("--check-can-unshare-user-namespace-and-change-root");
    args.push_back("--worker-dir-path");
    args.push_back(worker_dir);
    r = run_check_process(worker_program_, args);

    if (!remove_tree(worker_dir)) {
        LOG_WARN("[Probe] Cannot remove scratch directory %s", worker_dir.c_str());
    }
    return r;
}

namespace {

std::future<CheckResult> launch_check(CheckResult (SecurityProbe::*check)() const, const SecurityProbe* probe) {
    try {
        return std::async(std::launch::async, check, probe);
    } catch (const std::system_error& e) {
        LOG_DEBUG("[Probe] Cannot start check thread (%s), running inline", e.what());
        return std::async(std::launch::deferred, check, probe);
    }
}

} // namespace

SecurityProbeReport SecurityProbe::run() const {
    std::future<CheckResult> landlock = launch_check(&SecurityProbe::check_landlock, this);
    std::future<CheckResult> seccomp = launch_check(&SecurityProbe::check_seccomp, this);
    std::future<CheckResult> unshare = launch_check(&SecurityProbe::check_unshare, this);

    CheckResult landlock_result = landlock.get();
    CheckResult seccomp_result = seccomp.get();
    CheckResult unshare_result = unshare.get();

    SecurityProbeReport report;

    report.status.can_enable_landlock = landlock_result.success();
    if (!landlock_result.success()) {
        report.errors.push_back(SecureModeError(SecureModeErrorKind::CannotEnableLandlock,
                                                landlock_result.describe(),
                                                Sandbox::landlock_abi_version()));
    }

    report.status.can_enable_seccomp = seccomp_result.success();
    if (!seccomp_result.success()) {
        report.errors.push_back(SecureModeError(SecureModeErrorKind::CannotEnableSeccomp,
                                                seccomp_result.describe()));
    }

    report.status.can_unshare_user_namespace_and_change_root = unshare_result.success();
    if (!unshare_result.success()) {
        std::string detail = trim(unshare_result.stderr_output);
        if (detail.empty()) detail = unshare_result.describe();
        report.errors.push_back(SecureModeError(SecureModeErrorKind::CannotUnshareUserNamespaceAndChangeRoot,
                                                detail));
    }

    LOG_DEBUG("[Probe] landlock=%s seccomp=%s unshare=%s",
              report.status.can_enable_landlock ? "yes" : "no",
              report.status.can_enable_seccomp ? "yes" : "no",
              report.status.can_unshare_user_namespace_and_change_root ? "yes" : "no");
    return report;
}

// ============================================================================
// Reporting
// ============================================================================

bool log_security_report(const SecurityProbeReport& report, bool secure_validator_mode) {
    if (report.errors.empty()) {
        LOG_INFO("[Probe] All security features are available");
        return false;
    }

    std::vector<std::string> messages;
    for (size_t i = 0; i < report.errors.size(); ++i) {
        messages.push_back(report.errors[i].message());
    }
    std::string joined = join(messages, "\n  - ");

    if (!report.has_mandatory_failure()) {
        LOG_WARN("[Probe] Some security features are unavailable, the worker runs with reduced "
                 "protection:\n  - %s", joined.c_str());
        return false;
    }

    if (!secure_validator_mode) {
        LOG_WARN("[Probe] Secure validator mode is disabled and required security features are "
                 "missing. Do not run a validator like this:\n  - %s", joined.c_str());
        return false;
    }

    LOG_ERROR("[Probe] Cannot run in secure validator mode, required security features are "
              "missing:\n  - %s", joined.c_str());
    return true;
}

SecurityStatus check_security_status(const Config& config, const std::string& worker_program,
                                     bool& error_occurred) {
    std::string cache_path = config.get_string("security.cache_path", "/tmp");
    bool secure_mode = config.get_bool("security.secure_validator_mode", true);

    SecurityProbe probe(worker_program, cache_path);
    SecurityProbeReport report = probe.run();
    error_occurred = log_security_report(report, secure_mode);
    return report.status;
}

} // namespace pvfworker
