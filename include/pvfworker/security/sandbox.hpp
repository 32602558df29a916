/*
 * pvfworker C++ - Security Sandbox
 *
 * Kernel confinement primitives applied by the worker process to itself:
 *   - Landlock: filesystem access limited to the allowed paths,
 *   - seccomp: networking syscalls kill the process,
 *   - user namespace + pivot_root: the worker directory becomes "/".
 *
 * Every primitive is irreversible for the calling process. The same calls
 * back the --check-* probe modes of the worker binary.
 */
#ifndef pvfworker_SECURITY_SANDBOX_HPP
#define pvfworker_SECURITY_SANDBOX_HPP

#include <string>
#include <vector>

namespace pvfworker {

class Sandbox {
public:
    Sandbox();

    // Landlock ABI version of the running kernel, or -1 if unsupported
    static int landlock_abi_version();

    // Paths kept reachable once Landlock is enabled (call before enabling)
    void allow_path(const std::string& path);
    void allow_path_read_only(const std::string& path);

    // Enforce a Landlock ruleset that only permits the allowed paths.
    // Paths that do not exist are skipped.
    bool enable_landlock(std::string& error);

    // Install a seccomp filter killing the process on socket creation,
    // connect/bind/listen/accept and io_uring.
    static bool enable_seccomp(std::string& error);

    // Enter a new user and mount namespace and make `worker_dir` the root.
    // The process must be single-threaded.
    static bool change_root(const std::string& worker_dir, std::string& error);

    bool landlock_active() const { return landlock_active_; }

private:
    bool landlock_active_;
    std::vector<std::string> rw_paths_;
    std::vector<std::string> ro_paths_;
};

} // namespace pvfworker

#endif // pvfworker_SECURITY_SANDBOX_HPP
