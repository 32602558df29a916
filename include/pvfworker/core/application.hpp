/*
 * pvfworker C++ - Worker Application
 *
 * Lifecycle of the pvf-prepare-worker process: either one of the single-shot
 * capability checks, a security probe, or the job-serving worker connected
 * to its host over a Unix socket.
 */
#ifndef pvfworker_CORE_APPLICATION_HPP
#define pvfworker_CORE_APPLICATION_HPP

#include <pvfworker/core/config.hpp>
#include <pvfworker/core/types.hpp>
#include <pvfworker/prepare/backend_loader.hpp>

#include <string>

namespace pvfworker {

struct AppInfo {
    static constexpr const char* NAME = "pvf-prepare-worker";
    static constexpr const char* VERSION = "0.3.0";
};

enum class RunMode {
    Worker,
    CheckLandlock,
    CheckSeccomp,
    CheckUnshare,
    ProbeSecurity
};

class Application {
public:
    static Application& instance();

    // Returns false when the process should exit right away with exit_code()
    // (--help, --version, usage or startup errors).
    bool init(int argc, char* argv[]);

    int run();
    void shutdown();

    int exit_code() const { return exit_code_; }

    // A timed-out job may still be running inside the backend
    bool has_abandoned_work() const { return abandoned_work_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool check_version();
    bool load_backend();
    bool connect_to_host();
    bool receive_handshake();
    bool activate_sandbox();

    int run_worker();
    int run_check_landlock();
    int run_check_seccomp();
    int run_check_unshare();
    int run_probe();

    Config config_;
    BackendLoader loader_;
    SecurityStatus security_status_;
    RunMode mode_;
    int socket_fd_;
    int exit_code_;
    bool abandoned_work_;

    std::string program_;
    std::string config_file_;
    std::string socket_path_;
    std::string worker_dir_;
    std::string artifact_path_;
    std::string backend_path_;
    std::string node_version_;
    std::string log_level_;
};

} // namespace pvfworker

#endif // pvfworker_CORE_APPLICATION_HPP
