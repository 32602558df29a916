/*
 * pvfworker C++ - Application Implementation
 */
#include <pvfworker/core/application.hpp>
#include <pvfworker/core/logger.hpp>
#include <pvfworker/core/utils.hpp>
#include <pvfworker/ipc/codec.hpp>
#include <pvfworker/ipc/framed.hpp>
#include <pvfworker/prepare/worker_loop.hpp>
#include <pvfworker/security/probe.hpp>
#include <pvfworker/security/sandbox.hpp>

#include <iostream>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <climits>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace pvfworker {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - sandboxed PVF preparation worker\n\n"
              << "Usage:\n"
              << "  " << prog << " --socket-path <path> --worker-dir-path <dir> [options]\n"
              << "  " << prog << " --check-can-enable-landlock\n"
              << "  " << prog << " --check-can-enable-seccomp\n"
              << "  " << prog << " --check-can-unshare-user-namespace-and-change-root --worker-dir-path <dir>\n"
              << "  " << prog << " --probe-security [--config <file>]\n\n"
              << "Options:\n"
              << "  --artifact-path <file>      Where compiled artifacts are written\n"
              << "                              (default: <worker-dir>/artifact)\n"
              << "  --backend <lib.so>          Compiler backend (overrides backend.path)\n"
              << "  --config <file>             JSON configuration file\n"
              << "  --node-impl-version <v>     Refuse to start unless it matches ours\n"
              << "  --log-level <lvl>           debug, info, warn or error\n"
              << "  -h, --help                  Show this help message\n"
              << "  -v, --version               Show version\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

std::string self_executable(const char* argv0) {
    char buf[PATH_MAX];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return argv0;
    buf[n] = '\0';
    return std::string(buf);
}

} // namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : mode_(RunMode::Worker)
    , socket_fd_(-1)
    , exit_code_(exit_status::OK)
    , abandoned_work_(false)
{}

bool Application::parse_args(int argc, char* argv[]) {
    program_ = self_executable(argv[0]);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            exit_code_ = exit_status::OK;
            return false;
        }
        if (strcmp(arg, "-v") == 0 || strcmp(arg, "--version") == 0) {
            print_version();
            exit_code_ = exit_status::OK;
            return false;
        }
        if (strcmp(arg, "--check-can-enable-landlock") == 0) {
            mode_ = RunMode::CheckLandlock;
            continue;
        }
        if (strcmp(arg, "--check-can-enable-seccomp") == 0) {
            mode_ = RunMode::CheckSeccomp;
            continue;
        }
        if (strcmp(arg, "--check-can-unshare-user-namespace-and-change-root") == 0) {
            mode_ = RunMode::CheckUnshare;
            continue;
        }
        if (strcmp(arg, "--probe-security") == 0) {
            mode_ = RunMode::ProbeSecurity;
            continue;
        }

        std::string* target = nullptr;
        if (strcmp(arg, "--socket-path") == 0) target = &socket_path_;
        else if (strcmp(arg, "--worker-dir-path") == 0) target = &worker_dir_;
        else if (strcmp(arg, "--artifact-path") == 0) target = &artifact_path_;
        else if (strcmp(arg, "--backend") == 0) target = &backend_path_;
        else if (strcmp(arg, "--config") == 0) target = &config_file_;
        else if (strcmp(arg, "--node-impl-version") == 0) target = &node_version_;
        else if (strcmp(arg, "--log-level") == 0) target = &log_level_;

        if (!target) {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            exit_code_ = exit_status::USAGE;
            return false;
        }
        if (!has_value) {
            std::cerr << "Option " << arg << " needs a value\n";
            exit_code_ = exit_status::USAGE;
            return false;
        }
        *target = argv[++i];
    }

    if (mode_ == RunMode::CheckUnshare && worker_dir_.empty()) {
        std::cerr << "--check-can-unshare-user-namespace-and-change-root needs --worker-dir-path\n";
        exit_code_ = exit_status::USAGE;
        return false;
    }
    if (mode_ == RunMode::Worker && (socket_path_.empty() || worker_dir_.empty())) {
        print_usage(argv[0]);
        exit_code_ = exit_status::USAGE;
        return false;
    }
    return true;
}

void Application::setup_logging() {
    // Check processes report through stderr; keep it to the diagnostic
    if (mode_ == RunMode::CheckLandlock || mode_ == RunMode::CheckSeccomp || mode_ == RunMode::CheckUnshare) {
        Logger::instance().set_level(LogLevel::ERROR);
        return;
    }

    std::string level = log_level_.empty() ? config_.get_string("log_level", "info") : log_level_;
    Logger::instance().set_level(parse_log_level(level, LogLevel::INFO));
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    // Level first so config errors are reported at the requested level
    setup_logging();
    if (!config_file_.empty()) {
        bool loaded = config_.load_file(config_file_);
        setup_logging();
        if (loaded) {
            LOG_INFO("Loaded config from %s", config_file_.c_str());
        } else {
            LOG_WARN("Using default configuration");
        }
    }

    if (mode_ != RunMode::Worker) {
        return true;
    }

    LOG_INFO("%s v%s starting (pid %d)", AppInfo::NAME, AppInfo::VERSION, static_cast<int>(getpid()));

    if (!check_version()) {
        exit_code_ = exit_status::VERSION_MISMATCH;
        return false;
    }

    // The host may close the socket at any time; that is an I/O error, not a signal
    signal(SIGPIPE, SIG_IGN);

    if (artifact_path_.empty()) {
        artifact_path_ = join_path(worker_dir_, "artifact");
    }

    if (!load_backend() || !connect_to_host() || !receive_handshake() || !activate_sandbox()) {
        exit_code_ = exit_status::STARTUP_FAILED;
        return false;
    }
    return true;
}

bool Application::check_version() {
    if (node_version_.empty() || node_version_ == AppInfo::VERSION) {
        return true;
    }
    LOG_ERROR("Node and worker version mismatch: node %s, worker %s. The node was probably "
              "upgraded while running; restart it.", node_version_.c_str(), AppInfo::VERSION);
    return false;
}

bool Application::load_backend() {
    std::string path = backend_path_.empty() ? config_.get_string("backend.path", "") : backend_path_;
    if (path.empty()) {
        LOG_ERROR("No compiler backend configured (set backend.path or pass --backend)");
        return false;
    }
    return loader_.load(path);
}

bool Application::connect_to_host() {
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        LOG_ERROR("Socket path too long: %s", socket_path_.c_str());
        return false;
    }
    memcpy(addr.sun_path, socket_path_.c_str(), socket_path_.size());

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) {
        LOG_ERROR("Cannot create socket: %s", errno_string(errno).c_str());
        return false;
    }

    int rc;
    do {
        rc = connect(socket_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
        LOG_ERROR("Cannot connect to %s: %s", socket_path_.c_str(), errno_string(errno).c_str());
        return false;
    }

    LOG_DEBUG("[Worker] Connected to %s", socket_path_.c_str());
    return true;
}

bool Application::receive_handshake() {
    std::vector<uint8_t> frame;
    std::string error;
    RecvStatus status = framed_recv(socket_fd_, frame, DEFAULT_MAX_FRAME_SIZE, error);
    if (status != RecvStatus::Ok) {
        LOG_ERROR("[Worker] No handshake from host: %s",
                  status == RecvStatus::Closed ? "connection closed" : error.c_str());
        return false;
    }

    WorkerHandshake handshake;
    if (!decode_handshake(frame, handshake, error)) {
        LOG_ERROR("[Worker] Malformed handshake: %s", error.c_str());
        return false;
    }
    security_status_ = handshake.security_status;
    return true;
}

bool Application::activate_sandbox() {
    // The backend library is mapped and the socket connected; from here on
    // the worker only touches its own directory.
    std::string error;

    if (security_status_.can_enable_landlock) {
        Sandbox sandbox;
        sandbox.allow_path(worker_dir_);
        std::string artifact_dir = artifact_path_.substr(0, artifact_path_.rfind('/'));
        if (!artifact_dir.empty() && artifact_dir != worker_dir_) {
            sandbox.allow_path(artifact_dir);
        }
        sandbox.allow_path_read_only("/proc/self");     // memory sampler
        sandbox.allow_path_read_only("/etc/localtime"); // log timestamps
        if (!sandbox.enable_landlock(error)) {
            LOG_ERROR("[Sandbox] %s", error.c_str());
            return false;
        }
    } else {
        LOG_WARN("[Sandbox] Running without landlock");
    }

    if (security_status_.can_enable_seccomp) {
        if (!Sandbox::enable_seccomp(error)) {
            LOG_ERROR("[Sandbox] %s", error.c_str());
            return false;
        }
    } else {
        LOG_WARN("[Sandbox] Running without seccomp");
    }
    return true;
}

int Application::run() {
    switch (mode_) {
        case RunMode::CheckLandlock: return run_check_landlock();
        case RunMode::CheckSeccomp: return run_check_seccomp();
        case RunMode::CheckUnshare: return run_check_unshare();
        case RunMode::ProbeSecurity: return run_probe();
        case RunMode::Worker: break;
    }
    return run_worker();
}

int Application::run_worker() {
    RaceSettings settings;
    settings.memory_sample_interval = std::chrono::milliseconds(
        config_.get_int("prepare.memory_sample_interval_ms", 500));
    settings.wall_clock_lenience = config_.get_double("prepare.wall_clock_lenience", 3.0);
    int64_t max_frame = config_.get_int("prepare.max_frame_size", static_cast<int64_t>(DEFAULT_MAX_FRAME_SIZE));
    if (max_frame <= 0) {
        max_frame = static_cast<int64_t>(DEFAULT_MAX_FRAME_SIZE);
    }

    PreparationWorkerLoop loop(*loader_.backend(), settings, static_cast<size_t>(max_frame));
    bool clean = loop.run(socket_fd_, artifact_path_);
    abandoned_work_ = loop.has_abandoned_work();

    exit_code_ = clean ? exit_status::OK : exit_status::CHANNEL_FAILED;
    return exit_code_;
}

// ============================================================================
// Capability checks
// ============================================================================

int Application::run_check_landlock() {
    Sandbox sandbox;
    std::string error;
    if (!sandbox.enable_landlock(error)) {
        fprintf(stderr, "%s\n", error.c_str());
        return exit_status::CHECK_FAILED;
    }

    // Nothing was allowed, so even the root directory must be unreadable
    int fd = open("/", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd >= 0) {
        close(fd);
        fprintf(stderr, "landlock ruleset was accepted but is not enforced\n");
        return exit_status::CHECK_FAILED;
    }
    return exit_status::OK;
}

int Application::run_check_seccomp() {
#if defined(__x86_64__)
    std::string error;
    if (!Sandbox::enable_seccomp(error)) {
        fprintf(stderr, "%s\n", error.c_str());
        return exit_status::CHECK_FAILED;
    }
    return exit_status::OK;
#else
    fprintf(stderr, "seccomp filtering is only supported on x86_64\n");
    return exit_status::CHECK_FAILED;
#endif
}

int Application::run_check_unshare() {
    std::string error;
    if (!Sandbox::change_root(worker_dir_, error)) {
        fprintf(stderr, "%s\n", error.c_str());
        return exit_status::CHECK_FAILED;
    }
    return exit_status::OK;
}

int Application::run_probe() {
    bool error_occurred = false;
    SecurityStatus status = check_security_status(config_, program_, error_occurred);

    Json out;
    out["can_enable_landlock"] = status.can_enable_landlock;
    out["can_enable_seccomp"] = status.can_enable_seccomp;
    out["can_unshare_user_namespace_and_change_root"] = status.can_unshare_user_namespace_and_change_root;
    std::cout << out.dump() << std::endl;

    return error_occurred ? exit_status::CHECK_FAILED : exit_status::OK;
}

void Application::shutdown() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
    }

    if (abandoned_work_) {
        // The abandoned work thread may still execute backend code
        LOG_DEBUG("Keeping backend loaded, a timed-out job is still running");
        return;
    }
    loader_.unload();

    if (mode_ == RunMode::Worker) {
        LOG_INFO("Worker exiting with status %d", exit_code_);
    }
}

} // namespace pvfworker
