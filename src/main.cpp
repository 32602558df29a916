/*
 * pvfworker C++ - Preparation Worker
 *
 * Compiles untrusted PVF code for a host under CPU-time and memory bounds.
 *
 * Usage:
 *   ./pvf-prepare-worker --socket-path <path> --worker-dir-path <dir>
 *   ./pvf-prepare-worker --check-can-enable-landlock
 */
#include <pvfworker/core/application.hpp>

#include <cstdio>
#include <unistd.h>

int main(int argc, char* argv[]) {
    auto& app = pvfworker::Application::instance();

    if (!app.init(argc, argv)) {
        // --help/--version, usage or startup errors
        app.shutdown();
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    if (app.has_abandoned_work()) {
        // Static destructors must not race a work thread still in the backend
        fflush(stdout);
        fflush(stderr);
        _exit(result);
    }
    return result;
}
