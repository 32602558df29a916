/*
 * pvfworker C++ - OOM Sentinel Implementation
 *
 * hook() runs inside the allocator lock. Only raw system calls below.
 */
#include <pvfworker/prepare/oom_sentinel.hpp>
#include <pvfworker/ipc/codec.hpp>
#include <pvfworker/ipc/framed.hpp>
#include <pvfworker/core/logger.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace pvfworker {
namespace oom_sentinel {

namespace {
const size_t MAX_PAYLOAD = 128;

uint8_t g_payload[MAX_PAYLOAD];
std::atomic<size_t> g_payload_len(0);
std::atomic<int> g_fd(-1);
} // namespace

bool install(int fd) {
    if (g_payload_len.load() == 0) {
        std::vector<uint8_t> frame =
            frame_payload(encode_outcome(PrepareOutcome::fail(PrepareError::out_of_memory())));
        if (frame.size() > MAX_PAYLOAD) {
            LOG_ERROR("[Worker] OOM payload of %zu bytes does not fit the reserved buffer", frame.size());
            return false;
        }
        memcpy(g_payload, frame.data(), frame.size());
        g_payload_len.store(frame.size());
    }
    g_fd.store(fd);
    return true;
}

void clear() {
    g_fd.store(-1);
}

void hook() {
    int fd = g_fd.load();
    size_t len = g_payload_len.load();
    if (fd >= 0 && len > 0) {
        size_t written = 0;
        while (written < len) {
            ssize_t n = write(fd, g_payload + written, len - written);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            written += static_cast<size_t>(n);
        }
        close(fd);
    }
    _exit(exit_status::OUT_OF_MEMORY);
}

std::vector<uint8_t> payload() {
    size_t len = g_payload_len.load();
    return std::vector<uint8_t>(g_payload, g_payload + len);
}

} // namespace oom_sentinel
} // namespace pvfworker
