/*
 * pvfworker C++ - Resource Usage Implementation
 */
#include <pvfworker/prepare/resource_usage.hpp>
#include <pvfworker/prepare/allocation_tracker.hpp>
#include <pvfworker/core/logger.hpp>

#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>

namespace pvfworker {

std::chrono::nanoseconds process_cpu_time() {
    struct timespec ts;
    if (clock_gettime(CLOCK_PROCESS_CPUTIME_ID, &ts) != 0) {
        return std::chrono::nanoseconds(0);
    }
    return std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
}

std::optional<uint64_t> get_max_rss_thread() {
    struct rusage usage;
    if (getrusage(RUSAGE_THREAD, &usage) != 0) {
        return std::nullopt;
    }
    // ru_maxrss is in kilobytes on Linux
    return static_cast<uint64_t>(usage.ru_maxrss) * 1024;
}

std::optional<MemoryAllocationStats> sample_memory() {
    // statm: size resident shared text lib data dt (pages)
    char buf[128];
    int fd = open("/proc/self/statm", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return std::nullopt;
    ssize_t n;
    do {
        n = read(fd, buf, sizeof(buf) - 1);
    } while (n < 0 && errno == EINTR);
    close(fd);
    if (n <= 0) return std::nullopt;
    buf[n] = '\0';

    char* end = nullptr;
    strtoull(buf, &end, 10);                  // size
    unsigned long long resident_pages = strtoull(end, &end, 10);
    if (end == buf) return std::nullopt;

    MemoryAllocationStats s;
    s.resident = static_cast<uint64_t>(resident_pages) * static_cast<uint64_t>(sysconf(_SC_PAGESIZE));
    int64_t allocated = AllocationTracker::current();
    s.allocated = allocated > 0 ? static_cast<uint64_t>(allocated) : 0;
    return s;
}

// ============================================================================
// MemorySampler
// ============================================================================

MemorySampler::MemorySampler(std::chrono::milliseconds interval)
    : interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1))
    , stop_requested_(false)
    , have_sample_(false)
{}

MemorySampler::~MemorySampler() {
    stop();
}

void MemorySampler::start() {
    if (thread_.joinable()) return;
    stop_requested_ = false;
    have_sample_ = false;
    peak_ = MemoryAllocationStats();
    thread_ = std::thread(&MemorySampler::loop, this);
}

std::optional<MemoryAllocationStats> MemorySampler::stop() {
    if (!thread_.joinable()) {
        return have_sample_ ? std::optional<MemoryAllocationStats>(peak_) : std::nullopt;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    thread_.join();

    // One last sample so short jobs still report something
    std::optional<MemoryAllocationStats> last = sample_memory();
    if (last) record(*last);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!have_sample_) return std::nullopt;
    return peak_;
}

void MemorySampler::record(const MemoryAllocationStats& s) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!have_sample_) {
        peak_ = s;
        have_sample_ = true;
        return;
    }
    if (s.resident > peak_.resident) peak_.resident = s.resident;
    if (s.allocated > peak_.allocated) peak_.allocated = s.allocated;
}

void MemorySampler::loop() {
    for (;;) {
        std::optional<MemoryAllocationStats> s = sample_memory();
        if (s) record(*s);

        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }
    }
    LOG_DEBUG("[Memory] Sampler stopped");
}

} // namespace pvfworker
