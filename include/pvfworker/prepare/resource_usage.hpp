/*
 * pvfworker C++ - Resource Usage
 *
 * CPU clocks and memory statistics used to bound and report on a job.
 */
#ifndef pvfworker_PREPARE_RESOURCE_USAGE_HPP
#define pvfworker_PREPARE_RESOURCE_USAGE_HPP

#include <pvfworker/core/types.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace pvfworker {

// CPU time consumed by the whole process
std::chrono::nanoseconds process_cpu_time();

// Peak resident set size of the calling thread, in bytes
std::optional<uint64_t> get_max_rss_thread();

// Current resident bytes (/proc/self/statm) and tracked live bytes.
// Allocation-free so it can run while a job is being tracked.
std::optional<MemoryAllocationStats> sample_memory();

// Periodically samples memory in a background thread and keeps the peak
// of each counter until stopped.
class MemorySampler {
public:
    explicit MemorySampler(std::chrono::milliseconds interval);
    ~MemorySampler();

    void start();

    // Stop the thread and return the peaks, or nothing if no sample succeeded.
    std::optional<MemoryAllocationStats> stop();

private:
    MemorySampler(const MemorySampler&);
    MemorySampler& operator=(const MemorySampler&);

    void loop();
    void record(const MemoryAllocationStats& s);

    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_;
    bool have_sample_;
    MemoryAllocationStats peak_;
    std::thread thread_;
};

} // namespace pvfworker

#endif // pvfworker_PREPARE_RESOURCE_USAGE_HPP
