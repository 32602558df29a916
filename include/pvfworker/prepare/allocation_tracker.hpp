/*
 * pvfworker C++ - Allocation Tracker
 *
 * Replaces the global operator new/delete family and the C allocator
 * (malloc, calloc, realloc, free and the aligned variants) so every
 * allocation in the process, backend libraries included, updates a running
 * byte count. While tracking is armed the peak is recorded and, if a limit is
 * set, the OOM hook fires the moment an allocation would push the count past
 * it. The bytes are charged under the same lock as the limit check, so
 * concurrent allocations cannot jointly slip past the limit.
 *
 * The hook runs with the tracker lock held. It must not allocate or free
 * memory, directly or through any library call: doing so deadlocks. After
 * the hook returns the process is terminated with _exit().
 */
#ifndef pvfworker_PREPARE_ALLOCATION_TRACKER_HPP
#define pvfworker_PREPARE_ALLOCATION_TRACKER_HPP

#include <cstdint>
#include <optional>

namespace pvfworker {

typedef void (*OomHook)();

class AllocationTracker {
public:
    // Arm tracking. Counters restart from zero. Without a limit only the
    // peak is recorded and `on_oom` is never invoked.
    static void start_tracking(std::optional<int64_t> limit, OomHook on_oom);

    // Disarm and return the peak. Frees of memory allocated before
    // start_tracking() count against the total, so the value can be negative.
    static int64_t end_tracking();

    // Live tracked bytes since start_tracking(), 0 when not armed.
    static int64_t current();

    static bool is_tracking();
};

} // namespace pvfworker

#endif // pvfworker_PREPARE_ALLOCATION_TRACKER_HPP
