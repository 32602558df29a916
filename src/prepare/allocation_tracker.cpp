/*
 * pvfworker C++ - Allocation Tracker Implementation
 *
 * Everything on the allocation path below is allocation-free: a spin lock
 * over plain integers, glibc's own allocator entry points and
 * malloc_usable_size.
 */
#include <pvfworker/prepare/allocation_tracker.hpp>
#include <pvfworker/core/types.hpp>

#include <atomic>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <new>
#include <malloc.h>
#include <sched.h>
#include <unistd.h>

// glibc's allocator under its internal names. The replacements at the bottom
// of this file forward here, so every block stays a glibc block and
// malloc_usable_size works on all of them.
extern "C" {
void* __libc_malloc(size_t size);
void* __libc_calloc(size_t count, size_t size);
void* __libc_realloc(void* ptr, size_t size);
void* __libc_memalign(size_t alignment, size_t size);
void* __libc_valloc(size_t size);
void* __libc_pvalloc(size_t size);
void __libc_free(void* ptr);
}

namespace pvfworker {

namespace {

struct TrackerState {
    std::atomic_flag lock = ATOMIC_FLAG_INIT;
    bool active = false;
    bool has_limit = false;
    bool fired = false;
    uint64_t generation = 0;    // Bumped by every start_tracking()
    int64_t limit = 0;
    int64_t current = 0;
    int64_t peak = 0;
    OomHook on_oom = nullptr;
};

TrackerState g_tracker;

class SpinGuard {
public:
    SpinGuard() {
        while (g_tracker.lock.test_and_set(std::memory_order_acquire)) {
            sched_yield();
        }
    }
    ~SpinGuard() { g_tracker.lock.clear(std::memory_order_release); }

private:
    SpinGuard(const SpinGuard&);
    SpinGuard& operator=(const SpinGuard&);
};

int64_t byte_count(size_t size) {
    const size_t max = static_cast<size_t>(std::numeric_limits<int64_t>::max());
    return static_cast<int64_t>(size > max ? max : size);
}

void update_peak() {
    if (g_tracker.current > g_tracker.peak) {
        g_tracker.peak = g_tracker.current;
    }
}

// Charges `bytes` to the running total before the underlying allocation is
// made, firing the hook if that would cross the limit. Returns the tracking
// generation the charge belongs to, 0 when nothing was charged.
uint64_t reserve(int64_t bytes) {
    SpinGuard guard;
    if (!g_tracker.active) return 0;

    if (bytes > 0 && g_tracker.has_limit && !g_tracker.fired &&
        bytes > g_tracker.limit - g_tracker.current) {
        g_tracker.fired = true;
        if (g_tracker.on_oom) {
            g_tracker.on_oom();
        }
        // The lock is never released: no further allocation may succeed.
        _exit(exit_status::OUT_OF_MEMORY);
    }

    if (bytes > 0 && g_tracker.current > std::numeric_limits<int64_t>::max() - bytes) {
        return 0;
    }
    g_tracker.current += bytes;
    return g_tracker.generation;
}

// Replaces a reservation with what the allocator actually handed out and
// records the peak. `actual` is 0 when the allocation failed, which drops
// the reservation.
void settle(uint64_t generation, int64_t reserved, int64_t actual) {
    if (generation == 0) return;
    SpinGuard guard;
    if (!g_tracker.active || g_tracker.generation != generation) return;
    g_tracker.current += actual - reserved;
    update_peak();
}

void record_free(void* ptr) {
    if (!ptr) return;
    int64_t usable = byte_count(malloc_usable_size(ptr));
    SpinGuard guard;
    if (!g_tracker.active) return;
    g_tracker.current -= usable;
}

template <typename Allocate>
void* tracked(size_t size, Allocate allocate) {
    int64_t requested = byte_count(size);
    uint64_t generation = reserve(requested);
    void* ptr = allocate();
    settle(generation, requested, ptr ? byte_count(malloc_usable_size(ptr)) : 0);
    return ptr;
}

void* tracked_alloc(size_t size, size_t alignment) {
    if (alignment <= alignof(std::max_align_t)) {
        return tracked(size, [size] { return __libc_malloc(size); });
    }
    return tracked(size, [size, alignment] { return __libc_memalign(alignment, size); });
}

void* tracked_alloc_or_throw(size_t size, size_t alignment) {
    if (size == 0) size = 1;
    for (;;) {
        void* ptr = tracked_alloc(size, alignment);
        if (ptr) return ptr;
        std::new_handler handler = std::get_new_handler();
        if (!handler) throw std::bad_alloc();
        handler();
    }
}

void* tracked_realloc(void* ptr, size_t size) {
    if (!ptr) return tracked_alloc(size, 0);
    if (size == 0) {
        record_free(ptr);
        __libc_free(ptr);
        return nullptr;
    }

    // Only growth is charged up front. The old block stays counted until
    // the move succeeds; a shrink settles to a negative delta.
    int64_t old_usable = byte_count(malloc_usable_size(ptr));
    int64_t requested = byte_count(size);
    int64_t growth = requested > old_usable ? requested - old_usable : 0;
    uint64_t generation = reserve(growth);

    void* moved = __libc_realloc(ptr, size);
    int64_t actual = moved ? byte_count(malloc_usable_size(moved)) - old_usable : 0;
    settle(generation, growth, actual);
    return moved;
}

void tracked_free(void* ptr) {
    if (!ptr) return;
    record_free(ptr);
    __libc_free(ptr);
}

bool valid_alignment(size_t alignment) {
    return alignment != 0 && (alignment & (alignment - 1)) == 0;
}

} // namespace

void AllocationTracker::start_tracking(std::optional<int64_t> limit, OomHook on_oom) {
    SpinGuard guard;
    g_tracker.active = true;
    ++g_tracker.generation;
    g_tracker.has_limit = limit.has_value();
    g_tracker.limit = limit.has_value() ? *limit : 0;
    g_tracker.fired = false;
    g_tracker.current = 0;
    g_tracker.peak = 0;
    g_tracker.on_oom = on_oom;
}

int64_t AllocationTracker::end_tracking() {
    SpinGuard guard;
    g_tracker.active = false;
    g_tracker.has_limit = false;
    g_tracker.on_oom = nullptr;
    int64_t peak = g_tracker.peak;
    g_tracker.current = 0;
    g_tracker.peak = 0;
    return peak;
}

int64_t AllocationTracker::current() {
    SpinGuard guard;
    return g_tracker.active ? g_tracker.current : 0;
}

bool AllocationTracker::is_tracking() {
    SpinGuard guard;
    return g_tracker.active;
}

} // namespace pvfworker

using pvfworker::tracked;
using pvfworker::tracked_alloc;
using pvfworker::tracked_alloc_or_throw;
using pvfworker::tracked_free;
using pvfworker::tracked_realloc;
using pvfworker::valid_alignment;

// ============================================================================
// C allocator replacements
// ============================================================================

extern "C" {

void* malloc(size_t size) noexcept {
    return tracked_alloc(size, 0);
}

void free(void* ptr) noexcept {
    tracked_free(ptr);
}

void* calloc(size_t count, size_t size) noexcept {
    if (size != 0 && count > std::numeric_limits<size_t>::max() / size) {
        errno = ENOMEM;
        return nullptr;
    }
    return tracked(count * size, [count, size] { return __libc_calloc(count, size); });
}

void* realloc(void* ptr, size_t size) noexcept {
    return tracked_realloc(ptr, size);
}

void* memalign(size_t alignment, size_t size) noexcept {
    return tracked(size, [alignment, size] { return __libc_memalign(alignment, size); });
}

void* aligned_alloc(size_t alignment, size_t size) noexcept {
    if (!valid_alignment(alignment)) {
        errno = EINVAL;
        return nullptr;
    }
    return tracked(size, [alignment, size] { return __libc_memalign(alignment, size); });
}

int posix_memalign(void** memptr, size_t alignment, size_t size) noexcept {
    if (!valid_alignment(alignment) || alignment % sizeof(void*) != 0) {
        return EINVAL;
    }
    void* ptr = tracked(size, [alignment, size] { return __libc_memalign(alignment, size); });
    if (!ptr) return ENOMEM;
    *memptr = ptr;
    return 0;
}

void* valloc(size_t size) noexcept {
    return tracked(size, [size] { return __libc_valloc(size); });
}

void* pvalloc(size_t size) noexcept {
    return tracked(size, [size] { return __libc_pvalloc(size); });
}

} // extern "C"

// ============================================================================
// Global operator new/delete replacements
// ============================================================================

void* operator new(std::size_t size) {
    return tracked_alloc_or_throw(size, 0);
}

void* operator new[](std::size_t size) {
    return tracked_alloc_or_throw(size, 0);
}

void* operator new(std::size_t size, const std::nothrow_t&) noexcept {
    return tracked_alloc(size, 0);
}

void* operator new[](std::size_t size, const std::nothrow_t&) noexcept {
    return tracked_alloc(size, 0);
}

void* operator new(std::size_t size, std::align_val_t al) {
    return tracked_alloc_or_throw(size, static_cast<size_t>(al));
}

void* operator new[](std::size_t size, std::align_val_t al) {
    return tracked_alloc_or_throw(size, static_cast<size_t>(al));
}

void* operator new(std::size_t size, std::align_val_t al, const std::nothrow_t&) noexcept {
    return tracked_alloc(size, static_cast<size_t>(al));
}

void* operator new[](std::size_t size, std::align_val_t al, const std::nothrow_t&) noexcept {
    return tracked_alloc(size, static_cast<size_t>(al));
}

void operator delete(void* ptr) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr) noexcept { tracked_free(ptr); }
void operator delete(void* ptr, const std::nothrow_t&) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr, const std::nothrow_t&) noexcept { tracked_free(ptr); }
void operator delete(void* ptr, std::size_t) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr, std::size_t) noexcept { tracked_free(ptr); }
void operator delete(void* ptr, std::align_val_t) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr, std::align_val_t) noexcept { tracked_free(ptr); }
void operator delete(void* ptr, std::align_val_t, const std::nothrow_t&) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr, std::align_val_t, const std::nothrow_t&) noexcept { tracked_free(ptr); }
void operator delete(void* ptr, std::size_t, std::align_val_t) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr, std::size_t, std::align_val_t) noexcept { tracked_free(ptr); }
