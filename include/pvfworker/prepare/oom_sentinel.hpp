/*
 * pvfworker C++ - OOM Sentinel
 *
 * Last-gasp message of a worker that exceeded its memory ceiling. The payload
 * is the framed encoding of Err(OutOfMemory), built before tracking is armed
 * so the hook only copies pre-reserved bytes to the channel descriptor.
 */
#ifndef pvfworker_PREPARE_OOM_SENTINEL_HPP
#define pvfworker_PREPARE_OOM_SENTINEL_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pvfworker {
namespace oom_sentinel {

// Encode the payload into the static buffer (allocates; call before arming)
// and remember `fd` as the channel to write it to.
bool install(int fd);

// Forget the channel descriptor. The hook becomes a plain _exit().
void clear();

// OOM hook for AllocationTracker: write the payload, close the descriptor,
// terminate. Allocation-free.
void hook();

// Copy of the encoded payload, for tests and hosts
std::vector<uint8_t> payload();

} // namespace oom_sentinel
} // namespace pvfworker

#endif // pvfworker_PREPARE_OOM_SENTINEL_HPP
