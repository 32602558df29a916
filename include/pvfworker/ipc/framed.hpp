/*
 * pvfworker C++ - Framed Channel
 *
 * Length-prefixed messages over a byte stream. Each frame is an 8-byte
 * little-endian payload length followed by the payload.
 */
#ifndef pvfworker_IPC_FRAMED_HPP
#define pvfworker_IPC_FRAMED_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pvfworker {

const size_t FRAME_HEADER_SIZE = 8;
const size_t DEFAULT_MAX_FRAME_SIZE = 256 * 1024 * 1024;

enum class RecvStatus {
    Ok,
    Closed,     // Peer closed the stream on a frame boundary
    Error
};

// Prefix `payload` with its length header.
std::vector<uint8_t> frame_payload(const std::vector<uint8_t>& payload);

// Write one frame. Retries on EINTR and short writes.
bool framed_send(int fd, const std::vector<uint8_t>& payload, std::string& error);

// Read one frame. Frames announcing more than `max_size` bytes are an error.
RecvStatus framed_recv(int fd, std::vector<uint8_t>& payload, size_t max_size, std::string& error);

// Write the whole buffer to `fd`.
bool write_all(int fd, const uint8_t* data, size_t len, std::string& error);

} // namespace pvfworker

#endif // pvfworker_IPC_FRAMED_HPP
