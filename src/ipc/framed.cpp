/*
 * pvfworker C++ - Framed Channel Implementation
 */
#include <pvfworker/ipc/framed.hpp>
#include <pvfworker/core/utils.hpp>

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

namespace pvfworker {

namespace {

enum class ReadStatus { Ok, Eof, Error };

// Reads exactly `len` bytes. Eof is reported only if nothing was read.
ReadStatus read_exact(int fd, uint8_t* data, size_t len, std::string& error) {
    size_t got = 0;
    while (got < len) {
        ssize_t n = read(fd, data + got, len - got);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = "read failed: " + errno_string(errno);
            return ReadStatus::Error;
        }
        if (n == 0) {
            if (got == 0) return ReadStatus::Eof;
            error = "unexpected end of stream inside a frame";
            return ReadStatus::Error;
        }
        got += static_cast<size_t>(n);
    }
    return ReadStatus::Ok;
}

} // namespace

std::vector<uint8_t> frame_payload(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out;
    out.reserve(FRAME_HEADER_SIZE + payload.size());
    uint64_t len = payload.size();
    for (size_t i = 0; i < FRAME_HEADER_SIZE; ++i) {
        out.push_back(static_cast<uint8_t>((len >> (8 * i)) & 0xff));
    }
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

bool write_all(int fd, const uint8_t* data, size_t len, std::string& error) {
    size_t written = 0;
    bool is_socket = true;
    while (written < len) {
        ssize_t n;
        if (is_socket) {
            // MSG_NOSIGNAL: a vanished host must surface as EPIPE, not SIGPIPE
            n = send(fd, data + written, len - written, MSG_NOSIGNAL);
            if (n < 0 && errno == ENOTSOCK) {
                is_socket = false;
                continue;
            }
        } else {
            n = write(fd, data + written, len - written);
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            error = "write failed: " + errno_string(errno);
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

bool framed_send(int fd, const std::vector<uint8_t>& payload, std::string& error) {
    std::vector<uint8_t> frame = frame_payload(payload);
    return write_all(fd, frame.data(), frame.size(), error);
}

RecvStatus framed_recv(int fd, std::vector<uint8_t>& payload, size_t max_size, std::string& error) {
    uint8_t header[FRAME_HEADER_SIZE];
    ReadStatus st = read_exact(fd, header, sizeof(header), error);
    if (st == ReadStatus::Eof) return RecvStatus::Closed;
    if (st == ReadStatus::Error) return RecvStatus::Error;

    uint64_t len = 0;
    for (size_t i = 0; i < FRAME_HEADER_SIZE; ++i) {
        len |= static_cast<uint64_t>(header[i]) << (8 * i);
    }
    if (len > max_size) {
        error = "frame of " + std::to_string(len) + " bytes exceeds limit of " +
                std::to_string(max_size);
        return RecvStatus::Error;
    }

    payload.assign(static_cast<size_t>(len), 0);
    if (len == 0) return RecvStatus::Ok;

    st = read_exact(fd, payload.data(), payload.size(), error);
    if (st == ReadStatus::Eof) {
        error = "unexpected end of stream after frame header";
        return RecvStatus::Error;
    }
    return st == ReadStatus::Ok ? RecvStatus::Ok : RecvStatus::Error;
}

} // namespace pvfworker
