/*
 * pvfworker C++ - Message Codec
 *
 * Deterministic binary encoding (CBOR) of the messages exchanged with the
 * host. Decoders never throw; malformed input is reported through `error`.
 */
#ifndef pvfworker_IPC_CODEC_HPP
#define pvfworker_IPC_CODEC_HPP

#include <pvfworker/core/types.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace pvfworker {

// First message on a fresh connection, host -> worker
struct WorkerHandshake {
    SecurityStatus security_status;
};

std::vector<uint8_t> encode_handshake(const WorkerHandshake& handshake);
bool decode_handshake(const std::vector<uint8_t>& data, WorkerHandshake& out, std::string& error);

std::vector<uint8_t> encode_job(const PrepJob& job);
bool decode_job(const std::vector<uint8_t>& data, PrepJob& out, std::string& error);

std::vector<uint8_t> encode_outcome(const PrepareOutcome& outcome);
bool decode_outcome(const std::vector<uint8_t>& data, PrepareOutcome& out, std::string& error);

} // namespace pvfworker

#endif // pvfworker_IPC_CODEC_HPP
