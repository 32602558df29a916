/*
 * pvfworker C++ - Passthrough Backend Implementation
 */
#include <pvfworker/plugins/passthrough/passthrough.hpp>
#include <pvfworker/core/logger.hpp>

#include <cstring>

namespace pvfworker {

namespace {
const uint8_t WASM_MAGIC[4] = { 0x00, 0x61, 0x73, 0x6d };   // "\0asm"
const uint8_t WASM_VERSION[4] = { 0x01, 0x00, 0x00, 0x00 };
const size_t WASM_HEADER_SIZE = 8;
}

PassthroughBackend::PassthroughBackend() {}

const char* PassthroughBackend::name() const { return "passthrough"; }

BackendResult PassthroughBackend::prevalidate(const std::vector<uint8_t>& code) {
    if (code.size() < WASM_HEADER_SIZE) {
        return BackendResult::fail("module is " + std::to_string(code.size()) +
                                   " bytes, shorter than the wasm header");
    }
    if (memcmp(code.data(), WASM_MAGIC, sizeof(WASM_MAGIC)) != 0) {
        return BackendResult::fail("bad wasm magic number");
    }
    if (memcmp(code.data() + 4, WASM_VERSION, sizeof(WASM_VERSION)) != 0) {
        return BackendResult::fail("unsupported wasm binary version");
    }
    return BackendResult::ok(code);
}

BackendResult PassthroughBackend::prepare(const std::vector<uint8_t>& blob,
                                          const std::vector<uint8_t>& executor_params) {
    LOG_DEBUG("[Passthrough] Preparing %zu byte module (%zu bytes of executor params)",
              blob.size(), executor_params.size());
    return BackendResult::ok(blob);
}

BackendResult PassthroughBackend::instantiate(const std::vector<uint8_t>& artifact,
                                              const std::vector<uint8_t>& executor_params) {
    (void)executor_params;
    if (artifact.empty()) {
        return BackendResult::fail("empty artifact");
    }
    return BackendResult::ok(std::vector<uint8_t>());
}

} // namespace pvfworker

PVFWORKER_DECLARE_BACKEND(pvfworker::PassthroughBackend, "passthrough", "1.0.0",
                          "Copies validated wasm modules into artifacts unchanged")
