/*
 * pvfworker C++ - Passthrough Backend
 *
 * Reference compiler backend. Prevalidation checks the WASM module header,
 * preparation copies the module into the artifact unchanged, instantiation
 * only checks the artifact is non-empty. Useful for exercising the worker
 * without a real compiler.
 */
#ifndef pvfworker_PLUGINS_PASSTHROUGH_HPP
#define pvfworker_PLUGINS_PASSTHROUGH_HPP

#include <pvfworker/prepare/preparer.hpp>

namespace pvfworker {

class PassthroughBackend : public Preparer {
public:
    PassthroughBackend();

    const char* name() const;

    BackendResult prevalidate(const std::vector<uint8_t>& code);
    BackendResult prepare(const std::vector<uint8_t>& blob,
                          const std::vector<uint8_t>& executor_params);
    BackendResult instantiate(const std::vector<uint8_t>& artifact,
                              const std::vector<uint8_t>& executor_params);
};

} // namespace pvfworker

#endif // pvfworker_PLUGINS_PASSTHROUGH_HPP
