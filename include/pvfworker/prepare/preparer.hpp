/*
 * pvfworker C++ - Compiler Backend Interface
 *
 * The worker does not compile anything itself. It sequences and bounds the
 * calls into a backend that validates and compiles the untrusted code.
 * Backends are built as shared libraries and loaded by BackendLoader.
 */
#ifndef pvfworker_PREPARE_PREPARER_HPP
#define pvfworker_PREPARE_PREPARER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace pvfworker {

struct BackendResult {
    bool success;
    std::vector<uint8_t> data;
    std::string error;      // Diagnostic from the backend, passed through verbatim

    BackendResult() : success(false) {}

    static BackendResult ok(std::vector<uint8_t> data) {
        BackendResult r;
        r.success = true;
        r.data.swap(data);
        return r;
    }

    static BackendResult fail(const std::string& err) {
        BackendResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

class Preparer {
public:
    virtual ~Preparer() {}

    virtual const char* name() const = 0;

    // Check the untrusted code is well formed. On success `data` holds the
    // blob handed to prepare().
    virtual BackendResult prevalidate(const std::vector<uint8_t>& code) = 0;

    // Compile a prevalidated blob. On success `data` holds the artifact.
    virtual BackendResult prepare(const std::vector<uint8_t>& blob,
                                  const std::vector<uint8_t>& executor_params) = 0;

    // Build a runtime from the artifact once and throw it away.
    virtual BackendResult instantiate(const std::vector<uint8_t>& artifact,
                                      const std::vector<uint8_t>& executor_params) = 0;
};

// Metadata exported by a backend library
struct BackendInfo {
    const char* name;
    const char* version;
    const char* description;
};

typedef BackendInfo (*GetBackendInfoFunc)();
typedef Preparer* (*CreateBackendFunc)();
typedef void (*DestroyBackendFunc)(Preparer*);

} // namespace pvfworker

#define PVFWORKER_BACKEND_EXPORT extern "C" __attribute__((visibility("default")))

#define PVFWORKER_DECLARE_BACKEND(BackendClass, backend_name, backend_version, backend_desc) \
    PVFWORKER_BACKEND_EXPORT pvfworker::BackendInfo pvfworker_backend_info() { \
        pvfworker::BackendInfo info; \
        info.name = backend_name; \
        info.version = backend_version; \
        info.description = backend_desc; \
        return info; \
    } \
    PVFWORKER_BACKEND_EXPORT pvfworker::Preparer* pvfworker_create_backend() { \
        return new BackendClass(); \
    } \
    PVFWORKER_BACKEND_EXPORT void pvfworker_destroy_backend(pvfworker::Preparer* backend) { \
        delete backend; \
    }

#endif // pvfworker_PREPARE_PREPARER_HPP
