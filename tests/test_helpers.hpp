/*
 * pvfworker C++ - Test helpers
 */
#ifndef pvfworker_TESTS_TEST_HELPERS_HPP
#define pvfworker_TESTS_TEST_HELPERS_HPP

#include <pvfworker/core/utils.hpp>
#include <pvfworker/prepare/preparer.hpp>
#include <pvfworker/prepare/resource_usage.hpp>

#include <chrono>
#include <cstdlib>
#include <functional>
#include <string>
#include <vector>

namespace pvfworker {
namespace testing_support {

// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/pvfworker-test-XXXXXX";
        const char* dir = mkdtemp(tmpl);
        path_ = dir ? dir : "";
    }
    ~TempDir() {
        if (!path_.empty()) remove_tree(path_);
    }

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return join_path(path_, name); }

private:
    TempDir(const TempDir&);
    TempDir& operator=(const TempDir&);

    std::string path_;
};

// Smallest module the passthrough rules accept, padded to `size` bytes
inline std::vector<uint8_t> wasm_module(size_t size = 8) {
    std::vector<uint8_t> code(size < 8 ? 8 : size, 0);
    const uint8_t header[8] = { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00 };
    for (size_t i = 0; i < 8; ++i) code[i] = header[i];
    return code;
}

// Burn CPU time on the calling thread
inline void burn_cpu(std::chrono::milliseconds amount) {
    std::chrono::nanoseconds start = process_cpu_time();
    volatile uint64_t sink = 0;
    while (process_cpu_time() - start < amount) {
        for (int i = 0; i < 10000; ++i) sink = sink + static_cast<uint64_t>(i);
    }
}

// Preparer whose stages are supplied by the test
class FakePreparer : public Preparer {
public:
    typedef std::function<BackendResult(const std::vector<uint8_t>&)> Stage;

    FakePreparer()
        : instantiate_calls(0)
    {
        on_prevalidate = [](const std::vector<uint8_t>& code) { return BackendResult::ok(code); };
        on_prepare = [](const std::vector<uint8_t>& blob) { return BackendResult::ok(blob); };
        on_instantiate = [](const std::vector<uint8_t>&) { return BackendResult::ok(std::vector<uint8_t>()); };
    }

    const char* name() const { return "fake"; }

    BackendResult prevalidate(const std::vector<uint8_t>& code) { return on_prevalidate(code); }

    BackendResult prepare(const std::vector<uint8_t>& blob, const std::vector<uint8_t>&) {
        return on_prepare(blob);
    }

    BackendResult instantiate(const std::vector<uint8_t>& artifact, const std::vector<uint8_t>&) {
        ++instantiate_calls;
        return on_instantiate(artifact);
    }

    Stage on_prevalidate;
    Stage on_prepare;
    Stage on_instantiate;
    int instantiate_calls;
};

} // namespace testing_support
} // namespace pvfworker

#endif // pvfworker_TESTS_TEST_HELPERS_HPP
