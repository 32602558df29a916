/*
 * pvfworker C++ - Backend Loader
 *
 * Loads a compiler backend from a shared library (.so). The library must
 * export pvfworker_backend_info, pvfworker_create_backend and
 * pvfworker_destroy_backend (see PVFWORKER_DECLARE_BACKEND).
 */
#ifndef pvfworker_PREPARE_BACKEND_LOADER_HPP
#define pvfworker_PREPARE_BACKEND_LOADER_HPP

#include <pvfworker/prepare/preparer.hpp>

#include <string>

namespace pvfworker {

class BackendLoader {
public:
    BackendLoader();
    ~BackendLoader();

    // Load the backend at `path`. Any previously loaded backend is unloaded.
    bool load(const std::string& path);

    void unload();

    // Loaded backend, or nullptr
    Preparer* backend() const { return instance_; }

    const BackendInfo& info() const { return info_; }
    const std::string& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

private:
    BackendLoader(const BackendLoader&);
    BackendLoader& operator=(const BackendLoader&);

    void set_error(const std::string& error);

    void* handle_;
    Preparer* instance_;
    DestroyBackendFunc destroy_func_;
    BackendInfo info_;
    std::string path_;
    std::string last_error_;
};

} // namespace pvfworker

#endif // pvfworker_PREPARE_BACKEND_LOADER_HPP
