/*
 * pvfworker C++ - Backend Loader Implementation
 */
#include <pvfworker/prepare/backend_loader.hpp>
#include <pvfworker/core/dl_utils.hpp>
#include <pvfworker/core/logger.hpp>

namespace pvfworker {

BackendLoader::BackendLoader()
    : handle_(nullptr)
    , instance_(nullptr)
    , destroy_func_(nullptr)
{
    info_.name = "";
    info_.version = "";
    info_.description = "";
}

BackendLoader::~BackendLoader() {
    unload();
}

void BackendLoader::set_error(const std::string& error) {
    last_error_ = error;
    LOG_ERROR("[Backend] %s", error.c_str());
}

bool BackendLoader::load(const std::string& path) {
    unload();

    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* err = dlerror();
        set_error("Failed to load " + path + ": " + (err ? err : "unknown error"));
        return false;
    }

    GetBackendInfoFunc info_func = get_symbol<GetBackendInfoFunc>(handle, "pvfworker_backend_info");
    CreateBackendFunc create_func = get_symbol<CreateBackendFunc>(handle, "pvfworker_create_backend");
    DestroyBackendFunc destroy_func = get_symbol<DestroyBackendFunc>(handle, "pvfworker_destroy_backend");
    if (!info_func || !create_func || !destroy_func) {
        set_error("Library " + path + " does not export the backend entry points");
        dlclose(handle);
        return false;
    }

    Preparer* instance = create_func();
    if (!instance) {
        set_error("Backend factory in " + path + " returned null");
        dlclose(handle);
        return false;
    }

    handle_ = handle;
    instance_ = instance;
    destroy_func_ = destroy_func;
    info_ = info_func();
    path_ = path;
    last_error_.clear();

    LOG_INFO("[Backend] Loaded %s v%s from %s", info_.name, info_.version, path.c_str());
    return true;
}

void BackendLoader::unload() {
    if (instance_ && destroy_func_) {
        destroy_func_(instance_);
    }
    instance_ = nullptr;
    destroy_func_ = nullptr;
    if (handle_) {
        dlclose(handle_);
        handle_ = nullptr;
    }
    path_.clear();
}

} // namespace pvfworker
