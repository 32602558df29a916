/*
 * Small dl helper to centralize dlsym casting
 */
#ifndef pvfworker_CORE_DL_UTILS_HPP
#define pvfworker_CORE_DL_UTILS_HPP

#include <dlfcn.h>

namespace pvfworker {

template<typename T>
inline T get_symbol(void* handle, const char* name) {
    dlerror(); // clear
    void* sym = dlsym(handle, name);
    const char* err = dlerror();
    if (err || !sym) return nullptr;
    return reinterpret_cast<T>(sym);
}

} // namespace pvfworker

#endif // pvfworker_CORE_DL_UTILS_HPP
