/**
 * @file SharedLibrary.cpp
 * @brief dlopen/dlsym/dlclose wrapper.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/hotreload/SharedLibrary.hpp"

#include <dlfcn.h>

#include <string>
#include <utility>

namespace ember::hotreload {

SharedLibrary::SharedLibrary(void* handle, std::filesystem::path path) noexcept
    : _handle{handle}, _path{std::move(path)}
{
}

SharedLibrary::~SharedLibrary()
{
    close();
}

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept
    : _handle{std::exchange(other._handle, nullptr)}, _path{std::move(other._path)}
{
}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept
{
    if (this != &other)
    {
        close();
        _handle = std::exchange(other._handle, nullptr);
        _path   = std::move(other._path);
    }
    return *this;
}

core::Expected<SharedLibrary> SharedLibrary::open(const std::filesystem::path& path)
{
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle)
    {
        const char* reason = dlerror();
        return core::makeError(core::ErrorCode::kModuleLoadFailed,
                               "dlopen '" + path.string() + "' failed: " + (reason ? reason : "unknown error"));
    }
    return SharedLibrary{handle, path};
}

void* SharedLibrary::symbol(const char* name) const noexcept
{
    if (!_handle)
        return nullptr;
    return dlsym(_handle, name);
}

void SharedLibrary::close() noexcept
{
    if (_handle)
    {
        dlclose(_handle);
        _handle = nullptr;
    }
}

} // namespace ember::hotreload
