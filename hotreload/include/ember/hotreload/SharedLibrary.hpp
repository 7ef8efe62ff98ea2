/**
 * @file SharedLibrary.hpp
 * @brief RAII handle over the platform dynamic loader.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_HOTRELOAD_SHAREDLIBRARY_HPP
    #define EMBER_HOTRELOAD_SHAREDLIBRARY_HPP

#include "ember/core/Expected.hpp"
#include "ember/core/NonCopyable.hpp"

#include <filesystem>

namespace ember::hotreload {

/**
 * @class SharedLibrary
 * @brief Move-only owner of a dlopen() handle; closes it on destruction.
 */
class SharedLibrary final : public core::NonCopyable<SharedLibrary>
{
public:
    SharedLibrary() noexcept = default;
    ~SharedLibrary();

    SharedLibrary(SharedLibrary&& other) noexcept;
    SharedLibrary& operator=(SharedLibrary&& other) noexcept;

    /**
     * @brief Loads @p path with every symbol resolved immediately.
     * @return kModuleLoadFailed with the loader's diagnostic on failure.
     */
    [[nodiscard]] static core::Expected<SharedLibrary> open(const std::filesystem::path& path);

    /** @return The symbol's address, or nullptr when absent. */
    [[nodiscard]] void* symbol(const char* name) const noexcept;

    template <typename Fn>
    [[nodiscard]] Fn function(const char* name) const noexcept
    {
        return reinterpret_cast<Fn>(symbol(name));
    }

    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return _handle != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return _path; }

private:
    SharedLibrary(void* handle, std::filesystem::path path) noexcept;

    void*                 _handle{nullptr};
    std::filesystem::path _path;
};

} // namespace ember::hotreload

#endif // EMBER_HOTRELOAD_SHAREDLIBRARY_HPP
