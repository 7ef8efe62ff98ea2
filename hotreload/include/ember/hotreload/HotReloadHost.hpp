/**
 * @file HotReloadHost.hpp
 * @brief Loads a game module, swaps it when rebuilt, keeps its state block.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_HOTRELOAD_HOTRELOADHOST_HPP
    #define EMBER_HOTRELOAD_HOTRELOADHOST_HPP

#include "ember/hotreload/GameModule.hpp"
#include "ember/hotreload/SharedLibrary.hpp"
#include "ember/core/Constants.hpp"
#include "ember/core/Expected.hpp"
#include "ember/core/Log.hpp"
#include "ember/core/NonCopyable.hpp"
#include "ember/core/Types.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>

namespace ember::hotreload {

/**
 * @class HotReloadHost
 * @brief Unloaded → Loaded → Loaded (next generation)* → Unloaded.
 *
 * The module is never opened in place: each load copies it to
 * `<dir>/<stem>_gen<N><ext>` and opens the copy, so the build can
 * overwrite the original while the process runs.
 *
 * The state block is allocated (zeroed) by the first successful load and
 * is handed unchanged to every later generation. Only destroy() frees it.
 *
 * A failed reload leaves the host unloaded: api() returns nullptr and the
 * call helpers return false until a later load() succeeds.
 */
class HotReloadHost final : public core::NonCopyable<HotReloadHost>
{
public:
    HotReloadHost(std::filesystem::path modulePath, core::Logger& logger,
                  core::f64 pollInterval = core::kHotReloadPollInterval);
    ~HotReloadHost();

    /** @brief Copies, opens and resolves the module. */
    [[nodiscard]] core::Expected<void> load();

    /**
     * @brief shutdown(old) → unload → load → on_reload(new).
     * @return The load error when the new module cannot be used.
     */
    [[nodiscard]] core::Expected<void> reload(engine::Engine* engine);

    /**
     * @brief Checks the module's modification time every poll interval.
     * @return True when a reload happened, the reload error if it failed.
     */
    [[nodiscard]] core::Expected<bool> poll(core::f64 dt, engine::Engine* engine);

    /** @brief True when the module on disk differs from the loaded one. */
    [[nodiscard]] bool hasChanged() const;

    /** @brief Unloads, frees the state block and removes the copy. */
    void destroy();

    // ---- entry point helpers (false when unloaded or absent) --------------

    bool callInit(engine::Engine* engine);
    bool callUpdate(engine::Engine* engine, core::f32 dt);
    bool callRender(engine::Engine* engine);
    bool callShutdown(engine::Engine* engine);

    // ---- inspection --------------------------------------------------------

    [[nodiscard]] bool isLoaded() const noexcept { return _library.isOpen(); }

    /** @return The resolved entry points, or nullptr when unloaded. */
    [[nodiscard]] const GameModuleApi* api() const noexcept { return isLoaded() ? &_api : nullptr; }

    [[nodiscard]] void*       state() const noexcept { return _state.get(); }
    [[nodiscard]] core::usize stateSize() const noexcept { return _stateSize; }
    [[nodiscard]] core::u32   generation() const noexcept { return _generation; }

    [[nodiscard]] const std::filesystem::path& modulePath() const noexcept { return _modulePath; }
    [[nodiscard]] const std::filesystem::path& loadedCopyPath() const noexcept { return _copyPath; }

private:
    [[nodiscard]] std::filesystem::path copyPathFor(core::u32 generation) const;
    [[nodiscard]] core::Expected<GameModuleApi> resolve(const SharedLibrary& library) const;
    [[nodiscard]] core::Expected<void> prepareState(const GameModuleApi& api);
    void unload();

    std::filesystem::path           _modulePath;
    core::Logger&                   _logger;
    core::f64                       _pollInterval;
    core::f64                       _pollTimer{0.0};

    SharedLibrary                   _library;
    GameModuleApi                   _api{};
    std::filesystem::path           _copyPath;
    std::filesystem::file_time_type _lastWriteTime{};
    core::u32                       _generation{0};

    std::unique_ptr<std::byte[]>    _state;
    core::usize                     _stateSize{0};
    bool                            _stateReady{false};
};

} // namespace ember::hotreload

#endif // EMBER_HOTRELOAD_HOTRELOADHOST_HPP
