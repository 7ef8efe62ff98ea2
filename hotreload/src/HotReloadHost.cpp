/**
 * @file HotReloadHost.cpp
 * @brief Module copy/load/resolve, change polling and reload.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/hotreload/HotReloadHost.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace ember::hotreload {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTag = "HotReload";

} // namespace

HotReloadHost::HotReloadHost(fs::path modulePath, core::Logger& logger, core::f64 pollInterval)
    : _modulePath{std::move(modulePath)}, _logger{logger}, _pollInterval{pollInterval}
{
}

HotReloadHost::~HotReloadHost()
{
    destroy();
}

// ========================================================================== //
//  Load / unload                                                             //
// ========================================================================== //

fs::path HotReloadHost::copyPathFor(core::u32 generation) const
{
    fs::path copy = _modulePath.parent_path();
    copy /= _modulePath.stem().string() + "_gen" + std::to_string(generation) + _modulePath.extension().string();
    return copy;
}

core::Expected<GameModuleApi> HotReloadHost::resolve(const SharedLibrary& library) const
{
    GameModuleApi api;
    api.init   = library.function<GameInitFn>(kGameInitSymbol);
    api.update = library.function<GameUpdateFn>(kGameUpdateSymbol);

    if (!api.init || !api.update)
    {
        std::string missing;
        if (!api.init)
            missing += kGameInitSymbol;
        if (!api.update)
            missing += missing.empty() ? kGameUpdateSymbol : std::string{", "} + kGameUpdateSymbol;
        return core::makeError(core::ErrorCode::kSymbolMissing,
                               "module '" + _modulePath.string() + "' does not export " + missing);
    }

    if (auto fn = library.function<GameStateSizeFn>(kGameStateSizeSymbol))
        api.stateSize = fn;
    if (auto fn = library.function<GameRenderFn>(kGameRenderSymbol))
        api.render = fn;
    if (auto fn = library.function<GameShutdownFn>(kGameShutdownSymbol))
        api.shutdown = fn;
    if (auto fn = library.function<GameOnReloadFn>(kGameOnReloadSymbol))
        api.onReload = fn;
    return api;
}

core::Expected<void> HotReloadHost::prepareState(const GameModuleApi& api)
{
    const core::usize requested = api.stateSize ? (*api.stateSize)() : 0;

    if (!_stateReady)
    {
        if (requested > 0)
            _state = std::make_unique<std::byte[]>(requested);
        _stateSize  = requested;
        _stateReady = true;
        return {};
    }

    // The block is never reallocated, so a module needing more cannot run.
    if (requested > _stateSize)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "module needs a " + std::to_string(requested) + " byte state but the block holds " +
                                   std::to_string(_stateSize));
    }

    if (requested < _stateSize)
    {
        _logger.warn(kTag, "module now reports a {} byte state, keeping the existing {} byte block", requested,
                     _stateSize);
    }
    return {};
}

core::Expected<void> HotReloadHost::load()
{
    if (isLoaded())
        return core::makeError(core::ErrorCode::kInvalidState, "a module is already loaded");

    std::error_code ec;
    const fs::file_time_type writeTime = fs::last_write_time(_modulePath, ec);
    if (ec)
    {
        _logger.error(kTag, "cannot stat '{}': {}", _modulePath.string(), ec.message());
        return core::makeError(core::ErrorCode::kNotFound, "module '" + _modulePath.string() + "' not found");
    }

    const core::u32 next = _generation + 1;
    const fs::path  copy = copyPathFor(next);
    if (!fs::copy_file(_modulePath, copy, fs::copy_options::overwrite_existing, ec))
    {
        _logger.error(kTag, "cannot copy '{}' to '{}': {}", _modulePath.string(), copy.string(), ec.message());
        return core::makeError(core::ErrorCode::kIoError, "copy of '" + _modulePath.string() + "' failed");
    }

    auto library = SharedLibrary::open(copy);
    if (!library)
    {
        _logger.error(kTag, "{}", library.error().message());
        fs::remove(copy, ec);
        return std::unexpected(std::move(library.error()));
    }

    auto api = resolve(*library);
    if (!api)
    {
        _logger.error(kTag, "{}", api.error().message());
        library->close();
        fs::remove(copy, ec);
        return std::unexpected(std::move(api.error()));
    }

    if (auto prepared = prepareState(*api); !prepared)
    {
        _logger.error(kTag, "{}", prepared.error().message());
        library->close();
        fs::remove(copy, ec);
        return prepared;
    }

    _library       = std::move(*library);
    _api           = *api;
    _copyPath      = copy;
    _lastWriteTime = writeTime;
    _generation    = next;

    _logger.info(kTag, "loaded '{}' (generation {}, {} byte state)", _modulePath.filename().string(), _generation,
                 _stateSize);
    return {};
}

void HotReloadHost::unload()
{
    if (!isLoaded())
        return;

    _library.close();
    _api = GameModuleApi{};

    std::error_code ec;
    if (!_copyPath.empty() && !fs::remove(_copyPath, ec) && ec)
        _logger.warn(kTag, "cannot remove '{}': {}", _copyPath.string(), ec.message());
    _copyPath.clear();
}

void HotReloadHost::destroy()
{
    unload();
    _state.reset();
    _stateSize  = 0;
    _stateReady = false;
}

// ========================================================================== //
//  Reload                                                                    //
// ========================================================================== //

core::Expected<void> HotReloadHost::reload(engine::Engine* engine)
{
    if (!isLoaded())
        return core::makeError(core::ErrorCode::kInvalidState, "no module to reload");

    _logger.info(kTag, "reloading '{}'", _modulePath.filename().string());

    callShutdown(engine);
    unload();

    if (auto res = load(); !res)
    {
        _logger.error(kTag, "reload failed, host left unloaded");
        return res;
    }

    if (_api.onReload)
        (*_api.onReload)(_state.get(), engine);
    return {};
}

bool HotReloadHost::hasChanged() const
{
    std::error_code ec;
    const fs::file_time_type writeTime = fs::last_write_time(_modulePath, ec);
    // A module being rewritten may briefly not exist.
    if (ec)
        return false;
    return writeTime != _lastWriteTime;
}

core::Expected<bool> HotReloadHost::poll(core::f64 dt, engine::Engine* engine)
{
    if (!isLoaded())
        return false;

    _pollTimer += dt;
    if (_pollTimer < _pollInterval)
        return false;
    _pollTimer = 0.0;

    if (!hasChanged())
        return false;

    EMBER_TRY_VOID(reload(engine));
    return true;
}

// ========================================================================== //
//  Entry point helpers                                                       //
// ========================================================================== //

bool HotReloadHost::callInit(engine::Engine* engine)
{
    if (!isLoaded())
        return false;
    _api.init(_state.get(), engine);
    return true;
}

bool HotReloadHost::callUpdate(engine::Engine* engine, core::f32 dt)
{
    if (!isLoaded())
        return false;
    _api.update(_state.get(), engine, dt);
    return true;
}

bool HotReloadHost::callRender(engine::Engine* engine)
{
    if (!isLoaded() || !_api.render)
        return false;
    (*_api.render)(_state.get(), engine);
    return true;
}

bool HotReloadHost::callShutdown(engine::Engine* engine)
{
    if (!isLoaded() || !_api.shutdown)
        return false;
    (*_api.shutdown)(_state.get(), engine);
    return true;
}

} // namespace ember::hotreload
