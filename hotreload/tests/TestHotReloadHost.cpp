/**
 * @file TestHotReloadHost.cpp
 * @brief Module loading, state persistence across reloads, failure paths.
 *
 * The test modules are built by CMake; their paths arrive as the
 * EMBER_TEST_MODULE_* definitions.
 */

#include <catch2/catch_test_macros.hpp>

#include "RecordingLogger.hpp"
#include "modules/TestGameState.hpp"
#include "ember/core/Platform.hpp"
#include "ember/hotreload/HotReloadHost.hpp"
#include "ember/hotreload/SharedLibrary.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace ember::hotreload {

namespace fs = std::filesystem;
using testing::TestGameState;

namespace {

fs::path makeTempDir()
{
    static int counter = 0;
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() /
                   ("ember_hotreload_" + std::to_string(stamp) + "_" + std::to_string(++counter));
    fs::create_directories(dir);
    return dir;
}

class HotReloadFixture {
protected:
    HotReloadFixture()
        : dir{makeTempDir()}, modulePath{dir / (std::string{"game"} + core::kSharedLibraryExtension)}
    {
    }

    ~HotReloadFixture()
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    /** @brief Puts a freshly built module where the host watches. */
    void install(const char* builtModule)
    {
        fs::copy_file(builtModule, modulePath, fs::copy_options::overwrite_existing);
        // Two quick writes can share a coarse filesystem timestamp.
        ++installs;
        fs::last_write_time(modulePath, fs::last_write_time(modulePath) + std::chrono::seconds{2 * installs});
    }

    static TestGameState& stateOf(const HotReloadHost& host)
    {
        return *static_cast<TestGameState*>(host.state());
    }

    testing::RecordingLogger sink;
    core::Logger             logger{&sink, core::LogLevel::kDebug};
    fs::path                 dir;
    fs::path                 modulePath;
    int                      installs{0};
};

} // namespace

TEST_CASE("SharedLibrary resolves exported symbols", "[hotreload][library]")
{
    auto library = SharedLibrary::open(EMBER_TEST_MODULE_A);
    REQUIRE(library.has_value());
    REQUIRE(library->isOpen());
    REQUIRE(library->symbol("game_init") != nullptr);
    REQUIRE(library->symbol("game_does_not_exist") == nullptr);

    SharedLibrary moved = std::move(*library);
    REQUIRE(moved.isOpen());
    REQUIRE_FALSE(library->isOpen());

    moved.close();
    REQUIRE(moved.symbol("game_init") == nullptr);
}

TEST_CASE("SharedLibrary reports a missing file", "[hotreload][library]")
{
    const auto library = SharedLibrary::open("/nonexistent/libnothing.so");
    REQUIRE_FALSE(library.has_value());
    REQUIRE(library.error().code() == core::ErrorCode::kModuleLoadFailed);
}

TEST_CASE_METHOD(HotReloadFixture, "Loading a module allocates a zeroed state block", "[hotreload]")
{
    install(EMBER_TEST_MODULE_A);
    HotReloadHost host{modulePath, logger};

    REQUIRE_FALSE(host.isLoaded());
    REQUIRE(host.api() == nullptr);

    REQUIRE(host.load().has_value());
    REQUIRE(host.isLoaded());
    REQUIRE(host.generation() == 1);
    REQUIRE(host.api() != nullptr);
    REQUIRE(host.api()->render.has_value());
    REQUIRE(host.api()->shutdown.has_value());
    REQUIRE_FALSE(host.api()->onReload.has_value());

    REQUIRE(host.stateSize() == sizeof(TestGameState));
    REQUIRE(host.state() != nullptr);
    REQUIRE(stateOf(host).sentinel == 0);
    REQUIRE(stateOf(host).updateCalls == 0);

    REQUIRE(host.loadedCopyPath().filename() == std::string{"game_gen1"} + core::kSharedLibraryExtension);
    REQUIRE(fs::exists(host.loadedCopyPath()));
    REQUIRE(fs::exists(modulePath));

    REQUIRE(host.callInit(nullptr));
    REQUIRE(host.callUpdate(nullptr, 0.5f));
    REQUIRE(host.callRender(nullptr));
    REQUIRE(stateOf(host).initCalls == 1);
    REQUIRE(stateOf(host).updateCalls == 1);
    REQUIRE(stateOf(host).renderCalls == 1);
    REQUIRE(stateOf(host).moduleTag == testing::kModuleATag);

    REQUIRE_FALSE(host.load().has_value());
}

TEST_CASE_METHOD(HotReloadFixture, "Loading fails when the module file is absent", "[hotreload]")
{
    HotReloadHost host{modulePath, logger};

    const auto result = host.load();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kNotFound);
    REQUIRE(host.api() == nullptr);
    REQUIRE(host.generation() == 0);
}

TEST_CASE_METHOD(HotReloadFixture, "Loading fails without game_update", "[hotreload]")
{
    install(EMBER_TEST_MODULE_MISSING_UPDATE);
    HotReloadHost host{modulePath, logger};

    const auto result = host.load();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kSymbolMissing);
    REQUIRE(sink.contains(core::LogLevel::kError, "game_update"));

    REQUIRE_FALSE(host.isLoaded());
    REQUIRE(host.api() == nullptr);
    REQUIRE(host.state() == nullptr);
    REQUIRE_FALSE(host.callInit(nullptr));
    REQUIRE_FALSE(fs::exists(dir / (std::string{"game_gen1"} + core::kSharedLibraryExtension)));
}

TEST_CASE_METHOD(HotReloadFixture, "Reload keeps the state block byte for byte", "[hotreload]")
{
    install(EMBER_TEST_MODULE_A);
    HotReloadHost host{modulePath, logger};
    REQUIRE(host.load().has_value());
    REQUIRE(host.callInit(nullptr));

    stateOf(host).sentinel = 0xDEADBEEF;
    REQUIRE(host.callUpdate(nullptr, 0.25f));
    REQUIRE(host.callUpdate(nullptr, 0.25f));

    void* const blockBefore = host.state();
    const fs::path firstCopy = host.loadedCopyPath();

    install(EMBER_TEST_MODULE_B);
    REQUIRE(host.hasChanged());
    REQUIRE(host.reload(nullptr).has_value());

    REQUIRE(host.isLoaded());
    REQUIRE(host.generation() == 2);
    REQUIRE(host.state() == blockBefore);
    REQUIRE_FALSE(host.hasChanged());

    const TestGameState& state = stateOf(host);
    REQUIRE(state.sentinel == 0xDEADBEEF);
    REQUIRE(state.updateCalls == 2);
    REQUIRE(state.elapsed == 0.5f);
    REQUIRE(state.initCalls == 1);
    REQUIRE(state.shutdownCalls == 1);
    REQUIRE(state.reloadCalls == 1);

    REQUIRE_FALSE(fs::exists(firstCopy));
    REQUIRE(fs::exists(host.loadedCopyPath()));

    REQUIRE(host.callUpdate(nullptr, 0.25f));
    REQUIRE(stateOf(host).moduleTag == testing::kModuleBTag);

    SECTION("absent optional entry points are skipped")
    {
        REQUIRE_FALSE(host.api()->render.has_value());
        REQUIRE_FALSE(host.callRender(nullptr));
        REQUIRE(stateOf(host).renderCalls == 0);
    }
}

TEST_CASE_METHOD(HotReloadFixture, "A failed reload leaves the host unloaded", "[hotreload]")
{
    install(EMBER_TEST_MODULE_A);
    HotReloadHost host{modulePath, logger};
    REQUIRE(host.load().has_value());
    stateOf(host).sentinel = 42;

    install(EMBER_TEST_MODULE_MISSING_UPDATE);
    const auto result = host.reload(nullptr);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kSymbolMissing);
    REQUIRE_FALSE(host.isLoaded());
    REQUIRE(host.api() == nullptr);
    REQUIRE_FALSE(host.callUpdate(nullptr, 0.1f));
    REQUIRE(sink.contains(core::LogLevel::kError, "reload failed"));

    REQUIRE(host.state() != nullptr);
    REQUIRE(stateOf(host).sentinel == 42);
    REQUIRE(stateOf(host).shutdownCalls == 1);

    SECTION("a later load picks the block up again")
    {
        install(EMBER_TEST_MODULE_B);
        REQUIRE(host.load().has_value());
        REQUIRE(stateOf(host).sentinel == 42);
        REQUIRE(host.generation() == 2);
    }
}

TEST_CASE_METHOD(HotReloadFixture, "poll reloads on the next interval after a change", "[hotreload]")
{
    install(EMBER_TEST_MODULE_A);
    HotReloadHost host{modulePath, logger, 0.5};
    REQUIRE(host.load().has_value());

    auto polled = host.poll(1.0, nullptr);
    REQUIRE(polled.has_value());
    REQUIRE_FALSE(*polled);

    install(EMBER_TEST_MODULE_B);

    polled = host.poll(0.2, nullptr);
    REQUIRE(polled.has_value());
    REQUIRE_FALSE(*polled);
    REQUIRE(host.generation() == 1);

    polled = host.poll(0.4, nullptr);
    REQUIRE(polled.has_value());
    REQUIRE(*polled);
    REQUIRE(host.generation() == 2);
    REQUIRE(stateOf(host).reloadCalls == 1);

    SECTION("a broken rebuild surfaces as an error")
    {
        install(EMBER_TEST_MODULE_MISSING_UPDATE);
        polled = host.poll(0.5, nullptr);
        REQUIRE_FALSE(polled.has_value());
        REQUIRE_FALSE(host.isLoaded());

        polled = host.poll(0.5, nullptr);
        REQUIRE(polled.has_value());
        REQUIRE_FALSE(*polled);
    }
}

TEST_CASE_METHOD(HotReloadFixture, "A smaller state size on reload keeps the block", "[hotreload]")
{
    install(EMBER_TEST_MODULE_A);
    HotReloadHost host{modulePath, logger};
    REQUIRE(host.load().has_value());
    void* const block = host.state();

    install(EMBER_TEST_MODULE_SHRUNK);
    REQUIRE(host.reload(nullptr).has_value());

    REQUIRE(host.isLoaded());
    REQUIRE(host.state() == block);
    REQUIRE(host.stateSize() == sizeof(TestGameState));
    REQUIRE(sink.contains(core::LogLevel::kWarn, "keeping the existing"));
}

TEST_CASE_METHOD(HotReloadFixture, "A larger state size on reload is refused", "[hotreload]")
{
    install(EMBER_TEST_MODULE_A);
    HotReloadHost host{modulePath, logger};
    REQUIRE(host.load().has_value());
    void* const block = host.state();
    stateOf(host).sentinel = 7;

    install(EMBER_TEST_MODULE_RESIZED);
    const auto result = host.reload(nullptr);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE_FALSE(host.isLoaded());
    REQUIRE(host.api() == nullptr);
    REQUIRE(host.loadedCopyPath().empty());
    REQUIRE_FALSE(fs::exists(modulePath.parent_path() / (modulePath.stem().string() + "_gen2" +
                                                           modulePath.extension().string())));

    REQUIRE(host.state() == block);
    REQUIRE(host.stateSize() == sizeof(TestGameState));
    REQUIRE(stateOf(host).sentinel == 7);

    SECTION("a module that fits loads again")
    {
        install(EMBER_TEST_MODULE_B);
        REQUIRE(host.load().has_value());
        REQUIRE(host.state() == block);
    }
}

TEST_CASE_METHOD(HotReloadFixture, "destroy unloads and frees everything", "[hotreload]")
{
    install(EMBER_TEST_MODULE_A);
    HotReloadHost host{modulePath, logger};
    REQUIRE(host.load().has_value());
    const fs::path copy = host.loadedCopyPath();

    host.destroy();

    REQUIRE_FALSE(host.isLoaded());
    REQUIRE(host.state() == nullptr);
    REQUIRE(host.stateSize() == 0);
    REQUIRE_FALSE(fs::exists(copy));

    const auto result = host.reload(nullptr);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidState);
}

} // namespace ember::hotreload
