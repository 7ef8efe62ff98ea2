/**
 * @file TimeState.hpp
 * @brief Frame clock: clamped scaled delta, fixed-step accumulator and FPS.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_ENGINE_TIMESTATE_HPP
    #define EMBER_ENGINE_TIMESTATE_HPP

#include "ember/core/Constants.hpp"
#include "ember/core/Types.hpp"

#include <array>

namespace ember::engine {

/**
 * @class TimeState
 * @brief Turns raw frame deltas into variable and fixed-rate time.
 *
 * The raw delta is clamped to core::kMaxFrameDelta before anything else.
 * The scaled delta feeds the accumulator, which the caller drains with
 * @code
 *   while (time.shouldFixedUpdate()) { runFixed(); time.consumeFixedStep(); }
 * @endcode
 * A time scale of zero stops scaled time and fixed steps; realTime() and
 * the FPS counter keep running.
 */
class TimeState
{
public:
    explicit TimeState(core::f64 fixedTimestep = core::kDefaultFixedTimestep) noexcept;

    /** @brief Advances the clock by one frame of @p rawDelta seconds. */
    void update(core::f64 rawDelta) noexcept;

    [[nodiscard]] bool shouldFixedUpdate() const noexcept;
    void consumeFixedStep() noexcept;

    /** @brief accumulator / fixedTimestep, for render-side interpolation. */
    [[nodiscard]] core::f64 interpolationAlpha() const noexcept { return _accumulator / _fixedTimestep; }

    /** @brief Negative scales are clamped to zero. */
    void setTimeScale(core::f64 scale) noexcept;

    [[nodiscard]] core::f64 delta()         const noexcept { return _delta; }
    [[nodiscard]] core::f64 unscaledDelta() const noexcept { return _unscaledDelta; }
    [[nodiscard]] core::f64 timeScale()     const noexcept { return _timeScale; }
    [[nodiscard]] core::f64 fixedTimestep() const noexcept { return _fixedTimestep; }
    [[nodiscard]] core::f64 accumulator()   const noexcept { return _accumulator; }
    [[nodiscard]] core::f64 totalTime()     const noexcept { return _totalTime; }
    [[nodiscard]] core::f64 realTime()      const noexcept { return _realTime; }
    [[nodiscard]] core::u64 frameCount()    const noexcept { return _frameCount; }
    [[nodiscard]] core::f64 fps()           const noexcept { return _fps; }

private:
    void sampleFps(core::f64 unscaled) noexcept;

    core::f64 _fixedTimestep;
    core::f64 _delta{0.0};
    core::f64 _unscaledDelta{0.0};
    core::f64 _timeScale{1.0};
    core::f64 _accumulator{0.0};
    core::f64 _totalTime{0.0};
    core::f64 _realTime{0.0};
    core::u64 _frameCount{0};

    std::array<core::f64, core::kFpsSampleCount> _samples{};
    core::usize _sampleCursor{0};
    core::usize _sampleCount{0};
    core::f64   _fpsTimer{0.0};
    core::f64   _fps{0.0};
};

} // namespace ember::engine

#endif // EMBER_ENGINE_TIMESTATE_HPP
