/**
 * @file TimeState.cpp
 * @brief TimeState implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/engine/TimeState.hpp"

#include <algorithm>

namespace ember::engine {

namespace {

// Absorbs the rounding left by repeated subtraction of a step that is not
// exactly representable (1/60).
constexpr core::f64 kFixedStepTolerance = 1.0e-6;

} // namespace

TimeState::TimeState(core::f64 fixedTimestep) noexcept
    : _fixedTimestep{fixedTimestep > 0.0 ? fixedTimestep : core::kDefaultFixedTimestep}
{
}

void TimeState::update(core::f64 rawDelta) noexcept
{
    const core::f64 clamped = std::clamp(rawDelta, 0.0, core::kMaxFrameDelta);

    _unscaledDelta = clamped;
    _delta         = clamped * _timeScale;
    _accumulator  += _delta;
    _totalTime    += _delta;
    _realTime     += clamped;
    ++_frameCount;

    sampleFps(clamped);
}

bool TimeState::shouldFixedUpdate() const noexcept
{
    return _accumulator + _fixedTimestep * kFixedStepTolerance >= _fixedTimestep;
}

void TimeState::consumeFixedStep() noexcept
{
    _accumulator = std::max(_accumulator - _fixedTimestep, 0.0);
}

void TimeState::setTimeScale(core::f64 scale) noexcept
{
    _timeScale = std::max(scale, 0.0);
}

void TimeState::sampleFps(core::f64 unscaled) noexcept
{
    _samples[_sampleCursor] = unscaled;
    _sampleCursor = (_sampleCursor + 1) % _samples.size();
    _sampleCount  = std::min(_sampleCount + 1, _samples.size());

    _fpsTimer += unscaled;
    if (_fpsTimer < core::kFpsRefreshInterval)
        return;
    _fpsTimer = 0.0;

    core::f64 sum = 0.0;
    for (core::usize i = 0; i < _sampleCount; ++i)
        sum += _samples[i];
    const core::f64 average = sum / static_cast<core::f64>(_sampleCount);
    _fps = average > 0.0 ? 1.0 / average : 0.0;
}

} // namespace ember::engine
