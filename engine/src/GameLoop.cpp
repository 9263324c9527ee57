/**
 * @file GameLoop.cpp
 * @brief GameLoop implementation: fixed time-step with accumulator.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/engine/GameLoop.hpp>
#include <tks/core/Assert.hpp>
#include <tks/core/Log.hpp>
#include <chrono>
#include <format>

namespace tks::engine {

GameLoop::GameLoop(const Config& config)
    : _fixedDt{config.fixedDeltaTime()}
{
    TKS_VERIFY(config.tickRate() > 0);
}

GameLoop::~GameLoop() = default;

core::f64 GameLoop::advance(core::f64 frameTime, const LoopCallbacks& callbacks)
{
    TKS_ASSERT(callbacks.fixedUpdate);

    if (frameTime > kMaxFrameTime)
    {
        _dropped += frameTime - kMaxFrameTime;
        core::Log::warn("LOOP", std::format("frame of {:.3f}s clamped at tick {}", frameTime, _tickCount));
        frameTime = kMaxFrameTime;
    }

    if (callbacks.preFrame)
    {
        callbacks.preFrame(time() + _accumulator + frameTime);
    }

    _accumulator += frameTime;

    while (_accumulator >= _fixedDt)
    {
        ++_tickCount;
        _accumulator -= _fixedDt;
        callbacks.fixedUpdate(_fixedDt, time());
    }

    const core::f64 alpha = _accumulator / _fixedDt;

    if (callbacks.render)
    {
        callbacks.render(alpha);
    }

    if (callbacks.postFrame)
    {
        callbacks.postFrame();
    }

    return alpha;
}

void GameLoop::run(const LoopCallbacks& callbacks)
{
    _running = true;

    using Clock = std::chrono::steady_clock;
    auto previous = Clock::now();

    while (_running)
    {
        const auto current = Clock::now();
        const core::f64 frameTime = std::chrono::duration<core::f64>(current - previous).count();
        previous = current;

        advance(frameTime, callbacks);
    }

    core::Log::info("LOOP", std::format("stopped after {} ticks", _tickCount));
}

void GameLoop::requestStop() noexcept
{
    _running = false;
}

bool GameLoop::isRunning() const noexcept
{
    return _running;
}

core::u64 GameLoop::tickCount() const noexcept
{
    return _tickCount;
}

core::f64 GameLoop::time() const noexcept
{
    return static_cast<core::f64>(_tickCount) * _fixedDt;
}

core::f64 GameLoop::droppedTime() const noexcept
{
    return _dropped;
}

} // namespace tks::engine
