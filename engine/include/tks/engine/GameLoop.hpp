/**
 * @file GameLoop.hpp
 * @brief Fixed-step accumulator that paces SyncWorld steps and feeds the
 *        render alpha to the clock.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_ENGINE_GAMELOOP_HPP
    #define TKS_ENGINE_GAMELOOP_HPP

#include <tks/engine/Config.hpp>
#include <tks/core/NonCopyable.hpp>
#include <tks/core/Types.hpp>
#include <functional>

namespace tks::engine {

/** @brief Hooks run by one frame, in the order preFrame, fixedUpdate x N, render, postFrame. */
struct LoopCallbacks
{
    /** @brief Frame start; @p now is the time the frame advances to. Pump transports here. */
    std::function<void(core::f64 now)> preFrame;

    /** @brief One fixed tick; @p now is the simulated time at the end of that tick. Required. */
    std::function<void(core::f64 dt, core::f64 now)> fixedUpdate;

    /** @brief Fraction of the next tick already elapsed, in [0, 1). */
    std::function<void(core::f64 alpha)> render;

    std::function<void()> postFrame;
};

/**
 * @brief Fixed time-step game loop.
 *
 * Frames longer than kMaxFrameTime are clamped; the time lost that way
 * is accumulated in droppedTime() and reported under the "LOOP" tag.
 * A client whose loop stalls catches up through ClockSequencer snaps,
 * not through a burst of ticks.
 */
class GameLoop final : public core::NonCopyable<GameLoop>
{
public:
    static constexpr core::f64 kMaxFrameTime = 0.25;

    explicit GameLoop(const Config& config);
    ~GameLoop();

    /** @brief Drive advance() from the steady clock until requestStop(). */
    void run(const LoopCallbacks& callbacks);

    /**
     * @brief Run a single frame of @p frameTime seconds.
     * @return The render alpha of the frame.
     */
    core::f64 advance(core::f64 frameTime, const LoopCallbacks& callbacks);

    void requestStop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] core::u64 tickCount() const noexcept;

    /** @brief Simulated time consumed by fixed ticks, in seconds. */
    [[nodiscard]] core::f64 time() const noexcept;

    /** @brief Wall time discarded by frame clamping, in seconds. */
    [[nodiscard]] core::f64 droppedTime() const noexcept;

private:
    core::f64 _fixedDt;
    core::f64 _accumulator{0.0};
    core::f64 _dropped{0.0};
    bool _running{false};
    core::u64 _tickCount{0};
};

} // namespace tks::engine

#endif // TKS_ENGINE_GAMELOOP_HPP
