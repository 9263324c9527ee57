/**
 * @file ClockSequencer.hpp
 * @brief Tick / input id sequencing shared by one session.
 *
 * The server tick is ground truth and advances by exactly one per step.
 * A client keeps an estimate of the server's present tick: nominally one
 * per step, nudged by at most one extra tick per step toward a target
 * derived from the server reports, snapped only on a large desync.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_CLOCK_SEQUENCER_HPP
    #define TKS_SYNC_CLOCK_SEQUENCER_HPP

#include <tks/sync/TickRateEstimator.hpp>
#include <tks/engine/Config.hpp>
#include <tks/math/Vec3.hpp>
#include <tks/core/NonCopyable.hpp>
#include <tks/core/Types.hpp>

#include <optional>
#include <span>
#include <vector>

namespace tks::sync {

enum class ClockRole : core::u8
{
    Server = 0,
    Client
};

/**
 * @struct PeerPresence
 * @brief Where a peer's own entity stands and how far behind that peer sees the world.
 */
struct PeerPresence
{
    core::PeerId peer{core::kLocalPeer};
    math::Vec3f  position;
    core::f64    latencyTicks{0.0};
};

/**
 * @struct TimeDepth
 * @brief Result of ClockSequencer::timeDepth().
 */
struct TimeDepth
{
    core::f64    ticks{0.0};
    core::PeerId closest{core::kBroadcastPeer}; ///< Peer the depth belongs to; broadcast when none.
};

class ClockSequencer final : public core::NonCopyable<ClockSequencer>
{
public:
    ClockSequencer(ClockRole role, const engine::Config &config);

    /**
     * @brief Advance one fixed step.
     * @param now Local time in seconds, used by the rate estimator.
     */
    void step(core::f64 now);

    /**
     * @brief Record a tick reported by the server (client only).
     *
     * Older or repeated reports are ignored.  The first report snaps
     * the local tick onto it.
     */
    void onServerTick(core::Tick serverTick, core::f64 now);

    /** @brief Set the render interpolation fraction in [0, 1). */
    void setFraction(core::f64 alpha) noexcept;

    [[nodiscard]] ClockRole     role()           const noexcept { return _role; }
    [[nodiscard]] core::Tick    tick()           const noexcept { return _tick; }
    [[nodiscard]] core::InputId inputId()        const noexcept { return _inputId; }
    [[nodiscard]] core::f64     fraction()       const noexcept { return _fraction; }
    [[nodiscard]] core::Tick    lastServerTick() const noexcept { return _lastServerTick; }
    [[nodiscard]] core::u32     snapCount()      const noexcept { return _snaps; }

    /** @brief Whether a server tick has ever been received. */
    [[nodiscard]] bool synchronized() const noexcept { return _lastServerTick != core::kNoTick; }

    /** @brief No server report for longer than two send intervals. */
    [[nodiscard]] bool offline() const noexcept;

    /** @brief tick() + fraction(). */
    [[nodiscard]] core::f64 fractionalTick() const noexcept;

    /**
     * @brief Tick at which remote state is displayed.
     *
     * fractionalTick() - interpolationLag on a client, fractionalTick()
     * on the server.
     */
    [[nodiscard]] core::f64 renderTick() const noexcept;

    /** @brief Local tick at which @p id was sampled, while still in the lookback window. */
    [[nodiscard]] std::optional<core::Tick> tickForInput(core::InputId id) const;

    [[nodiscard]] const TickRateEstimator &rateEstimator() const noexcept { return _estimator; }

    /**
     * @brief Lag-compensation depth at @p point.
     *
     * Only the two peers nearest to @p point count.  The depth is the
     * closest peer's latency at that peer's own position and falls to 0
     * at the midpoint between the two, following the squared-distance
     * ratio.  Fewer than two peers, or both at @p point, give 0.
     */
    [[nodiscard]] static TimeDepth timeDepth(const math::Vec3f &point, std::span<const PeerPresence> peers);

private:
    void correct(core::f64 now);
    void remember(core::InputId id, core::Tick tick);

    struct LookbackEntry
    {
        core::InputId id{core::kNoInputId};
        core::Tick    tick{core::kNoTick};
    };

    ClockRole                  _role;
    core::u32                  _interpolationLag;
    core::u32                  _maxOfflineExtrapolation;
    core::u32                  _offlineSteps;
    core::Tick                 _tick{0};
    core::InputId              _inputId{0};
    core::f64                  _fraction{0.0};
    core::Tick                 _lastServerTick{core::kNoTick};
    core::u32                  _stepsSinceReport{0};
    core::u32                  _snaps{0};
    TickRateEstimator          _estimator;
    std::vector<LookbackEntry> _lookback;
};

} // namespace tks::sync

#endif // TKS_SYNC_CLOCK_SEQUENCER_HPP
