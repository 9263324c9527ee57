/**
 * @file PredictionController.hpp
 * @brief Client-side prediction activation state of one property.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_PREDICTION_CONTROLLER_HPP
    #define TKS_SYNC_PREDICTION_CONTROLLER_HPP

#include <tks/core/Types.hpp>

#include <optional>

namespace tks::sync {

/**
 * @enum PredictionState
 * @brief Activation states of client-side prediction.
 */
enum class PredictionState : core::u8
{
    ServerConfirmedOff = 0, ///< Display follows interpolated server state.
    ForcedOn,               ///< A local write happened; predict until the server consumed it.
    ServerConfirmedOn,      ///< The server marks the entity as predicted by this client.
    SmoothingOff            ///< Leaving prediction; display slides back to the interpolated state.
};

[[nodiscard]] const char *toString(PredictionState state) noexcept;

/**
 * @class PredictionController
 * @brief Drives the prediction state machine of a client property.
 *
 * A local write while the server has not confirmed prediction forces it
 * on until the server reports having consumed the input of that write.
 * Leaving prediction is never instantaneous: the display weight ramps
 * from 1 to 0 over a window sized from the measured round trip.
 */
class PredictionController final
{
public:
    /**
     * @brief Record a write made by local game logic during @p inputId.
     */
    void onLocalWrite(core::InputId inputId) noexcept;

    /**
     * @brief Feed the flags of a server frame for this entity.
     * @param confirmed      The frame carries the Predicted flag.
     * @param consumed       Last input id the server consumed for us, if any.
     * @param smoothingTicks Length of the exit ramp.
     * @return true when prediction just ended and the caller must roll
     *         the history back to the frame tick.
     */
    bool onServerFrame(bool confirmed, std::optional<core::InputId> consumed, core::u32 smoothingTicks) noexcept;

    /** @brief Advance the exit ramp by one step. */
    void step() noexcept;

    /** @brief Whether server frames must be reconciled instead of written. */
    [[nodiscard]] bool active() const noexcept;

    /**
     * @brief Display weight of the predicted state: 1 while active, 0 when
     *        off, decreasing while smoothing.
     */
    [[nodiscard]] core::f64 weight() const noexcept;

    [[nodiscard]] PredictionState state() const noexcept { return _state; }
    [[nodiscard]] core::InputId forcedUntil() const noexcept { return _forcedUntil; }

private:
    void exit(core::u32 smoothingTicks) noexcept;

    PredictionState _state{PredictionState::ServerConfirmedOff};
    core::InputId   _forcedUntil{core::kNoInputId};
    core::u32       _smoothingTotal{0};
    core::u32       _smoothingLeft{0};
};

} // namespace tks::sync

#endif // TKS_SYNC_PREDICTION_CONTROLLER_HPP
