/**
 * @file PredictionController.cpp
 * @brief PredictionController implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/sync/PredictionController.hpp>

#include <algorithm>

namespace tks::sync {

const char *toString(PredictionState state) noexcept
{
    switch (state)
    {
        case PredictionState::ServerConfirmedOff: return "server-confirmed-off";
        case PredictionState::ForcedOn:           return "forced-on";
        case PredictionState::ServerConfirmedOn:  return "server-confirmed-on";
        case PredictionState::SmoothingOff:       return "smoothing-off";
    }
    return "unknown";
}

void PredictionController::onLocalWrite(core::InputId inputId) noexcept
{
    if (_state == PredictionState::ServerConfirmedOn)
    {
        return;
    }
    _state = PredictionState::ForcedOn;
    _forcedUntil = std::max(_forcedUntil, inputId);
}

bool PredictionController::onServerFrame(bool confirmed,
                                         std::optional<core::InputId> consumed,
                                         core::u32 smoothingTicks) noexcept
{
    if (confirmed)
    {
        _state = PredictionState::ServerConfirmedOn;
        return false;
    }

    switch (_state)
    {
        case PredictionState::ServerConfirmedOn:
            exit(smoothingTicks);
            return true;
        case PredictionState::ForcedOn:
            if (consumed && *consumed >= _forcedUntil)
            {
                exit(smoothingTicks);
                return true;
            }
            return false;
        case PredictionState::ServerConfirmedOff:
        case PredictionState::SmoothingOff:
            return false;
    }
    return false;
}

void PredictionController::exit(core::u32 smoothingTicks) noexcept
{
    _state = PredictionState::SmoothingOff;
    _smoothingTotal = std::max<core::u32>(1, smoothingTicks);
    _smoothingLeft = _smoothingTotal;
}

void PredictionController::step() noexcept
{
    if (_state != PredictionState::SmoothingOff)
    {
        return;
    }
    if (_smoothingLeft > 0)
    {
        --_smoothingLeft;
    }
    if (_smoothingLeft == 0)
    {
        _state = PredictionState::ServerConfirmedOff;
    }
}

bool PredictionController::active() const noexcept
{
    return _state == PredictionState::ForcedOn || _state == PredictionState::ServerConfirmedOn;
}

core::f64 PredictionController::weight() const noexcept
{
    switch (_state)
    {
        case PredictionState::ForcedOn:
        case PredictionState::ServerConfirmedOn:
            return 1.0;
        case PredictionState::SmoothingOff:
            return static_cast<core::f64>(_smoothingLeft) / static_cast<core::f64>(_smoothingTotal);
        case PredictionState::ServerConfirmedOff:
            return 0.0;
    }
    return 0.0;
}

} // namespace tks::sync
