/**
 * @file Config.cpp
 * @brief Config::Builder implementation and consistency checks.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/engine/Config.hpp>

#include <format>

namespace tks::engine {

Config::Builder& Config::Builder::tickRate(core::u32 hz) noexcept
{
    _tickRate = hz;
    return *this;
}

Config::Builder& Config::Builder::serverMode(bool enabled) noexcept
{
    _serverMode = enabled;
    return *this;
}

Config::Builder& Config::Builder::historyCapacity(core::u32 ticks) noexcept
{
    _historyCapacity = ticks;
    return *this;
}

Config::Builder& Config::Builder::interpolationLag(core::u32 ticks) noexcept
{
    _interpolationLag = ticks;
    return *this;
}

Config::Builder& Config::Builder::serverSendRate(core::u32 hz) noexcept
{
    _serverSendRate = hz;
    return *this;
}

Config::Builder& Config::Builder::inputSendRate(core::u32 hz) noexcept
{
    _inputSendRate = hz;
    return *this;
}

Config::Builder& Config::Builder::inputBatchSize(core::u32 frames) noexcept
{
    _inputBatchSize = frames;
    return *this;
}

Config::Builder& Config::Builder::inputHistory(core::u32 frames) noexcept
{
    _inputHistory = frames;
    return *this;
}

Config::Builder& Config::Builder::maxExtrapolation(core::u32 ticks) noexcept
{
    _maxExtrapolation = ticks;
    return *this;
}

Config::Builder& Config::Builder::maxOfflineExtrapolation(core::u32 ticks) noexcept
{
    _maxOfflineExtrapolation = ticks;
    return *this;
}

Config::Builder& Config::Builder::stalenessDelay(core::u32 ticks) noexcept
{
    _stalenessDelay = ticks;
    return *this;
}

Config::Builder& Config::Builder::predictionMaxFrames(core::u32 frames) noexcept
{
    _predictionMaxFrames = frames;
    return *this;
}

Config::Builder& Config::Builder::inputTickLookback(core::u32 entries) noexcept
{
    _inputTickLookback = entries;
    return *this;
}

Config::Builder& Config::Builder::simulatedLatencyRange(core::f64 minSeconds, core::f64 maxSeconds) noexcept
{
    _minLatency = minSeconds;
    _maxLatency = maxSeconds;
    return *this;
}

Config::Builder& Config::Builder::simulatedPacketLossPercent(core::f32 percent) noexcept
{
    _lossPercent = percent;
    return *this;
}

Config::Builder& Config::Builder::simulationSeed(core::u32 seed) noexcept
{
    _seed = seed;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg._tickRate                = _tickRate;
    cfg._serverMode              = _serverMode;
    cfg._historyCapacity         = _historyCapacity;
    cfg._interpolationLag        = _interpolationLag;
    cfg._serverSendRate          = _serverSendRate;
    cfg._inputSendRate           = _inputSendRate;
    cfg._inputBatchSize          = _inputBatchSize;
    cfg._inputHistory            = _inputHistory;
    cfg._maxExtrapolation        = _maxExtrapolation;
    cfg._maxOfflineExtrapolation = _maxOfflineExtrapolation;
    cfg._stalenessDelay          = _stalenessDelay;
    cfg._predictionMaxFrames     = _predictionMaxFrames;
    cfg._inputTickLookback       = _inputTickLookback;
    cfg._minLatency              = _minLatency;
    cfg._maxLatency              = _maxLatency;
    cfg._lossPercent             = _lossPercent;
    cfg._seed                    = _seed;
    return cfg;
}

core::ExpectedVoid Config::validate() const
{
    if (_tickRate == 0)
    {
        return core::makeError(core::ErrorCode::InvalidArgument, "tickRate must be positive");
    }
    if (_serverSendRate == 0 || _serverSendRate > _tickRate)
    {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               std::format("serverSendRate {} outside (0, tickRate {}]", _serverSendRate, _tickRate));
    }
    if (_inputSendRate == 0)
    {
        return core::makeError(core::ErrorCode::InvalidArgument, "inputSendRate must be positive");
    }
    if (_historyCapacity <= _interpolationLag + 1)
    {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               std::format("historyCapacity {} cannot cover interpolationLag {}", _historyCapacity, _interpolationLag));
    }
    if (_inputBatchSize == 0 || _inputBatchSize > core::kMaxBatchFrames || _inputBatchSize > _inputHistory)
    {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               std::format("inputBatchSize {} outside [1, min({}, inputHistory {})]",
                                           _inputBatchSize, core::kMaxBatchFrames, _inputHistory));
    }
    if (_maxOfflineExtrapolation < _interpolationLag)
    {
        return core::makeError(core::ErrorCode::InvalidArgument, "maxOfflineExtrapolation must cover interpolationLag");
    }
    if (_minLatency < 0.0 || _maxLatency < _minLatency)
    {
        return core::makeError(core::ErrorCode::InvalidArgument, "simulatedLatencyRange must satisfy 0 <= min <= max");
    }
    if (_lossPercent < 0.0f || _lossPercent > 100.0f)
    {
        return core::makeError(core::ErrorCode::InvalidArgument, "simulatedPacketLossPercent outside [0, 100]");
    }
    return {};
}

} // namespace tks::engine
