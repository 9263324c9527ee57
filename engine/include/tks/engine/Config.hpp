/**
 * @file Config.hpp
 * @brief Synchronization configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_ENGINE_CONFIG_HPP
    #define TKS_ENGINE_CONFIG_HPP

#include <tks/core/Types.hpp>
#include <tks/core/Constants.hpp>
#include <tks/core/Expected.hpp>

namespace tks::engine {

/** @brief Immutable synchronization configuration. */
class Config
{
public:
    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder& tickRate(core::u32 hz) noexcept;
        Builder& serverMode(bool enabled) noexcept;
        Builder& historyCapacity(core::u32 ticks) noexcept;
        Builder& interpolationLag(core::u32 ticks) noexcept;
        Builder& serverSendRate(core::u32 hz) noexcept;
        Builder& inputSendRate(core::u32 hz) noexcept;
        Builder& inputBatchSize(core::u32 frames) noexcept;
        Builder& inputHistory(core::u32 frames) noexcept;
        Builder& maxExtrapolation(core::u32 ticks) noexcept;
        Builder& maxOfflineExtrapolation(core::u32 ticks) noexcept;
        Builder& stalenessDelay(core::u32 ticks) noexcept;
        Builder& predictionMaxFrames(core::u32 frames) noexcept;
        Builder& inputTickLookback(core::u32 entries) noexcept;
        Builder& simulatedLatencyRange(core::f64 minSeconds, core::f64 maxSeconds) noexcept;
        Builder& simulatedPacketLossPercent(core::f32 percent) noexcept;
        Builder& simulationSeed(core::u32 seed) noexcept;

        [[nodiscard]] Config build() const noexcept;

    private:
        core::u32 _tickRate{core::kTickRate};
        bool      _serverMode{false};
        core::u32 _historyCapacity{core::kHistoryCapacity};
        core::u32 _interpolationLag{core::kInterpolationLag};
        core::u32 _serverSendRate{core::kServerSendRate};
        core::u32 _inputSendRate{core::kInputSendRate};
        core::u32 _inputBatchSize{core::kInputBatchSize};
        core::u32 _inputHistory{core::kInputHistory};
        core::u32 _maxExtrapolation{core::kMaxExtrapolation};
        core::u32 _maxOfflineExtrapolation{core::kMaxOfflineExtrapolation};
        core::u32 _stalenessDelay{core::kStalenessDelay};
        core::u32 _predictionMaxFrames{core::kPredictionMaxFrames};
        core::u32 _inputTickLookback{core::kInputTickLookback};
        core::f64 _minLatency{0.0};
        core::f64 _maxLatency{0.0};
        core::f32 _lossPercent{0.0f};
        core::u32 _seed{0x5EED};
    };

    [[nodiscard]] core::u32 tickRate()                const noexcept { return _tickRate; }
    [[nodiscard]] core::f64 fixedDeltaTime()          const noexcept { return 1.0 / static_cast<core::f64>(_tickRate); }
    [[nodiscard]] bool      serverMode()              const noexcept { return _serverMode; }
    [[nodiscard]] core::u32 historyCapacity()         const noexcept { return _historyCapacity; }
    [[nodiscard]] core::u32 interpolationLag()        const noexcept { return _interpolationLag; }
    [[nodiscard]] core::u32 serverSendRate()          const noexcept { return _serverSendRate; }
    [[nodiscard]] core::u32 inputSendRate()           const noexcept { return _inputSendRate; }
    [[nodiscard]] core::u32 inputBatchSize()          const noexcept { return _inputBatchSize; }
    [[nodiscard]] core::u32 inputHistory()            const noexcept { return _inputHistory; }
    [[nodiscard]] core::u32 maxExtrapolation()        const noexcept { return _maxExtrapolation; }
    [[nodiscard]] core::u32 maxOfflineExtrapolation() const noexcept { return _maxOfflineExtrapolation; }
    [[nodiscard]] core::u32 stalenessDelay()          const noexcept { return _stalenessDelay; }
    [[nodiscard]] core::u32 predictionMaxFrames()     const noexcept { return _predictionMaxFrames; }
    [[nodiscard]] core::u32 inputTickLookback()       const noexcept { return _inputTickLookback; }
    [[nodiscard]] core::f64 simulatedMinLatency()     const noexcept { return _minLatency; }
    [[nodiscard]] core::f64 simulatedMaxLatency()     const noexcept { return _maxLatency; }
    [[nodiscard]] core::f32 simulatedPacketLoss()     const noexcept { return _lossPercent; }
    [[nodiscard]] core::u32 simulationSeed()          const noexcept { return _seed; }

    /**
     * @brief Checks the values against each other.
     * @return InvalidArgument naming the first inconsistent option.
     */
    [[nodiscard]] core::ExpectedVoid validate() const;

private:
    friend class Builder;

    core::u32 _tickRate{core::kTickRate};
    bool      _serverMode{false};
    core::u32 _historyCapacity{core::kHistoryCapacity};
    core::u32 _interpolationLag{core::kInterpolationLag};
    core::u32 _serverSendRate{core::kServerSendRate};
    core::u32 _inputSendRate{core::kInputSendRate};
    core::u32 _inputBatchSize{core::kInputBatchSize};
    core::u32 _inputHistory{core::kInputHistory};
    core::u32 _maxExtrapolation{core::kMaxExtrapolation};
    core::u32 _maxOfflineExtrapolation{core::kMaxOfflineExtrapolation};
    core::u32 _stalenessDelay{core::kStalenessDelay};
    core::u32 _predictionMaxFrames{core::kPredictionMaxFrames};
    core::u32 _inputTickLookback{core::kInputTickLookback};
    core::f64 _minLatency{0.0};
    core::f64 _maxLatency{0.0};
    core::f32 _lossPercent{0.0f};
    core::u32 _seed{0x5EED};
};

} // namespace tks::engine

#endif // TKS_ENGINE_CONFIG_HPP
