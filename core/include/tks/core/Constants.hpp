/**
 * @file Constants.hpp
 * @brief Library-wide compile-time defaults.
 *
 * Every tunable of the synchronization layer has its default here; the
 * runtime values live in engine::Config.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_CORE_CONSTANTS_HPP
    #define TKS_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace tks::core {

inline constexpr u32   kTickRate                   = 60;
inline constexpr f64   kFixedDeltaTime             = 1.0 / static_cast<f64>(kTickRate);

inline constexpr u32   kHistoryCapacity            = 64;
inline constexpr u32   kInterpolationLag           = 4;
inline constexpr u32   kServerSendRate             = 20;
inline constexpr u32   kInputSendRate              = 30;
inline constexpr u32   kInputBatchSize             = 8;
inline constexpr u32   kInputHistory               = 64;
inline constexpr u32   kMaxExtrapolation           = 5;
inline constexpr u32   kMaxOfflineExtrapolation    = 30;
inline constexpr u32   kStalenessDelay             = 10;
inline constexpr u32   kPredictionMaxFrames        = 4;
inline constexpr u32   kInputTickLookback          = 256;
inline constexpr usize kTickRateWindow             = 1000;

inline constexpr u32   kMaxActions                 = 255;
inline constexpr u32   kMaxProperties              = 255;
inline constexpr u32   kMaxBatchFrames             = 255;

inline constexpr f32   kLatencySmoothing           = 0.125f;

inline constexpr u32   kGenerationBits             = 18;
inline constexpr u32   kSlotBits                   = 14;

} // namespace tks::core

#endif // TKS_CORE_CONSTANTS_HPP
