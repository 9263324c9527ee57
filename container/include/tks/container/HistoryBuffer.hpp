/**
 * @file HistoryBuffer.hpp
 * @brief Tick-indexed circular history of one property value.
 *
 * A HistoryBuffer always holds the contiguous tick range
 * [oldestTick(), lastTick()].  Ticks that were never written are
 * synthesized by the gap-fill rule and flagged as such, so that a late
 * write can re-interpolate them against the new real sample.
 *
 * Reads accept fractional ticks: integer ticks return the stored slot
 * exactly, fractional ticks blend with the intra-tick rule, ticks past
 * lastTick() extrapolate with the gap-fill rule up to a fixed cap.
 *
 * @tparam T Value type; must have an Interpolation<T> specialisation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_CONTAINER_HISTORY_BUFFER_HPP
    #define TKS_CONTAINER_HISTORY_BUFFER_HPP

    #include <tks/core/Assert.hpp>
    #include <tks/core/Constants.hpp>
    #include <tks/core/Types.hpp>
    #include <tks/math/Interpolation.hpp>

    #include <concepts>
    #include <vector>

namespace tks::container {

/**
 * @brief Blend rule used between two samples.
 */
enum class InterpolationMode : core::u8 {
    kNone = 0, ///< Step: the left sample holds until the right tick is reached.
    kLinear    ///< Affine blend on the fractional position.
};

/**
 * @brief A value a HistoryBuffer can hold: copyable, comparable for change
 *        detection, and with a math::Interpolation rule.
 */
template <typename T>
concept Historizable = std::copyable<T> && std::equality_comparable<T> && requires(T a, T b, double t) {
    { math::Interpolation<T>::lerp(a, b, t) } -> std::convertible_to<T>;
    { math::Interpolation<T>::kCorrectable } -> std::convertible_to<bool>;
};

template <Historizable T>
class HistoryBuffer final {
public:
    using Traits = math::Interpolation<T>;

    HistoryBuffer() = default;
    explicit HistoryBuffer(core::usize capacity);

    /**
     * @brief Set the number of retained ticks.
     *
     * Only legal before the first write.
     */
    void resize(core::usize capacity);

    void setIntraTickMode(InterpolationMode mode) { _intraTick = mode; }
    void setGapFillMode(InterpolationMode mode)   { _gapFill = mode; }
    void setMaxExtrapolation(core::u32 ticks)     { _maxExtrapolation = ticks; }

    /**
     * @brief Store @p value at @p tick.
     *
     * The first write fills the whole buffer.  Writes older than the
     * oldest retained tick are ignored.  Historic writes re-interpolate
     * the synthesized neighbours on both sides, forward writes gap-fill
     * the skipped ticks.
     */
    void write(core::Tick tick, const T &value);

    /**
     * @brief Sample the history at a possibly fractional tick.
     */
    [[nodiscard]] T read(core::f64 tick) const;

    /** @brief Exact stored value at an integer tick, clamped to the retained range. */
    [[nodiscard]] T at(core::Tick tick) const;

    /**
     * @brief Replace every tick after @p toTick with the value held at @p toTick.
     *
     * lastTick() is kept.  Repeating the same rollback is a no-op.
     */
    void rollback(core::Tick toTick);

    /**
     * @brief Store @p authoritative at @p tick and shift every later tick by the
     *        prediction error at(tick) - authoritative.
     *
     * at(tick) equals @p authoritative exactly afterwards.  Non-correctable
     * types only replace the value at @p tick.  Ticks outside the retained
     * range are ignored.
     */
    void applyCorrection(core::Tick tick, const T &authoritative);

    /**
     * @brief Whether the value changed between @p oldTick and @p newTick.
     *
     * Uses lastChangedTick() as a shortcut: a value that changes and then
     * changes back inside the interval is reported as unchanged.
     */
    [[nodiscard]] bool changed(core::Tick oldTick, core::Tick newTick) const;

    [[nodiscard]] bool isSynthesized(core::Tick tick) const;

    [[nodiscard]] bool        empty()            const { return !_written; }
    [[nodiscard]] core::usize capacity()         const { return _values.size(); }
    [[nodiscard]] core::Tick  lastTick()         const { return _lastTick; }
    [[nodiscard]] core::Tick  lastChangedTick()  const { return _lastChangedTick; }
    [[nodiscard]] core::Tick  oldestTick()       const;
    [[nodiscard]] core::u32   maxExtrapolation() const { return _maxExtrapolation; }
    [[nodiscard]] InterpolationMode intraTickMode() const { return _intraTick; }
    [[nodiscard]] InterpolationMode gapFillMode()   const { return _gapFill; }

private:
    [[nodiscard]] core::usize slot(core::Tick tick) const;
    [[nodiscard]] T blend(const T &a, const T &b, core::f64 t, InterpolationMode mode) const;

    void fillGap(core::Tick left, const T &a, core::Tick right, const T &b);
    void fillPlateau(core::Tick from, core::Tick to, const T &value);
    void recomputeLastChanged();

    std::vector<T>       _values;
    std::vector<core::u8> _synthesized;
    core::Tick           _lastTick{core::kNoTick};
    core::Tick           _lastChangedTick{core::kNoTick};
    core::Tick           _rollbackFrom{core::kNoTick};
    core::Tick           _rollbackTo{core::kNoTick};
    core::u32            _maxExtrapolation{core::kMaxExtrapolation};
    InterpolationMode    _intraTick{InterpolationMode::kLinear};
    InterpolationMode    _gapFill{InterpolationMode::kLinear};
    bool                 _written{false};
};

} // namespace tks::container

    #include "HistoryBuffer.inl"

#endif // TKS_CONTAINER_HISTORY_BUFFER_HPP
