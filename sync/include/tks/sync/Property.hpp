/**
 * @file Property.hpp
 * @brief Historized synchronized property: type-erased base and typed store.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_PROPERTY_HPP
    #define TKS_SYNC_PROPERTY_HPP

#include <tks/sync/PredictionController.hpp>
#include <tks/sync/PropertyOptions.hpp>
#include <tks/net/protocol/Value.hpp>
#include <tks/container/HistoryBuffer.hpp>
#include <tks/core/Expected.hpp>
#include <tks/core/NonCopyable.hpp>
#include <tks/core/Types.hpp>

#include <functional>
#include <optional>
#include <string>

namespace tks::sync {

/**
 * @class IProperty
 * @brief Type-erased view of a property, used by the send and receive paths.
 *
 * Values cross this interface as net::protocol::Value so that frames can
 * be built and applied without knowing the property types.
 */
class IProperty : public core::NonCopyable<IProperty>
{
public:
    IProperty(std::string name, PropertyOptions options)
        : _name{std::move(name)}
        , _options{options}
    {}
    virtual ~IProperty() = default;

    [[nodiscard]] const std::string     &name()     const noexcept { return _name; }
    [[nodiscard]] const PropertyOptions &options()  const noexcept { return _options; }
    [[nodiscard]] SyncStrategy           strategy() const noexcept { return _options.strategy; }

    /** @brief Position in the wire ordering. */
    [[nodiscard]] core::u8 wireIndex() const noexcept { return _wireIndex; }
    void setWireIndex(core::u8 index) noexcept { _wireIndex = index; }

    [[nodiscard]] PredictionController       &prediction()       noexcept { return _prediction; }
    [[nodiscard]] const PredictionController &prediction() const noexcept { return _prediction; }

    [[nodiscard]] virtual net::protocol::ValueType type() const noexcept = 0;
    [[nodiscard]] virtual bool       empty()           const noexcept = 0;
    [[nodiscard]] virtual core::Tick lastTick()        const noexcept = 0;
    [[nodiscard]] virtual core::Tick lastChangedTick() const noexcept = 0;
    [[nodiscard]] virtual bool       changed(core::Tick oldTick, core::Tick newTick) const = 0;
    [[nodiscard]] virtual bool       bound()           const noexcept = 0;

    virtual void resize(core::usize capacity) = 0;
    /** @brief Extrapolation cap used when the options leave it unset. */
    virtual void setDefaultMaxExtrapolation(core::u32 ticks) = 0;

    /** @brief Exact stored value at @p tick. */
    [[nodiscard]] virtual net::protocol::Value valueAt(core::Tick tick) const = 0;

    /** @brief Store a received value; fails when the variant holds another type. */
    [[nodiscard]] virtual core::ExpectedVoid writeValue(core::Tick tick, const net::protocol::Value &value) = 0;

    /**
     * @brief Correct the prediction made at @p tick against @p authoritative.
     *
     * The error predicted(tick) - authoritative is subtracted from every
     * stored tick from @p tick to the newest prediction.  A second call for
     * the same or an older tick is ignored.
     */
    [[nodiscard]] virtual core::ExpectedVoid reconcile(core::Tick tick, const net::protocol::Value &authoritative) = 0;

    virtual void rollback(core::Tick toTick) = 0;

    /** @brief Repeat the newest stored value at @p tick if it lies ahead. */
    virtual void replicateForward(core::Tick tick) = 0;

    /**
     * @brief Read the bound game field.
     * @param tick   Tick to store the value at.
     * @param always Store even when the field still holds the last pushed value.
     * @return true when the field differs from the value last pushed into it.
     *         A field that was never pushed is not reported as written.
     */
    virtual bool pull(core::Tick tick, bool always) = 0;

    /** @brief Write the history sampled at @p tick into the bound game field. */
    virtual void push(core::f64 tick) = 0;

protected:
    std::string          _name;
    PropertyOptions      _options;
    core::u8             _wireIndex{0};
    PredictionController _prediction;
};

/**
 * @class Property
 * @brief Typed property holding the HistoryBuffer of one value.
 * @tparam T One of the net::protocol::Value alternatives.
 */
template <typename T>
class Property final : public IProperty
{
public:
    using Getter = std::function<T()>;
    using Setter = std::function<void(const T &)>;

    Property(std::string name, PropertyOptions options);

    [[nodiscard]] container::HistoryBuffer<T>       &history()       noexcept { return _history; }
    [[nodiscard]] const container::HistoryBuffer<T> &history() const noexcept { return _history; }

    /** @brief Bind a game field; either callable may be empty. */
    void bind(Getter getter, Setter setter);

    [[nodiscard]] net::protocol::ValueType type() const noexcept override;
    [[nodiscard]] bool       empty()           const noexcept override { return _history.empty(); }
    [[nodiscard]] core::Tick lastTick()        const noexcept override { return _history.lastTick(); }
    [[nodiscard]] core::Tick lastChangedTick() const noexcept override { return _history.lastChangedTick(); }
    [[nodiscard]] bool       changed(core::Tick oldTick, core::Tick newTick) const override;
    [[nodiscard]] bool       bound()           const noexcept override { return static_cast<bool>(_getter) || static_cast<bool>(_setter); }

    void resize(core::usize capacity) override { _history.resize(capacity); }
    void setDefaultMaxExtrapolation(core::u32 ticks) override;

    [[nodiscard]] net::protocol::Value valueAt(core::Tick tick) const override;
    [[nodiscard]] core::ExpectedVoid writeValue(core::Tick tick, const net::protocol::Value &value) override;
    [[nodiscard]] core::ExpectedVoid reconcile(core::Tick tick, const net::protocol::Value &authoritative) override;

    void rollback(core::Tick toTick) override { _history.rollback(toTick); }
    void replicateForward(core::Tick tick) override;

    bool pull(core::Tick tick, bool always) override;
    void push(core::f64 tick) override;

    /** @brief Last tick a reconciliation was applied at. */
    [[nodiscard]] core::Tick lastCorrectedTick() const noexcept { return _lastCorrected; }

private:
    [[nodiscard]] core::Expected<T> unwrap(const net::protocol::Value &value) const;

    container::HistoryBuffer<T> _history;
    Getter                      _getter;
    Setter                      _setter;
    std::optional<T>            _lastPushed;
    core::Tick                  _lastCorrected{core::kNoTick};
};

} // namespace tks::sync

#include "Property.inl"

#endif // TKS_SYNC_PROPERTY_HPP
