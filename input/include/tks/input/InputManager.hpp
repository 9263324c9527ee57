/**
 * @file InputManager.hpp
 * @brief Local input sampling and rate-limited batch emission.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_INPUT_INPUTMANAGER_HPP
    #define TKS_INPUT_INPUTMANAGER_HPP

#include <tks/input/ActionTable.hpp>
#include <tks/input/IInputSource.hpp>
#include <tks/input/PeerInputLedger.hpp>
#include <tks/core/Constants.hpp>
#include <tks/core/NonCopyable.hpp>
#include <tks/core/Types.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace tks::input {

/**
 * @class InputManager
 * @brief Owns the local peer's ledger (peer 0).
 *
 * Each fixed step the owner calls sample() with the step's input id.
 * pollBatch() is called every step too and yields an encoded batch of
 * the last batchSize frames whenever the send cadence is due, so every
 * frame travels several times.
 */
class InputManager final : public core::NonCopyable<InputManager>
{
public:
    InputManager(const ActionTable &table,
                 core::u32 batchSize = core::kInputBatchSize,
                 core::u32 sendRate = core::kInputSendRate,
                 core::u32 history = core::kInputHistory);
    ~InputManager();

    /** @brief Installs the source to sample (not owned; may be null). */
    void setSource(const IInputSource *source);

    /**
     * @brief Samples the source into the local ledger.
     * @param id            Input id of this step.
     * @param presentedTick Tick the local peer is presenting.
     */
    const InputFrame &sample(core::InputId id, core::Tick presentedTick);

    /** @brief Attach client-owned property values to the frame sampled at @p id. */
    bool attachOwned(core::InputId id, std::vector<OwnedBlock> owned);

    /**
     * @brief Returns the encoded batch to send when the cadence is due.
     * @param now Monotonic time in seconds.
     */
    [[nodiscard]] std::optional<std::vector<core::byte>> pollBatch(core::f64 now);

    [[nodiscard]] PeerInputLedger       &localLedger() noexcept;
    [[nodiscard]] const PeerInputLedger &localLedger() const noexcept;
    [[nodiscard]] const ActionTable     &table() const noexcept;

    /** @brief Input id of the most recent sample, kNoInputId before the first. */
    [[nodiscard]] core::InputId lastSampledId() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tks::input

#endif // TKS_INPUT_INPUTMANAGER_HPP
