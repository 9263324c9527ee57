/**
 * @file ITransport.hpp
 * @brief Abstract transport layer interface (Strategy pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_NET_TRANSPORT_ITRANSPORT_HPP
    #define TKS_NET_TRANSPORT_ITRANSPORT_HPP

#include <tks/core/Types.hpp>
#include <tks/core/Expected.hpp>

#include <functional>
#include <span>
#include <vector>

namespace tks::net::transport {

/**
 * @class ITransport
 * @brief Strategy interface for the message transport.
 *
 * A send hands a complete payload over and returns immediately.
 * Inbound payloads and connection changes are delivered through the
 * installed handlers, from inside the owner's step.  The reliable channel
 * delivers in order per peer; the unreliable one may drop or reorder.
 *
 * Concrete implementations:
 *   - @c LoopbackTransport - in-process hub with simulated latency/loss.
 */
class ITransport
{
public:
    using ReceiveHandler    = std::function<void(core::PeerId sender, std::span<const core::byte> payload)>;
    using ConnectionHandler = std::function<void(core::PeerId peer, bool connected)>;

    virtual ~ITransport() = default;

    /**
     * @brief Sends on the ordered reliable channel.
     * @param peer    Destination peer or core::kBroadcastPeer.
     * @param payload Complete encoded frame.
     */
    [[nodiscard]] virtual core::ExpectedVoid sendReliable(
        core::PeerId peer,
        std::span<const core::byte> payload) = 0;

    /**
     * @brief Sends on the unordered, lossy channel.
     * @param peer    Destination peer or core::kBroadcastPeer.
     * @param payload Complete encoded frame.
     */
    [[nodiscard]] virtual core::ExpectedVoid sendUnreliable(
        core::PeerId peer,
        std::span<const core::byte> payload) = 0;

    /** @brief Lists the peers currently reachable. */
    [[nodiscard]] virtual std::vector<core::PeerId> connectedPeers() const = 0;

    /** @brief Returns this endpoint's own peer id. */
    [[nodiscard]] virtual core::PeerId localPeerId() const noexcept = 0;

    /** @brief Installs the inbound payload callback. */
    virtual void setReceiveHandler(ReceiveHandler handler) = 0;

    /** @brief Installs the connect/disconnect callback. */
    virtual void setConnectionHandler(ConnectionHandler handler) = 0;

    /** @brief Returns a human-readable name for this transport. */
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace tks::net::transport

#endif // TKS_NET_TRANSPORT_ITRANSPORT_HPP
