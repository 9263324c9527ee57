/**
 * @file LoopbackTransport.hpp
 * @brief In-process transport hub with deterministic fault injection.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_NET_TRANSPORT_LOOPBACK_TRANSPORT_HPP
    #define TKS_NET_TRANSPORT_LOOPBACK_TRANSPORT_HPP

#include <tks/net/transport/ITransport.hpp>
#include <tks/core/NonCopyable.hpp>

#include <memory>

namespace tks::net::transport {

class LoopbackNetwork;

/**
 * @struct LoopbackConfig
 * @brief Simulated link characteristics.  All zero means instant and lossless.
 */
struct LoopbackConfig
{
    core::f64 minLatency{0.0};  ///< Seconds.
    core::f64 maxLatency{0.0};  ///< Seconds.
    core::f32 lossPercent{0.0f}; ///< Unreliable channel only.
    core::u32 seed{0x5EED};
};

/**
 * @struct LoopbackStats
 * @brief Counters of the hub since creation.
 */
struct LoopbackStats
{
    core::u64 sent{0};
    core::u64 delivered{0};
    core::u64 dropped{0};
};

/**
 * @class LoopbackTransport
 * @brief One endpoint attached to a LoopbackNetwork.
 *
 * The endpoint detaches itself from the hub on destruction; the hub must
 * outlive every endpoint it created.
 */
class LoopbackTransport final : public ITransport, public core::Pinned<LoopbackTransport>
{
public:
    LoopbackTransport(LoopbackNetwork &network, core::PeerId id);
    ~LoopbackTransport() override;

    [[nodiscard]] core::ExpectedVoid sendReliable(
        core::PeerId peer,
        std::span<const core::byte> payload) override;

    [[nodiscard]] core::ExpectedVoid sendUnreliable(
        core::PeerId peer,
        std::span<const core::byte> payload) override;

    [[nodiscard]] std::vector<core::PeerId> connectedPeers() const override;
    [[nodiscard]] core::PeerId localPeerId() const noexcept override;

    void setReceiveHandler(ReceiveHandler handler) override;
    void setConnectionHandler(ConnectionHandler handler) override;

    [[nodiscard]] const char* name() const noexcept override;

private:
    friend class LoopbackNetwork;

    LoopbackNetwork  &_network;
    core::PeerId      _id;
    ReceiveHandler    _onReceive;
    ConnectionHandler _onConnection;
};

/**
 * @class LoopbackNetwork
 * @brief Star topology linking one server endpoint to many clients.
 *
 * Every send is scheduled on a delivery queue keyed by logical delivery
 * time; advance() hands over everything due.  Latency is drawn uniformly
 * from the configured range and loss from the configured percentage,
 * both from a seeded generator.  Reliable payloads between a pair of
 * endpoints are never delivered out of order and never dropped.
 */
class LoopbackNetwork final : public core::Pinned<LoopbackNetwork>
{
public:
    explicit LoopbackNetwork(LoopbackConfig config = {});
    ~LoopbackNetwork();

    /** @brief Creates the server endpoint (peer core::kServerPeer). */
    [[nodiscard]] std::unique_ptr<LoopbackTransport> createServer();

    /**
     * @brief Creates a client endpoint and connects it to the server.
     *
     * Connection events reach both sides on the next advance().
     */
    [[nodiscard]] std::unique_ptr<LoopbackTransport> createClient();

    /** @brief Cuts the link of @p client; queued payloads to and from it are lost. */
    void disconnect(core::PeerId client);

    /** @brief Moves the logical clock to @p now and delivers everything due. */
    void advance(core::f64 now);

    /** @brief Delivers everything still queued, whatever its delivery time. */
    void flush();

    [[nodiscard]] core::f64 now() const noexcept;
    [[nodiscard]] core::usize pending() const noexcept;
    [[nodiscard]] LoopbackStats stats() const noexcept;

private:
    friend class LoopbackTransport;

    [[nodiscard]] core::ExpectedVoid send(
        core::PeerId from,
        core::PeerId to,
        std::span<const core::byte> payload,
        bool reliable);

    [[nodiscard]] std::vector<core::PeerId> peersOf(core::PeerId id) const;

    void detach(core::PeerId id);

    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tks::net::transport

#endif // TKS_NET_TRANSPORT_LOOPBACK_TRANSPORT_HPP
