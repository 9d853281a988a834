#pragma once

#include "config.hpp"
#include "scheduler.hpp"
#include "thread_pool.hpp"
#include "airmesh/mesh/connection_manager.hpp"
#include "airmesh/mesh/message_router.hpp"
#include "airmesh/mesh/session_supervisor.hpp"
#include "airmesh/mesh/stability_probe.hpp"
#include "airmesh/net/transport.hpp"
#include "airmesh/protocol/handshake.hpp"
#include "airmesh/protocol/session_cipher.hpp"

#include <atomic>
#include <memory>

namespace airmesh::core {

// One mesh participant: owns every component and wires them to a transport
class MeshNode : public net::TransportObserver {
public:
    MeshNode(const RuntimeConfig& config, net::Transport& transport);
    ~MeshNode() override;

    // Non-copyable and non-movable
    MeshNode(const MeshNode&) = delete;
    MeshNode& operator=(const MeshNode&) = delete;

    // Attaches to the transport and starts discovery
    void start();

    // Detaches from the transport and cancels pending work; a stopped node
    // cannot be started again
    void stop();

    bool running() const { return running_.load(std::memory_order_relaxed); }

    // TransportObserver
    void on_peer_found(const std::string& peer_id) override;
    void on_peer_lost(const std::string& peer_id) override;
    void on_link_state_changed(const std::string& peer_id, net::LinkState state) override;
    void on_data_received(const std::string& peer_id, std::span<const uint8_t> data) override;

    util::Result<util::Unit, mesh::RouteError> send(
        const std::string& peer_id,
        protocol::MessageType type,
        std::span<const uint8_t> payload
    );

    size_t broadcast(protocol::MessageType type, std::span<const uint8_t> payload);

    // Runs the key exchange on the calling thread
    util::Result<util::Unit, protocol::HandshakeError> establish_session(const std::string& peer_id);

    bool has_session(const std::string& peer_id) const;

    const std::string& peer_id() const { return transport_.local_peer_id(); }
    const std::string& device_id() const { return config_.device_id; }
    const crypto::PublicKey& public_key() const { return config_.keypair.public_key(); }

    protocol::SessionCipher& cipher() { return cipher_; }
    protocol::HandshakeProtocol& handshake() { return handshake_; }
    mesh::ConnectionManager& connections() { return connections_; }
    mesh::StabilityProbe& probe() { return probe_; }
    mesh::MessageRouter& router() { return router_; }
    mesh::SessionSupervisor& supervisor() { return supervisor_; }

    struct Stats {
        size_t connected_peers = 0;
        size_t sessions = 0;
        mesh::MessageRouter::Stats router;
        mesh::ConnectionManager::Stats connections;
        mesh::SessionSupervisor::Stats supervisor;
    };
    Stats stats() const;

private:
    void stop_workers();

    RuntimeConfig config_;
    net::Transport& transport_;

    // Declared first so they outlive every component that schedules work
    std::unique_ptr<ThreadPool> thread_pool_;
    std::unique_ptr<Scheduler> scheduler_;

    protocol::SessionCipher cipher_;
    mesh::ConnectionManager connections_;
    protocol::HandshakeProtocol handshake_;
    mesh::StabilityProbe probe_;
    mesh::MessageRouter router_;
    mesh::SessionSupervisor supervisor_;

    std::atomic<bool> running_{false};
};

} // namespace airmesh::core
