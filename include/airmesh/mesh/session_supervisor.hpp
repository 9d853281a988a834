#pragma once

#include "airmesh/core/scheduler.hpp"
#include "airmesh/core/thread_pool.hpp"
#include "airmesh/mesh/connection_manager.hpp"
#include "airmesh/mesh/stability_probe.hpp"
#include "airmesh/protocol/handshake.hpp"
#include "airmesh/protocol/session_cipher.hpp"
#include <chrono>
#include <mutex>
#include <set>
#include <string>

namespace airmesh::mesh {

struct SupervisorPolicy {
    std::chrono::seconds repair_interval{60};
    bool probe_before_handshake = true;
};

// Glues the connection lifecycle to the key exchange: new links get a
// stability probe and a handshake, dropped links lose their session, and a
// periodic pass repairs whatever fell through the cracks.
class SessionSupervisor {
public:
    SessionSupervisor(
        ConnectionManager& connections,
        protocol::HandshakeProtocol& handshake,
        protocol::SessionCipher& cipher,
        StabilityProbe& probe,
        core::ThreadPool& pool,
        core::Scheduler& scheduler,
        SupervisorPolicy policy = {}
    );
    ~SessionSupervisor();

    SessionSupervisor(const SessionSupervisor&) = delete;
    SessionSupervisor& operator=(const SessionSupervisor&) = delete;

    void start();
    void stop();

    // One repair pass; also run every repair_interval once started
    void repair_sessions();

    struct Stats {
        uint64_t handshakes_started = 0;
        uint64_t handshakes_succeeded = 0;
        uint64_t probe_failures = 0;
        uint64_t repairs = 0;
        uint64_t orphaned_sessions = 0;
        uint64_t expired_sessions = 0;
    };
    Stats stats() const;

private:
    void on_connection_event(const ConnectionEvent& event);

    // Queues establish() unless one is already queued or running for the peer
    void schedule_establish(const std::string& peer_id, bool probe_first);
    void establish(const std::string& peer_id, bool probe_first);

    ConnectionManager& connections_;
    protocol::HandshakeProtocol& handshake_;
    protocol::SessionCipher& cipher_;
    StabilityProbe& probe_;
    core::ThreadPool& pool_;
    core::Scheduler& scheduler_;
    SupervisorPolicy policy_;

    mutable std::mutex mutex_;
    std::set<std::string> establishing_;
    Stats stats_;
    bool running_ = false;

    core::EventChannel<ConnectionEvent>::SubscriptionId subscription_ = 0;
    core::Scheduler::TaskId repair_task_ = 0;
};

} // namespace airmesh::mesh
