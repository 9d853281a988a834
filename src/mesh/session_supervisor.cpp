#include "airmesh/mesh/session_supervisor.hpp"
#include "airmesh/util/logger.hpp"
#include <algorithm>
#include <type_traits>

namespace airmesh::mesh {

SessionSupervisor::SessionSupervisor(
    ConnectionManager& connections,
    protocol::HandshakeProtocol& handshake,
    protocol::SessionCipher& cipher,
    StabilityProbe& probe,
    core::ThreadPool& pool,
    core::Scheduler& scheduler,
    SupervisorPolicy policy
)
    : connections_(connections)
    , handshake_(handshake)
    , cipher_(cipher)
    , probe_(probe)
    , pool_(pool)
    , scheduler_(scheduler)
    , policy_(policy) {}

SessionSupervisor::~SessionSupervisor() {
    stop();
}

void SessionSupervisor::start() {
    {
        std::lock_guard lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }

    subscription_ = connections_.events().subscribe([this](const ConnectionEvent& event) {
        on_connection_event(event);
    });
    repair_task_ = scheduler_.schedule_every(policy_.repair_interval, [this] {
        repair_sessions();
    });

    LOG_DEBUG("Node: session supervisor started, repair every {}s", policy_.repair_interval.count());
}

void SessionSupervisor::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }

    connections_.events().unsubscribe(subscription_);
    if (repair_task_ != 0) {
        scheduler_.cancel(repair_task_);
        repair_task_ = 0;
    }
}

void SessionSupervisor::on_connection_event(const ConnectionEvent& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, PeerConnected>) {
            schedule_establish(e.peer_id, policy_.probe_before_handshake);
        } else if constexpr (std::is_same_v<T, PeerDisconnected>) {
            probe_.cancel(e.peer_id);
            handshake_.reset(e.peer_id);
        } else {
            LOG_INFO("Node: giving up on {} after {} reconnect attempts", e.peer_id, e.attempts);
        }
    }, event);
}

void SessionSupervisor::schedule_establish(const std::string& peer_id, bool probe_first) {
    {
        std::lock_guard lock(mutex_);
        if (!running_ || !establishing_.insert(peer_id).second) {
            return;
        }
    }

    bool queued = pool_.submit_detached([this, peer_id, probe_first] {
        establish(peer_id, probe_first);
    });
    if (!queued) {
        std::lock_guard lock(mutex_);
        establishing_.erase(peer_id);
    }
}

void SessionSupervisor::establish(const std::string& peer_id, bool probe_first) {
    bool attempted = false;
    bool succeeded = false;
    bool probe_failed = false;

    if (probe_first && !probe_.check(peer_id)) {
        probe_failed = true;
        LOG_WARNING("Node: {} failed the stability probe, deferring key exchange", peer_id);
    } else if (connections_.is_connected(peer_id)) {
        attempted = true;
        auto result = handshake_.initiate(peer_id);
        if (result) {
            succeeded = true;
        } else if (result.error() != protocol::HandshakeError::InProgress) {
            LOG_WARNING("Node: key exchange with {} failed: {}", peer_id, protocol::to_string(result.error()));
        }
    }

    std::lock_guard lock(mutex_);
    establishing_.erase(peer_id);
    if (attempted) ++stats_.handshakes_started;
    if (succeeded) ++stats_.handshakes_succeeded;
    if (probe_failed) ++stats_.probe_failures;
}

void SessionSupervisor::repair_sessions() {
    auto connected = connections_.connected_peers();
    size_t repaired = 0;

    for (const auto& peer_id : connected) {
        if (cipher_.has_session(peer_id) || handshake_.initiating(peer_id)) {
            continue;
        }
        LOG_DEBUG("Node: {} connected without a session, retrying key exchange", peer_id);
        schedule_establish(peer_id, false);
        ++repaired;
    }

    size_t orphaned = 0;
    for (const auto& peer_id : cipher_.peers()) {
        if (std::find(connected.begin(), connected.end(), peer_id) == connected.end()) {
            LOG_DEBUG("Node: discarding session of disconnected peer {}", peer_id);
            handshake_.reset(peer_id);
            ++orphaned;
        }
    }

    size_t expired = cipher_.expire_stale_sessions();

    std::lock_guard lock(mutex_);
    stats_.repairs += repaired;
    stats_.orphaned_sessions += orphaned;
    stats_.expired_sessions += expired;
}

SessionSupervisor::Stats SessionSupervisor::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

} // namespace airmesh::mesh
