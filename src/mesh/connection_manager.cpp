#include "airmesh/mesh/connection_manager.hpp"
#include "airmesh/util/logger.hpp"
#include <algorithm>

namespace airmesh::mesh {

std::string_view to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Discovered: return "discovered";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(net::Transport& transport, core::Scheduler& scheduler,
                                     ConnectionPolicy policy)
    : transport_(transport)
    , scheduler_(scheduler)
    , policy_(policy) {}

ConnectionManager::~ConnectionManager() {
    shutdown();
}

void ConnectionManager::shutdown() {
    std::lock_guard lock(mutex_);
    stopping_ = true;
}

PeerConnection& ConnectionManager::record_locked(const std::string& peer_id) {
    auto [it, inserted] = peers_.try_emplace(peer_id);
    if (inserted) {
        it->second.peer_id = peer_id;
        it->second.last_change = std::chrono::steady_clock::now();
    }
    return it->second;
}

size_t ConnectionManager::connected_count_locked() const {
    size_t count = 0;
    for (const auto& [id, peer] : peers_) {
        if (peer.state == ConnectionState::Connected) {
            ++count;
        }
    }
    return count;
}

uint64_t ConnectionManager::begin_attempt_locked(PeerConnection& peer) {
    peer.attempt.in_flight = true;
    peer.attempt.next_retry_at.reset();
    ++peer.attempt.generation;
    peer.state = ConnectionState::Connecting;
    peer.last_change = std::chrono::steady_clock::now();
    ++stats_.connect_requests;
    return peer.attempt.generation;
}

void ConnectionManager::handle_peer_found(const std::string& peer_id) {
    uint64_t generation = 0;
    {
        std::lock_guard lock(mutex_);
        if (stopping_ || peer_id == transport_.local_peer_id()) {
            return;
        }

        auto& peer = record_locked(peer_id);
        peer.discoverable = true;

        if (peer.state == ConnectionState::Connected || peer.attempt.in_flight) {
            LOG_TRACE("Connection: {} already {}", peer_id, to_string(peer.state));
            return;
        }
        if (connected_count_locked() >= policy_.max_connections) {
            LOG_DEBUG("Connection: at capacity ({}), not inviting {}", policy_.max_connections, peer_id);
            return;
        }

        generation = begin_attempt_locked(peer);
    }

    request_connect(peer_id, generation);
}

void ConnectionManager::handle_peer_lost(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return;
    }

    auto& peer = it->second;
    peer.discoverable = false;

    if (peer.state == ConnectionState::Connected) {
        // The link outlives discovery; only pending attempts are dropped
        peer.attempt = ConnectionAttempt{.generation = peer.attempt.generation + 1};
        return;
    }

    LOG_DEBUG("Connection: {} lost, forgetting it", peer_id);
    peers_.erase(it);
}

void ConnectionManager::handle_link_state(const std::string& peer_id, net::LinkState state) {
    switch (state) {
        case net::LinkState::Connecting: {
            std::lock_guard lock(mutex_);
            if (stopping_ || peer_id == transport_.local_peer_id()) {
                return;
            }
            auto& peer = record_locked(peer_id);
            if (peer.state != ConnectionState::Connected) {
                peer.state = ConnectionState::Connecting;
                peer.last_change = std::chrono::steady_clock::now();
            }
            return;
        }

        case net::LinkState::Connected: {
            bool over_capacity = false;
            {
                std::lock_guard lock(mutex_);
                if (stopping_ || peer_id == transport_.local_peer_id()) {
                    return;
                }
                auto& peer = record_locked(peer_id);
                if (peer.state == ConnectionState::Connected) {
                    return;
                }
                if (connected_count_locked() >= policy_.max_connections) {
                    over_capacity = true;
                } else {
                    peer.state = ConnectionState::Connected;
                    peer.last_change = std::chrono::steady_clock::now();
                    peer.attempt = ConnectionAttempt{.generation = peer.attempt.generation + 1};
                }
            }

            if (over_capacity) {
                LOG_WARNING("Connection: at capacity ({}), dropping link to {}", policy_.max_connections, peer_id);
                transport_.disconnect(peer_id);
                return;
            }

            LOG_INFO("Connection: {} connected", peer_id);
            events_.publish(PeerConnected{peer_id});
            return;
        }

        case net::LinkState::NotConnected: {
            bool was_connected = false;
            {
                std::lock_guard lock(mutex_);
                if (stopping_) {
                    return;
                }
                auto it = peers_.find(peer_id);
                if (it == peers_.end()) {
                    return;
                }

                auto& peer = it->second;
                const auto idle_state = peer.discoverable ? ConnectionState::Discovered
                                                          : ConnectionState::Disconnected;
                if (peer.state == ConnectionState::Connected) {
                    was_connected = true;
                    peer.state = ConnectionState::Disconnected;
                    peer.attempt = ConnectionAttempt{.generation = peer.attempt.generation + 1};
                } else if (peer.attempt.in_flight) {
                    peer.attempt.in_flight = false;
                    peer.state = idle_state;
                } else {
                    // Not tracked as connected: nothing to undo
                    if (peer.state == ConnectionState::Connecting) {
                        peer.state = idle_state;
                    }
                    return;
                }
                peer.last_change = std::chrono::steady_clock::now();
            }

            if (was_connected) {
                LOG_INFO("Connection: {} disconnected", peer_id);
                events_.publish(PeerDisconnected{peer_id});
            } else {
                LOG_DEBUG("Connection: invitation to {} failed", peer_id);
            }
            schedule_retry(peer_id);
            return;
        }
    }
}

void ConnectionManager::request_connect(const std::string& peer_id, uint64_t generation) {
    LOG_INFO("Connection: inviting {}", peer_id);
    transport_.connect(peer_id, policy_.connect_timeout);

    scheduler_.schedule_after(policy_.attempt_safety_timeout, [this, peer_id, generation] {
        on_safety_timeout(peer_id, generation);
    });
}

void ConnectionManager::on_safety_timeout(const std::string& peer_id, uint64_t generation) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return;
        }

        auto& peer = it->second;
        if (!peer.attempt.in_flight || peer.attempt.generation != generation ||
            peer.state == ConnectionState::Connected) {
            return;
        }

        peer.attempt.in_flight = false;
        peer.state = peer.discoverable ? ConnectionState::Discovered : ConnectionState::Disconnected;
        peer.last_change = std::chrono::steady_clock::now();
        ++stats_.safety_timeouts;
    }

    LOG_WARNING("Connection: no answer from {} within {}ms, clearing attempt",
                peer_id, policy_.attempt_safety_timeout.count());
    schedule_retry(peer_id);
}

void ConnectionManager::schedule_retry(const std::string& peer_id) {
    std::optional<PeerUnreachable> unreachable;
    std::chrono::milliseconds delay{0};
    uint64_t generation = 0;
    int retry = 0;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        auto it = peers_.find(peer_id);
        if (it == peers_.end() || it->second.state == ConnectionState::Connected) {
            return;
        }

        auto& peer = it->second;
        if (peer.attempt.retry_count >= policy_.max_reconnect_attempts) {
            unreachable = PeerUnreachable{peer_id, peer.attempt.retry_count};
            ++stats_.unreachable;
            peer.attempt = ConnectionAttempt{.generation = peer.attempt.generation + 1};
            if (!peer.discoverable) {
                peers_.erase(it);
            }
        } else {
            retry = ++peer.attempt.retry_count;
            delay = policy_.reconnect_backoff * (std::chrono::milliseconds::rep{1} << std::clamp(retry - 1, 0, 16));
            peer.attempt.next_retry_at = std::chrono::steady_clock::now() + delay;
            generation = ++peer.attempt.generation;
            ++stats_.retries;
        }
    }

    if (unreachable) {
        LOG_WARNING("Connection: {} unreachable after {} attempts", peer_id, unreachable->attempts);
        events_.publish(*unreachable);
        return;
    }

    LOG_DEBUG("Connection: retry {}/{} for {} in {}ms", retry, policy_.max_reconnect_attempts,
              peer_id, delay.count());
    scheduler_.schedule_after(delay, [this, peer_id, generation] {
        on_retry(peer_id, generation);
    });
}

void ConnectionManager::on_retry(const std::string& peer_id, uint64_t generation) {
    bool skipped = false;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return;
        }

        auto& peer = it->second;
        if (peer.attempt.generation != generation) {
            return;
        }
        peer.attempt.next_retry_at.reset();

        if (peer.state == ConnectionState::Connected || peer.attempt.in_flight) {
            // The transport got there on its own
            return;
        }

        if (!peer.discoverable || connected_count_locked() >= policy_.max_connections) {
            skipped = true;
        } else {
            peer.attempt.in_flight = true;
            peer.state = ConnectionState::Connecting;
            peer.last_change = std::chrono::steady_clock::now();
            ++stats_.connect_requests;
        }
    }

    if (skipped) {
        LOG_DEBUG("Connection: {} not reachable for retry, skipping", peer_id);
        schedule_retry(peer_id);
        return;
    }

    request_connect(peer_id, generation);
}

net::SendStatus ConnectionManager::deliver(const std::string& peer_id, std::span<const uint8_t> frame) {
    if (!is_connected(peer_id)) {
        LOG_DEBUG("Connection: not sending to {}, not connected", peer_id);
        return net::SendStatus::NotConnected;
    }

    auto status = transport_.send(frame, {peer_id});
    switch (status) {
        case net::SendStatus::Sent: {
            std::lock_guard lock(mutex_);
            ++stats_.frames_sent;
            break;
        }
        case net::SendStatus::NotConnected: {
            {
                std::lock_guard lock(mutex_);
                ++stats_.resyncs;
            }
            LOG_INFO("Connection: transport reports {} not connected, resynchronizing", peer_id);
            handle_link_state(peer_id, net::LinkState::NotConnected);
            break;
        }
        case net::SendStatus::Failed:
            LOG_WARNING("Connection: send to {} failed", peer_id);
            break;
    }
    return status;
}

bool ConnectionManager::is_connected(const std::string& peer_id) const {
    std::lock_guard lock(mutex_);
    auto it = peers_.find(peer_id);
    return it != peers_.end() && it->second.state == ConnectionState::Connected;
}

std::vector<std::string> ConnectionManager::connected_peers() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [id, peer] : peers_) {
        if (peer.state == ConnectionState::Connected) {
            result.push_back(id);
        }
    }
    return result;
}

void ConnectionManager::disconnect(const std::string& peer_id) {
    LOG_INFO("Connection: disconnecting {}", peer_id);
    transport_.disconnect(peer_id);
}

std::optional<PeerConnection> ConnectionManager::peer(const std::string& peer_id) const {
    std::lock_guard lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t ConnectionManager::tracked_peers() const {
    std::lock_guard lock(mutex_);
    return peers_.size();
}

size_t ConnectionManager::connected_count() const {
    std::lock_guard lock(mutex_);
    return connected_count_locked();
}

ConnectionManager::Stats ConnectionManager::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

} // namespace airmesh::mesh
