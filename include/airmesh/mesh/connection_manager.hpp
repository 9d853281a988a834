#pragma once

#include "airmesh/core/event_channel.hpp"
#include "airmesh/core/scheduler.hpp"
#include "airmesh/net/transport.hpp"
#include "airmesh/protocol/frame_sink.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace airmesh::mesh {

struct ConnectionPolicy {
    size_t max_connections = 15;
    std::chrono::milliseconds connect_timeout{30000};

    // Clears an attempt whose transport callback never arrived
    std::chrono::milliseconds attempt_safety_timeout{35000};

    int max_reconnect_attempts = 3;

    // Delay before retry k is reconnect_backoff * 2^(k-1)
    std::chrono::milliseconds reconnect_backoff{2000};
};

enum class ConnectionState {
    Discovered,
    Connecting,
    Connected,
    Disconnected
};

std::string_view to_string(ConnectionState state);

struct ConnectionAttempt {
    bool in_flight = false;
    int retry_count = 0;
    std::optional<std::chrono::steady_clock::time_point> next_retry_at;
    uint64_t generation = 0;  // bumped to invalidate pending timers
};

struct PeerConnection {
    std::string peer_id;
    ConnectionState state = ConnectionState::Discovered;
    bool discoverable = false;
    ConnectionAttempt attempt;
    std::chrono::steady_clock::time_point last_change;
};

struct PeerConnected {
    std::string peer_id;
};

struct PeerDisconnected {
    std::string peer_id;
};

// Reconnect budget exhausted
struct PeerUnreachable {
    std::string peer_id;
    int attempts = 0;
};

using ConnectionEvent = std::variant<PeerConnected, PeerDisconnected, PeerUnreachable>;

// Turns raw transport callbacks into a managed peer set with bounded,
// non-duplicated connection attempts. Knows nothing about cryptography.
class ConnectionManager : public protocol::FrameSink {
public:
    ConnectionManager(net::Transport& transport, core::Scheduler& scheduler, ConnectionPolicy policy = {});
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Transport callbacks
    void handle_peer_found(const std::string& peer_id);
    void handle_peer_lost(const std::string& peer_id);
    void handle_link_state(const std::string& peer_id, net::LinkState state);

    // Re-validates the connected set before sending; a transport
    // NotConnected result resynchronizes the peer instead of failing hard
    net::SendStatus deliver(const std::string& peer_id, std::span<const uint8_t> frame) override;
    bool is_connected(const std::string& peer_id) const override;
    std::vector<std::string> connected_peers() const override;

    // Asks the transport to drop the link; state follows its callback
    void disconnect(const std::string& peer_id);

    // Stops acting on timers and callbacks
    void shutdown();

    std::optional<PeerConnection> peer(const std::string& peer_id) const;
    size_t tracked_peers() const;
    size_t connected_count() const;

    struct Stats {
        uint64_t connect_requests = 0;
        uint64_t retries = 0;
        uint64_t safety_timeouts = 0;
        uint64_t unreachable = 0;
        uint64_t frames_sent = 0;
        uint64_t resyncs = 0;
    };
    Stats stats() const;

    const ConnectionPolicy& policy() const { return policy_; }

    core::EventChannel<ConnectionEvent>& events() { return events_; }

private:
    size_t connected_count_locked() const;
    uint64_t begin_attempt_locked(PeerConnection& peer);
    PeerConnection& record_locked(const std::string& peer_id);

    void request_connect(const std::string& peer_id, uint64_t generation);
    void on_safety_timeout(const std::string& peer_id, uint64_t generation);
    void schedule_retry(const std::string& peer_id);
    void on_retry(const std::string& peer_id, uint64_t generation);

    net::Transport& transport_;
    core::Scheduler& scheduler_;
    ConnectionPolicy policy_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PeerConnection> peers_;
    Stats stats_;
    bool stopping_ = false;

    core::EventChannel<ConnectionEvent> events_;
};

} // namespace airmesh::mesh
