#pragma once

#include "airmesh/core/event_channel.hpp"
#include "airmesh/mesh/flood_guard.hpp"
#include "airmesh/mesh/stability_probe.hpp"
#include "airmesh/protocol/frame_sink.hpp"
#include "airmesh/protocol/handshake.hpp"
#include "airmesh/protocol/session_cipher.hpp"
#include "airmesh/protocol/wire.hpp"
#include "airmesh/util/result.hpp"
#include <array>
#include <mutex>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace airmesh::mesh {

// Collaborator-facing channels; emergency traffic shares the signal channel
enum class FeatureRoute {
    Signal,
    Chat,
    Game,
    System,
    Topology
};

inline constexpr size_t FEATURE_ROUTE_COUNT = 5;

std::string_view to_string(FeatureRoute route);

// nullopt for the key-exchange types, which never reach a feature
std::optional<FeatureRoute> route_for(protocol::MessageType type);

struct FeatureMessage {
    protocol::MessageType type = protocol::MessageType::Chat;
    std::vector<uint8_t> payload;
    std::string sender_id;
    bool encrypted = false;
};

enum class RouteError {
    ReservedType,
    NoSessionKey,
    NotConnected,
    SendFailed
};

std::string_view to_string(RouteError error);

struct RouterPolicy {
    // Payloads of these types travel inside the encrypted envelope
    std::set<protocol::MessageType> encrypted_types{
        protocol::MessageType::Chat,
        protocol::MessageType::Game
    };

    // Inbound rate limit per peer
    FloodPolicy flood;
};

// Single entry point for inbound bytes and the send path for features.
// Inbound traffic fails closed: anything that does not decode, authenticate
// or decrypt is dropped and counted.
class MessageRouter {
public:
    MessageRouter(
        protocol::HandshakeProtocol& handshake,
        protocol::SessionCipher& cipher,
        protocol::FrameSink& sink,
        StabilityProbe& probe,
        RouterPolicy policy = {}
    );

    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

    void on_bytes_received(const std::string& peer_id, std::span<const uint8_t> bytes);

    util::Result<util::Unit, RouteError> send(
        const std::string& peer_id,
        protocol::MessageType type,
        std::span<const uint8_t> payload
    );

    // Sends to every connected peer; returns the number of deliveries
    size_t broadcast(protocol::MessageType type, std::span<const uint8_t> payload);

    core::EventChannel<FeatureMessage>& channel(FeatureRoute route);

    bool is_encrypted(protocol::MessageType type) const;

    struct Stats {
        uint64_t received = 0;
        uint64_t sent = 0;
        uint64_t malformed = 0;
        uint64_t unrecognized = 0;
        uint64_t crypto_rejected = 0;
        uint64_t handshake_frames = 0;
        uint64_t probe_frames = 0;
        uint64_t flood_dropped = 0;
    };
    Stats stats() const;

    const RouterPolicy& policy() const { return policy_; }

    FloodGuard& flood_guard() { return flood_; }

private:
    void dispatch_feature(const std::string& peer_id, const protocol::FeaturePayload& feature);
    void publish(FeatureMessage message);

    protocol::HandshakeProtocol& handshake_;
    protocol::SessionCipher& cipher_;
    protocol::FrameSink& sink_;
    StabilityProbe& probe_;
    RouterPolicy policy_;
    FloodGuard flood_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    std::array<core::EventChannel<FeatureMessage>, FEATURE_ROUTE_COUNT> channels_;
};

} // namespace airmesh::mesh
