#include "airmesh/mesh/message_router.hpp"
#include "airmesh/util/logger.hpp"
#include <type_traits>

namespace airmesh::mesh {

std::string_view to_string(FeatureRoute route) {
    switch (route) {
        case FeatureRoute::Signal: return "signal";
        case FeatureRoute::Chat: return "chat";
        case FeatureRoute::Game: return "game";
        case FeatureRoute::System: return "system";
        case FeatureRoute::Topology: return "topology";
    }
    return "unknown";
}

std::optional<FeatureRoute> route_for(protocol::MessageType type) {
    using protocol::MessageType;
    switch (type) {
        case MessageType::Signal:
        case MessageType::Emergency:
            return FeatureRoute::Signal;
        case MessageType::Chat: return FeatureRoute::Chat;
        case MessageType::System: return FeatureRoute::System;
        case MessageType::Game: return FeatureRoute::Game;
        case MessageType::Topology: return FeatureRoute::Topology;
        case MessageType::KeyExchange:
        case MessageType::KeyExchangeResponse:
            return std::nullopt;
    }
    return std::nullopt;
}

std::string_view to_string(RouteError error) {
    switch (error) {
        case RouteError::ReservedType: return "reserved type";
        case RouteError::NoSessionKey: return "no session key";
        case RouteError::NotConnected: return "not connected";
        case RouteError::SendFailed: return "send failed";
    }
    return "unknown";
}

MessageRouter::MessageRouter(
    protocol::HandshakeProtocol& handshake,
    protocol::SessionCipher& cipher,
    protocol::FrameSink& sink,
    StabilityProbe& probe,
    RouterPolicy policy
)
    : handshake_(handshake)
    , cipher_(cipher)
    , sink_(sink)
    , probe_(probe)
    , policy_(std::move(policy))
    , flood_(policy_.flood) {}

void MessageRouter::on_bytes_received(const std::string& peer_id, std::span<const uint8_t> bytes) {
    {
        std::lock_guard lock(stats_mutex_);
        ++stats_.received;
    }

    auto message = protocol::decode(bytes);

    // Malformed frames cost the sender a token like any other
    bool emergency = false;
    if (message) {
        if (const auto* feature = std::get_if<protocol::FeaturePayload>(&message->payload)) {
            emergency = feature->type == protocol::MessageType::Emergency;
        }
    }
    auto verdict = flood_.admit(peer_id, emergency);
    if (verdict != FloodVerdict::Accepted) {
        LOG_TRACE("Router: dropping frame from {} ({})", peer_id, to_string(verdict));
        std::lock_guard lock(stats_mutex_);
        ++stats_.flood_dropped;
        return;
    }

    if (!message) {
        LOG_DEBUG("Router: dropping malformed frame from {} ({} bytes): {}",
                  peer_id, bytes.size(), protocol::to_string(message.error()));
        std::lock_guard lock(stats_mutex_);
        ++stats_.malformed;
        return;
    }

    std::visit([&](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;

        if constexpr (std::is_same_v<T, protocol::KeyExchangeRequest>) {
            {
                std::lock_guard lock(stats_mutex_);
                ++stats_.handshake_frames;
            }
            handshake_.handle_request(peer_id, payload);
        } else if constexpr (std::is_same_v<T, protocol::KeyExchangeResponse>) {
            {
                std::lock_guard lock(stats_mutex_);
                ++stats_.handshake_frames;
            }
            handshake_.handle_response(peer_id, payload);
        } else if constexpr (std::is_same_v<T, protocol::FeaturePayload>) {
            dispatch_feature(peer_id, payload);
        } else {
            LOG_DEBUG("Router: dropping unrecognized type {} from {}", payload.raw_type, peer_id);
            std::lock_guard lock(stats_mutex_);
            ++stats_.unrecognized;
        }
    }, message->payload);
}

void MessageRouter::dispatch_feature(const std::string& peer_id, const protocol::FeaturePayload& feature) {
    if (feature.type == protocol::MessageType::System && is_probe_payload(feature.data)) {
        {
            std::lock_guard lock(stats_mutex_);
            ++stats_.probe_frames;
        }
        probe_.handle_payload(peer_id, feature.data);
        return;
    }

    if (!is_encrypted(feature.type)) {
        publish(FeatureMessage{feature.type, feature.data, peer_id, false});
        return;
    }

    auto plaintext = cipher_.open(peer_id, feature.data);
    if (!plaintext) {
        LOG_WARNING("Router: rejected {} frame from {}: {}",
                    protocol::to_string(feature.type), peer_id, protocol::to_string(plaintext.error()));
        std::lock_guard lock(stats_mutex_);
        ++stats_.crypto_rejected;
        return;
    }

    publish(FeatureMessage{feature.type, std::move(*plaintext), peer_id, true});
}

void MessageRouter::publish(FeatureMessage message) {
    auto route = route_for(message.type);
    if (!route) {
        return;
    }
    LOG_TRACE("Router: {} bytes of {} from {}", message.payload.size(),
              protocol::to_string(message.type), message.sender_id);
    channels_[static_cast<size_t>(*route)].publish(message);
}

util::Result<util::Unit, RouteError> MessageRouter::send(
    const std::string& peer_id,
    protocol::MessageType type,
    std::span<const uint8_t> payload
) {
    using Result = util::Result<util::Unit, RouteError>;

    if (!route_for(type)) {
        LOG_WARNING("Router: refusing to send reserved type {} to {}", protocol::to_string(type), peer_id);
        return Result::err(RouteError::ReservedType);
    }
    if (type == protocol::MessageType::System && is_probe_payload(payload)) {
        return Result::err(RouteError::ReservedType);
    }

    // Checked first so an unreachable peer does not consume a message number
    if (!sink_.is_connected(peer_id)) {
        return Result::err(RouteError::NotConnected);
    }

    std::vector<uint8_t> body;
    if (is_encrypted(type)) {
        auto sealed = cipher_.seal(peer_id, payload);
        if (!sealed) {
            LOG_DEBUG("Router: cannot seal {} for {}: {}",
                      protocol::to_string(type), peer_id, protocol::to_string(sealed.error()));
            return Result::err(sealed.error() == protocol::CryptoError::NoSessionKey
                                   ? RouteError::NoSessionKey
                                   : RouteError::SendFailed);
        }
        body = std::move(*sealed);
    } else {
        body.assign(payload.begin(), payload.end());
    }

    auto frame = protocol::encode(protocol::make_feature_message(type, body));
    switch (sink_.deliver(peer_id, frame)) {
        case net::SendStatus::Sent:
            break;
        case net::SendStatus::NotConnected:
            return Result::err(RouteError::NotConnected);
        case net::SendStatus::Failed:
            return Result::err(RouteError::SendFailed);
    }

    std::lock_guard lock(stats_mutex_);
    ++stats_.sent;
    return Result::ok(util::unit);
}

size_t MessageRouter::broadcast(protocol::MessageType type, std::span<const uint8_t> payload) {
    size_t delivered = 0;
    for (const auto& peer_id : sink_.connected_peers()) {
        auto result = send(peer_id, type, payload);
        if (result) {
            ++delivered;
        } else {
            LOG_DEBUG("Router: broadcast to {} failed: {}", peer_id, to_string(result.error()));
        }
    }
    return delivered;
}

core::EventChannel<FeatureMessage>& MessageRouter::channel(FeatureRoute route) {
    return channels_[static_cast<size_t>(route)];
}

bool MessageRouter::is_encrypted(protocol::MessageType type) const {
    return policy_.encrypted_types.contains(type);
}

MessageRouter::Stats MessageRouter::stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

} // namespace airmesh::mesh
