#pragma once

#include "airmesh/core/event_channel.hpp"
#include "airmesh/crypto/curve25519.hpp"
#include "airmesh/protocol/frame_sink.hpp"
#include "airmesh/protocol/session_cipher.hpp"
#include "airmesh/protocol/wire.hpp"
#include "airmesh/util/result.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <variant>

namespace airmesh::protocol {

struct HandshakePolicy {
    int max_attempts = 3;

    // How long each request waits for the session to appear
    std::chrono::milliseconds response_timeout{3000};

    // Delay before retry k is backoff_base * 2^(k-1)
    std::chrono::milliseconds backoff_base{2000};
};

enum class HandshakeError {
    Timeout,
    PeerNotConnected,
    Cancelled,
    InProgress
};

std::string_view to_string(HandshakeError error);

namespace handshake_state {

struct NoSession {};

struct RequestSent {
    uint8_t retry_count = 0;
    std::chrono::steady_clock::time_point sent_at;
};

struct Established {};

struct Failed {
    std::string reason;
};

} // namespace handshake_state

using HandshakeState = std::variant<
    handshake_state::NoSession,
    handshake_state::RequestSent,
    handshake_state::Established,
    handshake_state::Failed
>;

std::string_view state_name(const HandshakeState& state);

struct HandshakeEstablished {
    PeerIdentity peer;
    bool initiator = false;
};

struct HandshakeFailed {
    std::string peer_id;
    std::string reason;
};

// The peer answered a key exchange with an error status
struct PeerReportedError {
    std::string peer_id;
    std::string message;
};

using HandshakeEvent = std::variant<HandshakeEstablished, HandshakeFailed, PeerReportedError>;

// X25519 key exchange that bootstraps one SessionKey per peer. The initiator
// sends its identity key; the responder answers with a fresh ephemeral key,
// so every session starts from new key material.
class HandshakeProtocol {
public:
    HandshakeProtocol(
        crypto::X25519KeyPair identity,
        std::string sender_id,
        SessionCipher& cipher,
        FrameSink& sink,
        HandshakePolicy policy = {}
    );
    ~HandshakeProtocol();

    HandshakeProtocol(const HandshakeProtocol&) = delete;
    HandshakeProtocol& operator=(const HandshakeProtocol&) = delete;

    // Blocks for at most max_attempts * response_timeout plus backoff.
    // Succeeds immediately when a session already exists.
    util::Result<util::Unit, HandshakeError> initiate(const std::string& peer_id);

    void handle_request(const std::string& peer_id, const KeyExchangeRequest& request);
    void handle_response(const std::string& peer_id, const KeyExchangeResponse& response);

    // Forgets the peer: cancels a waiting initiate() and drops its session
    void reset(const std::string& peer_id);

    // Cancels every waiting initiate(); later calls fail with Cancelled
    void shutdown();

    HandshakeState state(const std::string& peer_id) const;
    bool initiating(const std::string& peer_id) const;

    const crypto::PublicKey& public_key() const { return identity_.public_key(); }
    const std::string& sender_id() const { return sender_id_; }
    const HandshakePolicy& policy() const { return policy_; }

    core::EventChannel<HandshakeEvent>& events() { return events_; }

private:
    enum class WaitResult { Session, Cancelled, TimedOut };

    struct PeerEntry {
        HandshakeState state = handshake_state::NoSession{};
        uint64_t generation = 0;
        bool initiating = false;
        // A request from the peer is being answered; cleared once installed
        bool responding = false;
    };

    // Retry delays stop doubling past this point
    static constexpr int MAX_BACKOFF_SHIFT = 16;

    WaitResult wait_for_session(const std::string& peer_id, uint64_t generation,
                                std::chrono::milliseconds timeout);
    bool cancelled_locked(const std::string& peer_id, uint64_t generation) const;
    util::Result<util::Unit, HandshakeError> conclude(const std::string& peer_id, uint64_t generation,
                                                      WaitResult result, HandshakeError last_error);
    void reply(const std::string& peer_id, KeyExchangeStatus status,
               const crypto::PublicKey& key, std::optional<std::string> error = std::nullopt);
    void finish_responding(const std::string& peer_id);
    void on_session_event(const SessionEvent& event);
    std::chrono::milliseconds backoff_delay(int attempt) const;

    crypto::X25519KeyPair identity_;
    std::string sender_id_;
    SessionCipher& cipher_;
    FrameSink& sink_;
    HandshakePolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, PeerEntry> peers_;
    bool stopping_ = false;

    core::EventChannel<SessionEvent>::SubscriptionId cipher_subscription_ = 0;
    core::EventChannel<HandshakeEvent> events_;
};

} // namespace airmesh::protocol
