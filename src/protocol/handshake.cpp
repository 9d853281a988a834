#include "airmesh/protocol/handshake.hpp"
#include "airmesh/util/encoding.hpp"
#include "airmesh/util/logger.hpp"
#include <algorithm>
#include <type_traits>

namespace airmesh::protocol {

namespace {

uint32_t unix_now() {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return static_cast<uint32_t>(secs);
}

std::optional<std::string> device_id_of(const std::string& sender_id) {
    if (sender_id.empty()) {
        return std::nullopt;
    }
    return sender_id;
}

} // anonymous namespace

std::string_view to_string(HandshakeError error) {
    switch (error) {
        case HandshakeError::Timeout: return "timed out";
        case HandshakeError::PeerNotConnected: return "peer not connected";
        case HandshakeError::Cancelled: return "cancelled";
        case HandshakeError::InProgress: return "already in progress";
    }
    return "unknown";
}

std::string_view state_name(const HandshakeState& state) {
    return std::visit([](const auto& s) -> std::string_view {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, handshake_state::NoSession>) return "no session";
        else if constexpr (std::is_same_v<T, handshake_state::RequestSent>) return "request sent";
        else if constexpr (std::is_same_v<T, handshake_state::Established>) return "established";
        else return "failed";
    }, state);
}

HandshakeProtocol::HandshakeProtocol(
    crypto::X25519KeyPair identity,
    std::string sender_id,
    SessionCipher& cipher,
    FrameSink& sink,
    HandshakePolicy policy
)
    : identity_(std::move(identity))
    , sender_id_(std::move(sender_id))
    , cipher_(cipher)
    , sink_(sink)
    , policy_(policy) {
    cipher_subscription_ = cipher_.events().subscribe(
        [this](const SessionEvent& event) { on_session_event(event); });
}

HandshakeProtocol::~HandshakeProtocol() {
    shutdown();
    cipher_.events().unsubscribe(cipher_subscription_);
}

void HandshakeProtocol::shutdown() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
}

std::chrono::milliseconds HandshakeProtocol::backoff_delay(int attempt) const {
    const int shift = std::clamp(attempt - 1, 0, MAX_BACKOFF_SHIFT);
    return policy_.backoff_base * (std::chrono::milliseconds::rep{1} << shift);
}

void HandshakeProtocol::on_session_event(const SessionEvent& event) {
    std::lock_guard lock(mutex_);
    if (const auto* discarded = std::get_if<SessionDiscarded>(&event)) {
        auto it = peers_.find(discarded->peer_id);
        if (it != peers_.end() &&
            std::holds_alternative<handshake_state::Established>(it->second.state)) {
            it->second.state = handshake_state::NoSession{};
        }
    }
    // Wakes initiate() waiters on installs as well as discards
    cv_.notify_all();
}

bool HandshakeProtocol::cancelled_locked(const std::string& peer_id, uint64_t generation) const {
    if (stopping_) {
        return true;
    }
    auto it = peers_.find(peer_id);
    return it == peers_.end() || it->second.generation != generation;
}

HandshakeProtocol::WaitResult HandshakeProtocol::wait_for_session(
    const std::string& peer_id, uint64_t generation, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    bool woke = cv_.wait_for(lock, timeout, [&] {
        return cancelled_locked(peer_id, generation) || cipher_.has_session(peer_id);
    });

    if (cancelled_locked(peer_id, generation)) {
        return WaitResult::Cancelled;
    }
    return woke ? WaitResult::Session : WaitResult::TimedOut;
}

util::Result<util::Unit, HandshakeError> HandshakeProtocol::initiate(const std::string& peer_id) {
    using R = util::Result<util::Unit, HandshakeError>;

    uint64_t generation = 0;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return R::err(HandshakeError::Cancelled);
        }
        auto& entry = peers_[peer_id];
        if (cipher_.has_session(peer_id)) {
            entry.state = handshake_state::Established{};
            return R::ok(util::unit);
        }
        if (entry.initiating) {
            return R::err(HandshakeError::InProgress);
        }
        entry.initiating = true;
        entry.state = handshake_state::RequestSent{0, std::chrono::steady_clock::now()};
        generation = entry.generation;
    }

    LOG_INFO("Handshake: initiating key exchange with {}", peer_id);

    HandshakeError last_error = HandshakeError::Timeout;
    for (int attempt = 0; attempt < policy_.max_attempts; ++attempt) {
        if (attempt > 0) {
            const auto delay = backoff_delay(attempt);
            LOG_DEBUG("Handshake: retrying {} in {}ms", peer_id, delay.count());
            auto waited = wait_for_session(peer_id, generation, delay);
            if (waited != WaitResult::TimedOut) {
                return conclude(peer_id, generation, waited, last_error);
            }
        }

        if (!sink_.is_connected(peer_id)) {
            last_error = HandshakeError::PeerNotConnected;
            LOG_DEBUG("Handshake: {} not connected (attempt {}/{})", peer_id, attempt + 1, policy_.max_attempts);
            continue;
        }

        bool answered = false;
        {
            std::lock_guard lock(mutex_);
            if (cancelled_locked(peer_id, generation)) {
                break;
            }
            auto& entry = peers_[peer_id];
            // The peer's own request may have been answered since the last check
            answered = entry.responding || cipher_.has_session(peer_id);
            if (!answered) {
                entry.state = handshake_state::RequestSent{
                    static_cast<uint8_t>(attempt), std::chrono::steady_clock::now()};
            }
        }
        if (answered) {
            LOG_DEBUG("Handshake: answered {} as responder, not sending a request", peer_id);
            auto waited = wait_for_session(peer_id, generation, policy_.response_timeout);
            return conclude(peer_id, generation, waited, last_error);
        }

        KeyExchangeRequest request;
        request.retry_count = static_cast<uint8_t>(attempt);
        request.timestamp = unix_now();
        request.sender_id = sender_id_;
        request.public_key = identity_.public_key().to_vector();

        auto status = sink_.deliver(peer_id, encode(WireMessage{PROTOCOL_VERSION, std::move(request)}));
        if (status != net::SendStatus::Sent) {
            last_error = status == net::SendStatus::NotConnected ? HandshakeError::PeerNotConnected
                                                                 : HandshakeError::Timeout;
            LOG_WARNING("Handshake: request to {} not delivered ({})", peer_id, net::to_string(status));
            continue;
        }

        auto waited = wait_for_session(peer_id, generation, policy_.response_timeout);
        if (waited != WaitResult::TimedOut) {
            return conclude(peer_id, generation, waited, last_error);
        }

        last_error = HandshakeError::Timeout;
        LOG_WARNING("Handshake: no response from {} (attempt {}/{})", peer_id, attempt + 1, policy_.max_attempts);
    }

    return conclude(peer_id, generation, WaitResult::TimedOut, last_error);
}

util::Result<util::Unit, HandshakeError> HandshakeProtocol::conclude(
    const std::string& peer_id, uint64_t generation, WaitResult result, HandshakeError last_error) {
    using R = util::Result<util::Unit, HandshakeError>;

    std::string reason;
    {
        std::lock_guard lock(mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return R::err(HandshakeError::Cancelled);
        }
        it->second.initiating = false;

        if (result == WaitResult::Cancelled || cancelled_locked(peer_id, generation)) {
            if (std::holds_alternative<handshake_state::NoSession>(it->second.state) &&
                !it->second.responding) {
                peers_.erase(it);
            }
            LOG_DEBUG("Handshake: key exchange with {} cancelled", peer_id);
            return R::err(HandshakeError::Cancelled);
        }

        // A response may land between the last wait and this point
        if (result == WaitResult::Session || cipher_.has_session(peer_id)) {
            it->second.state = handshake_state::Established{};
            return R::ok(util::unit);
        }

        reason = std::format("no session after {} attempts ({})", policy_.max_attempts, to_string(last_error));
        it->second.state = handshake_state::Failed{reason};
    }

    LOG_WARNING("Handshake: key exchange with {} failed: {}", peer_id, reason);
    events_.publish(HandshakeFailed{peer_id, reason});
    return R::err(last_error);
}

void HandshakeProtocol::handle_request(const std::string& peer_id, const KeyExchangeRequest& request) {
    enum class Decision { Answer, AlreadyEstablished, Ignore };

    crypto::PublicKey remote;
    const bool key_ok = crypto::PublicKey::from_bytes(request.public_key, remote);

    // Decided under the lock so initiate() sees either the session or the
    // responding flag before it sends a request of its own
    Decision decision = Decision::Answer;
    uint64_t generation = 0;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        auto& entry = peers_[peer_id];
        if (entry.responding) {
            decision = Decision::Ignore;
        } else if (cipher_.has_session(peer_id)) {
            entry.state = handshake_state::Established{};
            decision = Decision::AlreadyEstablished;
        } else if (key_ok &&
                   std::holds_alternative<handshake_state::RequestSent>(entry.state) &&
                   remote < identity_.public_key()) {
            // Both sides initiated; the lower key answers, so ours is pending on theirs
            LOG_DEBUG("Handshake: simultaneous key exchange with {}, keeping own request", peer_id);
            decision = Decision::Ignore;
        } else if (key_ok) {
            entry.responding = true;
            generation = entry.generation;
        } else if (!entry.initiating &&
                   std::holds_alternative<handshake_state::NoSession>(entry.state)) {
            peers_.erase(peer_id);
        }
    }

    if (decision == Decision::Ignore) {
        return;
    }
    if (decision == Decision::AlreadyEstablished) {
        LOG_DEBUG("Handshake: {} already has a session, answering alreadyEstablished", peer_id);
        reply(peer_id, KeyExchangeStatus::AlreadyEstablished, identity_.public_key());
        return;
    }
    if (!key_ok) {
        LOG_WARNING("Handshake: {} sent a {}-byte public key", peer_id, request.public_key.size());
        reply(peer_id, KeyExchangeStatus::Error, identity_.public_key(), "invalid public key length");
        return;
    }

    auto ephemeral = crypto::X25519KeyPair::generate();
    auto session = SessionKey::derive(ephemeral, remote);
    if (!session) {
        finish_responding(peer_id);
        LOG_WARNING("Handshake: key agreement with {} failed: {}", peer_id, to_string(session.error()));
        reply(peer_id, KeyExchangeStatus::Error, identity_.public_key(),
              std::format("key agreement failed: {}", to_string(session.error())));
        return;
    }

    auto device_id = device_id_of(request.sender_id);
    cipher_.install(peer_id, std::move(session).value(), device_id);

    bool current = false;
    {
        std::lock_guard lock(mutex_);
        auto it = peers_.find(peer_id);
        if (it != peers_.end()) {
            it->second.responding = false;
            current = !stopping_ && it->second.generation == generation;
            if (current) {
                it->second.state = handshake_state::Established{};
            } else if (!it->second.initiating) {
                peers_.erase(it);
            }
        }
    }
    cv_.notify_all();

    if (!current) {
        // reset() ran while the session was being installed
        LOG_DEBUG("Handshake: key exchange with {} was reset, dropping the new session", peer_id);
        cipher_.remove(peer_id);
        return;
    }

    reply(peer_id, KeyExchangeStatus::Success, ephemeral.public_key());
    LOG_INFO("Handshake: session with {} established (responder, key {})",
             peer_id, util::fingerprint(remote.span()));
    events_.publish(HandshakeEstablished{PeerIdentity{peer_id, device_id}, false});
}

void HandshakeProtocol::finish_responding(const std::string& peer_id) {
    {
        std::lock_guard lock(mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return;
        }
        it->second.responding = false;
        if (!it->second.initiating &&
            std::holds_alternative<handshake_state::NoSession>(it->second.state)) {
            peers_.erase(it);
        }
    }
    cv_.notify_all();
}

void HandshakeProtocol::handle_response(const std::string& peer_id, const KeyExchangeResponse& response) {
    switch (response.status) {
        case KeyExchangeStatus::AlreadyEstablished:
            LOG_DEBUG("Handshake: {} reports an existing session", peer_id);
            return;
        case KeyExchangeStatus::Error: {
            std::string message = response.error_message.value_or("unspecified error");
            LOG_WARNING("Handshake: {} rejected key exchange: {}", peer_id, message);
            events_.publish(PeerReportedError{peer_id, std::move(message)});
            return;
        }
        case KeyExchangeStatus::Success:
            break;
    }

    if (cipher_.has_session(peer_id)) {
        LOG_DEBUG("Handshake: ignoring duplicate success from {}", peer_id);
        return;
    }

    {
        std::lock_guard lock(mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end() ||
            !(std::holds_alternative<handshake_state::RequestSent>(it->second.state) ||
              std::holds_alternative<handshake_state::Failed>(it->second.state))) {
            LOG_DEBUG("Handshake: unsolicited response from {}", peer_id);
            return;
        }
    }

    crypto::PublicKey remote;
    if (!crypto::PublicKey::from_bytes(response.public_key, remote)) {
        LOG_WARNING("Handshake: {} answered with a {}-byte public key", peer_id, response.public_key.size());
        return;
    }

    auto session = SessionKey::derive(identity_, remote);
    if (!session) {
        LOG_WARNING("Handshake: key agreement with {} failed: {}", peer_id, to_string(session.error()));
        return;
    }

    auto device_id = device_id_of(response.sender_id);
    cipher_.install(peer_id, std::move(session).value(), device_id);
    {
        std::lock_guard lock(mutex_);
        auto it = peers_.find(peer_id);
        if (it != peers_.end()) {
            it->second.state = handshake_state::Established{};
        }
    }
    cv_.notify_all();

    LOG_INFO("Handshake: session with {} established (initiator, key {})",
             peer_id, util::fingerprint(remote.span()));
    events_.publish(HandshakeEstablished{PeerIdentity{peer_id, device_id}, true});
}

void HandshakeProtocol::reset(const std::string& peer_id) {
    {
        std::lock_guard lock(mutex_);
        auto it = peers_.find(peer_id);
        if (it != peers_.end()) {
            ++it->second.generation;
            it->second.state = handshake_state::NoSession{};
            if (!it->second.initiating && !it->second.responding) {
                peers_.erase(it);
            }
        }
    }
    cv_.notify_all();
    cipher_.remove(peer_id);
}

HandshakeState HandshakeProtocol::state(const std::string& peer_id) const {
    std::lock_guard lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return handshake_state::NoSession{};
    }
    return it->second.state;
}

bool HandshakeProtocol::initiating(const std::string& peer_id) const {
    std::lock_guard lock(mutex_);
    auto it = peers_.find(peer_id);
    return it != peers_.end() && it->second.initiating;
}

void HandshakeProtocol::reply(const std::string& peer_id, KeyExchangeStatus status,
                              const crypto::PublicKey& key, std::optional<std::string> error) {
    KeyExchangeResponse response;
    response.status = status;
    response.timestamp = unix_now();
    response.sender_id = sender_id_;
    response.public_key = key.to_vector();
    response.error_message = std::move(error);

    auto sent = sink_.deliver(peer_id, encode(WireMessage{PROTOCOL_VERSION, std::move(response)}));
    if (sent != net::SendStatus::Sent) {
        LOG_WARNING("Handshake: {} response to {} not delivered ({})",
                    to_string(status), peer_id, net::to_string(sent));
    }
}

} // namespace airmesh::protocol
