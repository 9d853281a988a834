#include "airmesh/protocol/session_cipher.hpp"
#include "airmesh/crypto/chacha20poly1305.hpp"
#include "airmesh/crypto/hmac_sha256.hpp"
#include "airmesh/util/logger.hpp"

namespace airmesh::protocol {

namespace {

constexpr std::string_view KDF_SALT = "airmesh.session.salt.v1";
constexpr std::string_view KDF_INFO = "airmesh/session/v1";
constexpr std::string_view RATCHET_ENC_LABEL = "airmesh.ratchet.enc";
constexpr std::string_view RATCHET_MAC_LABEL = "airmesh.ratchet.mac";

std::span<const uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

ChainState advance(const ChainState& chain) {
    ChainState next;
    next.keys.encryption_key = crypto::ratchet_key(
        chain.keys.encryption_key, RATCHET_ENC_LABEL, chain.message_number);
    next.keys.hmac_key = crypto::ratchet_key(
        chain.keys.hmac_key, RATCHET_MAC_LABEL, chain.message_number);
    next.message_number = chain.message_number + 1;
    return next;
}

std::vector<uint8_t> mac_input(const EncryptedFrame& frame) {
    auto header = frame.auth_header();
    std::vector<uint8_t> input(header.begin(), header.end());
    input.insert(input.end(), frame.ciphertext.begin(), frame.ciphertext.end());
    return input;
}

uint64_t unix_seconds(SessionCipher::Clock::time_point tp) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    return secs < 0 ? 0 : static_cast<uint64_t>(secs);
}

// HMAC first, then the AEAD; nothing is returned unless both verify
util::Result<std::vector<uint8_t>, CryptoError> open_with(const ChainKeys& keys, const EncryptedFrame& frame) {
    using R = util::Result<std::vector<uint8_t>, CryptoError>;

    if (!crypto::verify_hmac_sha256(frame.hmac, keys.hmac_key.span(), mac_input(frame))) {
        return R::err(CryptoError::AuthenticationFailed);
    }

    auto header = frame.auth_header();
    auto plaintext = crypto::ChaCha20Poly1305(keys.encryption_key)
        .open(frame.ciphertext, header, frame.message_number);
    if (!plaintext) {
        return R::err(CryptoError::DecryptionFailed);
    }
    return R::ok(std::move(*plaintext));
}

} // anonymous namespace

std::string_view to_string(CryptoError error) {
    switch (error) {
        case CryptoError::NoSessionKey: return "no session key";
        case CryptoError::InvalidPublicKey: return "invalid public key";
        case CryptoError::AuthenticationFailed: return "authentication failed";
        case CryptoError::Replay: return "replayed message";
        case CryptoError::Stale: return "stale message";
        case CryptoError::WindowExceeded: return "message number too far ahead";
        case CryptoError::DecryptionFailed: return "decryption failed";
        case CryptoError::MalformedFrame: return "malformed frame";
    }
    return "unknown";
}

std::string_view to_string(DiscardReason reason) {
    switch (reason) {
        case DiscardReason::RekeyLimit: return "rekey limit";
        case DiscardReason::Expired: return "expired";
        case DiscardReason::Removed: return "removed";
    }
    return "unknown";
}

// SessionKey

util::Result<SessionKey, CryptoError> SessionKey::derive(
    const crypto::X25519KeyPair& local,
    const crypto::PublicKey& remote
) {
    using R = util::Result<SessionKey, CryptoError>;

    if (remote == local.public_key()) {
        return R::err(CryptoError::InvalidPublicKey);
    }

    auto shared = crypto::x25519(local.private_key(), remote);
    if (!shared) {
        return R::err(CryptoError::InvalidPublicKey);
    }

    const bool local_is_low = local.public_key() < remote;
    const crypto::PublicKey& low = local_is_low ? local.public_key() : remote;
    const crypto::PublicKey& high = local_is_low ? remote : local.public_key();

    std::vector<uint8_t> info(KDF_INFO.begin(), KDF_INFO.end());
    info.insert(info.end(), low.data(), low.data() + low.size());
    info.insert(info.end(), high.data(), high.data() + high.size());

    auto okm = crypto::hkdf<4>(as_bytes(KDF_SALT), shared->span(), info);

    const ChainKeys low_to_high{okm[0], okm[1]};
    const ChainKeys high_to_low{okm[2], okm[3]};

    SessionKey key;
    key.sending.keys = local_is_low ? low_to_high : high_to_low;
    key.receiving.keys = local_is_low ? high_to_low : low_to_high;
    return R::ok(std::move(key));
}

// SessionCipher

SessionCipher::SessionCipher(SessionPolicy policy)
    : policy_(policy)
    , clock_([] { return Clock::now(); }) {}

void SessionCipher::set_clock(ClockSource clock) {
    std::lock_guard lock(mutex_);
    clock_ = std::move(clock);
}

SessionCipher::Clock::time_point SessionCipher::now_locked() const {
    return clock_();
}

SessionCipher::Table::iterator SessionCipher::resolve_locked(const std::string& id) {
    auto it = sessions_.find(id);
    if (it != sessions_.end()) {
        return it;
    }
    auto mapped = device_to_peer_.find(id);
    if (mapped != device_to_peer_.end()) {
        return sessions_.find(mapped->second);
    }
    return sessions_.end();
}

SessionCipher::Table::const_iterator SessionCipher::resolve_locked(const std::string& id) const {
    auto it = sessions_.find(id);
    if (it != sessions_.end()) {
        return it;
    }
    auto mapped = device_to_peer_.find(id);
    if (mapped != device_to_peer_.end()) {
        return sessions_.find(mapped->second);
    }
    return sessions_.end();
}

bool SessionCipher::expired_locked(const Entry& entry, Clock::time_point now) const {
    return now - entry.key.created_at >= policy_.rekey_after_time;
}

void SessionCipher::erase_locked(Table::iterator it) {
    if (it->second.device_id) {
        device_to_peer_.erase(*it->second.device_id);
    }
    sessions_.erase(it);
}

void SessionCipher::install(const std::string& peer_id, SessionKey key,
                            std::optional<std::string> device_id) {
    PeerIdentity identity{peer_id, device_id};
    {
        std::lock_guard lock(mutex_);
        key.created_at = now_locked();

        auto existing = sessions_.find(peer_id);
        if (existing != sessions_.end()) {
            erase_locked(existing);
        }

        if (device_id) {
            auto mapped = device_to_peer_.find(*device_id);
            if (mapped != device_to_peer_.end() && mapped->second != peer_id) {
                auto stale = sessions_.find(mapped->second);
                if (stale != sessions_.end()) {
                    erase_locked(stale);
                }
            }
            device_to_peer_[*device_id] = peer_id;
        }

        sessions_.emplace(peer_id, Entry{std::move(key), std::move(device_id)});
    }

    LOG_INFO("Cipher: session installed for {}", peer_id);
    events_.publish(SessionInstalled{std::move(identity)});
}

bool SessionCipher::has_session(const std::string& peer_id) const {
    std::lock_guard lock(mutex_);
    auto it = resolve_locked(peer_id);
    return it != sessions_.end() && !expired_locked(it->second, now_locked());
}

util::Result<EncryptedFrame, CryptoError> SessionCipher::encrypt(
    const std::string& peer_id,
    std::span<const uint8_t> plaintext
) {
    using R = util::Result<EncryptedFrame, CryptoError>;

    std::optional<SessionDiscarded> discarded;
    std::optional<EncryptedFrame> frame;
    {
        std::lock_guard lock(mutex_);
        const auto now = now_locked();

        auto it = resolve_locked(peer_id);
        if (it == sessions_.end()) {
            return R::err(CryptoError::NoSessionKey);
        }

        if (expired_locked(it->second, now)) {
            discarded = SessionDiscarded{it->first, DiscardReason::Expired};
            erase_locked(it);
        } else {
            SessionKey& key = it->second.key;
            ChainState& chain = key.sending;

            EncryptedFrame out;
            out.message_number = chain.message_number;
            out.timestamp = unix_seconds(now);

            auto header = out.auth_header();
            out.ciphertext = crypto::ChaCha20Poly1305(chain.keys.encryption_key)
                .seal(plaintext, header, out.message_number);
            out.hmac = crypto::hmac_sha256(chain.keys.hmac_key.span(), mac_input(out)).to_vector();

            chain = advance(chain);
            frame = std::move(out);

            if (key.message_number() >= policy_.rekey_after_messages) {
                discarded = SessionDiscarded{it->first, DiscardReason::RekeyLimit};
                erase_locked(it);
            }
        }
    }

    if (discarded) {
        LOG_INFO("Cipher: session for {} discarded ({})", discarded->peer_id, to_string(discarded->reason));
        events_.publish(*discarded);
    }

    if (!frame) {
        return R::err(CryptoError::NoSessionKey);
    }
    return R::ok(std::move(*frame));
}

util::Result<std::vector<uint8_t>, CryptoError> SessionCipher::decrypt(
    const std::string& peer_id,
    const EncryptedFrame& frame
) {
    using R = util::Result<std::vector<uint8_t>, CryptoError>;

    std::optional<SessionDiscarded> discarded;
    std::optional<R> result;
    {
        std::lock_guard lock(mutex_);
        const auto now = now_locked();

        auto it = resolve_locked(peer_id);
        if (it == sessions_.end()) {
            return R::err(CryptoError::NoSessionKey);
        }

        if (expired_locked(it->second, now)) {
            discarded = SessionDiscarded{it->first, DiscardReason::Expired};
            erase_locked(it);
            result = R::err(CryptoError::NoSessionKey);
        }

        if (!result) {
            SessionKey& key = it->second.key;
            ChainState& chain = key.receiving;
            const uint64_t n = frame.message_number;

            const uint64_t now_s = unix_seconds(now);
            const uint64_t skew = now_s > frame.timestamp ? now_s - frame.timestamp
                                                          : frame.timestamp - now_s;

            if (n + policy_.backtrack_window < chain.message_number) {
                result = R::err(CryptoError::Replay);
            } else if (skew > static_cast<uint64_t>(policy_.max_message_age.count())) {
                result = R::err(CryptoError::Stale);
            } else if (n < chain.message_number) {
                // Late frame: only numbers we skipped and have not used yet
                auto retained = key.skipped.find(n);
                if (retained == key.skipped.end()) {
                    result = R::err(CryptoError::Replay);
                } else {
                    result = open_with(retained->second, frame);
                    if (result->is_ok()) {
                        key.skipped.erase(retained);
                    }
                }
            } else if (n - chain.message_number > policy_.max_forward_skip) {
                result = R::err(CryptoError::WindowExceeded);
            } else {
                // Walk the chain forward on a copy; commit only on success
                ChainState cursor = chain;
                std::map<uint64_t, ChainKeys> passed;
                while (cursor.message_number < n) {
                    passed.emplace(cursor.message_number, cursor.keys);
                    cursor = advance(cursor);
                }

                result = open_with(cursor.keys, frame);
                if (result->is_ok()) {
                    chain = advance(cursor);
                    key.skipped.merge(passed);
                    while (!key.skipped.empty() &&
                           key.skipped.begin()->first + policy_.backtrack_window < chain.message_number) {
                        key.skipped.erase(key.skipped.begin());
                    }
                }
            }

            if (result->is_ok() && key.message_number() >= policy_.rekey_after_messages) {
                discarded = SessionDiscarded{it->first, DiscardReason::RekeyLimit};
                erase_locked(it);
            }
        }
    }

    if (discarded) {
        LOG_INFO("Cipher: session for {} discarded ({})", discarded->peer_id, to_string(discarded->reason));
        events_.publish(*discarded);
    }
    return std::move(*result);
}

util::Result<std::vector<uint8_t>, CryptoError> SessionCipher::seal(
    const std::string& peer_id,
    std::span<const uint8_t> plaintext
) {
    using R = util::Result<std::vector<uint8_t>, CryptoError>;

    auto frame = encrypt(peer_id, plaintext);
    if (!frame) {
        return R::err(frame.error());
    }
    return R::ok(frame->serialize());
}

util::Result<std::vector<uint8_t>, CryptoError> SessionCipher::open(
    const std::string& peer_id,
    std::span<const uint8_t> envelope
) {
    using R = util::Result<std::vector<uint8_t>, CryptoError>;

    auto frame = EncryptedFrame::parse(envelope);
    if (!frame) {
        return R::err(CryptoError::MalformedFrame);
    }
    return decrypt(peer_id, *frame);
}

bool SessionCipher::remove(const std::string& peer_id) {
    std::optional<SessionDiscarded> discarded;
    {
        std::lock_guard lock(mutex_);
        auto it = resolve_locked(peer_id);
        if (it == sessions_.end()) {
            return false;
        }
        discarded = SessionDiscarded{it->first, DiscardReason::Removed};
        erase_locked(it);
    }

    LOG_DEBUG("Cipher: session for {} removed", discarded->peer_id);
    events_.publish(*discarded);
    return true;
}

void SessionCipher::clear() {
    for (const auto& peer : peers()) {
        remove(peer);
    }
}

size_t SessionCipher::expire_stale_sessions() {
    std::vector<SessionDiscarded> expired;
    {
        std::lock_guard lock(mutex_);
        const auto now = now_locked();
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            auto current = it++;
            if (expired_locked(current->second, now)) {
                expired.push_back(SessionDiscarded{current->first, DiscardReason::Expired});
                erase_locked(current);
            }
        }
    }

    for (const auto& event : expired) {
        LOG_INFO("Cipher: session for {} expired", event.peer_id);
        events_.publish(event);
    }
    return expired.size();
}

std::vector<std::string> SessionCipher::peers() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(sessions_.size());
    for (const auto& [peer_id, entry] : sessions_) {
        result.push_back(peer_id);
    }
    return result;
}

size_t SessionCipher::session_count() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

std::optional<uint64_t> SessionCipher::message_number(const std::string& peer_id) const {
    std::lock_guard lock(mutex_);
    auto it = resolve_locked(peer_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.key.message_number();
}

std::optional<PeerIdentity> SessionCipher::identity(const std::string& peer_id) const {
    std::lock_guard lock(mutex_);
    auto it = resolve_locked(peer_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return PeerIdentity{it->first, it->second.device_id};
}

} // namespace airmesh::protocol
