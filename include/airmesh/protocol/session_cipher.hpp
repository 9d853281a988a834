#pragma once

#include "airmesh/core/event_channel.hpp"
#include "airmesh/crypto/curve25519.hpp"
#include "airmesh/crypto/types.hpp"
#include "airmesh/protocol/encrypted_frame.hpp"
#include "airmesh/util/result.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace airmesh::protocol {

enum class CryptoError {
    NoSessionKey,
    InvalidPublicKey,
    AuthenticationFailed,
    Replay,
    Stale,
    WindowExceeded,
    DecryptionFailed,
    MalformedFrame
};

std::string_view to_string(CryptoError error);

struct SessionPolicy {
    // Frames up to this many numbers behind the receive counter are still
    // accepted once, using the keys retained for them
    uint64_t backtrack_window = 10;

    // Frames whose timestamp is further than this from local time are stale
    std::chrono::seconds max_message_age{300};

    // A session serves at most this many encrypt and decrypt operations
    uint64_t rekey_after_messages = 500;

    // Sessions older than this are discarded
    std::chrono::seconds rekey_after_time{300};

    // Largest gap a single frame may skip ahead in the receive chain
    uint64_t max_forward_skip = 256;
};

// Keys for one message in one direction
struct ChainKeys {
    crypto::SymmetricKey encryption_key;
    crypto::SymmetricKey hmac_key;
};

// One direction of a session; keys ratchet after every message
struct ChainState {
    ChainKeys keys;
    uint64_t message_number = 0;
};

// Symmetric state shared with one peer after a successful key exchange.
// Sending and receiving chains are split by public-key order so both peers
// agree on them without knowing who initiated.
struct SessionKey {
    ChainState sending;
    ChainState receiving;
    std::chrono::system_clock::time_point created_at{};

    // Receive-chain keys of numbers that were skipped, for late delivery
    std::map<uint64_t, ChainKeys> skipped;

    // Total operations performed with this session
    uint64_t message_number() const {
        return sending.message_number + receiving.message_number;
    }

    // DH(local, remote) followed by HKDF-SHA256 into the two chains
    static util::Result<SessionKey, CryptoError> derive(
        const crypto::X25519KeyPair& local,
        const crypto::PublicKey& remote
    );
};

struct PeerIdentity {
    std::string peer_id;                   // transport-level display name
    std::optional<std::string> device_id;  // stable id announced in the key exchange
};

enum class DiscardReason {
    RekeyLimit,
    Expired,
    Removed
};

std::string_view to_string(DiscardReason reason);

struct SessionInstalled {
    PeerIdentity peer;
};

struct SessionDiscarded {
    std::string peer_id;
    DiscardReason reason;
};

using SessionEvent = std::variant<SessionInstalled, SessionDiscarded>;

// Per-peer authenticated encryption with a one-way key ratchet
class SessionCipher {
public:
    using Clock = std::chrono::system_clock;
    using ClockSource = std::function<Clock::time_point()>;

    explicit SessionCipher(SessionPolicy policy = {});

    SessionCipher(const SessionCipher&) = delete;
    SessionCipher& operator=(const SessionCipher&) = delete;

    // Installs (or replaces) the session for a peer. A device id already
    // mapped to another transport id moves to this one.
    void install(const std::string& peer_id, SessionKey key,
                 std::optional<std::string> device_id = std::nullopt);

    // Accepts a transport id or a mapped device id
    bool has_session(const std::string& peer_id) const;

    util::Result<EncryptedFrame, CryptoError> encrypt(
        const std::string& peer_id,
        std::span<const uint8_t> plaintext
    );

    util::Result<std::vector<uint8_t>, CryptoError> decrypt(
        const std::string& peer_id,
        const EncryptedFrame& frame
    );

    // encrypt() followed by serialization of the envelope
    util::Result<std::vector<uint8_t>, CryptoError> seal(
        const std::string& peer_id,
        std::span<const uint8_t> plaintext
    );

    // Envelope parsing followed by decrypt()
    util::Result<std::vector<uint8_t>, CryptoError> open(
        const std::string& peer_id,
        std::span<const uint8_t> envelope
    );

    // Returns true if a session was removed
    bool remove(const std::string& peer_id);

    void clear();

    // Drops sessions older than the rotation interval; returns how many
    size_t expire_stale_sessions();

    std::vector<std::string> peers() const;
    size_t session_count() const;

    std::optional<uint64_t> message_number(const std::string& peer_id) const;
    std::optional<PeerIdentity> identity(const std::string& peer_id) const;

    const SessionPolicy& policy() const { return policy_; }

    // Replaces the wall clock used for timestamps, freshness and key age
    void set_clock(ClockSource clock);

    core::EventChannel<SessionEvent>& events() { return events_; }

private:
    struct Entry {
        SessionKey key;
        std::optional<std::string> device_id;
    };
    using Table = std::map<std::string, Entry>;

    Table::iterator resolve_locked(const std::string& id);
    Table::const_iterator resolve_locked(const std::string& id) const;
    bool expired_locked(const Entry& entry, Clock::time_point now) const;
    void erase_locked(Table::iterator it);
    Clock::time_point now_locked() const;

    SessionPolicy policy_;

    mutable std::mutex mutex_;
    Table sessions_;
    std::map<std::string, std::string> device_to_peer_;
    ClockSource clock_;

    core::EventChannel<SessionEvent> events_;
};

} // namespace airmesh::protocol
