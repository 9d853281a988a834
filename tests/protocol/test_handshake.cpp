#include <catch2/catch_test_macros.hpp>
#include "airmesh/protocol/handshake.hpp"
#include "helpers/wait.hpp"
#include <algorithm>
#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

using namespace airmesh::protocol;
using namespace airmesh::crypto;
using airmesh::net::SendStatus;
using airmesh::testing::wait_until;

namespace {

// Hands frames straight to the other side's handshake on the sending thread
class DirectLink : public FrameSink {
public:
    explicit DirectLink(std::string local_id) : local_id_(std::move(local_id)) {}

    void attach(HandshakeProtocol& remote) { remote_ = &remote; }

    SendStatus deliver(const std::string&, std::span<const uint8_t> frame) override {
        if (!connected) {
            return SendStatus::NotConnected;
        }

        auto message = decode(frame);
        if (!message) {
            return SendStatus::Failed;
        }
        {
            std::lock_guard lock(mutex_);
            sent_.push_back(*message);
        }
        if (vanish_after_send) {
            connected = false;
            return SendStatus::Sent;
        }
        if (drop || remote_ == nullptr) {
            return SendStatus::Sent;
        }

        if (auto* request = std::get_if<KeyExchangeRequest>(&message->payload)) {
            remote_->handle_request(local_id_, *request);
        } else if (auto* response = std::get_if<KeyExchangeResponse>(&message->payload)) {
            remote_->handle_response(local_id_, *response);
        }
        return SendStatus::Sent;
    }

    bool is_connected(const std::string&) const override {
        // Runs once, on the caller's thread, before the connectivity answer
        if (before_connected_check) {
            auto hook = std::move(before_connected_check);
            before_connected_check = nullptr;
            hook();
        }
        return connected;
    }

    std::vector<std::string> connected_peers() const override { return {}; }

    std::vector<WireMessage> sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    std::atomic<bool> connected{true};
    std::atomic<bool> drop{false};

    // The peer goes away right after this frame is handed over
    std::atomic<bool> vanish_after_send{false};

    mutable std::function<void()> before_connected_check;

    size_t requests_sent() const {
        std::lock_guard lock(mutex_);
        return std::count_if(sent_.begin(), sent_.end(), [](const WireMessage& message) {
            return std::holds_alternative<KeyExchangeRequest>(message.payload);
        });
    }

private:
    std::string local_id_;
    HandshakeProtocol* remote_ = nullptr;
    mutable std::mutex mutex_;
    std::vector<WireMessage> sent_;
};

HandshakePolicy quick_policy() {
    HandshakePolicy policy;
    policy.max_attempts = 2;
    policy.response_timeout = std::chrono::milliseconds(100);
    policy.backoff_base = std::chrono::milliseconds(10);
    return policy;
}

// Alice reaches Bob as "bob"; Bob reaches Alice as "alice"
struct Pair {
    explicit Pair(HandshakePolicy policy = quick_policy())
        : Pair(X25519KeyPair::generate(), X25519KeyPair::generate(), policy) {}

    Pair(X25519KeyPair alice_key, X25519KeyPair bob_key, HandshakePolicy policy = quick_policy())
        : alice_link("alice")
        , bob_link("bob")
        , alice(std::move(alice_key), "alice-device", alice_cipher, alice_link, policy)
        , bob(std::move(bob_key), "bob-device", bob_cipher, bob_link, policy) {
        alice_link.attach(bob);
        bob_link.attach(alice);
    }

    SessionCipher alice_cipher;
    SessionCipher bob_cipher;
    DirectLink alice_link;
    DirectLink bob_link;
    HandshakeProtocol alice;
    HandshakeProtocol bob;
};

std::vector<uint8_t> bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

void require_working_sessions(Pair& pair) {
    auto to_bob = pair.alice_cipher.encrypt("bob", bytes("ping"));
    REQUIRE(to_bob.is_ok());
    auto at_bob = pair.bob_cipher.decrypt("alice", *to_bob);
    REQUIRE(at_bob.is_ok());
    REQUIRE(*at_bob == bytes("ping"));

    auto to_alice = pair.bob_cipher.encrypt("alice", bytes("pong"));
    REQUIRE(to_alice.is_ok());
    auto at_alice = pair.alice_cipher.decrypt("bob", *to_alice);
    REQUIRE(at_alice.is_ok());
    REQUIRE(*at_alice == bytes("pong"));
}

} // anonymous namespace

TEST_CASE("Handshake establishes a session", "[protocol][handshake]") {
    Pair pair;

    std::vector<HandshakeEstablished> alice_events;
    std::vector<HandshakeEstablished> bob_events;
    pair.alice.events().subscribe([&](const HandshakeEvent& event) {
        if (auto* e = std::get_if<HandshakeEstablished>(&event)) alice_events.push_back(*e);
    });
    pair.bob.events().subscribe([&](const HandshakeEvent& event) {
        if (auto* e = std::get_if<HandshakeEstablished>(&event)) bob_events.push_back(*e);
    });

    auto result = pair.alice.initiate("bob");
    REQUIRE(result.is_ok());

    REQUIRE(pair.alice_cipher.has_session("bob"));
    REQUIRE(pair.bob_cipher.has_session("alice"));
    REQUIRE(state_name(pair.alice.state("bob")) == "established");
    REQUIRE(state_name(pair.bob.state("alice")) == "established");
    REQUIRE_FALSE(pair.alice.initiating("bob"));

    SECTION("Both ciphers agree") {
        require_working_sessions(pair);
    }

    SECTION("One message each way") {
        auto frame = pair.alice_cipher.encrypt("bob", bytes("hello"));
        auto opened = pair.bob_cipher.decrypt("alice", *frame);
        REQUIRE(*opened == bytes("hello"));
        REQUIRE(pair.alice_cipher.message_number("bob") == 1u);
        REQUIRE(pair.bob_cipher.message_number("alice") == 1u);
    }

    SECTION("Device ids are announced") {
        REQUIRE(pair.alice_cipher.identity("bob")->device_id == "bob-device");
        REQUIRE(pair.bob_cipher.identity("alice")->device_id == "alice-device");
        REQUIRE(pair.alice_cipher.has_session("bob-device"));
    }

    SECTION("Events name the initiator") {
        REQUIRE(alice_events.size() == 1);
        REQUIRE(alice_events[0].initiator);
        REQUIRE(alice_events[0].peer.peer_id == "bob");
        REQUIRE(bob_events.size() == 1);
        REQUIRE_FALSE(bob_events[0].initiator);
    }

    SECTION("Responder answers with a fresh key") {
        auto replies = pair.bob_link.sent();
        REQUIRE(replies.size() == 1);
        auto& response = std::get<KeyExchangeResponse>(replies[0].payload);
        REQUIRE(response.status == KeyExchangeStatus::Success);
        REQUIRE(response.sender_id == "bob-device");
        REQUIRE(response.public_key != pair.bob.public_key().to_vector());
    }

    SECTION("Request carries the identity key") {
        auto requests = pair.alice_link.sent();
        REQUIRE(requests.size() == 1);
        auto& request = std::get<KeyExchangeRequest>(requests[0].payload);
        REQUIRE(request.retry_count == 0);
        REQUIRE(request.sender_id == "alice-device");
        REQUIRE(request.public_key == pair.alice.public_key().to_vector());
    }

    SECTION("Initiating again is a no-op") {
        REQUIRE(pair.alice.initiate("bob").is_ok());
        REQUIRE(pair.bob.initiate("alice").is_ok());
        REQUIRE(pair.alice_link.sent().size() == 1);
        REQUIRE(pair.bob_link.sent().size() == 1);
    }

    SECTION("A repeated request is answered alreadyEstablished") {
        auto request = std::get<KeyExchangeRequest>(pair.alice_link.sent()[0].payload);
        pair.bob.handle_request("alice", request);

        auto replies = pair.bob_link.sent();
        REQUIRE(replies.size() == 2);
        REQUIRE(std::get<KeyExchangeResponse>(replies[1].payload).status == KeyExchangeStatus::AlreadyEstablished);
        require_working_sessions(pair);
    }

    SECTION("A discarded session returns to no session") {
        pair.alice_cipher.remove("bob");
        REQUIRE(state_name(pair.alice.state("bob")) == "no session");
    }
}

TEST_CASE("Handshake with an unreachable peer", "[protocol][handshake]") {
    Pair pair;

    std::vector<HandshakeFailed> failures;
    pair.alice.events().subscribe([&](const HandshakeEvent& event) {
        if (auto* e = std::get_if<HandshakeFailed>(&event)) failures.push_back(*e);
    });

    SECTION("Not connected") {
        pair.alice_link.connected = false;

        auto result = pair.alice.initiate("bob");
        REQUIRE(result.error() == HandshakeError::PeerNotConnected);
        REQUIRE(pair.alice_link.sent().empty());
    }

    SECTION("Requests are lost") {
        pair.alice_link.drop = true;

        auto result = pair.alice.initiate("bob");
        REQUIRE(result.error() == HandshakeError::Timeout);

        auto requests = pair.alice_link.sent();
        REQUIRE(requests.size() == 2);
        REQUIRE(std::get<KeyExchangeRequest>(requests[0].payload).retry_count == 0);
        REQUIRE(std::get<KeyExchangeRequest>(requests[1].payload).retry_count == 1);
    }

    REQUIRE(state_name(pair.alice.state("bob")) == "failed");
    REQUIRE_FALSE(pair.alice_cipher.has_session("bob"));
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].peer_id == "bob");

    // A later attempt starts over and succeeds once the link works
    pair.alice_link.connected = true;
    pair.alice_link.drop = false;
    REQUIRE(pair.alice.initiate("bob").is_ok());
    REQUIRE(pair.bob_cipher.has_session("alice"));
}

TEST_CASE("Peer disconnects during the handshake", "[protocol][handshake]") {
    Pair pair;
    pair.alice_link.vanish_after_send = true;

    auto result = pair.alice.initiate("bob");
    REQUIRE(result.is_err());
    REQUIRE(result.error() == HandshakeError::PeerNotConnected);

    REQUIRE(pair.alice_link.sent().size() == 1);
    REQUIRE(state_name(pair.alice.state("bob")) == "failed");
    REQUIRE_FALSE(pair.alice.initiating("bob"));
    REQUIRE_FALSE(pair.alice_cipher.has_session("bob"));
    REQUIRE_FALSE(pair.bob_cipher.has_session("alice"));
}

TEST_CASE("Simultaneous initiation converges", "[protocol][handshake]") {
    Pair pair;

    auto from_alice = std::async(std::launch::async, [&] { return pair.alice.initiate("bob"); });
    auto from_bob = std::async(std::launch::async, [&] { return pair.bob.initiate("alice"); });

    REQUIRE(from_alice.get().is_ok());
    REQUIRE(from_bob.get().is_ok());

    REQUIRE(pair.alice_cipher.has_session("bob"));
    REQUIRE(pair.bob_cipher.has_session("alice"));
    require_working_sessions(pair);
}

TEST_CASE("Answering the peer's request replaces our own", "[protocol][handshake]") {
    // Bob holds the lower key, so Bob answers when both sides initiate
    auto first = X25519KeyPair::generate();
    auto second = X25519KeyPair::generate();
    if (first.public_key() < second.public_key()) {
        std::swap(first, second);
    }
    Pair pair(std::move(first), std::move(second));
    REQUIRE(pair.bob.public_key() < pair.alice.public_key());

    // Alice's request reaches Bob after Bob decided to initiate but before
    // Bob put its own request on the wire
    std::optional<airmesh::util::Result<airmesh::util::Unit, HandshakeError>> alice_result;
    pair.bob_link.before_connected_check = [&] {
        alice_result = pair.alice.initiate("bob");
    };

    auto bob_result = pair.bob.initiate("alice");

    REQUIRE(alice_result.has_value());
    REQUIRE(alice_result->is_ok());
    REQUIRE(bob_result.is_ok());

    SECTION("Bob never sends a request of its own") {
        REQUIRE(pair.bob_link.requests_sent() == 0);
        REQUIRE(pair.alice_link.requests_sent() == 1);
    }

    SECTION("Both sides hold the same session") {
        require_working_sessions(pair);
        REQUIRE(state_name(pair.alice.state("bob")) == "established");
        REQUIRE(state_name(pair.bob.state("alice")) == "established");
        REQUIRE_FALSE(pair.bob.initiating("alice"));
    }
}

TEST_CASE("Handshake rejects bad key material", "[protocol][handshake]") {
    Pair pair;

    std::vector<PeerReportedError> reported;
    pair.alice.events().subscribe([&](const HandshakeEvent& event) {
        if (auto* e = std::get_if<PeerReportedError>(&event)) reported.push_back(*e);
    });

    SECTION("Short public key") {
        KeyExchangeRequest request;
        request.sender_id = "alice-device";
        request.public_key = {0x01, 0x02, 0x03};
        pair.bob.handle_request("alice", request);

        auto replies = pair.bob_link.sent();
        REQUIRE(replies.size() == 1);
        auto& response = std::get<KeyExchangeResponse>(replies[0].payload);
        REQUIRE(response.status == KeyExchangeStatus::Error);
        REQUIRE(response.error_message == "invalid public key length");

        REQUIRE(reported.size() == 1);
        REQUIRE(reported[0].peer_id == "bob");
        REQUIRE(reported[0].message == "invalid public key length");
        REQUIRE_FALSE(pair.bob_cipher.has_session("alice"));
    }

    SECTION("All-zero public key") {
        KeyExchangeRequest request;
        request.public_key = std::vector<uint8_t>(32, 0);
        pair.bob.handle_request("alice", request);

        auto& response = std::get<KeyExchangeResponse>(pair.bob_link.sent()[0].payload);
        REQUIRE(response.status == KeyExchangeStatus::Error);
        REQUIRE(reported.size() == 1);
        REQUIRE_FALSE(pair.bob_cipher.has_session("alice"));
    }

    SECTION("Unsolicited success is ignored") {
        KeyExchangeResponse response;
        response.public_key = X25519KeyPair::generate().public_key().to_vector();
        pair.alice.handle_response("bob", response);

        REQUIRE_FALSE(pair.alice_cipher.has_session("bob"));
    }
}

TEST_CASE("Waiting handshakes can be cancelled", "[protocol][handshake]") {
    HandshakePolicy policy;
    policy.max_attempts = 1;
    policy.response_timeout = std::chrono::seconds(10);
    Pair pair(policy);
    pair.alice_link.drop = true;

    auto started = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&] { return pair.alice.initiate("bob"); });
    REQUIRE(wait_until([&] { return pair.alice_link.sent().size() == 1; }));

    REQUIRE(pair.alice.initiating("bob"));
    REQUIRE(pair.alice.initiate("bob").error() == HandshakeError::InProgress);

    SECTION("By reset") {
        pair.alice.reset("bob");
        REQUIRE(pending.get().error() == HandshakeError::Cancelled);
        REQUIRE(state_name(pair.alice.state("bob")) == "no session");
    }

    SECTION("By shutdown") {
        pair.alice.shutdown();
        REQUIRE(pending.get().error() == HandshakeError::Cancelled);
        REQUIRE(pair.alice.initiate("carol").error() == HandshakeError::Cancelled);
    }

    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    REQUIRE_FALSE(pair.alice.initiating("bob"));
}
