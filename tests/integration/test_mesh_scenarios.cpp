#include <catch2/catch_test_macros.hpp>
#include "airmesh/core/node.hpp"
#include "airmesh/net/loopback_transport.hpp"
#include "helpers/wait.hpp"
#include <mutex>

using namespace airmesh;
using core::MeshNode;
using core::NodeConfig;
using core::RuntimeConfig;
using mesh::FeatureMessage;
using mesh::FeatureRoute;
using protocol::MessageType;
using testing::wait_until;
using namespace std::chrono_literals;

namespace {

RuntimeConfig node_config(const std::string& name) {
    NodeConfig config;
    config.display_name = name;
    config.device_id = name + "-device";
    config.num_threads = 4;
    config.handshake_response_timeout_ms = 500;
    config.handshake_backoff_ms = 50;
    config.connect_timeout_ms = 200;
    config.attempt_safety_timeout_ms = 300;
    config.reconnect_backoff_ms = 50;
    config.max_reconnect_attempts = 3;
    config.probe_timeout_ms = 500;
    config.repair_interval_seconds = 1;

    auto runtime = RuntimeConfig::resolve(config);
    REQUIRE(runtime.has_value());
    return *runtime;
}

// Thread-safe collector for one feature channel
class Inbox {
public:
    void attach(MeshNode& node, FeatureRoute route) {
        node.router().channel(route).subscribe([this](const FeatureMessage& message) {
            std::lock_guard lock(mutex_);
            messages_.push_back(message);
        });
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return messages_.size();
    }

    std::vector<FeatureMessage> messages() const {
        std::lock_guard lock(mutex_);
        return messages_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<FeatureMessage> messages_;
};

std::vector<uint8_t> bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

// Hub, transports and nodes in destruction-safe order
struct Mesh {
    Mesh()
        : alice_transport(hub.create_endpoint("alice"))
        , bob_transport(hub.create_endpoint("bob"))
        , alice(node_config("alice"), *alice_transport)
        , bob(node_config("bob"), *bob_transport) {
        alice_chat.attach(alice, FeatureRoute::Chat);
        bob_chat.attach(bob, FeatureRoute::Chat);
    }

    void start() {
        alice.start();
        bob.start();
    }

    bool sessions_up() {
        return alice.has_session("bob") && bob.has_session("alice");
    }

    Inbox alice_chat;
    Inbox bob_chat;
    net::LoopbackHub hub;
    std::unique_ptr<net::LoopbackTransport> alice_transport;
    std::unique_ptr<net::LoopbackTransport> bob_transport;
    MeshNode alice;
    MeshNode bob;
};

void require_chat(Mesh& mesh, const std::string& text) {
    auto before = mesh.bob_chat.size();
    REQUIRE(mesh.alice.send("bob", MessageType::Chat, bytes(text)).is_ok());
    REQUIRE(wait_until([&] { return mesh.bob_chat.size() == before + 1; }));

    auto received = mesh.bob_chat.messages().back();
    REQUIRE(received.payload == bytes(text));
    REQUIRE(received.sender_id == "alice");
    REQUIRE(received.encrypted);
}

} // anonymous namespace

TEST_CASE("Two nodes meet and talk", "[integration]") {
    Mesh mesh;
    mesh.start();

    REQUIRE(wait_until([&] { return mesh.sessions_up(); }, 10s));
    REQUIRE(mesh.hub.linked("alice", "bob"));
    REQUIRE(mesh.alice.cipher().identity("bob")->device_id == "bob-device");
    REQUIRE(mesh.bob.cipher().identity("alice")->device_id == "alice-device");

    require_chat(mesh, "hello from alice");

    REQUIRE(mesh.bob.send("alice", MessageType::Chat, bytes("hello from bob")).is_ok());
    REQUIRE(wait_until([&] { return mesh.alice_chat.size() == 1; }));
    REQUIRE(mesh.alice_chat.messages()[0].payload == bytes("hello from bob"));

    SECTION("Plaintext broadcast") {
        Inbox signals;
        signals.attach(mesh.bob, FeatureRoute::Signal);
        REQUIRE(mesh.alice.broadcast(MessageType::Emergency, bytes("sos")) == 1);
        REQUIRE(wait_until([&] { return signals.size() == 1; }));
        REQUIRE_FALSE(signals.messages()[0].encrypted);
        REQUIRE(signals.messages()[0].type == MessageType::Emergency);
    }

    SECTION("Node statistics") {
        auto stats = mesh.alice.stats();
        REQUIRE(stats.connected_peers == 1);
        REQUIRE(stats.sessions == 1);
        REQUIRE(stats.router.sent >= 1);
        REQUIRE(stats.router.handshake_frames >= 1);
        auto started = stats.supervisor.handshakes_started + mesh.bob.stats().supervisor.handshakes_started;
        REQUIRE(started >= 1);
    }

    SECTION("Stopping is idempotent") {
        mesh.alice.stop();
        mesh.alice.stop();
        REQUIRE_FALSE(mesh.alice.running());
    }
}

TEST_CASE("A severed link is rebuilt with a new session", "[integration]") {
    Mesh mesh;
    mesh.start();
    REQUIRE(wait_until([&] { return mesh.sessions_up(); }, 10s));
    require_chat(mesh, "before");

    mesh.hub.sever("alice", "bob");

    // Both sides drop the session with the link, then reconnect and rekey
    REQUIRE(wait_until([&] { return mesh.alice.stats().connections.connect_requests >= 2 ||
                                    mesh.bob.stats().connections.connect_requests >= 2; }, 10s));
    REQUIRE(wait_until([&] { return mesh.hub.linked("alice", "bob") && mesh.sessions_up(); }, 10s));

    require_chat(mesh, "after");
}

TEST_CASE("Malformed frames do not disturb a session", "[integration]") {
    Mesh mesh;
    mesh.start();
    REQUIRE(wait_until([&] { return mesh.sessions_up(); }, 10s));

    std::vector<uint8_t> garbage = {0xFF, 0x00, 0x13, 0x37};
    std::vector<uint8_t> truncated_request = {0x01, 0x05, 0x00};
    std::vector<uint8_t> forged_chat = protocol::encode(
        protocol::make_feature_message(MessageType::Chat, bytes("forged")));

    mesh.bob.on_data_received("alice", garbage);
    mesh.bob.on_data_received("alice", truncated_request);
    mesh.bob.on_data_received("alice", forged_chat);

    auto stats = mesh.bob.router().stats();
    REQUIRE(stats.malformed == 2);
    REQUIRE(stats.crypto_rejected == 1);
    REQUIRE(mesh.bob_chat.size() == 0);
    REQUIRE(mesh.bob.has_session("alice"));

    require_chat(mesh, "still here");
}

TEST_CASE("Duplicated frames are delivered once", "[integration]") {
    Mesh mesh;
    mesh.hub.set_duplicate_delivery(true);
    mesh.start();
    REQUIRE(wait_until([&] { return mesh.sessions_up(); }, 10s));

    for (int i = 0; i < 3; ++i) {
        REQUIRE(mesh.alice.send("bob", MessageType::Chat, bytes("copy " + std::to_string(i))).is_ok());
    }
    REQUIRE(wait_until([&] { return mesh.bob_chat.size() == 3; }));
    mesh.hub.flush();

    REQUIRE(mesh.bob_chat.size() == 3);
    REQUIRE(mesh.bob.router().stats().crypto_rejected >= 3);
}

TEST_CASE("Unanswered invitations give up", "[integration]") {
    Mesh mesh;
    mesh.hub.set_accepting("alice", false);
    mesh.hub.set_accepting("bob", false);
    mesh.start();

    REQUIRE(wait_until([&] { return mesh.alice.connections().stats().unreachable >= 1; }, 10s));
    REQUIRE(mesh.alice.connections().stats().safety_timeouts >= 1);
    REQUIRE(mesh.hub.connect_requests("alice", "bob") == 4);
    REQUIRE_FALSE(mesh.hub.linked("alice", "bob"));
    REQUIRE_FALSE(mesh.alice.has_session("bob"));

    auto result = mesh.alice.send("bob", MessageType::Chat, bytes("anyone?"));
    REQUIRE(result.error() == airmesh::mesh::RouteError::NotConnected);
}

TEST_CASE("A key exchange over a dead link is repaired later", "[integration]") {
    Mesh mesh;
    mesh.hub.set_link_enabled("alice", "bob", false);
    mesh.start();

    // The link comes up but carries nothing, so the probe rejects it
    REQUIRE(wait_until([&] { return mesh.hub.linked("alice", "bob"); }));
    REQUIRE(wait_until([&] {
        return mesh.alice.supervisor().stats().probe_failures >= 1 &&
               mesh.bob.supervisor().stats().probe_failures >= 1;
    }, 10s));
    REQUIRE_FALSE(mesh.alice.has_session("bob"));

    mesh.hub.set_link_enabled("alice", "bob", true);

    // A repair pass retries the key exchange without probing
    REQUIRE(wait_until([&] { return mesh.sessions_up(); }, 15s));
    REQUIRE(mesh.alice.supervisor().stats().repairs + mesh.bob.supervisor().stats().repairs >= 1);

    require_chat(mesh, "repaired");
}
