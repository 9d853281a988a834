#include <catch2/catch_test_macros.hpp>
#include "airmesh/mesh/connection_manager.hpp"
#include "helpers/wait.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>

using namespace airmesh::mesh;
using airmesh::core::Scheduler;
using airmesh::core::ThreadPool;
using airmesh::net::LinkState;
using airmesh::net::SendStatus;
using airmesh::testing::wait_until;
using namespace std::chrono_literals;

namespace {

// Records what the manager asks of the radio; callbacks are driven by hand
class RecordingTransport : public airmesh::net::Transport {
public:
    const std::string& local_peer_id() const override { return local_id_; }
    void set_observer(airmesh::net::TransportObserver*) override {}
    void start_discovery() override {}
    void stop_discovery() override {}

    void connect(const std::string& peer_id, std::chrono::milliseconds) override {
        std::lock_guard lock(mutex_);
        connects_.push_back(peer_id);
    }

    void disconnect(const std::string& peer_id) override {
        std::lock_guard lock(mutex_);
        disconnects_.push_back(peer_id);
    }

    SendStatus send(std::span<const uint8_t>, const std::vector<std::string>&) override {
        ++sends;
        return send_status;
    }

    size_t connects_to(const std::string& peer_id) const {
        std::lock_guard lock(mutex_);
        return std::count(connects_.begin(), connects_.end(), peer_id);
    }

    std::vector<std::string> disconnects() const {
        std::lock_guard lock(mutex_);
        return disconnects_;
    }

    std::atomic<SendStatus> send_status{SendStatus::Sent};
    std::atomic<int> sends{0};

private:
    std::string local_id_ = "self";
    mutable std::mutex mutex_;
    std::vector<std::string> connects_;
    std::vector<std::string> disconnects_;
};

struct Rig {
    explicit Rig(ConnectionPolicy policy)
        : pool(2)
        , scheduler(pool)
        , manager(transport, scheduler, policy) {
        manager.events().subscribe([this](const ConnectionEvent& event) {
            std::lock_guard lock(mutex);
            events.push_back(event);
        });
    }

    ~Rig() {
        scheduler.stop();
        pool.stop();
    }

    template<typename T>
    size_t count() const {
        std::lock_guard lock(mutex);
        return std::count_if(events.begin(), events.end(),
                             [](const ConnectionEvent& e) { return std::holds_alternative<T>(e); });
    }

    template<typename T>
    std::optional<T> last() const {
        std::lock_guard lock(mutex);
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (auto* e = std::get_if<T>(&*it)) {
                return *e;
            }
        }
        return std::nullopt;
    }

    ThreadPool pool;
    Scheduler scheduler;
    RecordingTransport transport;
    ConnectionManager manager;

    mutable std::mutex mutex;
    std::vector<ConnectionEvent> events;
};

// Timers long enough that nothing fires during a test unless wanted
ConnectionPolicy slow_policy() {
    ConnectionPolicy policy;
    policy.max_connections = 3;
    policy.connect_timeout = 5s;
    policy.attempt_safety_timeout = 10s;
    policy.max_reconnect_attempts = 2;
    policy.reconnect_backoff = 10s;
    return policy;
}

ConnectionPolicy fast_policy() {
    ConnectionPolicy policy;
    policy.max_connections = 3;
    policy.connect_timeout = 20ms;
    policy.attempt_safety_timeout = 40ms;
    policy.max_reconnect_attempts = 2;
    policy.reconnect_backoff = 10ms;
    return policy;
}

std::vector<uint8_t> frame() {
    return {0x01, 0x03, 0xAA};
}

} // anonymous namespace

TEST_CASE("Discovery leads to one invitation", "[mesh][connection]") {
    Rig rig(slow_policy());

    rig.manager.handle_peer_found("peer-a");
    REQUIRE(rig.transport.connects_to("peer-a") == 1);
    REQUIRE(rig.manager.peer("peer-a")->state == ConnectionState::Connecting);
    REQUIRE(rig.manager.peer("peer-a")->attempt.in_flight);

    SECTION("Repeated discovery while in flight") {
        rig.manager.handle_peer_found("peer-a");
        rig.manager.handle_peer_found("peer-a");
        REQUIRE(rig.transport.connects_to("peer-a") == 1);
        REQUIRE(rig.manager.stats().connect_requests == 1);
    }

    SECTION("Transport reports connecting then connected") {
        rig.manager.handle_link_state("peer-a", LinkState::Connecting);
        rig.manager.handle_link_state("peer-a", LinkState::Connected);
        rig.manager.handle_link_state("peer-a", LinkState::Connected);

        REQUIRE(rig.manager.is_connected("peer-a"));
        REQUIRE(rig.manager.connected_peers() == std::vector<std::string>{"peer-a"});
        REQUIRE(rig.count<PeerConnected>() == 1);
        REQUIRE_FALSE(rig.manager.peer("peer-a")->attempt.in_flight);

        rig.manager.handle_peer_found("peer-a");
        REQUIRE(rig.transport.connects_to("peer-a") == 1);
    }

    SECTION("Own id is ignored") {
        rig.manager.handle_peer_found("self");
        rig.manager.handle_link_state("self", LinkState::Connected);
        REQUIRE(rig.transport.connects_to("self") == 0);
        REQUIRE_FALSE(rig.manager.is_connected("self"));
    }
}

TEST_CASE("Connections initiated by the remote side", "[mesh][connection]") {
    Rig rig(slow_policy());

    rig.manager.handle_link_state("peer-b", LinkState::Connecting);
    REQUIRE(rig.manager.peer("peer-b")->state == ConnectionState::Connecting);

    rig.manager.handle_link_state("peer-b", LinkState::Connected);
    REQUIRE(rig.manager.is_connected("peer-b"));
    REQUIRE(rig.last<PeerConnected>()->peer_id == "peer-b");
    REQUIRE(rig.transport.connects_to("peer-b") == 0);
}

TEST_CASE("Connection capacity", "[mesh][connection]") {
    auto policy = slow_policy();
    policy.max_connections = 1;
    Rig rig(policy);

    rig.manager.handle_link_state("peer-a", LinkState::Connected);
    REQUIRE(rig.manager.connected_count() == 1);

    SECTION("No invitations at capacity") {
        rig.manager.handle_peer_found("peer-b");
        REQUIRE(rig.transport.connects_to("peer-b") == 0);
        REQUIRE(rig.manager.peer("peer-b")->state == ConnectionState::Discovered);
    }

    SECTION("Incoming links beyond capacity are dropped") {
        rig.manager.handle_link_state("peer-b", LinkState::Connected);
        REQUIRE_FALSE(rig.manager.is_connected("peer-b"));
        REQUIRE(rig.transport.disconnects() == std::vector<std::string>{"peer-b"});
        REQUIRE(rig.count<PeerConnected>() == 1);
    }
}

TEST_CASE("Safety timeout clears a silent invitation", "[mesh][connection]") {
    auto policy = fast_policy();
    policy.max_reconnect_attempts = 1;
    Rig rig(policy);

    rig.manager.handle_peer_found("peer-a");

    // Timeout, one retry, timeout again, then give up
    REQUIRE(wait_until([&] { return rig.count<PeerUnreachable>() == 1; }));
    REQUIRE(rig.transport.connects_to("peer-a") == 2);

    auto stats = rig.manager.stats();
    REQUIRE(stats.safety_timeouts == 2);
    REQUIRE(stats.retries == 1);
    REQUIRE(stats.unreachable == 1);
    REQUIRE(rig.last<PeerUnreachable>()->attempts == 1);

    // Still discoverable, so the record stays for a later sighting
    auto peer = rig.manager.peer("peer-a");
    REQUIRE(peer.has_value());
    REQUIRE(peer->state == ConnectionState::Discovered);
    REQUIRE_FALSE(peer->attempt.in_flight);
    REQUIRE(peer->attempt.retry_count == 0);
}

TEST_CASE("Failed invitations back off and give up", "[mesh][connection]") {
    auto policy = fast_policy();
    policy.attempt_safety_timeout = 10s;
    Rig rig(policy);

    rig.manager.handle_peer_found("peer-a");
    REQUIRE(rig.transport.connects_to("peer-a") == 1);

    rig.manager.handle_link_state("peer-a", LinkState::NotConnected);
    REQUIRE(rig.manager.peer("peer-a")->attempt.retry_count == 1);
    REQUIRE(wait_until([&] { return rig.transport.connects_to("peer-a") == 2; }));

    rig.manager.handle_link_state("peer-a", LinkState::NotConnected);
    REQUIRE(wait_until([&] { return rig.transport.connects_to("peer-a") == 3; }));

    rig.manager.handle_link_state("peer-a", LinkState::NotConnected);
    REQUIRE(rig.count<PeerUnreachable>() == 1);
    REQUIRE(rig.last<PeerUnreachable>()->attempts == 2);
    REQUIRE(rig.manager.stats().retries == 2);
    REQUIRE(rig.count<PeerDisconnected>() == 0);

    std::this_thread::sleep_for(50ms);
    REQUIRE(rig.transport.connects_to("peer-a") == 3);

    SECTION("A later connection resets the budget") {
        rig.manager.handle_link_state("peer-a", LinkState::Connected);
        REQUIRE(rig.manager.is_connected("peer-a"));
        REQUIRE(rig.manager.peer("peer-a")->attempt.retry_count == 0);
    }
}

TEST_CASE("Dropped links reconnect", "[mesh][connection]") {
    auto policy = fast_policy();
    policy.attempt_safety_timeout = 10s;
    Rig rig(policy);

    rig.manager.handle_peer_found("peer-a");
    rig.manager.handle_link_state("peer-a", LinkState::Connected);
    REQUIRE(rig.transport.connects_to("peer-a") == 1);

    SECTION("Peer still in range") {
        rig.manager.handle_link_state("peer-a", LinkState::NotConnected);
        REQUIRE(rig.count<PeerDisconnected>() == 1);
        REQUIRE_FALSE(rig.manager.is_connected("peer-a"));

        REQUIRE(wait_until([&] { return rig.transport.connects_to("peer-a") == 2; }));
        rig.manager.handle_link_state("peer-a", LinkState::Connected);
        REQUIRE(rig.manager.is_connected("peer-a"));
        REQUIRE(rig.count<PeerConnected>() == 2);
    }

    SECTION("Peer out of range") {
        rig.manager.handle_peer_lost("peer-a");
        REQUIRE(rig.manager.is_connected("peer-a"));

        rig.manager.handle_link_state("peer-a", LinkState::NotConnected);
        REQUIRE(rig.count<PeerDisconnected>() == 1);

        // Retries are skipped while undiscoverable, then the record goes
        REQUIRE(wait_until([&] { return rig.count<PeerUnreachable>() == 1; }));
        REQUIRE(rig.manager.tracked_peers() == 0);
        REQUIRE(rig.transport.connects_to("peer-a") == 1);
    }
}

TEST_CASE("Lost peers are forgotten unless connected", "[mesh][connection]") {
    auto policy = fast_policy();
    Rig rig(policy);

    rig.manager.handle_peer_found("peer-a");
    rig.manager.handle_peer_lost("peer-a");
    REQUIRE(rig.manager.tracked_peers() == 0);

    // The pending safety timeout finds nothing to act on
    std::this_thread::sleep_for(100ms);
    REQUIRE(rig.manager.stats().safety_timeouts == 0);
    REQUIRE(rig.transport.connects_to("peer-a") == 1);

    rig.manager.handle_peer_lost("never-seen");
    REQUIRE(rig.manager.tracked_peers() == 0);
}

TEST_CASE("Delivery through the connection manager", "[mesh][connection]") {
    Rig rig(slow_policy());
    auto data = frame();

    SECTION("Unknown peer is not sent to") {
        REQUIRE(rig.manager.deliver("peer-a", data) == SendStatus::NotConnected);
        REQUIRE(rig.transport.sends.load() == 0);
    }

    rig.manager.handle_peer_found("peer-a");
    rig.manager.handle_link_state("peer-a", LinkState::Connected);

    SECTION("Connected peer") {
        REQUIRE(rig.manager.deliver("peer-a", data) == SendStatus::Sent);
        REQUIRE(rig.manager.stats().frames_sent == 1);
    }

    SECTION("Transport disagrees about the link") {
        rig.transport.send_status = SendStatus::NotConnected;
        REQUIRE(rig.manager.deliver("peer-a", data) == SendStatus::NotConnected);

        REQUIRE_FALSE(rig.manager.is_connected("peer-a"));
        REQUIRE(rig.count<PeerDisconnected>() == 1);
        REQUIRE(rig.manager.stats().resyncs == 1);
        REQUIRE(rig.manager.peer("peer-a")->attempt.retry_count == 1);
    }

    SECTION("Transport failure keeps the link") {
        rig.transport.send_status = SendStatus::Failed;
        REQUIRE(rig.manager.deliver("peer-a", data) == SendStatus::Failed);
        REQUIRE(rig.manager.is_connected("peer-a"));
    }

    SECTION("Disconnect is left to the transport") {
        rig.manager.disconnect("peer-a");
        REQUIRE(rig.transport.disconnects() == std::vector<std::string>{"peer-a"});
        REQUIRE(rig.manager.is_connected("peer-a"));
    }
}

TEST_CASE("Shut down manager ignores callbacks", "[mesh][connection]") {
    Rig rig(slow_policy());
    rig.manager.shutdown();

    rig.manager.handle_peer_found("peer-a");
    rig.manager.handle_link_state("peer-a", LinkState::Connected);

    REQUIRE(rig.transport.connects_to("peer-a") == 0);
    REQUIRE_FALSE(rig.manager.is_connected("peer-a"));
    REQUIRE(rig.count<PeerConnected>() == 0);
}
