#pragma once

#include "airmesh/net/transport.hpp"
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

namespace airmesh::net {

class LoopbackTransport;

// In-process stand-in for the radio: endpoints created from one hub discover
// each other, connect and exchange frames. All callbacks run on a single
// delivery thread in the order they were queued. Links can be made lossy,
// severed or duplicated to exercise the layers above.
class LoopbackHub {
public:
    LoopbackHub();
    ~LoopbackHub();

    LoopbackHub(const LoopbackHub&) = delete;
    LoopbackHub& operator=(const LoopbackHub&) = delete;

    // Throws std::invalid_argument if the id is already taken
    std::unique_ptr<LoopbackTransport> create_endpoint(const std::string& peer_id);

    // While disabled, frames between the two peers are dropped silently
    void set_link_enabled(const std::string& a, const std::string& b, bool enabled);

    // While false, connect requests to the peer are never answered
    void set_accepting(const std::string& peer_id, bool accepting);

    void set_duplicate_delivery(bool duplicate);

    // Drops the link as if radio contact was lost; both sides see NotConnected
    void sever(const std::string& a, const std::string& b);

    bool linked(const std::string& a, const std::string& b) const;
    size_t connect_requests(const std::string& from, const std::string& to) const;
    size_t frames_delivered() const;

    // Blocks until every queued callback has been delivered
    void flush();

private:
    friend class LoopbackTransport;

    using Link = std::pair<std::string, std::string>;

    enum class EventKind { PeerFound, PeerLost, LinkChanged, Data };

    struct Event {
        std::string target;
        EventKind kind;
        std::string peer;
        LinkState state = LinkState::NotConnected;
        std::vector<uint8_t> data;
    };

    struct Endpoint {
        TransportObserver* observer = nullptr;
        bool discoverable = false;
        bool accepting = true;
    };

    static Link make_link(const std::string& a, const std::string& b);

    void attach_observer(const std::string& peer_id, TransportObserver* observer);
    void detach(const std::string& peer_id);
    void start_discovery(const std::string& peer_id);
    void stop_discovery(const std::string& peer_id);
    void connect(const std::string& from, const std::string& to);
    void disconnect(const std::string& from, const std::string& to);
    SendStatus send(const std::string& from, std::span<const uint8_t> data,
                    const std::vector<std::string>& peers);

    void unlink_locked(Link link);
    void enqueue_locked(Event event);
    void delivery_loop();

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Event> queue_;
    bool delivering_ = false;
    bool stopping_ = false;

    std::map<std::string, Endpoint> endpoints_;
    std::set<Link> links_;
    std::set<Link> lossy_;
    std::map<std::pair<std::string, std::string>, size_t> connect_counts_;
    bool duplicate_ = false;
    size_t delivered_ = 0;

    // Held while a callback runs so observers can be detached safely
    std::recursive_mutex delivery_mutex_;
    std::thread delivery_thread_;
};

class LoopbackTransport : public Transport {
public:
    ~LoopbackTransport() override;

    const std::string& local_peer_id() const override { return peer_id_; }

    void set_observer(TransportObserver* observer) override;

    void start_discovery() override;
    void stop_discovery() override;

    void connect(const std::string& peer_id, std::chrono::milliseconds timeout) override;
    void disconnect(const std::string& peer_id) override;

    SendStatus send(std::span<const uint8_t> data, const std::vector<std::string>& peer_ids) override;

private:
    friend class LoopbackHub;

    LoopbackTransport(LoopbackHub& hub, std::string peer_id);

    LoopbackHub& hub_;
    std::string peer_id_;
};

} // namespace airmesh::net
