#include "airmesh/net/loopback_transport.hpp"
#include "airmesh/util/logger.hpp"
#include <stdexcept>

namespace airmesh::net {

// LoopbackHub

LoopbackHub::LoopbackHub() {
    delivery_thread_ = std::thread(&LoopbackHub::delivery_loop, this);
}

LoopbackHub::~LoopbackHub() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    idle_cv_.notify_all();
    if (delivery_thread_.joinable()) {
        delivery_thread_.join();
    }
}

LoopbackHub::Link LoopbackHub::make_link(const std::string& a, const std::string& b) {
    return a < b ? Link{a, b} : Link{b, a};
}

std::unique_ptr<LoopbackTransport> LoopbackHub::create_endpoint(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    if (endpoints_.contains(peer_id)) {
        throw std::invalid_argument("loopback endpoint already exists: " + peer_id);
    }
    endpoints_.emplace(peer_id, Endpoint{});
    return std::unique_ptr<LoopbackTransport>(new LoopbackTransport(*this, peer_id));
}

void LoopbackHub::set_link_enabled(const std::string& a, const std::string& b, bool enabled) {
    std::lock_guard lock(mutex_);
    if (enabled) {
        lossy_.erase(make_link(a, b));
    } else {
        lossy_.insert(make_link(a, b));
    }
}

void LoopbackHub::set_accepting(const std::string& peer_id, bool accepting) {
    std::lock_guard lock(mutex_);
    auto it = endpoints_.find(peer_id);
    if (it != endpoints_.end()) {
        it->second.accepting = accepting;
    }
}

void LoopbackHub::set_duplicate_delivery(bool duplicate) {
    std::lock_guard lock(mutex_);
    duplicate_ = duplicate;
}

void LoopbackHub::sever(const std::string& a, const std::string& b) {
    std::lock_guard lock(mutex_);
    unlink_locked(make_link(a, b));
}

bool LoopbackHub::linked(const std::string& a, const std::string& b) const {
    std::lock_guard lock(mutex_);
    return links_.contains(make_link(a, b));
}

size_t LoopbackHub::connect_requests(const std::string& from, const std::string& to) const {
    std::lock_guard lock(mutex_);
    auto it = connect_counts_.find({from, to});
    return it == connect_counts_.end() ? 0 : it->second;
}

size_t LoopbackHub::frames_delivered() const {
    std::lock_guard lock(mutex_);
    return delivered_;
}

void LoopbackHub::flush() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return stopping_ || (queue_.empty() && !delivering_); });
}

void LoopbackHub::attach_observer(const std::string& peer_id, TransportObserver* observer) {
    std::lock_guard delivery(delivery_mutex_);
    std::lock_guard lock(mutex_);
    auto it = endpoints_.find(peer_id);
    if (it != endpoints_.end()) {
        it->second.observer = observer;
    }
}

void LoopbackHub::detach(const std::string& peer_id) {
    std::lock_guard delivery(delivery_mutex_);
    std::lock_guard lock(mutex_);

    auto it = endpoints_.find(peer_id);
    if (it == endpoints_.end()) {
        return;
    }
    const bool was_discoverable = it->second.discoverable;
    endpoints_.erase(it);

    std::vector<Link> attached;
    for (const auto& link : links_) {
        if (link.first == peer_id || link.second == peer_id) {
            attached.push_back(link);
        }
    }
    for (const auto& link : attached) {
        unlink_locked(link);
    }

    if (was_discoverable) {
        for (const auto& [other, endpoint] : endpoints_) {
            if (endpoint.discoverable) {
                enqueue_locked(Event{other, EventKind::PeerLost, peer_id});
            }
        }
    }
}

void LoopbackHub::start_discovery(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    auto self = endpoints_.find(peer_id);
    if (self == endpoints_.end() || self->second.discoverable) {
        return;
    }
    self->second.discoverable = true;

    for (const auto& [other, endpoint] : endpoints_) {
        if (other == peer_id || !endpoint.discoverable) {
            continue;
        }
        enqueue_locked(Event{peer_id, EventKind::PeerFound, other});
        enqueue_locked(Event{other, EventKind::PeerFound, peer_id});
    }
}

void LoopbackHub::stop_discovery(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    auto self = endpoints_.find(peer_id);
    if (self == endpoints_.end() || !self->second.discoverable) {
        return;
    }
    self->second.discoverable = false;

    for (const auto& [other, endpoint] : endpoints_) {
        if (other == peer_id || !endpoint.discoverable) {
            continue;
        }
        enqueue_locked(Event{peer_id, EventKind::PeerLost, other});
        enqueue_locked(Event{other, EventKind::PeerLost, peer_id});
    }
}

void LoopbackHub::connect(const std::string& from, const std::string& to) {
    std::lock_guard lock(mutex_);
    ++connect_counts_[{from, to}];

    auto link = make_link(from, to);
    if (links_.contains(link)) {
        return;
    }

    auto target = endpoints_.find(to);
    if (target == endpoints_.end() || !target->second.discoverable) {
        enqueue_locked(Event{from, EventKind::LinkChanged, to, LinkState::NotConnected});
        return;
    }
    if (!target->second.accepting) {
        LOG_TRACE("Loopback: {} ignores invitation from {}", to, from);
        return;
    }

    links_.insert(link);
    enqueue_locked(Event{from, EventKind::LinkChanged, to, LinkState::Connecting});
    enqueue_locked(Event{to, EventKind::LinkChanged, from, LinkState::Connecting});
    enqueue_locked(Event{from, EventKind::LinkChanged, to, LinkState::Connected});
    enqueue_locked(Event{to, EventKind::LinkChanged, from, LinkState::Connected});
}

void LoopbackHub::disconnect(const std::string& from, const std::string& to) {
    std::lock_guard lock(mutex_);
    unlink_locked(make_link(from, to));
}

SendStatus LoopbackHub::send(const std::string& from, std::span<const uint8_t> data,
                             const std::vector<std::string>& peers) {
    std::lock_guard lock(mutex_);
    if (peers.empty()) {
        return SendStatus::Failed;
    }

    // Like the radio API, one unconnected recipient fails the whole send
    for (const auto& peer : peers) {
        if (!links_.contains(make_link(from, peer))) {
            return SendStatus::NotConnected;
        }
    }

    for (const auto& peer : peers) {
        if (lossy_.contains(make_link(from, peer))) {
            continue;
        }
        const int copies = duplicate_ ? 2 : 1;
        for (int i = 0; i < copies; ++i) {
            enqueue_locked(Event{peer, EventKind::Data, from, LinkState::Connected,
                                 std::vector<uint8_t>(data.begin(), data.end())});
        }
    }
    return SendStatus::Sent;
}

void LoopbackHub::unlink_locked(Link link) {
    if (links_.erase(link) == 0) {
        return;
    }
    enqueue_locked(Event{link.first, EventKind::LinkChanged, link.second, LinkState::NotConnected});
    enqueue_locked(Event{link.second, EventKind::LinkChanged, link.first, LinkState::NotConnected});
}

void LoopbackHub::enqueue_locked(Event event) {
    queue_.push_back(std::move(event));
    queue_cv_.notify_one();
}

void LoopbackHub::delivery_loop() {
    while (true) {
        Event event;
        {
            std::unique_lock lock(mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            delivering_ = true;
        }

        {
            std::lock_guard delivery(delivery_mutex_);
            TransportObserver* observer = nullptr;
            {
                std::lock_guard lock(mutex_);
                auto it = endpoints_.find(event.target);
                if (it != endpoints_.end()) {
                    observer = it->second.observer;
                }
                if (observer && event.kind == EventKind::Data) {
                    ++delivered_;
                }
            }

            if (observer) {
                switch (event.kind) {
                    case EventKind::PeerFound:
                        observer->on_peer_found(event.peer);
                        break;
                    case EventKind::PeerLost:
                        observer->on_peer_lost(event.peer);
                        break;
                    case EventKind::LinkChanged:
                        observer->on_link_state_changed(event.peer, event.state);
                        break;
                    case EventKind::Data:
                        observer->on_data_received(event.peer, event.data);
                        break;
                }
            }
        }

        {
            std::lock_guard lock(mutex_);
            delivering_ = false;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }
}

// LoopbackTransport

LoopbackTransport::LoopbackTransport(LoopbackHub& hub, std::string peer_id)
    : hub_(hub)
    , peer_id_(std::move(peer_id)) {}

LoopbackTransport::~LoopbackTransport() {
    hub_.detach(peer_id_);
}

void LoopbackTransport::set_observer(TransportObserver* observer) {
    hub_.attach_observer(peer_id_, observer);
}

void LoopbackTransport::start_discovery() {
    hub_.start_discovery(peer_id_);
}

void LoopbackTransport::stop_discovery() {
    hub_.stop_discovery(peer_id_);
}

void LoopbackTransport::connect(const std::string& peer_id, std::chrono::milliseconds timeout) {
    LOG_TRACE("Loopback: {} invites {} (timeout {}ms)", peer_id_, peer_id, timeout.count());
    hub_.connect(peer_id_, peer_id);
}

void LoopbackTransport::disconnect(const std::string& peer_id) {
    hub_.disconnect(peer_id_, peer_id);
}

SendStatus LoopbackTransport::send(std::span<const uint8_t> data, const std::vector<std::string>& peer_ids) {
    return hub_.send(peer_id_, data, peer_ids);
}

} // namespace airmesh::net
