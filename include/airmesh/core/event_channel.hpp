#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace airmesh::core {

// Typed publish/subscribe point owned by the component that emits the events.
// Handlers run synchronously on the publishing thread, outside the channel lock,
// so a handler may subscribe, unsubscribe or publish again.
template<typename Event>
class EventChannel {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    EventChannel() = default;
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    SubscriptionId subscribe(Handler handler) {
        std::lock_guard lock(mutex_);
        SubscriptionId id = next_id_++;
        handlers_.emplace(id, std::move(handler));
        return id;
    }

    void unsubscribe(SubscriptionId id) {
        std::lock_guard lock(mutex_);
        handlers_.erase(id);
    }

    void publish(const Event& event) const {
        std::vector<Handler> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot.reserve(handlers_.size());
            for (const auto& [id, handler] : handlers_) {
                snapshot.push_back(handler);
            }
        }
        for (const auto& handler : snapshot) {
            handler(event);
        }
    }

    size_t subscriber_count() const {
        std::lock_guard lock(mutex_);
        return handlers_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_ = 1;
};

} // namespace airmesh::core
