#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace airmesh::net {

enum class LinkState {
    Connecting,
    Connected,
    NotConnected
};

enum class SendStatus {
    Sent,
    NotConnected,
    Failed
};

std::string_view to_string(LinkState state);
std::string_view to_string(SendStatus status);

// Receives transport callbacks. Calls may arrive on any transport thread and
// must not block.
class TransportObserver {
public:
    virtual ~TransportObserver() = default;

    virtual void on_peer_found(const std::string& peer_id) = 0;
    virtual void on_peer_lost(const std::string& peer_id) = 0;
    virtual void on_link_state_changed(const std::string& peer_id, LinkState state) = 0;
    virtual void on_data_received(const std::string& peer_id, std::span<const uint8_t> data) = 0;
};

// Unreliable, possibly reordering and duplicating byte pipe between nearby
// peers. Discovery, invitations and radio handling live behind it.
class Transport {
public:
    virtual ~Transport() = default;

    virtual const std::string& local_peer_id() const = 0;

    // nullptr detaches; must wait for any callback already in progress
    virtual void set_observer(TransportObserver* observer) = 0;

    virtual void start_discovery() = 0;
    virtual void stop_discovery() = 0;

    virtual void connect(const std::string& peer_id, std::chrono::milliseconds timeout) = 0;
    virtual void disconnect(const std::string& peer_id) = 0;

    virtual SendStatus send(std::span<const uint8_t> data, const std::vector<std::string>& peer_ids) = 0;
};

} // namespace airmesh::net
