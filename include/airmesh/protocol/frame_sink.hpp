#pragma once

#include "airmesh/net/transport.hpp"
#include <span>
#include <string>
#include <vector>

namespace airmesh::protocol {

// Outbound path for encoded frames; implemented by the connection manager
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual net::SendStatus deliver(const std::string& peer_id, std::span<const uint8_t> frame) = 0;
    virtual bool is_connected(const std::string& peer_id) const = 0;
    virtual std::vector<std::string> connected_peers() const = 0;
};

} // namespace airmesh::protocol
