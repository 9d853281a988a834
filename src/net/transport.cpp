#include "airmesh/net/transport.hpp"

namespace airmesh::net {

std::string_view to_string(LinkState state) {
    switch (state) {
        case LinkState::Connecting: return "connecting";
        case LinkState::Connected: return "connected";
        case LinkState::NotConnected: return "notConnected";
    }
    return "unknown";
}

std::string_view to_string(SendStatus status) {
    switch (status) {
        case SendStatus::Sent: return "sent";
        case SendStatus::NotConnected: return "notConnected";
        case SendStatus::Failed: return "failed";
    }
    return "unknown";
}

} // namespace airmesh::net
