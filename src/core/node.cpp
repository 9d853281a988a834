#include "airmesh/core/node.hpp"
#include "airmesh/util/encoding.hpp"
#include "airmesh/util/logger.hpp"

namespace airmesh::core {

MeshNode::MeshNode(const RuntimeConfig& config, net::Transport& transport)
    : config_(config)
    , transport_(transport)
    , thread_pool_(std::make_unique<ThreadPool>(config.num_threads))
    , scheduler_(std::make_unique<Scheduler>(*thread_pool_))
    , cipher_(config.session)
    , connections_(transport, *scheduler_, config.connection)
    , handshake_(config.keypair, config.device_id, cipher_, connections_, config.handshake)
    , probe_(connections_, config.probe)
    , router_(handshake_, cipher_, connections_, probe_, config.router)
    , supervisor_(connections_, handshake_, cipher_, probe_, *thread_pool_, *scheduler_, config.supervisor)
{
}

MeshNode::~MeshNode() {
    stop();
    stop_workers();
}

void MeshNode::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    LOG_INFO("Node: starting {} as {} (key {})", peer_id(), config_.device_id,
             util::fingerprint(public_key().span()));

    supervisor_.start();
    transport_.set_observer(this);
    transport_.start_discovery();

    LOG_INFO("Node: running with {} worker threads", thread_pool_->num_threads());
}

void MeshNode::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;  // Already stopped
    }

    LOG_INFO("Node: stopping {}", peer_id());

    // No callbacks after this returns
    transport_.stop_discovery();
    transport_.set_observer(nullptr);

    supervisor_.stop();
    connections_.shutdown();
    handshake_.shutdown();
    probe_.shutdown();

    stop_workers();
}

void MeshNode::stop_workers() {
    scheduler_->stop();
    thread_pool_->stop();
}

void MeshNode::on_peer_found(const std::string& peer_id) {
    connections_.handle_peer_found(peer_id);
}

void MeshNode::on_peer_lost(const std::string& peer_id) {
    connections_.handle_peer_lost(peer_id);
}

void MeshNode::on_link_state_changed(const std::string& peer_id, net::LinkState state) {
    LOG_TRACE("Node: link to {} is {}", peer_id, net::to_string(state));
    connections_.handle_link_state(peer_id, state);
}

void MeshNode::on_data_received(const std::string& peer_id, std::span<const uint8_t> data) {
    router_.on_bytes_received(peer_id, data);
}

util::Result<util::Unit, mesh::RouteError> MeshNode::send(
    const std::string& peer_id,
    protocol::MessageType type,
    std::span<const uint8_t> payload
) {
    return router_.send(peer_id, type, payload);
}

size_t MeshNode::broadcast(protocol::MessageType type, std::span<const uint8_t> payload) {
    return router_.broadcast(type, payload);
}

util::Result<util::Unit, protocol::HandshakeError> MeshNode::establish_session(const std::string& peer_id) {
    return handshake_.initiate(peer_id);
}

bool MeshNode::has_session(const std::string& peer_id) const {
    return cipher_.has_session(peer_id);
}

MeshNode::Stats MeshNode::stats() const {
    Stats stats;
    stats.connected_peers = connections_.connected_count();
    stats.sessions = cipher_.session_count();
    stats.router = router_.stats();
    stats.connections = connections_.stats();
    stats.supervisor = supervisor_.stats();
    return stats;
}

} // namespace airmesh::core
