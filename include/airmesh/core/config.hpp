#pragma once

#include "airmesh/crypto/curve25519.hpp"
#include "airmesh/mesh/connection_manager.hpp"
#include "airmesh/mesh/message_router.hpp"
#include "airmesh/mesh/session_supervisor.hpp"
#include "airmesh/mesh/stability_probe.hpp"
#include "airmesh/protocol/handshake.hpp"
#include "airmesh/protocol/session_cipher.hpp"
#include "airmesh/util/logger.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace airmesh::core {

// Node configuration as written in the INI file
struct NodeConfig {
    // [Node]
    std::string display_name;
    std::optional<std::string> device_id;
    std::string private_key_base64;  // generated at resolve time when empty
    std::string log_level = "info";
    size_t num_threads = 0;  // 0 = auto-detect

    // [Session]
    uint64_t backtrack_window = 10;
    uint64_t max_message_age_seconds = 300;
    uint64_t rekey_after_messages = 500;
    uint64_t rekey_after_seconds = 300;
    uint64_t max_forward_skip = 256;

    // [Handshake]
    int handshake_max_attempts = 3;
    uint64_t handshake_response_timeout_ms = 3000;
    uint64_t handshake_backoff_ms = 2000;

    // [Connection]
    size_t max_connections = 15;
    uint64_t connect_timeout_ms = 30000;
    uint64_t attempt_safety_timeout_ms = 35000;
    int max_reconnect_attempts = 3;
    uint64_t reconnect_backoff_ms = 2000;
    uint64_t repair_interval_seconds = 60;

    // [Probe]
    bool probe_enabled = true;
    int probe_count = 3;
    int probe_required_successes = 2;
    uint64_t probe_timeout_ms = 2000;

    // [Router]
    std::vector<std::string> encrypted_types{"chat", "game"};
    bool flood_protection = true;
    uint64_t max_messages_per_second = 10;
    uint64_t burst_size = 20;
    uint64_t ban_after_drops = 20;
    uint64_t ban_seconds = 300;

    // Parse from INI file
    static std::optional<NodeConfig> parse_file(const std::string& path);

    // Parse from string; nullopt on values that are not numbers or booleans
    static std::optional<NodeConfig> parse(const std::string& content);

    // Validate configuration
    bool validate() const;

    // Generate a documented sample with a fresh private key
    static std::string generate_sample();
};

// Stable id announced in key exchanges when none is configured
std::string default_device_id(const crypto::PublicKey& public_key);

// Runtime configuration (resolved from NodeConfig)
struct RuntimeConfig {
    crypto::X25519KeyPair keypair;
    std::string display_name;
    std::string device_id;
    util::LogLevel log_level = util::LogLevel::Info;
    size_t num_threads = 0;

    protocol::SessionPolicy session;
    protocol::HandshakePolicy handshake;
    mesh::ConnectionPolicy connection;
    mesh::ProbePolicy probe;
    mesh::RouterPolicy router;
    mesh::SupervisorPolicy supervisor;

    // nullopt if the config does not validate
    static std::optional<RuntimeConfig> resolve(const NodeConfig& config);
};

} // namespace airmesh::core
