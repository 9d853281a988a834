#include "airmesh/core/config.hpp"
#include "airmesh/util/encoding.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace airmesh::core {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return str;
}

std::pair<std::string, std::string> parse_line(const std::string& line) {
    auto eq = line.find('=');
    if (eq == std::string::npos) {
        return {trim(line), ""};
    }
    return {trim(line.substr(0, eq)), trim(line.substr(eq + 1))};
}

uint64_t parse_unsigned(const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument("expected an unsigned number: " + value);
    }
    size_t consumed = 0;
    auto result = std::stoull(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters: " + value);
    }
    return result;
}

int parse_int(const std::string& value) {
    size_t consumed = 0;
    auto result = std::stoi(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters: " + value);
    }
    return result;
}

bool parse_bool(const std::string& value) {
    auto lower = to_lower(value);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") return false;
    throw std::invalid_argument("expected a boolean: " + value);
}

std::vector<std::string> parse_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = to_lower(trim(item));
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Feature types only; key-exchange names are not accepted
std::optional<protocol::MessageType> feature_type_from_name(const std::string& name) {
    for (uint8_t value = 1; value <= 8; ++value) {
        auto type = protocol::message_type_from_byte(value);
        if (!type || !mesh::route_for(*type)) {
            continue;
        }
        if (to_lower(std::string(protocol::to_string(*type))) == name) {
            return type;
        }
    }
    return std::nullopt;
}

// Backoff doubles per retry, up to 16 times
constexpr uint64_t MAX_BACKOFF_MS = 60'000;
constexpr uint64_t MAX_TIMEOUT_MS = 600'000;

constexpr uint64_t MAX_FLOOD_LIMIT = 100'000;
constexpr uint64_t MAX_BAN_SECONDS = 7 * 24 * 3600;

} // anonymous namespace

std::optional<NodeConfig> NodeConfig::parse_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        LOG_ERROR("Config: cannot open {}", path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::optional<NodeConfig> NodeConfig::parse(const std::string& content) {
    NodeConfig config;
    std::istringstream stream(content);
    std::string line;
    size_t line_number = 0;

    enum class Section { None, Node, Session, Handshake, Connection, Probe, Router };
    Section current_section = Section::None;

    try {
        while (std::getline(stream, line)) {
            ++line_number;
            line = trim(line);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            // Check for section headers
            if (line[0] == '[') {
                auto header = to_lower(trim(line.substr(1, line.find(']') - 1)));
                if (header == "node") {
                    current_section = Section::Node;
                } else if (header == "session") {
                    current_section = Section::Session;
                } else if (header == "handshake") {
                    current_section = Section::Handshake;
                } else if (header == "connection") {
                    current_section = Section::Connection;
                } else if (header == "probe") {
                    current_section = Section::Probe;
                } else if (header == "router") {
                    current_section = Section::Router;
                } else {
                    LOG_WARNING("Config: ignoring unknown section [{}] at line {}", header, line_number);
                    current_section = Section::None;
                }
                continue;
            }

            auto [key, value] = parse_line(line);
            key = to_lower(key);

            switch (current_section) {
                case Section::Node:
                    if (key == "displayname") {
                        config.display_name = value;
                    } else if (key == "deviceid") {
                        config.device_id = value;
                    } else if (key == "privatekey") {
                        config.private_key_base64 = value;
                    } else if (key == "loglevel") {
                        config.log_level = value;
                    } else if (key == "threads") {
                        config.num_threads = parse_unsigned(value);
                    }
                    break;

                case Section::Session:
                    if (key == "backtrackwindow") {
                        config.backtrack_window = parse_unsigned(value);
                    } else if (key == "maxmessageage") {
                        config.max_message_age_seconds = parse_unsigned(value);
                    } else if (key == "rekeyaftermessages") {
                        config.rekey_after_messages = parse_unsigned(value);
                    } else if (key == "rekeyafterseconds") {
                        config.rekey_after_seconds = parse_unsigned(value);
                    } else if (key == "maxforwardskip") {
                        config.max_forward_skip = parse_unsigned(value);
                    }
                    break;

                case Section::Handshake:
                    if (key == "maxattempts") {
                        config.handshake_max_attempts = parse_int(value);
                    } else if (key == "responsetimeoutms") {
                        config.handshake_response_timeout_ms = parse_unsigned(value);
                    } else if (key == "backoffms") {
                        config.handshake_backoff_ms = parse_unsigned(value);
                    }
                    break;

                case Section::Connection:
                    if (key == "maxconnections") {
                        config.max_connections = parse_unsigned(value);
                    } else if (key == "connecttimeoutms") {
                        config.connect_timeout_ms = parse_unsigned(value);
                    } else if (key == "attemptsafetytimeoutms") {
                        config.attempt_safety_timeout_ms = parse_unsigned(value);
                    } else if (key == "maxreconnectattempts") {
                        config.max_reconnect_attempts = parse_int(value);
                    } else if (key == "reconnectbackoffms") {
                        config.reconnect_backoff_ms = parse_unsigned(value);
                    } else if (key == "repairintervalseconds") {
                        config.repair_interval_seconds = parse_unsigned(value);
                    }
                    break;

                case Section::Probe:
                    if (key == "enabled") {
                        config.probe_enabled = parse_bool(value);
                    } else if (key == "probecount") {
                        config.probe_count = parse_int(value);
                    } else if (key == "requiredsuccesses") {
                        config.probe_required_successes = parse_int(value);
                    } else if (key == "timeoutms") {
                        config.probe_timeout_ms = parse_unsigned(value);
                    }
                    break;

                case Section::Router:
                    if (key == "encryptedtypes") {
                        config.encrypted_types = parse_list(value);
                    } else if (key == "floodprotection") {
                        config.flood_protection = parse_bool(value);
                    } else if (key == "maxmessagespersecond") {
                        config.max_messages_per_second = parse_unsigned(value);
                    } else if (key == "burstsize") {
                        config.burst_size = parse_unsigned(value);
                    } else if (key == "banafterdrops") {
                        config.ban_after_drops = parse_unsigned(value);
                    } else if (key == "banseconds") {
                        config.ban_seconds = parse_unsigned(value);
                    }
                    break;

                case Section::None:
                    break;
            }
        }
    } catch (const std::exception& e) {
        // std::stoi and friends report bad numbers by throwing
        LOG_ERROR("Config: invalid value at line {}: {}", line_number, e.what());
        return std::nullopt;
    }

    return config;
}

bool NodeConfig::validate() const {
    // A configured private key must be valid base64 of the right length
    if (!private_key_base64.empty()) {
        auto decoded = util::base64_decode(private_key_base64);
        if (!decoded || decoded->size() != crypto::KEY_SIZE) {
            LOG_ERROR("Config: PrivateKey is not a base64 32-byte key");
            return false;
        }
    }

    if (device_id && (device_id->empty() || device_id->size() > protocol::MAX_SHORT_FIELD)) {
        LOG_ERROR("Config: DeviceId must be 1-{} bytes", protocol::MAX_SHORT_FIELD);
        return false;
    }

    if (!util::parse_log_level(log_level)) {
        LOG_ERROR("Config: unknown LogLevel '{}'", log_level);
        return false;
    }

    if (rekey_after_messages == 0 || rekey_after_seconds == 0 || max_message_age_seconds == 0) {
        LOG_ERROR("Config: session limits must be positive");
        return false;
    }
    if (max_forward_skip == 0) {
        LOG_ERROR("Config: MaxForwardSkip must be positive");
        return false;
    }

    if (handshake_max_attempts < 1 || handshake_max_attempts > 16) {
        LOG_ERROR("Config: handshake MaxAttempts must be 1-16");
        return false;
    }
    if (handshake_response_timeout_ms == 0 || handshake_response_timeout_ms > MAX_TIMEOUT_MS) {
        LOG_ERROR("Config: handshake ResponseTimeoutMs must be 1-{}", MAX_TIMEOUT_MS);
        return false;
    }
    if (handshake_backoff_ms > MAX_BACKOFF_MS) {
        LOG_ERROR("Config: handshake BackoffMs must not exceed {}", MAX_BACKOFF_MS);
        return false;
    }

    if (max_connections == 0) {
        LOG_ERROR("Config: MaxConnections must be positive");
        return false;
    }
    if (max_reconnect_attempts < 0 || max_reconnect_attempts > 16) {
        LOG_ERROR("Config: MaxReconnectAttempts must be 0-16");
        return false;
    }
    if (reconnect_backoff_ms > MAX_BACKOFF_MS) {
        LOG_ERROR("Config: ReconnectBackoffMs must not exceed {}", MAX_BACKOFF_MS);
        return false;
    }
    if (attempt_safety_timeout_ms < connect_timeout_ms) {
        LOG_ERROR("Config: AttemptSafetyTimeoutMs must not be shorter than ConnectTimeoutMs");
        return false;
    }
    if (repair_interval_seconds == 0) {
        LOG_ERROR("Config: RepairIntervalSeconds must be positive");
        return false;
    }

    if (probe_enabled) {
        if (probe_count < 1 || probe_required_successes < 1 || probe_required_successes > probe_count) {
            LOG_ERROR("Config: RequiredSuccesses must be between 1 and ProbeCount");
            return false;
        }
        if (probe_timeout_ms == 0) {
            LOG_ERROR("Config: probe TimeoutMs must be positive");
            return false;
        }
    }

    if (flood_protection) {
        if (max_messages_per_second == 0 || max_messages_per_second > MAX_FLOOD_LIMIT ||
            burst_size == 0 || burst_size > MAX_FLOOD_LIMIT) {
            LOG_ERROR("Config: MaxMessagesPerSecond and BurstSize must be 1-{}", MAX_FLOOD_LIMIT);
            return false;
        }
        if (ban_after_drops > MAX_FLOOD_LIMIT || ban_seconds > MAX_BAN_SECONDS) {
            LOG_ERROR("Config: BanAfterDrops must not exceed {} and BanSeconds {}",
                      MAX_FLOOD_LIMIT, MAX_BAN_SECONDS);
            return false;
        }
    }

    for (const auto& name : encrypted_types) {
        if (!feature_type_from_name(name)) {
            LOG_ERROR("Config: '{}' cannot be an encrypted type", name);
            return false;
        }
    }

    return true;
}

std::string NodeConfig::generate_sample() {
    auto keypair = crypto::X25519KeyPair::generate();

    std::ostringstream oss;
    oss << "[Node]\n";
    oss << "# Name shown to nearby peers\n";
    oss << "DisplayName = airmesh-" << util::fingerprint(keypair.public_key().span()) << "\n";
    oss << "# Stable id announced in key exchanges (defaults to a public key digest)\n";
    oss << "# DeviceId = " << default_device_id(keypair.public_key()) << "\n";
    oss << "# Identity private key (keep secret!)\n";
    oss << "PrivateKey = " << keypair.private_key_base64() << "\n";
    oss << "# trace, debug, info, warning, error, fatal\n";
    oss << "LogLevel = info\n";
    oss << "# Worker threads (0 = auto-detect)\n";
    oss << "Threads = 0\n";
    oss << "\n";
    oss << "[Session]\n";
    oss << "# Late frames accepted this many numbers behind the newest\n";
    oss << "BacktrackWindow = 10\n";
    oss << "# Maximum clock skew of a frame, in seconds\n";
    oss << "MaxMessageAge = 300\n";
    oss << "# Discard a session after this many messages or seconds\n";
    oss << "RekeyAfterMessages = 500\n";
    oss << "RekeyAfterSeconds = 300\n";
    oss << "# Largest jump ahead a single frame may make\n";
    oss << "MaxForwardSkip = 256\n";
    oss << "\n";
    oss << "[Handshake]\n";
    oss << "MaxAttempts = 3\n";
    oss << "ResponseTimeoutMs = 3000\n";
    oss << "# Retry k waits BackoffMs * 2^(k-1)\n";
    oss << "BackoffMs = 2000\n";
    oss << "\n";
    oss << "[Connection]\n";
    oss << "MaxConnections = 15\n";
    oss << "ConnectTimeoutMs = 30000\n";
    oss << "# Clears an invitation the transport never answered\n";
    oss << "AttemptSafetyTimeoutMs = 35000\n";
    oss << "MaxReconnectAttempts = 3\n";
    oss << "ReconnectBackoffMs = 2000\n";
    oss << "RepairIntervalSeconds = 60\n";
    oss << "\n";
    oss << "[Probe]\n";
    oss << "# Check a new link before the key exchange\n";
    oss << "Enabled = true\n";
    oss << "ProbeCount = 3\n";
    oss << "RequiredSuccesses = 2\n";
    oss << "TimeoutMs = 2000\n";
    oss << "\n";
    oss << "[Router]\n";
    oss << "# Message types sent inside the encrypted envelope\n";
    oss << "EncryptedTypes = chat, game\n";
    oss << "# Per-peer inbound limit; emergency messages skip the rate check\n";
    oss << "FloodProtection = true\n";
    oss << "MaxMessagesPerSecond = 10\n";
    oss << "BurstSize = 20\n";
    oss << "# Dropped messages within a minute before the peer is ignored (0 = never)\n";
    oss << "BanAfterDrops = 20\n";
    oss << "BanSeconds = 300\n";

    return oss.str();
}

std::string default_device_id(const crypto::PublicKey& public_key) {
    return util::to_hex(public_key.span(), 8);
}

std::optional<RuntimeConfig> RuntimeConfig::resolve(const NodeConfig& config) {
    if (!config.validate()) {
        return std::nullopt;
    }

    RuntimeConfig runtime;

    if (config.private_key_base64.empty()) {
        LOG_INFO("Config: no PrivateKey configured, generating an ephemeral identity");
        runtime.keypair = crypto::X25519KeyPair::generate();
    } else {
        auto keypair = crypto::X25519KeyPair::from_base64(config.private_key_base64);
        if (!keypair) {
            return std::nullopt;
        }
        runtime.keypair = *keypair;
    }

    const auto& public_key = runtime.keypair.public_key();
    runtime.device_id = config.device_id.value_or(default_device_id(public_key));
    runtime.display_name = config.display_name.empty()
        ? "airmesh-" + util::fingerprint(public_key.span())
        : config.display_name;
    runtime.log_level = *util::parse_log_level(config.log_level);
    runtime.num_threads = config.num_threads;

    runtime.session.backtrack_window = config.backtrack_window;
    runtime.session.max_message_age = std::chrono::seconds(config.max_message_age_seconds);
    runtime.session.rekey_after_messages = config.rekey_after_messages;
    runtime.session.rekey_after_time = std::chrono::seconds(config.rekey_after_seconds);
    runtime.session.max_forward_skip = config.max_forward_skip;

    runtime.handshake.max_attempts = config.handshake_max_attempts;
    runtime.handshake.response_timeout = std::chrono::milliseconds(config.handshake_response_timeout_ms);
    runtime.handshake.backoff_base = std::chrono::milliseconds(config.handshake_backoff_ms);

    runtime.connection.max_connections = config.max_connections;
    runtime.connection.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
    runtime.connection.attempt_safety_timeout = std::chrono::milliseconds(config.attempt_safety_timeout_ms);
    runtime.connection.max_reconnect_attempts = config.max_reconnect_attempts;
    runtime.connection.reconnect_backoff = std::chrono::milliseconds(config.reconnect_backoff_ms);

    runtime.probe.enabled = config.probe_enabled;
    runtime.probe.probe_count = config.probe_count;
    runtime.probe.required_successes = config.probe_required_successes;
    runtime.probe.probe_timeout = std::chrono::milliseconds(config.probe_timeout_ms);

    runtime.router.encrypted_types.clear();
    for (const auto& name : config.encrypted_types) {
        runtime.router.encrypted_types.insert(*feature_type_from_name(name));
    }
    runtime.router.flood.enabled = config.flood_protection;
    runtime.router.flood.max_messages_per_second = static_cast<uint32_t>(config.max_messages_per_second);
    runtime.router.flood.burst_size = static_cast<uint32_t>(config.burst_size);
    runtime.router.flood.ban_after_drops = static_cast<uint32_t>(config.ban_after_drops);
    runtime.router.flood.ban_duration = std::chrono::seconds(config.ban_seconds);

    runtime.supervisor.repair_interval = std::chrono::seconds(config.repair_interval_seconds);
    runtime.supervisor.probe_before_handshake = config.probe_enabled;

    return runtime;
}

} // namespace airmesh::core
