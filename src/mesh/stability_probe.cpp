#include "airmesh/mesh/stability_probe.hpp"
#include "airmesh/crypto/random.hpp"
#include "airmesh/protocol/wire.hpp"
#include "airmesh/util/logger.hpp"

namespace airmesh::mesh {

namespace {

template<typename T>
T read_le(const uint8_t* data) {
    T result = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        result |= static_cast<T>(data[i]) << (8 * i);
    }
    return result;
}

template<typename T>
void write_le(uint8_t* data, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        data[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

uint64_t wall_clock_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // anonymous namespace

std::vector<uint8_t> ProbePayload::serialize() const {
    std::vector<uint8_t> payload(PROBE_PAYLOAD_SIZE);
    payload[0] = static_cast<uint8_t>(kind);
    write_le(&payload[1], nonce);
    write_le(&payload[9], timestamp);
    return payload;
}

std::optional<ProbePayload> ProbePayload::parse(std::span<const uint8_t> payload) {
    if (!is_probe_payload(payload)) return std::nullopt;
    ProbePayload msg;
    msg.kind = static_cast<ProbeKind>(payload[0]);
    msg.nonce = read_le<uint64_t>(&payload[1]);
    msg.timestamp = read_le<uint64_t>(&payload[9]);
    return msg;
}

bool is_probe_payload(std::span<const uint8_t> payload) {
    if (payload.size() != PROBE_PAYLOAD_SIZE) return false;
    return payload[0] == static_cast<uint8_t>(ProbeKind::Probe) ||
           payload[0] == static_cast<uint8_t>(ProbeKind::Echo);
}

StabilityProbe::StabilityProbe(protocol::FrameSink& sink, ProbePolicy policy)
    : sink_(sink)
    , policy_(policy) {}

StabilityProbe::~StabilityProbe() {
    shutdown();
}

bool StabilityProbe::check(const std::string& peer_id) {
    if (!policy_.enabled) {
        return true;
    }

    std::vector<ProbePayload> probes;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return false;
        }
        if (checks_.contains(peer_id)) {
            LOG_DEBUG("Probe: check for {} already running", peer_id);
            return false;
        }

        auto& check = checks_[peer_id];
        auto now = std::chrono::steady_clock::now();
        for (int i = 0; i < policy_.probe_count; ++i) {
            ProbePayload probe{ProbeKind::Probe, crypto::random_u64(), wall_clock_ms()};
            check.outstanding.emplace(probe.nonce, now);
            probes.push_back(probe);
        }
    }

    for (const auto& probe : probes) {
        send(peer_id, probe);
    }

    std::unique_lock lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + policy_.probe_timeout;
    cv_.wait_until(lock, deadline, [&] {
        const auto& check = checks_.at(peer_id);
        return check.cancelled || check.successes >= policy_.required_successes;
    });

    auto node = checks_.extract(peer_id);
    const auto& check = node.mapped();
    bool stable = !check.cancelled && check.successes >= policy_.required_successes;

    if (stable) {
        auto average = check.total_rtt / check.successes;
        rtt_[peer_id] = average;
        LOG_DEBUG("Probe: {} stable, {}/{} echoes, RTT={}us",
                  peer_id, check.successes, policy_.probe_count, average.count());
    } else if (check.cancelled) {
        LOG_DEBUG("Probe: check for {} cancelled", peer_id);
    } else {
        LOG_WARNING("Probe: {} unstable, {}/{} echoes within {}ms",
                    peer_id, check.successes, policy_.probe_count, policy_.probe_timeout.count());
    }
    return stable;
}

void StabilityProbe::handle_payload(const std::string& peer_id, std::span<const uint8_t> payload) {
    auto message = ProbePayload::parse(payload);
    if (!message) {
        return;
    }

    if (message->kind == ProbeKind::Probe) {
        send(peer_id, ProbePayload{ProbeKind::Echo, message->nonce, wall_clock_ms()});
        return;
    }

    std::lock_guard lock(mutex_);
    auto it = checks_.find(peer_id);
    if (it == checks_.end()) {
        LOG_TRACE("Probe: late echo from {}", peer_id);
        return;
    }

    auto& check = it->second;
    auto sent = check.outstanding.find(message->nonce);
    if (sent == check.outstanding.end()) {
        // Duplicate or unknown nonce
        return;
    }

    check.total_rtt += std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - sent->second);
    check.outstanding.erase(sent);
    ++check.successes;
    cv_.notify_all();
}

void StabilityProbe::cancel(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    rtt_.erase(peer_id);
    auto it = checks_.find(peer_id);
    if (it != checks_.end()) {
        it->second.cancelled = true;
        cv_.notify_all();
    }
}

void StabilityProbe::shutdown() {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    for (auto& [id, check] : checks_) {
        check.cancelled = true;
    }
    cv_.notify_all();
}

std::optional<std::chrono::microseconds> StabilityProbe::round_trip_time(const std::string& peer_id) const {
    std::lock_guard lock(mutex_);
    auto it = rtt_.find(peer_id);
    if (it == rtt_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void StabilityProbe::send(const std::string& peer_id, const ProbePayload& payload) {
    auto data = payload.serialize();
    auto frame = protocol::encode(protocol::make_feature_message(protocol::MessageType::System, data));
    auto status = sink_.deliver(peer_id, frame);
    if (status != net::SendStatus::Sent) {
        LOG_DEBUG("Probe: could not reach {}: {}", peer_id, net::to_string(status));
    }
}

} // namespace airmesh::mesh
