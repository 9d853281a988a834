#pragma once

#include "airmesh/protocol/frame_sink.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace airmesh::mesh {

struct ProbePolicy {
    bool enabled = true;
    int probe_count = 3;
    int required_successes = 2;

    // Time allowed for the echoes of one check
    std::chrono::milliseconds probe_timeout{2000};
};

// First byte of core-reserved system payloads
enum class ProbeKind : uint8_t {
    Probe = 0xF0,
    Echo = 0xF1
};

// kind(1) + nonce(8) + timestamp(8)
inline constexpr size_t PROBE_PAYLOAD_SIZE = 17;

struct ProbePayload {
    ProbeKind kind = ProbeKind::Probe;
    uint64_t nonce = 0;
    uint64_t timestamp = 0;  // sender's wall clock, milliseconds since epoch

    std::vector<uint8_t> serialize() const;
    static std::optional<ProbePayload> parse(std::span<const uint8_t> payload);
};

// True if a system payload belongs to the probe and not to a feature
bool is_probe_payload(std::span<const uint8_t> payload);

// Checks that a fresh link carries traffic both ways before a handshake is
// attempted over it. Probes travel as plaintext system messages.
class StabilityProbe {
public:
    explicit StabilityProbe(protocol::FrameSink& sink, ProbePolicy policy = {});
    ~StabilityProbe();

    StabilityProbe(const StabilityProbe&) = delete;
    StabilityProbe& operator=(const StabilityProbe&) = delete;

    // Blocks for at most probe_timeout. True when enough echoes arrived or
    // the probe is disabled.
    bool check(const std::string& peer_id);

    // Answers probes and records echoes; other payloads are ignored
    void handle_payload(const std::string& peer_id, std::span<const uint8_t> payload);

    // Aborts a running check for the peer; it returns false
    void cancel(const std::string& peer_id);

    // Aborts every running check; later checks fail immediately
    void shutdown();

    // Average of the last successful check
    std::optional<std::chrono::microseconds> round_trip_time(const std::string& peer_id) const;

    const ProbePolicy& policy() const { return policy_; }

private:
    struct Check {
        std::map<uint64_t, std::chrono::steady_clock::time_point> outstanding;
        int successes = 0;
        bool cancelled = false;
        std::chrono::microseconds total_rtt{0};
    };

    void send(const std::string& peer_id, const ProbePayload& payload);

    protocol::FrameSink& sink_;
    ProbePolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Check> checks_;
    std::map<std::string, std::chrono::microseconds> rtt_;
    bool stopping_ = false;
};

} // namespace airmesh::mesh
