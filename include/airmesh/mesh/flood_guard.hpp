#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace airmesh::mesh {

struct FloodPolicy {
    bool enabled = true;

    // Sustained inbound rate per peer, and the burst allowed on top of it
    uint32_t max_messages_per_second = 10;
    uint32_t burst_size = 20;

    // A peer that overruns its budget this many times within a minute is
    // ignored for ban_duration
    uint32_t ban_after_drops = 20;
    std::chrono::seconds ban_duration{300};
};

enum class FloodVerdict {
    Accepted,
    RateLimited,
    Banned
};

std::string_view to_string(FloodVerdict verdict);

// Per-peer token bucket in front of the inbound path. Emergency traffic is
// exempt from the rate limit but not from a ban.
class FloodGuard {
public:
    using Clock = std::chrono::steady_clock;
    using ClockSource = std::function<Clock::time_point()>;

    explicit FloodGuard(FloodPolicy policy = {});

    FloodGuard(const FloodGuard&) = delete;
    FloodGuard& operator=(const FloodGuard&) = delete;

    FloodVerdict admit(const std::string& peer_id, bool exempt_from_rate = false);

    bool is_banned(const std::string& peer_id);
    void unban(const std::string& peer_id);

    // Replaces the monotonic clock used for refills and ban expiry
    void set_clock(ClockSource clock);

    struct Stats {
        uint64_t accepted = 0;
        uint64_t rate_limited = 0;
        uint64_t banned_drops = 0;
        uint64_t bans = 0;
    };
    Stats stats() const;

    const FloodPolicy& policy() const { return policy_; }

private:
    struct PeerBucket {
        double tokens = 0.0;
        Clock::time_point last_refill{};
        Clock::time_point last_seen{};
        uint32_t strikes = 0;
        Clock::time_point first_strike{};
        Clock::time_point banned_until{};
    };

    bool banned_locked(PeerBucket& bucket, const std::string& peer_id, Clock::time_point now);
    void refill_locked(PeerBucket& bucket, Clock::time_point now) const;
    void prune_locked(Clock::time_point now);

    FloodPolicy policy_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PeerBucket> peers_;
    ClockSource clock_;
    Stats stats_;
};

} // namespace airmesh::mesh
