#include "airmesh/mesh/flood_guard.hpp"
#include "airmesh/util/logger.hpp"
#include <algorithm>

namespace airmesh::mesh {

namespace {

// Strikes older than this no longer count towards a ban
constexpr auto STRIKE_WINDOW = std::chrono::seconds(60);

// Idle buckets are dropped once the table grows past this
constexpr size_t PRUNE_THRESHOLD = 64;

} // anonymous namespace

std::string_view to_string(FloodVerdict verdict) {
    switch (verdict) {
        case FloodVerdict::Accepted: return "accepted";
        case FloodVerdict::RateLimited: return "rate limited";
        case FloodVerdict::Banned: return "banned";
    }
    return "unknown";
}

FloodGuard::FloodGuard(FloodPolicy policy)
    : policy_(policy)
    , clock_([] { return Clock::now(); }) {}

void FloodGuard::set_clock(ClockSource clock) {
    std::lock_guard lock(mutex_);
    clock_ = std::move(clock);
}

void FloodGuard::refill_locked(PeerBucket& bucket, Clock::time_point now) const {
    const double capacity = static_cast<double>(policy_.burst_size);
    if (bucket.last_refill == Clock::time_point{}) {
        bucket.tokens = capacity;
        bucket.last_refill = now;
        return;
    }
    if (now > bucket.last_refill) {
        const double elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
        bucket.tokens = std::min(capacity, bucket.tokens + elapsed * policy_.max_messages_per_second);
        bucket.last_refill = now;
    }
}

bool FloodGuard::banned_locked(PeerBucket& bucket, const std::string& peer_id, Clock::time_point now) {
    if (bucket.banned_until == Clock::time_point{}) {
        return false;
    }
    if (now < bucket.banned_until) {
        return true;
    }
    LOG_INFO("Flood: ban on {} expired", peer_id);
    bucket.banned_until = {};
    bucket.strikes = 0;
    bucket.tokens = static_cast<double>(policy_.burst_size);
    bucket.last_refill = now;
    return false;
}

void FloodGuard::prune_locked(Clock::time_point now) {
    if (peers_.size() <= PRUNE_THRESHOLD) {
        return;
    }
    std::erase_if(peers_, [&](const auto& item) {
        const auto& bucket = item.second;
        return bucket.banned_until <= now && now - bucket.last_seen > STRIKE_WINDOW;
    });
}

FloodVerdict FloodGuard::admit(const std::string& peer_id, bool exempt_from_rate) {
    if (!policy_.enabled) {
        return FloodVerdict::Accepted;
    }

    std::lock_guard lock(mutex_);
    const auto now = clock_();
    prune_locked(now);

    auto& bucket = peers_[peer_id];
    bucket.last_seen = now;

    if (banned_locked(bucket, peer_id, now)) {
        ++stats_.banned_drops;
        return FloodVerdict::Banned;
    }

    refill_locked(bucket, now);
    if (exempt_from_rate) {
        ++stats_.accepted;
        return FloodVerdict::Accepted;
    }

    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        ++stats_.accepted;
        return FloodVerdict::Accepted;
    }

    ++stats_.rate_limited;
    if (bucket.strikes == 0 || now - bucket.first_strike > STRIKE_WINDOW) {
        bucket.strikes = 0;
        bucket.first_strike = now;
    }
    ++bucket.strikes;

    if (policy_.ban_after_drops > 0 && bucket.strikes >= policy_.ban_after_drops) {
        bucket.banned_until = now + policy_.ban_duration;
        ++stats_.bans;
        LOG_WARNING("Flood: banning {} for {}s after {} dropped messages",
                    peer_id, policy_.ban_duration.count(), bucket.strikes);
    } else if (bucket.strikes == 1) {
        LOG_WARNING("Flood: {} exceeds {} messages/s, dropping", peer_id, policy_.max_messages_per_second);
    }
    return FloodVerdict::RateLimited;
}

bool FloodGuard::is_banned(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    auto it = peers_.find(peer_id);
    return it != peers_.end() && banned_locked(it->second, peer_id, clock_());
}

void FloodGuard::unban(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it != peers_.end()) {
        it->second.banned_until = {};
        it->second.strikes = 0;
        LOG_INFO("Flood: lifted ban on {}", peer_id);
    }
}

FloodGuard::Stats FloodGuard::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

} // namespace airmesh::mesh
