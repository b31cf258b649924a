#include <sfera/rate_limiter/rate_limiter.hpp>
#include <sfera/core/logger.hpp>
#include <sfera/core/utils.hpp>
#include <algorithm>

namespace sfera {

const size_t RateLimiter::PRUNE_INTERVAL;

RateLimiter::RateLimiter(const RateLimiterOptions& options)
    : options_(options)
    // A window no larger than the threshold could never exceed it
    , capacity_(std::max(options.window_capacity,
                         static_cast<size_t>(std::max(options.max_requests_per_minute, 0)) + 1))
    , checks_since_prune_(0) {}

int RateLimiter::count_recent(const std::deque<int64_t>& window, int64_t now_ms) const {
    int64_t cutoff = now_ms - options_.window_ms;
    int count = 0;
    for (std::deque<int64_t>::const_iterator it = window.begin(); it != window.end(); ++it) {
        if (*it > cutoff) {
            ++count;
        }
    }
    return count;
}

bool RateLimiter::is_allowed(const std::string& identity) {
    return is_allowed(identity, current_timestamp_ms());
}

bool RateLimiter::is_allowed(const std::string& identity, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (++checks_since_prune_ >= PRUNE_INTERVAL) {
        prune_locked(now_ms);
        checks_since_prune_ = 0;
    }
    
    std::map<std::string, int64_t>::iterator blocked = blocked_until_.find(identity);
    if (blocked != blocked_until_.end()) {
        if (now_ms < blocked->second) {
            LOG_WARN("Rate limiter: %s is blocked until %s", identity.c_str(),
                     format_timestamp(blocked->second / 1000).c_str());
            return false;
        }
        blocked_until_.erase(blocked);
        LOG_INFO("Rate limiter: block lifted for %s", identity.c_str());
    }
    
    std::deque<int64_t>& window = windows_[identity];
    window.push_back(now_ms);
    while (window.size() > capacity_) {
        window.pop_front();
    }
    
    int recent = count_recent(window, now_ms);
    if (recent > options_.max_requests_per_minute) {
        blocked_until_[identity] = now_ms + options_.block_duration_ms;
        LOG_WARN("Rate limiter: %s exceeded %d requests/minute, blocked for %lld s",
                 identity.c_str(), options_.max_requests_per_minute,
                 static_cast<long long>(options_.block_duration_ms / 1000));
        return false;
    }
    
    return true;
}

void RateLimiter::reset(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.erase(identity);
    blocked_until_.erase(identity);
    LOG_INFO("Rate limiter: limits reset for %s", identity.c_str());
}

RateLimitStatus RateLimiter::status(const std::string& identity) const {
    return status(identity, current_timestamp_ms());
}

RateLimitStatus RateLimiter::status(const std::string& identity, int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    RateLimitStatus result;
    
    std::map<std::string, int64_t>::const_iterator blocked = blocked_until_.find(identity);
    if (blocked != blocked_until_.end()) {
        result.blocked = true;
        result.blocked_until_ms = blocked->second;
        result.remaining_seconds = std::max<int64_t>(0, (blocked->second - now_ms) / 1000);
        return result;
    }
    
    std::map<std::string, std::deque<int64_t> >::const_iterator window = windows_.find(identity);
    if (window != windows_.end()) {
        result.requests_in_last_minute = count_recent(window->second, now_ms);
    }
    result.remaining_requests = std::max(0, options_.max_requests_per_minute -
                                            result.requests_in_last_minute);
    return result;
}

void RateLimiter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.clear();
    blocked_until_.clear();
}

size_t RateLimiter::prune(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    return prune_locked(now_ms);
}

size_t RateLimiter::prune_locked(int64_t now_ms) {
    int64_t cutoff = now_ms - options_.window_ms;
    size_t dropped = 0;
    
    std::map<std::string, std::deque<int64_t> >::iterator it = windows_.begin();
    while (it != windows_.end()) {
        std::map<std::string, int64_t>::iterator blocked = blocked_until_.find(it->first);
        bool block_active = blocked != blocked_until_.end() && now_ms < blocked->second;
        bool idle = it->second.empty() || it->second.back() <= cutoff;
        if (idle && !block_active) {
            if (blocked != blocked_until_.end()) {
                blocked_until_.erase(blocked);
            }
            windows_.erase(it++);
            ++dropped;
        } else {
            ++it;
        }
    }
    
    if (dropped > 0) {
        LOG_DEBUG("Rate limiter: pruned %zu idle identities", dropped);
    }
    return dropped;
}

size_t RateLimiter::tracked_identities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

} // namespace sfera
