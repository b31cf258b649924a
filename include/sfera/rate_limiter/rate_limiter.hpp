#ifndef SFERA_RATE_LIMITER_RATE_LIMITER_HPP
#define SFERA_RATE_LIMITER_RATE_LIMITER_HPP

#include <string>
#include <map>
#include <deque>
#include <mutex>
#include <cstdint>

namespace sfera {

struct RateLimiterOptions {
    int max_requests_per_minute;   // threshold inside the window
    int64_t block_duration_ms;     // penalty once the threshold is exceeded
    int64_t window_ms;             // trailing window length
    size_t window_capacity;        // timestamps kept per identity
    
    RateLimiterOptions()
        : max_requests_per_minute(10)
        , block_duration_ms(5 * 60 * 1000)
        , window_ms(60 * 1000)
        , window_capacity(10) {}
};

// Read-only projection of one identity's state
struct RateLimitStatus {
    bool blocked;
    int64_t blocked_until_ms;      // 0 when open
    int64_t remaining_seconds;     // until unblock, floored at 0
    int requests_in_last_minute;   // open only
    int remaining_requests;        // open only, floored at 0
    
    RateLimitStatus()
        : blocked(false)
        , blocked_until_ms(0)
        , remaining_seconds(0)
        , requests_in_last_minute(0)
        , remaining_requests(0) {}
};

// Per-identity sliding window limiter with temporary blocking.
//
// Open: each request is appended to the identity's window; if more than
// max_requests_per_minute fall inside the trailing window the identity is
// Blocked until now + block_duration and the request is rejected.
// Blocked: every request is rejected (and not recorded) until blocked_until;
// the first request at or after it drops the block and is evaluated fresh.
class RateLimiter {
public:
    explicit RateLimiter(const RateLimiterOptions& options = RateLimiterOptions());
    
    bool is_allowed(const std::string& identity);
    bool is_allowed(const std::string& identity, int64_t now_ms);
    
    // Administrative override: forget window and block for identity
    void reset(const std::string& identity);
    
    RateLimitStatus status(const std::string& identity) const;
    RateLimitStatus status(const std::string& identity, int64_t now_ms) const;
    
    // Forget every identity
    void clear();
    
    size_t tracked_identities() const;
    
    // Forget identities with no request inside the window and no active block.
    // Also runs automatically every PRUNE_INTERVAL admission checks.
    // Returns the number of identities dropped.
    size_t prune(int64_t now_ms);
    
    static const size_t PRUNE_INTERVAL = 1024;
    
    const RateLimiterOptions& options() const { return options_; }
    size_t window_capacity() const { return capacity_; }

private:
    int count_recent(const std::deque<int64_t>& window, int64_t now_ms) const;
    size_t prune_locked(int64_t now_ms);
    
    RateLimiterOptions options_;
    size_t capacity_;
    std::map<std::string, std::deque<int64_t> > windows_;
    std::map<std::string, int64_t> blocked_until_;
    size_t checks_since_prune_;
    mutable std::mutex mutex_;
};

} // namespace sfera

#endif // SFERA_RATE_LIMITER_RATE_LIMITER_HPP
