/*
 * Sfera - Expiring key/value cache for expensive API responses
 *
 * Entries are visible only while now - stored_at < ttl. Expired entries are
 * erased when read. At capacity, the entry with the oldest stored_at is
 * evicted (a full scan; the workload holds tens of keys, not thousands).
 */
#ifndef SFERA_CACHE_TTL_CACHE_HPP
#define SFERA_CACHE_TTL_CACHE_HPP

#include <sfera/core/logger.hpp>
#include <sfera/core/utils.hpp>
#include <string>
#include <map>
#include <mutex>
#include <cstdint>

namespace sfera {

struct CacheStats {
    size_t size;
    size_t max_size;
    uint64_t hits;
    uint64_t misses;
    double hit_rate;
    int64_t ttl_seconds;
    
    CacheStats() : size(0), max_size(0), hits(0), misses(0), hit_rate(0.0), ttl_seconds(0) {}
};

template<typename V>
class TtlCache {
public:
    explicit TtlCache(int64_t ttl_seconds = 300, size_t max_size = 100)
        : ttl_ms_(ttl_seconds * 1000)
        , max_size_(max_size > 0 ? max_size : 1)
        , hits_(0)
        , misses_(0) {}
    
    // Copy the live value for key into out. Absent or expired -> false (a miss).
    bool get(const std::string& key, V& out) {
        return get(key, out, current_timestamp_ms());
    }
    
    bool get(const std::string& key, V& out, int64_t now_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        
        typename std::map<std::string, Entry>::iterator it = entries_.find(key);
        if (it != entries_.end()) {
            if (now_ms - it->second.stored_at_ms < ttl_ms_) {
                ++hits_;
                out = it->second.value;
                LOG_DEBUG("Cache HIT for key: %s... (hit rate: %.1f%%)",
                          key.substr(0, 20).c_str(), hit_rate_locked() * 100.0);
                return true;
            }
            entries_.erase(it);
        }
        
        ++misses_;
        LOG_DEBUG("Cache MISS for key: %s...", key.substr(0, 20).c_str());
        return false;
    }
    
    // Store value, replacing any entry for key and resetting its timestamp
    void set(const std::string& key, const V& value) {
        set(key, value, current_timestamp_ms());
    }
    
    void set(const std::string& key, const V& value, int64_t now_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        
        if (entries_.find(key) == entries_.end() && entries_.size() >= max_size_) {
            evict_oldest_locked();
        }
        
        Entry& entry = entries_[key];
        entry.value = value;
        entry.stored_at_ms = now_ms;
        LOG_DEBUG("Cache SET for key: %s... (size: %zu/%zu)",
                  key.substr(0, 20).c_str(), entries_.size(), max_size_);
    }
    
    // Cached value for key, or the result of fn() which is then stored.
    // Exceptions from fn propagate and nothing is cached.
    template<typename F>
    V get_or_compute(const std::string& key, F fn) {
        V value;
        if (get(key, value)) {
            return value;
        }
        value = fn();
        set(key, value);
        return value;
    }
    
    // Drop every entry and reset counters
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        hits_ = 0;
        misses_ = 0;
        LOG_INFO("Cache cleared");
    }
    
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }
    
    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats s;
        s.size = entries_.size();
        s.max_size = max_size_;
        s.hits = hits_;
        s.misses = misses_;
        s.hit_rate = hit_rate_locked();
        s.ttl_seconds = ttl_ms_ / 1000;
        return s;
    }

private:
    struct Entry {
        V value;
        int64_t stored_at_ms;
        
        Entry() : value(), stored_at_ms(0) {}
    };
    
    double hit_rate_locked() const {
        uint64_t total = hits_ + misses_;
        return total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
    }
    
    void evict_oldest_locked() {
        if (entries_.empty()) return;
        
        typename std::map<std::string, Entry>::iterator oldest = entries_.begin();
        for (typename std::map<std::string, Entry>::iterator it = entries_.begin();
             it != entries_.end(); ++it) {
            if (it->second.stored_at_ms < oldest->second.stored_at_ms) {
                oldest = it;
            }
        }
        LOG_DEBUG("Cache full, removed oldest entry: %s...", oldest->first.substr(0, 20).c_str());
        entries_.erase(oldest);
    }
    
    int64_t ttl_ms_;
    size_t max_size_;
    uint64_t hits_;
    uint64_t misses_;
    std::map<std::string, Entry> entries_;
    mutable std::mutex mutex_;
};

} // namespace sfera

#endif // SFERA_CACHE_TTL_CACHE_HPP
