/*
 * Sfera - Memory store interfaces
 *
 * The aggregator and scheduler only see these. Implementations may block on
 * I/O and report failures by throwing.
 */
#ifndef SFERA_MEMORY_STORES_HPP
#define SFERA_MEMORY_STORES_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace sfera {

class UserStateStore {
public:
    virtual ~UserStateStore() {}
    
    // Profile / core memory rendered for the system prompt ("" if unknown user)
    virtual std::string format_for_prompt(const std::string& user_id) = 0;
    
    // Users that currently have an active plan
    virtual std::vector<UserState> active_users() = 0;
    
    // Record that a proactive message went out at timestamp (unix seconds)
    virtual void mark_proactive(const std::string& user_id, int64_t timestamp) = 0;
};

class SummaryStore {
public:
    virtual ~SummaryStore() {}
    
    // Most recent session summary, "" if none
    virtual std::string get_last_summary(const std::string& user_id) = 0;
    
    virtual void add_summary(const std::string& user_id, const std::string& text) = 0;
};

class VectorMemoryStore {
public:
    virtual ~VectorMemoryStore() {}
    
    // Up to limit most recent records matching filter, oldest first.
    // Records are objects shaped {role, content, ...}.
    virtual std::vector<Json> query_all(const MemoryFilter& filter, size_t limit) = 0;
    
    virtual void add(const std::string& user_id, const Json& record) = 0;
};

} // namespace sfera

#endif // SFERA_MEMORY_STORES_HPP
