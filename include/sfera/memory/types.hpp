/*
 * Sfera - Memory Types
 *
 * Conversation turns, bootstrap results and user state shared by the
 * memory aggregator, the stores and the proactive scheduler.
 */
#ifndef SFERA_MEMORY_TYPES_HPP
#define SFERA_MEMORY_TYPES_HPP

#include <sfera/core/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include <cstdint>

namespace sfera {

// One conversation turn
struct ChatMessage {
    std::string role;       // "system", "user" or "assistant"
    std::string content;
    
    ChatMessage() {}
    ChatMessage(const std::string& r, const std::string& c) : role(r), content(c) {}
};

// Ordered conversation handed to the session runtime
class ChatContext {
public:
    // Throws std::invalid_argument for a role outside system/user/assistant
    void add_message(const std::string& role, const std::string& content);
    
    const std::vector<ChatMessage>& messages() const { return messages_; }
    size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }
    void clear() { messages_.clear(); }
    
    static bool is_valid_role(const std::string& role);

private:
    std::vector<ChatMessage> messages_;
};

// Result of loading every memory source at session start
struct BootstrapContext {
    ChatContext context;                // replayed history + greeting turn
    std::string core_memory;            // formatted profile
    std::string episodic_memory;        // framed last summary, empty if none
    std::vector<Json> recent_records;   // raw records from the vector store
};

// Vector store query filter
struct MemoryFilter {
    std::string user_id;
    
    MemoryFilter() {}
    explicit MemoryFilter(const std::string& user) : user_id(user) {}
};

// Long-term state of a user as seen by the proactive scheduler
struct UserState {
    std::string user_id;
    std::string name;
    std::map<std::string, std::string> profile;
    std::string active_plan;
    int64_t last_update;              // unix seconds, -1 if never
    int64_t last_proactive_message;   // unix seconds, -1 if never
    
    UserState() : last_update(-1), last_proactive_message(-1) {}
    
    bool has_active_plan() const { return !active_plan.empty(); }
};

// Raised when a memory source fails during aggregation
class MemoryLoadError : public std::runtime_error {
public:
    MemoryLoadError(const std::string& source, const std::string& detail)
        : std::runtime_error("could not load memory: " + source + ": " + detail)
        , source_(source) {}
    
    const std::string& source() const { return source_; }

private:
    std::string source_;
};

} // namespace sfera

#endif // SFERA_MEMORY_TYPES_HPP
