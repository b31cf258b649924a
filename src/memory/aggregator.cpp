/*
 * Sfera - Memory Aggregator Implementation
 */
#include <sfera/memory/aggregator.hpp>
#include <sfera/core/logger.hpp>
#include <future>

namespace sfera {

const char* EPISODIC_MEMORY_HEADER =
    "# EPISODIC MEMORY (LAST SESSION SUMMARY)\n"
    "[SYSTEM NOTE: Use this to continue the conversation naturally.]\n";

AggregatorOptions::AggregatorOptions()
    : history_limit(30)
    , replay_limit(10)
    , greeting("User connected. You MUST say exactly: 'Привет. Я Sfera AI. Твоя цифровая "
               "напарница в трейдинге. Чем сегодня займемся?' Address the user as 'ты' "
               "(informal) at all times.") {}

MemoryAggregator::MemoryAggregator(UserStateStore& user_state,
                                   SummaryStore& summaries,
                                   VectorMemoryStore& history,
                                   ThreadPool& pool,
                                   const AggregatorOptions& options)
    : user_state_(user_state)
    , summaries_(summaries)
    , history_(history)
    , pool_(pool)
    , options_(options) {}

// Result of a finished future, or MemoryLoadError naming the source
template<typename T>
static T collect(std::future<T>& result, const char* source) {
    try {
        return result.get();
    } catch (const std::exception& e) {
        LOG_ERROR("Memory source '%s' failed: %s", source, e.what());
        throw MemoryLoadError(source, e.what());
    }
}

BootstrapContext MemoryAggregator::load(const std::string& user_id) {
    LOG_INFO("Starting parallel memory loading for user %s...", user_id.c_str());
    
    // A worker blocking on its own pool can deadlock
    if (pool_.owns_current_thread()) {
        throw MemoryLoadError("scheduler", "load called from a worker of its own pool");
    }
    
    // Tasks hold the stores, not this, so they stay valid if we throw early
    UserStateStore* user_state = &user_state_;
    SummaryStore* summaries = &summaries_;
    VectorMemoryStore* history = &history_;
    MemoryFilter filter(user_id);
    size_t limit = options_.history_limit;
    
    std::future<std::string> profile_task;
    std::future<std::string> summary_task;
    std::future<std::vector<Json> > history_task;
    try {
        profile_task = pool_.submit([user_state, user_id]() {
            return user_state->format_for_prompt(user_id);
        });
        summary_task = pool_.submit([summaries, user_id]() {
            return summaries->get_last_summary(user_id);
        });
        history_task = pool_.submit([history, filter, limit]() {
            return history->query_all(filter, limit);
        });
    } catch (const std::runtime_error& e) {
        if (profile_task.valid()) profile_task.wait();
        if (summary_task.valid()) summary_task.wait();
        throw MemoryLoadError("scheduler", e.what());
    }
    
    // Fan-in: every source finishes before any result is inspected
    profile_task.wait();
    summary_task.wait();
    history_task.wait();
    
    BootstrapContext result;
    result.core_memory = collect(profile_task, "profile");
    std::string last_summary = collect(summary_task, "summary");
    result.recent_records = collect(history_task, "history");
    
    LOG_INFO("Loaded core memory for %s", user_id.c_str());
    
    result.episodic_memory = frame_episodic(last_summary);
    if (!result.episodic_memory.empty()) {
        LOG_INFO("Loaded episodic memory for %s", user_id.c_str());
    }
    
    if (!result.recent_records.empty()) {
        LOG_INFO("Loaded %zu recent memories for user %s",
                 result.recent_records.size(), user_id.c_str());
    }
    
    replay_history(result.recent_records, result.context, user_id);
    
    // Greeting goes after the replayed history
    result.context.add_message("system", options_.greeting);
    
    return result;
}

void MemoryAggregator::replay_history(const std::vector<Json>& records, ChatContext& context,
                                      const std::string& user_id) const {
    size_t start = records.size() > options_.replay_limit
        ? records.size() - options_.replay_limit : 0;
    
    for (size_t i = start; i < records.size(); ++i) {
        const Json& record = records[i];
        if (!record.is_object()) {
            LOG_WARN("Skipping malformed memory record %zu for %s: not an object", i, user_id.c_str());
            continue;
        }
        
        // A record without a role is a user turn
        const Json& role_value = record["role"];
        const Json& content_value = record["content"];
        if ((!role_value.is_null() && !role_value.is_string()) ||
            (!content_value.is_null() && !content_value.is_string())) {
            LOG_WARN("Skipping malformed memory record %zu for %s: role/content not text", i, user_id.c_str());
            continue;
        }
        
        std::string role = role_value.as_string("user");
        std::string content = content_value.as_string();
        if ((role != "user" && role != "assistant") || content.empty()) {
            continue;
        }
        
        try {
            context.add_message(role, content);
        } catch (const std::invalid_argument& e) {
            LOG_WARN("Failed to add memory to chat context: %s", e.what());
        }
    }
}

std::string MemoryAggregator::frame_episodic(const std::string& summary) {
    if (summary.empty()) return "";
    return std::string(EPISODIC_MEMORY_HEADER) + summary;
}

std::string MemoryAggregator::format_history(const std::vector<Json>& records) {
    std::string out;
    for (size_t i = 0; i < records.size(); ++i) {
        std::string role = records[i].get_string("role", "unknown");
        std::string content = records[i].get_string("content");
        if (!out.empty()) out += "\n";
        if (role == "user") {
            out += "User: " + content;
        } else if (role == "assistant") {
            out += "Assistant: " + content;
        } else {
            out += content;
        }
    }
    return out;
}

} // namespace sfera
