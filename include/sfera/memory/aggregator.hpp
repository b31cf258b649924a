/*
 * Sfera - Memory Aggregator
 *
 * Loads the three memory sources of a user concurrently at session start
 * (profile, last episodic summary, recent history) and merges them into the
 * bootstrap context of the new conversation.
 */
#ifndef SFERA_MEMORY_AGGREGATOR_HPP
#define SFERA_MEMORY_AGGREGATOR_HPP

#include "types.hpp"
#include "stores.hpp"
#include <sfera/core/thread_pool.hpp>
#include <string>
#include <vector>

namespace sfera {

struct AggregatorOptions {
    size_t history_limit;    // records requested from the vector store
    size_t replay_limit;     // most recent records replayed into the context
    std::string greeting;    // final system turn
    
    AggregatorOptions();
};

// Header placed before the last session summary
extern const char* EPISODIC_MEMORY_HEADER;

class MemoryAggregator {
public:
    MemoryAggregator(UserStateStore& user_state,
                     SummaryStore& summaries,
                     VectorMemoryStore& history,
                     ThreadPool& pool,
                     const AggregatorOptions& options = AggregatorOptions());
    
    // Fan out the three fetches, wait for all of them, then merge.
    // Any failing source throws MemoryLoadError; no partial context is built.
    // Must not run on a worker of the pool given here: that call is rejected
    // with MemoryLoadError("scheduler").
    BootstrapContext load(const std::string& user_id);
    
    const AggregatorOptions& options() const { return options_; }
    
    // "# EPISODIC MEMORY ..." framing, "" for an empty summary
    static std::string frame_episodic(const std::string& summary);
    
    // Render records as "User: ..." / "Assistant: ..." lines
    static std::string format_history(const std::vector<Json>& records);

private:
    void replay_history(const std::vector<Json>& records, ChatContext& context,
                        const std::string& user_id) const;
    
    UserStateStore& user_state_;
    SummaryStore& summaries_;
    VectorMemoryStore& history_;
    ThreadPool& pool_;
    AggregatorOptions options_;
};

} // namespace sfera

#endif // SFERA_MEMORY_AGGREGATOR_HPP
