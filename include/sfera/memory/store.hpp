/*
 * Sfera - Memory SQLite Store
 *
 * One SQLite database backing the user-state, summary and conversation
 * history stores. Collaborator calls throw MemoryStoreError on failure;
 * management calls (open, schema, import) return false and set last_error().
 */
#ifndef SFERA_MEMORY_STORE_HPP
#define SFERA_MEMORY_STORE_HPP

#include "stores.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <stdexcept>
#include <sqlite3.h>

namespace sfera {

class MemoryStoreError : public std::runtime_error {
public:
    explicit MemoryStoreError(const std::string& what) : std::runtime_error(what) {}
};

class MemoryStore : public UserStateStore, public SummaryStore, public VectorMemoryStore {
public:
    MemoryStore();
    ~MemoryStore();
    
    // Open database at path (":memory:" for a private in-memory database)
    bool open(const std::string& db_path);
    void close();
    bool is_open() const;
    
    // Schema management
    bool ensure_schema();
    
    // Seed from a document {"users": {...}, "summaries": {...}, "history": [...]}
    bool import_json(const Json& doc);
    
    // User operations
    bool upsert_user(const UserState& state);
    bool get_user(const std::string& user_id, UserState& out);
    
    // UserStateStore
    std::string format_for_prompt(const std::string& user_id) override;
    std::vector<UserState> active_users() override;
    void mark_proactive(const std::string& user_id, int64_t timestamp) override;
    
    // SummaryStore
    std::string get_last_summary(const std::string& user_id) override;
    void add_summary(const std::string& user_id, const std::string& text) override;
    
    // VectorMemoryStore
    std::vector<Json> query_all(const MemoryFilter& filter, size_t limit) override;
    void add(const std::string& user_id, const Json& record) override;
    
    int count_history(const std::string& user_id);
    
    // Utility
    std::string last_error() const;

private:
    MemoryStore(const MemoryStore&);
    MemoryStore& operator=(const MemoryStore&);
    
    sqlite3* db_;
    std::string last_error_;
    mutable std::mutex mutex_;
    
    bool exec(const std::string& sql);
    sqlite3_stmt* prepare(const char* sql);
    void require_open() const;
    void throw_db_error(const std::string& op);
    void set_error_from_db();
    
    bool upsert_user_locked(const UserState& state);
    bool insert_summary_locked(const std::string& user_id, const std::string& text, int64_t created_at);
    bool insert_history_locked(const std::string& user_id, const Json& record, int64_t created_at);
    static UserState read_user_row(sqlite3_stmt* stmt);
};

} // namespace sfera

#endif // SFERA_MEMORY_STORE_HPP
