/*
 * Sfera - Memory SQLite Store Implementation
 */
#include <sfera/memory/store.hpp>
#include <sfera/core/logger.hpp>
#include <sfera/core/utils.hpp>
#include <sstream>

namespace sfera {

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// Accepts unix seconds or an ISO-8601 string; -1 otherwise
static int64_t json_timestamp(const Json& value) {
    if (value.is_number()) return value.as_int();
    if (value.is_string()) return parse_timestamp(value.as_string());
    return -1;
}

MemoryStore::MemoryStore() 
    : db_(nullptr)
{
}

MemoryStore::~MemoryStore() {
    close();
}

bool MemoryStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    
    return true;
}

void MemoryStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool MemoryStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool MemoryStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "Database not open";
        return false;
    }
    
    if (!exec(
        "CREATE TABLE IF NOT EXISTS users ("
        "  user_id TEXT PRIMARY KEY,"
        "  name TEXT NOT NULL DEFAULT '',"
        "  profile TEXT NOT NULL DEFAULT '{}',"
        "  active_plan TEXT NOT NULL DEFAULT '',"
        "  last_update INTEGER NOT NULL DEFAULT -1,"
        "  last_proactive_message INTEGER NOT NULL DEFAULT -1"
        ")")) {
        return false;
    }
    
    if (!exec(
        "CREATE TABLE IF NOT EXISTS summaries ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  user_id TEXT NOT NULL,"
        "  text TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL"
        ")")) {
        return false;
    }
    
    // payload holds the record as JSON text, exactly as it was stored
    if (!exec(
        "CREATE TABLE IF NOT EXISTS history ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  user_id TEXT NOT NULL,"
        "  payload TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL"
        ")")) {
        return false;
    }
    
    exec("CREATE INDEX IF NOT EXISTS idx_summaries_user ON summaries(user_id)");
    exec("CREATE INDEX IF NOT EXISTS idx_history_user ON history(user_id)");
    
    return true;
}

bool MemoryStore::import_json(const Json& doc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "Database not open";
        return false;
    }
    if (!doc.is_object()) {
        last_error_ = "Seed document must be an object";
        return false;
    }
    
    int64_t now = current_timestamp();
    exec("BEGIN");
    
    const std::map<std::string, Json>& users = doc["users"].as_object();
    for (std::map<std::string, Json>::const_iterator it = users.begin(); it != users.end(); ++it) {
        const Json& u = it->second;
        UserState state;
        state.user_id = it->first;
        state.name = u.get_string("name");
        state.active_plan = u.get_string("active_plan");
        state.last_update = json_timestamp(u["last_update"]);
        state.last_proactive_message = json_timestamp(u["last_proactive_message"]);
        
        const std::map<std::string, Json>& profile = u["profile"].as_object();
        for (std::map<std::string, Json>::const_iterator p = profile.begin(); p != profile.end(); ++p) {
            state.profile[p->first] = p->second.is_string() ? p->second.as_string() : p->second.dump();
        }
        
        if (!upsert_user_locked(state)) {
            exec("ROLLBACK");
            return false;
        }
    }
    
    const std::map<std::string, Json>& summaries = doc["summaries"].as_object();
    for (std::map<std::string, Json>::const_iterator it = summaries.begin(); it != summaries.end(); ++it) {
        const std::vector<Json>& texts = it->second.as_array();
        for (size_t i = 0; i < texts.size(); ++i) {
            if (!texts[i].is_string()) continue;
            if (!insert_summary_locked(it->first, texts[i].as_string(), now)) {
                exec("ROLLBACK");
                return false;
            }
        }
    }
    
    const std::vector<Json>& history = doc["history"].as_array();
    size_t imported = 0;
    for (size_t i = 0; i < history.size(); ++i) {
        std::string user_id = history[i].get_string("user_id");
        if (user_id.empty()) {
            LOG_WARN("MemoryStore: history entry %zu has no user_id, ignored", i);
            continue;
        }
        if (!insert_history_locked(user_id, history[i], now)) {
            exec("ROLLBACK");
            return false;
        }
        ++imported;
    }
    
    if (!exec("COMMIT")) {
        return false;
    }
    
    LOG_INFO("MemoryStore: imported %zu users, %zu history records", users.size(), imported);
    return true;
}

bool MemoryStore::upsert_user(const UserState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "Database not open";
        return false;
    }
    return upsert_user_locked(state);
}

bool MemoryStore::upsert_user_locked(const UserState& state) {
    Json profile = Json::object();
    for (std::map<std::string, std::string>::const_iterator it = state.profile.begin();
         it != state.profile.end(); ++it) {
        profile.set(it->first, it->second);
    }
    
    sqlite3_stmt* stmt = prepare(
        "INSERT OR REPLACE INTO users (user_id, name, profile, active_plan, last_update, last_proactive_message) "
        "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmt) return false;
    
    std::string profile_text = profile.dump();
    sqlite3_bind_text(stmt, 1, state.user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, state.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, profile_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, state.active_plan.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, state.last_update);
    sqlite3_bind_int64(stmt, 6, state.last_proactive_message);
    
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

UserState MemoryStore::read_user_row(sqlite3_stmt* stmt) {
    UserState state;
    state.user_id = column_text(stmt, 0);
    state.name = column_text(stmt, 1);
    state.active_plan = column_text(stmt, 3);
    state.last_update = sqlite3_column_int64(stmt, 4);
    state.last_proactive_message = sqlite3_column_int64(stmt, 5);
    
    try {
        Json profile = Json::parse(column_text(stmt, 2));
        const std::map<std::string, Json>& fields = profile.as_object();
        for (std::map<std::string, Json>::const_iterator it = fields.begin(); it != fields.end(); ++it) {
            state.profile[it->first] = it->second.as_string(it->second.dump());
        }
    } catch (const std::exception& e) {
        LOG_WARN("MemoryStore: unreadable profile for %s: %s", state.user_id.c_str(), e.what());
    }
    return state;
}

bool MemoryStore::get_user(const std::string& user_id, UserState& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    sqlite3_stmt* stmt = prepare(
        "SELECT user_id, name, profile, active_plan, last_update, last_proactive_message "
        "FROM users WHERE user_id = ?");
    if (!stmt) throw_db_error("get_user");
    
    sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out = read_user_row(stmt);
        sqlite3_finalize(stmt);
        return true;
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) throw_db_error("get_user");
    return false;
}

// ============ UserStateStore ============

std::string MemoryStore::format_for_prompt(const std::string& user_id) {
    UserState state;
    if (!get_user(user_id, state)) {
        return "";
    }
    
    std::ostringstream oss;
    oss << "# USER PROFILE\n";
    if (!state.name.empty()) {
        oss << "- name: " << state.name << "\n";
    }
    for (std::map<std::string, std::string>::const_iterator it = state.profile.begin();
         it != state.profile.end(); ++it) {
        oss << "- " << it->first << ": " << it->second << "\n";
    }
    if (state.has_active_plan()) {
        oss << "- active plan: " << state.active_plan << "\n";
    }
    return oss.str();
}

std::vector<UserState> MemoryStore::active_users() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    sqlite3_stmt* stmt = prepare(
        "SELECT user_id, name, profile, active_plan, last_update, last_proactive_message "
        "FROM users WHERE active_plan != '' ORDER BY user_id");
    if (!stmt) throw_db_error("active_users");
    
    std::vector<UserState> users;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        users.push_back(read_user_row(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) throw_db_error("active_users");
    return users;
}

void MemoryStore::mark_proactive(const std::string& user_id, int64_t timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    sqlite3_stmt* stmt = prepare("UPDATE users SET last_proactive_message = ? WHERE user_id = ?");
    if (!stmt) throw_db_error("mark_proactive");
    
    sqlite3_bind_int64(stmt, 1, timestamp);
    sqlite3_bind_text(stmt, 2, user_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) throw_db_error("mark_proactive");
}

// ============ SummaryStore ============

std::string MemoryStore::get_last_summary(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    sqlite3_stmt* stmt = prepare(
        "SELECT text FROM summaries WHERE user_id = ? ORDER BY id DESC LIMIT 1");
    if (!stmt) throw_db_error("get_last_summary");
    
    sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    std::string text;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        text = column_text(stmt, 0);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) throw_db_error("get_last_summary");
    return text;
}

void MemoryStore::add_summary(const std::string& user_id, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    if (!insert_summary_locked(user_id, text, current_timestamp())) {
        throw_db_error("add_summary");
    }
}

bool MemoryStore::insert_summary_locked(const std::string& user_id, const std::string& text,
                                        int64_t created_at) {
    sqlite3_stmt* stmt = prepare(
        "INSERT INTO summaries (user_id, text, created_at) VALUES (?, ?, ?)");
    if (!stmt) return false;
    
    sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, created_at);
    
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

// ============ VectorMemoryStore ============

std::vector<Json> MemoryStore::query_all(const MemoryFilter& filter, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    sqlite3_stmt* stmt = prepare(
        "SELECT payload FROM ("
        "  SELECT id, payload FROM history WHERE user_id = ? ORDER BY id DESC LIMIT ?"
        ") ORDER BY id ASC");
    if (!stmt) throw_db_error("query_all");
    
    sqlite3_bind_text(stmt, 1, filter.user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(limit));
    
    std::vector<Json> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::string payload = column_text(stmt, 0);
        try {
            records.push_back(Json::parse(payload));
        } catch (const std::exception&) {
            // Keep the raw text; consumers treat non-objects as malformed
            records.push_back(Json(payload));
        }
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) throw_db_error("query_all");
    return records;
}

void MemoryStore::add(const std::string& user_id, const Json& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    if (!insert_history_locked(user_id, record, current_timestamp())) {
        throw_db_error("add");
    }
}

bool MemoryStore::insert_history_locked(const std::string& user_id, const Json& record,
                                        int64_t created_at) {
    sqlite3_stmt* stmt = prepare(
        "INSERT INTO history (user_id, payload, created_at) VALUES (?, ?, ?)");
    if (!stmt) return false;
    
    std::string payload = record.dump();
    sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, payload.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, created_at);
    
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

int MemoryStore::count_history(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    sqlite3_stmt* stmt = prepare("SELECT COUNT(*) FROM history WHERE user_id = ?");
    if (!stmt) throw_db_error("count_history");
    
    sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

// ============ Helpers ============

std::string MemoryStore::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool MemoryStore::exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        if (err_msg) {
            last_error_ = err_msg;
            sqlite3_free(err_msg);
        }
        LOG_ERROR("MemoryStore: '%s' failed: %s", sql.c_str(), last_error_.c_str());
        return false;
    }
    return true;
}

sqlite3_stmt* MemoryStore::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return nullptr;
    }
    return stmt;
}

void MemoryStore::require_open() const {
    if (!db_) {
        throw MemoryStoreError("memory store is not open");
    }
}

void MemoryStore::throw_db_error(const std::string& op) {
    set_error_from_db();
    throw MemoryStoreError("memory store " + op + " failed: " + last_error_);
}

void MemoryStore::set_error_from_db() {
    if (db_) {
        last_error_ = sqlite3_errmsg(db_);
    }
}

} // namespace sfera
