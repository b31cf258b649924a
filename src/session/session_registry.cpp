#include <sfera/session/session_registry.hpp>
#include <sfera/core/logger.hpp>

namespace sfera {

SessionRegistry::SessionRegistry() {}

void SessionRegistry::register_session(const std::string& user_id, const SessionHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[user_id] = handle;
    LOG_INFO("Session registered for user: %s", user_id.c_str());
}

void SessionRegistry::unregister_session(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(user_id) > 0) {
        LOG_INFO("Session unregistered for user: %s", user_id.c_str());
    }
}

bool SessionRegistry::get(const std::string& user_id, SessionHandle& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, SessionHandle>::const_iterator it = sessions_.find(user_id);
    if (it == sessions_.end()) return false;
    out = it->second;
    return true;
}

SessionContext* SessionRegistry::get_context(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, SessionHandle>::const_iterator it = sessions_.find(user_id);
    return it != sessions_.end() ? it->second.context : nullptr;
}

SessionAgent* SessionRegistry::get_agent(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, SessionHandle>::const_iterator it = sessions_.find(user_id);
    return it != sessions_.end() ? it->second.agent : nullptr;
}

bool SessionRegistry::is_active(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.find(user_id) != sessions_.end();
}

std::set<std::string> SessionRegistry::list_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> users;
    for (std::map<std::string, SessionHandle>::const_iterator it = sessions_.begin();
         it != sessions_.end(); ++it) {
        users.insert(it->first);
    }
    return users;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
    LOG_INFO("All sessions cleared from registry");
}

} // namespace sfera
