#ifndef SFERA_SESSION_SESSION_REGISTRY_HPP
#define SFERA_SESSION_SESSION_REGISTRY_HPP

#include <string>
#include <map>
#include <set>
#include <mutex>

namespace sfera {

// Conversation state owned by the session runtime. Opaque to the registry.
class SessionContext {
public:
    virtual ~SessionContext() {}
};

// Live agent of a session; lets outside actors push a message into it
class SessionAgent {
public:
    virtual ~SessionAgent() {}
    
    // Deliver text as an agent-initiated turn. Returns false if the session
    // can no longer accept messages.
    virtual bool inject_message(const std::string& text) = 0;
};

// Non-owning association of a user with the runtime's live objects.
// The runtime keeps both objects alive between register and unregister.
struct SessionHandle {
    std::string user_id;
    SessionContext* context;
    SessionAgent* agent;
    
    SessionHandle() : context(nullptr), agent(nullptr) {}
    SessionHandle(const std::string& user, SessionContext* ctx, SessionAgent* a)
        : user_id(user), context(ctx), agent(a) {}
};

// Directory of active sessions keyed by user identity. Handles are stored and
// returned verbatim, never dereferenced. A second register for the same user
// replaces the first.
class SessionRegistry {
public:
    SessionRegistry();
    
    void register_session(const std::string& user_id, const SessionHandle& handle);
    
    // No-op when user_id has no session
    void unregister_session(const std::string& user_id);
    
    // Copy the handle for user_id into out; false when not active
    bool get(const std::string& user_id, SessionHandle& out) const;
    
    // Null when not active
    SessionContext* get_context(const std::string& user_id) const;
    SessionAgent* get_agent(const std::string& user_id) const;
    
    bool is_active(const std::string& user_id) const;
    
    std::set<std::string> list_active() const;
    
    size_t size() const;
    
    void clear();

private:
    SessionRegistry(const SessionRegistry&);
    SessionRegistry& operator=(const SessionRegistry&);
    
    std::map<std::string, SessionHandle> sessions_;
    mutable std::mutex mutex_;
};

} // namespace sfera

#endif // SFERA_SESSION_SESSION_REGISTRY_HPP
