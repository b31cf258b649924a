/*
 * Sfera - Proactive follow-up scheduler
 *
 * Periodically looks for users with an active plan that went quiet and
 * pushes a follow-up into their live session through the session registry.
 */
#ifndef SFERA_PROACTIVE_SCHEDULER_HPP
#define SFERA_PROACTIVE_SCHEDULER_HPP

#include <sfera/memory/stores.hpp>
#include <sfera/session/session_registry.hpp>
#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <cstdint>

namespace sfera {

struct ProactiveOptions {
    int64_t interval_seconds;    // pause between passes
    int64_t follow_up_hours;     // quiet period before a follow-up, and min gap between them
    
    ProactiveOptions() : interval_seconds(300), follow_up_hours(24) {}
};

struct ProactiveReport {
    size_t checked;      // users with an active plan
    size_t due;          // users needing a follow-up
    size_t delivered;    // injected into a live session
    size_t offline;      // logged for later notification
    
    ProactiveReport() : checked(0), due(0), delivered(0), offline(0) {}
};

class ProactiveScheduler {
public:
    ProactiveScheduler(UserStateStore& users, SessionRegistry& registry,
                       const ProactiveOptions& options = ProactiveOptions());
    ~ProactiveScheduler();
    
    // One pass over active users at now (unix seconds)
    ProactiveReport run_once(int64_t now);
    
    // Whether state needs a follow-up at now
    bool needs_follow_up(const UserState& state, int64_t now) const;
    
    static std::string follow_up_message(const UserState& state);
    
    // Background passes every interval_seconds
    void start();
    void stop();
    bool is_running() const;

private:
    ProactiveScheduler(const ProactiveScheduler&);
    ProactiveScheduler& operator=(const ProactiveScheduler&);
    
    void loop();
    
    UserStateStore& users_;
    SessionRegistry& registry_;
    ProactiveOptions options_;
    
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool running_;
};

} // namespace sfera

#endif // SFERA_PROACTIVE_SCHEDULER_HPP
