/*
 * Sfera - Proactive follow-up scheduler implementation
 */
#include <sfera/proactive/scheduler.hpp>
#include <sfera/core/guard.hpp>
#include <sfera/core/logger.hpp>
#include <sfera/core/utils.hpp>
#include <chrono>
#include <vector>

namespace sfera {

ProactiveScheduler::ProactiveScheduler(UserStateStore& users, SessionRegistry& registry,
                                       const ProactiveOptions& options)
    : users_(users)
    , registry_(registry)
    , options_(options)
    , running_(false) {}

ProactiveScheduler::~ProactiveScheduler() {
    stop();
}

bool ProactiveScheduler::needs_follow_up(const UserState& state, int64_t now) const {
    if (!state.has_active_plan()) return false;
    
    int64_t quiet = options_.follow_up_hours * 3600;
    
    // A plan that was never updated gets its first follow-up right away
    bool due = state.last_update < 0 || now - state.last_update > quiet;
    
    // At most one proactive message per quiet period
    if (state.last_proactive_message >= 0 && now - state.last_proactive_message < quiet) {
        due = false;
    }
    return due;
}

std::string ProactiveScheduler::follow_up_message(const UserState& state) {
    return "Привет! Это Sfera AI.\n\n"
           "Я заметила, что у тебя активен план '" + state.active_plan + "'.\n"
           "Прошло уже 24 часа с последнего обновления.\n\n"
           "Когда будешь готов, давай продолжим работу!";
}

ProactiveReport ProactiveScheduler::run_once(int64_t now) {
    ProactiveReport report;
    
    std::vector<UserState> active = users_.active_users();
    report.checked = active.size();
    if (active.empty()) {
        LOG_DEBUG("Proactive: no active plans");
        return report;
    }
    LOG_INFO("Proactive: %zu users with active plans", active.size());
    
    for (size_t i = 0; i < active.size(); ++i) {
        const UserState& state = active[i];
        if (!needs_follow_up(state, now)) continue;
        ++report.due;
        
        LOG_INFO("Proactive: user '%s' needs a follow-up on plan '%s'",
                 state.user_id.c_str(), state.active_plan.c_str());
        
        try {
            std::string message = follow_up_message(state);
            SessionAgent* agent = registry_.get_agent(state.user_id);
            if (agent && agent->inject_message(message)) {
                ++report.delivered;
                LOG_INFO("Proactive: follow-up delivered to live session of %s", state.user_id.c_str());
            } else {
                ++report.offline;
                LOG_INFO("Proactive: %s is offline, pending notification: %s",
                         state.user_id.c_str(), message.c_str());
            }
            
            // Stamp either way so the user is not messaged again this period
            users_.mark_proactive(state.user_id, now);
        } catch (const std::exception& e) {
            LOG_ERROR("Proactive: follow-up for %s failed: %s", state.user_id.c_str(), e.what());
        }
    }
    
    return report;
}

void ProactiveScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&ProactiveScheduler::loop, this);
    LOG_INFO("Proactive scheduler started (every %lld s)",
             static_cast<long long>(options_.interval_seconds));
}

void ProactiveScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("Proactive scheduler stopped");
}

bool ProactiveScheduler::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void ProactiveScheduler::loop() {
    while (true) {
        guarded_call("proactive pass", ProactiveReport(), [this]() {
            return run_once(current_timestamp());
        });
        
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, std::chrono::seconds(options_.interval_seconds),
                       [this] { return !running_; });
        if (!running_) return;
    }
}

} // namespace sfera
