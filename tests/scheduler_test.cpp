#include <sfera/proactive/scheduler.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace sfera;

namespace {

const int64_t NOW = 1800000000;
const int64_t HOUR = 3600;

class FakeUserStore : public UserStateStore {
public:
    std::string format_for_prompt(const std::string&) override { return ""; }
    
    std::vector<UserState> active_users() override {
        std::lock_guard<std::mutex> lock(mutex);
        ++passes;
        if (fail_listing) {
            throw std::runtime_error("users table locked");
        }
        return users;
    }
    
    void mark_proactive(const std::string& user_id, int64_t timestamp) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (user_id == failing_user) {
            throw std::runtime_error("write failed");
        }
        marks[user_id] = timestamp;
    }
    
    std::vector<UserState> users;
    std::map<std::string, int64_t> marks;
    std::string failing_user;
    int passes = 0;
    bool fail_listing = false;
    std::mutex mutex;
};

class RecordingAgent : public SessionAgent {
public:
    explicit RecordingAgent(bool accept = true) : accept_(accept) {}
    
    bool inject_message(const std::string& text) override {
        messages.push_back(text);
        return accept_;
    }
    
    std::vector<std::string> messages;

private:
    bool accept_;
};

UserState planner(const std::string& id, int64_t last_update, int64_t last_proactive = -1) {
    UserState state;
    state.user_id = id;
    state.name = "Ann";
    state.active_plan = "DCA into BTC";
    state.last_update = last_update;
    state.last_proactive_message = last_proactive;
    return state;
}

} // namespace

TEST(ProactiveSchedulerTest, FollowUpRules) {
    FakeUserStore store;
    SessionRegistry registry;
    ProactiveScheduler scheduler(store, registry);
    
    EXPECT_TRUE(scheduler.needs_follow_up(planner("a", -1), NOW));
    EXPECT_TRUE(scheduler.needs_follow_up(planner("a", NOW - 25 * HOUR), NOW));
    EXPECT_FALSE(scheduler.needs_follow_up(planner("a", NOW - 2 * HOUR), NOW));
    EXPECT_FALSE(scheduler.needs_follow_up(planner("a", NOW - 48 * HOUR, NOW - HOUR), NOW));
    EXPECT_TRUE(scheduler.needs_follow_up(planner("a", NOW - 48 * HOUR, NOW - 30 * HOUR), NOW));
    
    UserState no_plan = planner("a", -1);
    no_plan.active_plan.clear();
    EXPECT_FALSE(scheduler.needs_follow_up(no_plan, NOW));
}

TEST(ProactiveSchedulerTest, DeliversToLiveSessionsAndMarksEveryone) {
    FakeUserStore store;
    store.users.push_back(planner("online", NOW - 30 * HOUR));
    store.users.push_back(planner("offline", NOW - 30 * HOUR));
    store.users.push_back(planner("fresh", NOW - HOUR));
    
    SessionRegistry registry;
    RecordingAgent agent;
    registry.register_session("online", SessionHandle("online", nullptr, &agent));
    
    ProactiveScheduler scheduler(store, registry);
    ProactiveReport report = scheduler.run_once(NOW);
    
    EXPECT_EQ(3u, report.checked);
    EXPECT_EQ(2u, report.due);
    EXPECT_EQ(1u, report.delivered);
    EXPECT_EQ(1u, report.offline);
    
    ASSERT_EQ(1u, agent.messages.size());
    EXPECT_EQ(ProactiveScheduler::follow_up_message(store.users[0]), agent.messages[0]);
    EXPECT_NE(std::string::npos, agent.messages[0].find("DCA into BTC"));
    
    EXPECT_EQ(NOW, store.marks["online"]);
    EXPECT_EQ(NOW, store.marks["offline"]);
    EXPECT_EQ(0u, store.marks.count("fresh"));
}

TEST(ProactiveSchedulerTest, RejectedInjectionCountsAsOffline) {
    FakeUserStore store;
    store.users.push_back(planner("closing", -1));
    SessionRegistry registry;
    RecordingAgent agent(false);
    registry.register_session("closing", SessionHandle("closing", nullptr, &agent));
    
    ProactiveScheduler scheduler(store, registry);
    ProactiveReport report = scheduler.run_once(NOW);
    
    EXPECT_EQ(0u, report.delivered);
    EXPECT_EQ(1u, report.offline);
}

TEST(ProactiveSchedulerTest, OneFailingUserDoesNotStopThePass) {
    FakeUserStore store;
    store.users.push_back(planner("broken", -1));
    store.users.push_back(planner("healthy", -1));
    store.failing_user = "broken";
    SessionRegistry registry;
    
    ProactiveScheduler scheduler(store, registry);
    ProactiveReport report = scheduler.run_once(NOW);
    
    EXPECT_EQ(2u, report.due);
    EXPECT_EQ(NOW, store.marks["healthy"]);
}

TEST(ProactiveSchedulerTest, FollowUpMessageNamesThePlan) {
    std::string message = ProactiveScheduler::follow_up_message(planner("x", -1));
    EXPECT_EQ(0u, message.find("Привет! Это Sfera AI."));
    EXPECT_NE(std::string::npos, message.find("'DCA into BTC'"));
}

TEST(ProactiveSchedulerTest, StopsPromptly) {
    FakeUserStore store;
    SessionRegistry registry;
    ProactiveOptions options;
    options.interval_seconds = 3600;
    ProactiveScheduler scheduler(store, registry, options);
    
    scheduler.start();
    scheduler.start();
    EXPECT_TRUE(scheduler.is_running());
    
    std::chrono::steady_clock::time_point begin = std::chrono::steady_clock::now();
    scheduler.stop();
    scheduler.stop();
    std::chrono::steady_clock::duration took = std::chrono::steady_clock::now() - begin;
    
    EXPECT_FALSE(scheduler.is_running());
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(took).count(), 5);
}

TEST(ProactiveSchedulerTest, BackgroundLoopSurvivesFailingPass) {
    FakeUserStore store;
    store.fail_listing = true;
    SessionRegistry registry;
    ProactiveScheduler scheduler(store, registry);
    
    EXPECT_THROW(scheduler.run_once(NOW), std::runtime_error);
    
    scheduler.start();
    for (int i = 0; i < 200; ++i) {
        {
            std::lock_guard<std::mutex> lock(store.mutex);
            if (store.passes >= 2) break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(scheduler.is_running());
    scheduler.stop();
    
    std::lock_guard<std::mutex> lock(store.mutex);
    EXPECT_GE(store.passes, 2);
}
