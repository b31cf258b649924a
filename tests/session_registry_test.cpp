#include <sfera/session/session_registry.hpp>
#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include <sstream>

using namespace sfera;

namespace {

class FakeContext : public SessionContext {};

class FakeAgent : public SessionAgent {
public:
    bool inject_message(const std::string& text) override {
        received.push_back(text);
        return true;
    }
    
    std::vector<std::string> received;
};

} // namespace

TEST(SessionRegistryTest, RegisterAndLookup) {
    SessionRegistry registry;
    FakeContext ctx;
    FakeAgent agent;
    
    registry.register_session("u1", SessionHandle("u1", &ctx, &agent));
    
    EXPECT_TRUE(registry.is_active("u1"));
    EXPECT_EQ(&ctx, registry.get_context("u1"));
    EXPECT_EQ(&agent, registry.get_agent("u1"));
    
    SessionHandle handle;
    ASSERT_TRUE(registry.get("u1", handle));
    EXPECT_EQ("u1", handle.user_id);
    EXPECT_EQ(&agent, handle.agent);
}

TEST(SessionRegistryTest, LastRegistrationWins) {
    SessionRegistry registry;
    FakeContext first_ctx, second_ctx;
    FakeAgent first_agent, second_agent;
    
    registry.register_session("u1", SessionHandle("u1", &first_ctx, &first_agent));
    registry.register_session("u1", SessionHandle("u1", &second_ctx, &second_agent));
    
    EXPECT_EQ(1u, registry.size());
    EXPECT_EQ(&second_ctx, registry.get_context("u1"));
    EXPECT_EQ(&second_agent, registry.get_agent("u1"));
}

TEST(SessionRegistryTest, UnknownUserYieldsNothing) {
    SessionRegistry registry;
    SessionHandle handle;
    
    EXPECT_FALSE(registry.is_active("ghost"));
    EXPECT_FALSE(registry.get("ghost", handle));
    EXPECT_EQ(nullptr, registry.get_context("ghost"));
    EXPECT_EQ(nullptr, registry.get_agent("ghost"));
    
    registry.unregister_session("ghost");
    EXPECT_EQ(0u, registry.size());
}

TEST(SessionRegistryTest, UnregisterAndList) {
    SessionRegistry registry;
    FakeAgent agent;
    registry.register_session("a", SessionHandle("a", nullptr, &agent));
    registry.register_session("b", SessionHandle("b", nullptr, &agent));
    registry.register_session("c", SessionHandle("c", nullptr, nullptr));
    
    registry.unregister_session("b");
    
    std::set<std::string> active = registry.list_active();
    EXPECT_EQ(2u, active.size());
    EXPECT_EQ(1u, active.count("a"));
    EXPECT_EQ(1u, active.count("c"));
    EXPECT_FALSE(registry.is_active("b"));
}

TEST(SessionRegistryTest, ClearIsIdempotent) {
    SessionRegistry registry;
    registry.register_session("a", SessionHandle("a", nullptr, nullptr));
    
    registry.clear();
    registry.clear();
    EXPECT_TRUE(registry.list_active().empty());
}

TEST(SessionRegistryTest, ConcurrentRegistration) {
    SessionRegistry registry;
    std::vector<std::thread> threads;
    
    for (int t = 0; t < 4; ++t) {
        threads.push_back(std::thread([&registry, t]() {
            for (int i = 0; i < 50; ++i) {
                std::ostringstream id;
                id << "user-" << t << "-" << i;
                registry.register_session(id.str(), SessionHandle(id.str(), nullptr, nullptr));
                registry.is_active(id.str());
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }
    
    EXPECT_EQ(200u, registry.size());
}
