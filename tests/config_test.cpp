#include <sfera/core/config.hpp>
#include <gtest/gtest.h>
#include <cstdlib>

using sfera::Config;

TEST(ConfigTest, ReadsDotNotationKeys) {
    Config config;
    ASSERT_TRUE(config.load_string(
        "{\"log_level\": \"debug\", \"cache\": {\"crypto_ttl\": 45},"
        " \"api\": {\"auth\": {\"token\": \"abc\"}}, \"verbose\": true}"));
    
    EXPECT_EQ("debug", config.get_string("log_level"));
    EXPECT_EQ(45, config.get_int("cache.crypto_ttl", 30));
    EXPECT_EQ("abc", config.get_string("api.auth.token"));
    EXPECT_TRUE(config.get_bool("verbose"));
    EXPECT_TRUE(config.get_section("cache").is_object());
}

TEST(ConfigTest, UsesDefaultsForMissingOrMistypedKeys) {
    Config config;
    ASSERT_TRUE(config.load_string("{\"cache\": {\"crypto_ttl\": \"soon\"}}"));
    
    EXPECT_EQ(30, config.get_int("cache.crypto_ttl", 30));
    EXPECT_EQ(100, config.get_int("cache.crypto_max_size", 100));
    EXPECT_EQ("info", config.get_string("log_level", "info"));
    EXPECT_FALSE(config.get_bool("verbose", false));
}

TEST(ConfigTest, FallsBackToEnvironment) {
    setenv("SFERA_RATE_LIMIT_BLOCK_MINUTES", "7", 1);
    setenv("SFERA_API_GOOGLE_API_KEY", "from-env", 1);
    
    Config config;
    ASSERT_TRUE(config.load_string("{\"api\": {\"google_api_key\": \"from-file\"}}"));
    
    EXPECT_EQ(7, config.get_int("rate_limit.block_minutes", 5));
    // File values win over the environment
    EXPECT_EQ("from-file", config.get_string("api.google_api_key"));
    
    unsetenv("SFERA_RATE_LIMIT_BLOCK_MINUTES");
    unsetenv("SFERA_API_GOOGLE_API_KEY");
}

TEST(ConfigTest, EnvKeyNaming) {
    EXPECT_EQ("SFERA_CACHE_CRYPTO_TTL", Config::to_env_key("cache.crypto_ttl"));
    EXPECT_EQ("SFERA_LOG_LEVEL", Config::to_env_key("log_level"));
}

TEST(ConfigTest, RejectsInvalidDocuments) {
    Config config;
    EXPECT_FALSE(config.load_string("{not json"));
    EXPECT_FALSE(config.load_string("[1, 2]"));
    EXPECT_FALSE(config.load_file("/nonexistent/sfera-config.json"));
}
