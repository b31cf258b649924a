#include <sfera/tools/tool_service.hpp>
#include <sfera/core/guard.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace sfera;

namespace {

// Serves canned responses and records requested URLs
struct FakeHttp {
    std::vector<std::string> urls;
    HttpResponse next;
    
    HttpResponse operator()(const std::string& url) {
        urls.push_back(url);
        return next;
    }
};

HttpResponse response(long status, const std::string& body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = body;
    return resp;
}

class ToolServiceTest : public ::testing::Test {
protected:
    ToolServiceTest() : http_(std::make_shared<FakeHttp>()) {
        options_.binance_price_url = "http://prices.test/ticker";
        options_.weather_url = "http://weather.test";
        options_.search_url = "http://search.test/v1";
    }
    
    std::unique_ptr<ToolService> make_service() {
        std::shared_ptr<FakeHttp> http = http_;
        limiter_.reset(new RateLimiter(limiter_options_));
        return std::unique_ptr<ToolService>(new ToolService(options_, *limiter_,
            [http](const std::string& url) { return (*http)(url); }));
    }
    
    std::shared_ptr<FakeHttp> http_;
    ToolOptions options_;
    RateLimiterOptions limiter_options_;
    std::unique_ptr<RateLimiter> limiter_;
};

} // namespace

TEST_F(ToolServiceTest, CryptoPriceIsCached) {
    http_->next = response(200, "{\"symbol\":\"BTCUSDT\",\"price\":\"64000.50000000\"}");
    std::unique_ptr<ToolService> tools = make_service();
    
    EXPECT_EQ("BTC: 64000.50000000 USDT", tools->crypto_price("u1", "btc"));
    EXPECT_EQ("BTC: 64000.50000000 USDT", tools->crypto_price("u1", " BTC "));
    
    ASSERT_EQ(1u, http_->urls.size());
    EXPECT_EQ("http://prices.test/ticker?symbol=BTCUSDT", http_->urls[0]);
    
    CacheStats stats = tools->cache_stats()["crypto_price"];
    EXPECT_EQ(1u, stats.hits);
    EXPECT_EQ(1u, stats.misses);
}

TEST_F(ToolServiceTest, FailuresAreReportedAndNotCached) {
    http_->next = response(503, "unavailable");
    http_->next.error = "HTTP 503";
    std::unique_ptr<ToolService> tools = make_service();
    
    EXPECT_EQ(std::string(DEFAULT_TOOL_ERROR) + " Details: HTTP 503", tools->crypto_price("u1", "ETH"));
    
    http_->next = response(200, "{\"price\":\"3100.00\"}");
    EXPECT_EQ("ETH: 3100.00 USDT", tools->crypto_price("u1", "ETH"));
    EXPECT_EQ(2u, http_->urls.size());
}

TEST_F(ToolServiceTest, MalformedBodyIsAFailure) {
    http_->next = response(200, "<html>");
    std::unique_ptr<ToolService> tools = make_service();
    
    std::string reply = tools->crypto_price("u1", "BTC");
    EXPECT_EQ(0u, reply.find(DEFAULT_TOOL_ERROR));
    EXPECT_EQ(0u, tools->cache_stats()["crypto_price"].size);
}

TEST_F(ToolServiceTest, RateLimitedBeforeCache) {
    limiter_options_.max_requests_per_minute = 1;
    
    http_->next = response(200, "{\"price\":\"1.0\"}");
    std::unique_ptr<ToolService> tools = make_service();
    
    EXPECT_EQ("DOGE: 1.0 USDT", tools->crypto_price("u1", "DOGE"));
    EXPECT_EQ(RATE_LIMITED_MESSAGE, tools->crypto_price("u1", "DOGE"));
    EXPECT_EQ(RATE_LIMITED_MESSAGE, tools->weather("u1", "Paris"));
    
    // Other users are unaffected and hit the cache
    EXPECT_EQ("DOGE: 1.0 USDT", tools->crypto_price("u2", "DOGE"));
    EXPECT_EQ(1u, http_->urls.size());
}

TEST_F(ToolServiceTest, WeatherReportIsTrimmed) {
    http_->next = response(200, "Paris: +18C\n");
    std::unique_ptr<ToolService> tools = make_service();
    
    EXPECT_EQ("Paris: +18C", tools->weather("u1", "Paris"));
    ASSERT_EQ(1u, http_->urls.size());
    EXPECT_EQ("http://weather.test/Paris?format=3", http_->urls[0]);
    EXPECT_EQ("Nothing to look up.", tools->weather("u1", "   "));
}

TEST_F(ToolServiceTest, SearchNeedsCredentials) {
    std::unique_ptr<ToolService> tools = make_service();
    EXPECT_EQ("Web search is not configured.", tools->web_search("u1", "btc halving"));
    EXPECT_TRUE(http_->urls.empty());
}

TEST_F(ToolServiceTest, SearchListsResults) {
    options_.google_api_key = "key";
    options_.google_cse_id = "cx";
    options_.max_search_results = 2;
    http_->next = response(200,
        "{\"items\": [{\"title\": \"A\", \"link\": \"http://a\"},"
        "            {\"title\": \"B\", \"link\": \"http://b\"},"
        "            {\"title\": \"C\", \"link\": \"http://c\"}]}");
    std::unique_ptr<ToolService> tools = make_service();
    
    EXPECT_EQ("A - http://a\nB - http://b", tools->web_search("u1", "btc"));
    ASSERT_EQ(1u, http_->urls.size());
    EXPECT_EQ("http://search.test/v1?key=key&cx=cx&num=2&q=btc", http_->urls[0]);
    
    http_->next = response(200, "{}");
    EXPECT_EQ("No results for 'nothing'.", tools->web_search("u1", "nothing"));
}

TEST_F(ToolServiceTest, ClearCachesResetsStats) {
    http_->next = response(200, "{\"price\":\"2\"}");
    std::unique_ptr<ToolService> tools = make_service();
    tools->crypto_price("u1", "SOL");
    
    tools->clear_caches();
    
    std::map<std::string, CacheStats> stats = tools->cache_stats();
    EXPECT_EQ(3u, stats.size());
    EXPECT_EQ(0u, stats["crypto_price"].size);
    EXPECT_EQ(0u, stats["crypto_price"].misses);
}
