/*
 * Sfera - Market and information tools
 *
 * Outbound calls to paid / rate-limited APIs. Each call is admitted by the
 * per-user rate limiter, then served from its tool's TTL cache, and only on a
 * miss goes to the network. Failures become a user-facing message.
 */
#ifndef SFERA_TOOLS_TOOL_SERVICE_HPP
#define SFERA_TOOLS_TOOL_SERVICE_HPP

#include <sfera/cache/ttl_cache.hpp>
#include <sfera/core/config.hpp>
#include <sfera/core/http_client.hpp>
#include <sfera/rate_limiter/rate_limiter.hpp>
#include <string>
#include <map>
#include <functional>

namespace sfera {

// Performs a GET; the default uses a per-thread libcurl HttpClient
typedef std::function<HttpResponse(const std::string& url)> HttpFetcher;

struct ToolOptions {
    std::string binance_price_url;
    std::string weather_url;
    std::string search_url;
    std::string google_api_key;
    std::string google_cse_id;
    int max_search_results;
    long timeout_ms;
    
    int64_t crypto_ttl;
    size_t crypto_max_size;
    int64_t weather_ttl;
    size_t weather_max_size;
    int64_t search_ttl;
    size_t search_max_size;
    
    ToolOptions();
    
    static ToolOptions from_config(const Config& config);
};

// Reply used when the rate limiter rejects a call
extern const char* RATE_LIMITED_MESSAGE;

class ToolService {
public:
    ToolService(const ToolOptions& options, RateLimiter& limiter,
                HttpFetcher fetcher = HttpFetcher());
    
    // "BTC: 64000.12 USDT"
    std::string crypto_price(const std::string& user_id, const std::string& symbol);
    
    // wttr.in one-line report
    std::string weather(const std::string& user_id, const std::string& city);
    
    // Top results as "title - link" lines
    std::string web_search(const std::string& user_id, const std::string& query);
    
    std::map<std::string, CacheStats> cache_stats() const;
    void clear_caches();

private:
    typedef std::string (ToolService::*FetchFn)(const std::string& arg);
    
    std::string run(const std::string& tool, const std::string& user_id,
                    const std::string& arg, TtlCache<std::string>& cache, FetchFn fetch);
    
    std::string fetch_price(const std::string& symbol);
    std::string fetch_weather(const std::string& city);
    std::string fetch_search(const std::string& query);
    
    HttpResponse get(const std::string& url);
    
    ToolOptions options_;
    RateLimiter& limiter_;
    HttpFetcher fetcher_;
    TtlCache<std::string> crypto_cache_;
    TtlCache<std::string> weather_cache_;
    TtlCache<std::string> search_cache_;
};

} // namespace sfera

#endif // SFERA_TOOLS_TOOL_SERVICE_HPP
