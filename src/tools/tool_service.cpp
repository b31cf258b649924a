/*
 * Sfera - Market and information tools implementation
 */
#include <sfera/tools/tool_service.hpp>
#include <sfera/cache/cache_key.hpp>
#include <sfera/core/guard.hpp>
#include <sfera/core/logger.hpp>
#include <sfera/core/utils.hpp>
#include <sstream>
#include <stdexcept>

namespace sfera {

const char* RATE_LIMITED_MESSAGE = "Too many requests. Please wait a few minutes and try again.";

ToolOptions::ToolOptions()
    : binance_price_url("https://api.binance.com/api/v3/ticker/price")
    , weather_url("https://wttr.in")
    , search_url("https://www.googleapis.com/customsearch/v1")
    , max_search_results(5)
    , timeout_ms(5000)
    , crypto_ttl(30)
    , crypto_max_size(100)
    , weather_ttl(600)
    , weather_max_size(50)
    , search_ttl(600)
    , search_max_size(50) {}

ToolOptions ToolOptions::from_config(const Config& config) {
    ToolOptions o;
    o.binance_price_url = config.get_string("api.binance_price", o.binance_price_url);
    o.weather_url = config.get_string("api.weather", o.weather_url);
    o.search_url = config.get_string("api.search", o.search_url);
    o.google_api_key = config.get_string("api.google_api_key");
    o.google_cse_id = config.get_string("api.google_cse_id");
    o.max_search_results = static_cast<int>(config.get_int("api.max_search_results", o.max_search_results));
    o.timeout_ms = static_cast<long>(config.get_int("http.timeout_ms", o.timeout_ms));
    o.crypto_ttl = config.get_int("cache.crypto_ttl", o.crypto_ttl);
    o.crypto_max_size = static_cast<size_t>(config.get_int("cache.crypto_max_size", 100));
    o.weather_ttl = config.get_int("cache.weather_ttl", o.weather_ttl);
    o.weather_max_size = static_cast<size_t>(config.get_int("cache.weather_max_size", 50));
    o.search_ttl = config.get_int("cache.search_ttl", o.search_ttl);
    o.search_max_size = static_cast<size_t>(config.get_int("cache.search_max_size", 50));
    return o;
}

ToolService::ToolService(const ToolOptions& options, RateLimiter& limiter, HttpFetcher fetcher)
    : options_(options)
    , limiter_(limiter)
    , fetcher_(fetcher)
    , crypto_cache_(options.crypto_ttl, options.crypto_max_size)
    , weather_cache_(options.weather_ttl, options.weather_max_size)
    , search_cache_(options.search_ttl, options.search_max_size) {}

std::string ToolService::crypto_price(const std::string& user_id, const std::string& symbol) {
    return run("crypto_price", user_id, to_upper(trim(symbol)), crypto_cache_,
               &ToolService::fetch_price);
}

std::string ToolService::weather(const std::string& user_id, const std::string& city) {
    return run("weather", user_id, trim(city), weather_cache_, &ToolService::fetch_weather);
}

std::string ToolService::web_search(const std::string& user_id, const std::string& query) {
    if (options_.google_api_key.empty() || options_.google_cse_id.empty()) {
        return "Web search is not configured.";
    }
    return run("web_search", user_id, trim(query), search_cache_, &ToolService::fetch_search);
}

std::string ToolService::run(const std::string& tool, const std::string& user_id,
                             const std::string& arg, TtlCache<std::string>& cache,
                             FetchFn fetch) {
    if (!limiter_.is_allowed(user_id)) {
        return RATE_LIMITED_MESSAGE;
    }
    if (arg.empty()) {
        return "Nothing to look up.";
    }
    
    std::vector<std::string> key_args;
    key_args.push_back(tool);
    key_args.push_back(arg);
    std::string key = make_cache_key(key_args);
    
    // A throwing fetch leaves the cache untouched
    return guarded_tool_call(tool, DEFAULT_TOOL_ERROR, [this, fetch, &arg, &cache, &key]() {
        return cache.get_or_compute(key, [this, fetch, &arg]() {
            return (this->*fetch)(arg);
        });
    });
}

HttpResponse ToolService::get(const std::string& url) {
    if (fetcher_) {
        return fetcher_(url);
    }
    // HttpClient keeps a curl handle, which must not be shared across threads
    static thread_local HttpClient client;
    client.set_timeout(options_.timeout_ms);
    return client.get(url);
}

std::string ToolService::fetch_price(const std::string& symbol) {
    std::string pair = ends_with(symbol, "USDT") ? symbol : symbol + "USDT";
    HttpResponse resp = get(options_.binance_price_url + "?symbol=" + url_encode(pair));
    if (!resp.ok()) {
        throw std::runtime_error(resp.error.empty() ? "request failed" : resp.error);
    }
    
    Json body = resp.json();
    std::string price = body.get_string("price");
    if (price.empty()) {
        throw std::runtime_error("no price in response for " + pair);
    }
    
    std::string base = pair.substr(0, pair.size() - 4);
    return base + ": " + price + " USDT";
}

std::string ToolService::fetch_weather(const std::string& city) {
    HttpResponse resp = get(options_.weather_url + "/" + url_encode(city) + "?format=3");
    if (!resp.ok()) {
        throw std::runtime_error(resp.error.empty() ? "request failed" : resp.error);
    }
    std::string report = trim(resp.body);
    if (report.empty()) {
        throw std::runtime_error("empty weather report for " + city);
    }
    return report;
}

std::string ToolService::fetch_search(const std::string& query) {
    std::ostringstream url;
    url << options_.search_url
        << "?key=" << url_encode(options_.google_api_key)
        << "&cx=" << url_encode(options_.google_cse_id)
        << "&num=" << options_.max_search_results
        << "&q=" << url_encode(query);
    
    HttpResponse resp = get(url.str());
    if (!resp.ok()) {
        throw std::runtime_error(resp.error.empty() ? "request failed" : resp.error);
    }
    
    Json body = resp.json();
    const std::vector<Json>& items = body["items"].as_array();
    if (items.empty()) {
        return "No results for '" + query + "'.";
    }
    
    std::vector<std::string> lines;
    for (size_t i = 0; i < items.size() && static_cast<int>(i) < options_.max_search_results; ++i) {
        lines.push_back(items[i].get_string("title") + " - " + items[i].get_string("link"));
    }
    return join(lines, "\n");
}

std::map<std::string, CacheStats> ToolService::cache_stats() const {
    std::map<std::string, CacheStats> stats;
    stats["crypto_price"] = crypto_cache_.stats();
    stats["weather"] = weather_cache_.stats();
    stats["web_search"] = search_cache_.stats();
    return stats;
}

void ToolService::clear_caches() {
    crypto_cache_.clear();
    weather_cache_.clear();
    search_cache_.clear();
}

} // namespace sfera
