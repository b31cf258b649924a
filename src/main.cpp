/*
 * Sfera - Console session runtime
 * 
 * Runs one conversation session on the terminal on top of the governance
 * core: memory bootstrap, session registry, rate-limited cached tools and
 * proactive follow-ups.
 * 
 * Usage:
 *   ./sfera [config.json] [user_id]
 */

#include <sfera/core/logger.hpp>
#include <sfera/core/config.hpp>
#include <sfera/core/json.hpp>
#include <sfera/core/utils.hpp>
#include <sfera/core/thread_pool.hpp>
#include <sfera/rate_limiter/rate_limiter.hpp>
#include <sfera/session/session_registry.hpp>
#include <sfera/memory/store.hpp>
#include <sfera/memory/aggregator.hpp>
#include <sfera/tools/tool_service.hpp>
#include <sfera/proactive/scheduler.hpp>

#include <iostream>
#include <fstream>
#include <csignal>
#include <memory>
#include <mutex>
#include <curl/curl.h>

namespace sfera {

static const char* APP_VERSION = "0.3.0";
static const char* APP_NAME = "Sfera";

static volatile sig_atomic_t g_stop_requested = 0;

static void signal_handler(int sig) {
    (void)sig;
    g_stop_requested = 1;
}

// ============================================================================
// Console session: the runtime's context and agent objects
// ============================================================================

class ConsoleSession : public SessionContext, public SessionAgent {
public:
    explicit ConsoleSession(const std::string& user_id) : user_id_(user_id), user_turns_(0) {}
    
    const std::string& user_id() const { return user_id_; }
    
    void reset_context(const ChatContext& context) {
        std::lock_guard<std::mutex> lock(mutex_);
        context_ = context;
    }
    
    // Proactive messages arrive from the scheduler thread
    bool inject_message(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        context_.add_message("assistant", text);
        std::cout << "\n[sfera] " << text << "\n> " << std::flush;
        return true;
    }
    
    void say(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[sfera] " << text << "\n";
    }
    
    void record_user_turn(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        context_.add_message("user", text);
        last_user_turn_ = text;
        ++user_turns_;
    }
    
    std::string summary() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (user_turns_ == 0) return "";
        return "Session on " + format_timestamp(current_timestamp()) + ": " +
               std::to_string(user_turns_) + " user messages. Last topic: " +
               truncate_safe(last_user_turn_, 200);
    }
    
    size_t context_size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return context_.size();
    }

private:
    std::string user_id_;
    ChatContext context_;
    std::string last_user_turn_;
    int user_turns_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Application
// ============================================================================

class Application {
public:
    Application() : running_(true) {}
    
    bool init(int argc, char* argv[]);
    int run();
    bool is_running() const { return running_; }
    void shutdown();

private:
    Application(const Application&);
    Application& operator=(const Application&);
    
    bool open_store();
    void bootstrap();
    void handle_line(const std::string& line);
    void print_stats();
    
    bool running_;
    std::string user_id_;
    Config config_;
    MemoryStore store_;
    std::unique_ptr<ThreadPool> pool_;
    std::unique_ptr<RateLimiter> limiter_;
    SessionRegistry registry_;
    std::unique_ptr<ToolService> tools_;
    std::unique_ptr<MemoryAggregator> aggregator_;
    std::unique_ptr<ProactiveScheduler> scheduler_;
    std::unique_ptr<ConsoleSession> session_;
};

bool Application::init(int argc, char* argv[]) {
    std::string config_file = "config.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [config.json] [user_id]\n";
            running_ = false;
            return false;
        }
        if (arg == "--version" || arg == "-v") {
            std::cout << APP_NAME << " " << APP_VERSION << "\n";
            running_ = false;
            return false;
        }
    }
    if (argc > 1) config_file = argv[1];
    
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    
    if (!config_.load_file(config_file)) {
        LOG_WARN("Failed to load config from %s, using defaults", config_file.c_str());
    } else {
        LOG_INFO("Loaded config from %s", config_file.c_str());
    }
    
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
    LOG_INFO("%s v%s starting...", APP_NAME, APP_VERSION);
    
    user_id_ = argc > 2 ? argv[2] : config_.get_string("session.user_id", "local-user");
    
    curl_global_init(CURL_GLOBAL_DEFAULT);
    
    if (!open_store()) {
        return false;
    }
    
    pool_.reset(new ThreadPool(static_cast<size_t>(config_.get_int("workers", 4))));
    
    RateLimiterOptions limits;
    limits.max_requests_per_minute = static_cast<int>(
        config_.get_int("rate_limit.max_requests_per_minute", limits.max_requests_per_minute));
    limits.block_duration_ms = config_.get_int("rate_limit.block_minutes", 5) * 60 * 1000;
    limiter_.reset(new RateLimiter(limits));
    
    tools_.reset(new ToolService(ToolOptions::from_config(config_), *limiter_));
    
    AggregatorOptions memory;
    memory.history_limit = static_cast<size_t>(config_.get_int("memory.history_limit", 30));
    memory.replay_limit = static_cast<size_t>(config_.get_int("memory.replay_limit", 10));
    memory.greeting = config_.get_string("memory.greeting", memory.greeting);
    aggregator_.reset(new MemoryAggregator(store_, store_, store_, *pool_, memory));
    
    ProactiveOptions proactive;
    proactive.interval_seconds = config_.get_int("proactive.interval_seconds", 300);
    proactive.follow_up_hours = config_.get_int("proactive.follow_up_hours", 24);
    scheduler_.reset(new ProactiveScheduler(store_, registry_, proactive));
    
    return true;
}

bool Application::open_store() {
    std::string db_path = config_.get_string("memory.db_path", "sfera.db");
    if (!store_.open(db_path) || !store_.ensure_schema()) {
        LOG_ERROR("Cannot open memory database %s: %s", db_path.c_str(), store_.last_error().c_str());
        return false;
    }
    
    std::string seed_file = config_.get_string("memory.seed_file");
    if (seed_file.empty()) return true;
    
    UserState existing;
    try {
        if (store_.get_user(user_id_, existing)) return true;
    } catch (const MemoryStoreError& e) {
        LOG_ERROR("Cannot read user %s: %s", user_id_.c_str(), e.what());
        return false;
    }
    
    std::ifstream f(seed_file.c_str());
    if (!f.is_open()) {
        LOG_WARN("Seed file %s not found", seed_file.c_str());
        return true;
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    try {
        if (!store_.import_json(Json::parse(content))) {
            LOG_WARN("Seeding from %s failed: %s", seed_file.c_str(), store_.last_error().c_str());
        }
    } catch (const std::exception& e) {
        LOG_WARN("Seed file %s is not valid JSON: %s", seed_file.c_str(), e.what());
    }
    return true;
}

void Application::bootstrap() {
    session_.reset(new ConsoleSession(user_id_));
    
    try {
        BootstrapContext boot = aggregator_->load(user_id_);
        session_->reset_context(boot.context);
        if (!boot.core_memory.empty()) {
            LOG_DEBUG("Core memory:\n%s", boot.core_memory.c_str());
        }
        if (!boot.episodic_memory.empty()) {
            LOG_DEBUG("%s", boot.episodic_memory.c_str());
        }
        LOG_INFO("Session context has %zu turns", boot.context.size());
    } catch (const MemoryLoadError& e) {
        // Start fresh rather than refuse the session
        LOG_ERROR("%s", e.what());
        std::cout << "[sfera] could not load memory, starting with an empty context\n";
        ChatContext fresh;
        fresh.add_message("system", aggregator_->options().greeting);
        session_->reset_context(fresh);
    }
    
    registry_.register_session(user_id_, SessionHandle(user_id_, session_.get(), session_.get()));
}

void Application::print_stats() {
    std::map<std::string, CacheStats> stats = tools_->cache_stats();
    for (std::map<std::string, CacheStats>::const_iterator it = stats.begin(); it != stats.end(); ++it) {
        const CacheStats& s = it->second;
        std::cout << "  " << it->first << ": size " << s.size << "/" << s.max_size
                  << ", hits " << s.hits << ", misses " << s.misses
                  << ", hit rate " << static_cast<int>(s.hit_rate * 100.0) << "%"
                  << ", ttl " << s.ttl_seconds << "s\n";
    }
    std::cout << "  active sessions: " << registry_.size()
              << ", context turns: " << session_->context_size() << "\n";
}

void Application::handle_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty()) return;
    
    size_t space = line.find(' ');
    std::string command = line.substr(0, space);
    std::string arg = space == std::string::npos ? "" : trim(line.substr(space + 1));
    
    if (command == "/quit" || command == "/exit") {
        running_ = false;
    } else if (command == "/price") {
        session_->say(tools_->crypto_price(user_id_, arg.empty() ? "BTC" : arg));
    } else if (command == "/weather") {
        session_->say(tools_->weather(user_id_, arg));
    } else if (command == "/search") {
        session_->say(tools_->web_search(user_id_, arg));
    } else if (command == "/stats") {
        print_stats();
    } else if (command == "/status") {
        RateLimitStatus st = limiter_->status(user_id_);
        if (st.blocked) {
            std::cout << "  blocked, " << st.remaining_seconds << "s remaining\n";
        } else {
            std::cout << "  " << st.requests_in_last_minute << " requests in the last minute, "
                      << st.remaining_requests << " remaining\n";
        }
    } else if (command == "/reset") {
        limiter_->reset(user_id_);
        tools_->clear_caches();
    } else if (starts_with(command, "/")) {
        std::cout << "  commands: /price SYM, /weather CITY, /search QUERY, /stats, /status, /reset, /quit\n";
    } else if (!limiter_->is_allowed(user_id_)) {
        session_->say(RATE_LIMITED_MESSAGE);
    } else {
        session_->record_user_turn(line);
        Json record = Json::object();
        record.set("role", "user");
        record.set("content", line);
        record.set("user_id", user_id_);
        record.set("timestamp", format_timestamp(current_timestamp()));
        try {
            store_.add(user_id_, record);
        } catch (const MemoryStoreError& e) {
            LOG_ERROR("Could not store message: %s", e.what());
        }
    }
}

int Application::run() {
    bootstrap();
    scheduler_->start();
    
    std::cout << "[sfera] session started for " << user_id_ << " (type /help)\n";
    std::string line;
    while (running_ && !g_stop_requested) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        handle_line(line);
    }
    return 0;
}

void Application::shutdown() {
    if (scheduler_) scheduler_->stop();
    
    if (session_) {
        registry_.unregister_session(user_id_);
        std::string summary = session_->summary();
        if (!summary.empty()) {
            try {
                store_.add_summary(user_id_, summary);
            } catch (const MemoryStoreError& e) {
                LOG_ERROR("Could not store session summary: %s", e.what());
            }
        }
    }
    
    if (pool_) pool_->shutdown();
    store_.close();
    curl_global_cleanup();
    LOG_INFO("%s stopped", APP_NAME);
}

} // namespace sfera

int main(int argc, char* argv[]) {
    sfera::Application app;
    
    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.is_running() ? 1 : 0;
    }
    
    int result = app.run();
    app.shutdown();
    
    return result;
}
