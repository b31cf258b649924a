#ifndef SFERA_CORE_LOGGER_HPP
#define SFERA_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>
#include <atomic>

namespace sfera {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive), INFO otherwise
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;
    
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    void log_impl(const char* level_str, const char* fmt, va_list args);
    
    std::atomic<LogLevel> level_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) sfera::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  sfera::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  sfera::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) sfera::Logger::instance().error(__VA_ARGS__)

} // namespace sfera

#endif // SFERA_CORE_LOGGER_HPP
