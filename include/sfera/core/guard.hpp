/*
 * Sfera - Uniform fallback and logging around fallible units of work
 */
#ifndef SFERA_CORE_GUARD_HPP
#define SFERA_CORE_GUARD_HPP

#include <sfera/core/logger.hpp>
#include <string>
#include <functional>
#include <stdexcept>

namespace sfera {

enum class GuardMode {
    LOUD,    // failure logged as ERROR
    SILENT   // failure logged as WARN (non-critical work)
};

// Run fn and return its result, or fallback if it throws.
template<typename T, typename F>
T guarded_call(const std::string& name, const T& fallback, F fn,
               GuardMode mode = GuardMode::LOUD) {
    try {
        return fn();
    } catch (const std::exception& e) {
        if (mode == GuardMode::SILENT) {
            LOG_WARN("Silently handled error in '%s': %s", name.c_str(), e.what());
        } else {
            LOG_ERROR("Error in '%s': %s", name.c_str(), e.what());
        }
        return fallback;
    }
}

// Tool flavour: a failure becomes "<default_response> Details: <what>"
std::string guarded_tool_call(const std::string& name,
                              const std::string& default_response,
                              const std::function<std::string()>& fn);

// Default user-facing message for failed tool calls
extern const char* DEFAULT_TOOL_ERROR;

} // namespace sfera

#endif // SFERA_CORE_GUARD_HPP
