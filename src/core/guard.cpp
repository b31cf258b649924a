#include <sfera/core/guard.hpp>

namespace sfera {

const char* DEFAULT_TOOL_ERROR = "An error occurred while running the operation.";

std::string guarded_tool_call(const std::string& name,
                              const std::string& default_response,
                              const std::function<std::string()>& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        LOG_ERROR("Error in tool '%s': %s", name.c_str(), e.what());
        return default_response + " Details: " + e.what();
    }
}

} // namespace sfera
