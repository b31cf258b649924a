#include <sfera/memory/types.hpp>

namespace sfera {

bool ChatContext::is_valid_role(const std::string& role) {
    return role == "system" || role == "user" || role == "assistant";
}

void ChatContext::add_message(const std::string& role, const std::string& content) {
    if (!is_valid_role(role)) {
        throw std::invalid_argument("unsupported chat role '" + role + "'");
    }
    messages_.push_back(ChatMessage(role, content));
}

} // namespace sfera
