#include <sfera/core/config.hpp>
#include <sfera/core/logger.hpp>
#include <sfera/core/utils.hpp>
#include <fstream>
#include <cstdlib>

namespace sfera {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) return false;
    
    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            LOG_ERROR("Config: top-level value must be an object");
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config: parse error: %s", e.what());
        return false;
    }
}

const Json& Config::lookup(const std::string& key) const {
    // Walk nested sections ("gateway.auth.token")
    std::vector<std::string> parts = split(key, '.');
    const Json* node = &data_;
    for (size_t i = 0; i < parts.size(); ++i) {
        node = &(*node)[parts[i]];
        if (node->is_null()) break;
    }
    return *node;
}

std::string Config::to_env_key(const std::string& key) {
    return "SFERA_" + to_upper(replace_all(key, ".", "_"));
}

bool Config::env_value(const std::string& key, std::string& out) {
    const char* value = std::getenv(to_env_key(key).c_str());
    if (!value || !*value) return false;
    out = value;
    return true;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json& v = lookup(key);
    if (v.is_string()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_string();
    }
    
    std::string env;
    if (env_value(key, env)) {
        LOG_DEBUG("Config: key '%s' taken from environment", key.c_str());
        return env;
    }

    LOG_DEBUG("Config: key '%s' not found", key.c_str());
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json& v = lookup(key);
    if (v.is_number()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_int();
    }
    
    std::string env;
    if (env_value(key, env)) {
        char* end = NULL;
        long long parsed = std::strtoll(env.c_str(), &end, 10);
        if (end && *end == '\0') {
            return static_cast<int64_t>(parsed);
        }
        LOG_WARN("Config: ignoring non-numeric %s='%s'", to_env_key(key).c_str(), env.c_str());
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json& v = lookup(key);
    if (v.is_bool()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_bool();
    }
    
    std::string env;
    if (env_value(key, env)) {
        std::string lowered = to_lower(trim(env));
        if (lowered == "1" || lowered == "true" || lowered == "yes") return true;
        if (lowered == "0" || lowered == "false" || lowered == "no") return false;
    }
    return def;
}

const Json& Config::get_section(const std::string& key) const {
    return lookup(key);
}

const Json& Config::data() const { return data_; }

} // namespace sfera
