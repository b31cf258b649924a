#ifndef SFERA_CORE_CONFIG_HPP
#define SFERA_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace sfera {

// JSON configuration with dot-notation keys ("cache.crypto_ttl").
// Every lookup falls back to SFERA_<KEY> in the environment, then to the default.
class Config {
public:
    Config();
    
    // Load from JSON file
    bool load_file(const std::string& path);
    
    // Load from JSON string
    bool load_string(const std::string& json_str);
    
    std::string get_string(const std::string& key, const std::string& def = "") const;
    
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    
    bool get_bool(const std::string& key, bool def = false) const;
    
    // Get nested object (null if missing)
    const Json& get_section(const std::string& key) const;
    
    // Raw data access
    const Json& data() const;
    
    // "cache.crypto_ttl" -> "SFERA_CACHE_CRYPTO_TTL"
    static std::string to_env_key(const std::string& key);

private:
    Json data_;
    
    const Json& lookup(const std::string& key) const;
    static bool env_value(const std::string& key, std::string& out);
};

} // namespace sfera

#endif // SFERA_CORE_CONFIG_HPP
