#ifndef SFERA_CACHE_CACHE_KEY_HPP
#define SFERA_CACHE_CACHE_KEY_HPP

#include <string>
#include <vector>
#include <map>

namespace sfera {

// Deterministic key for a call: positional args in order, then named args
// sorted by name as "name=value", joined with '|' and hashed to 32 hex chars (MD5).
std::string make_cache_key(const std::vector<std::string>& args,
                           const std::map<std::string, std::string>& named_args =
                               std::map<std::string, std::string>());

} // namespace sfera

#endif // SFERA_CACHE_CACHE_KEY_HPP
