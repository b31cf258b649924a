#include <sfera/cache/cache_key.hpp>
#include <sfera/core/utils.hpp>

namespace sfera {

std::string make_cache_key(const std::vector<std::string>& args,
                           const std::map<std::string, std::string>& named_args) {
    std::vector<std::string> parts(args);
    
    // std::map iterates in key order
    for (std::map<std::string, std::string>::const_iterator it = named_args.begin();
         it != named_args.end(); ++it) {
        parts.push_back(it->first + "=" + it->second);
    }
    
    return md5_hex(join(parts, "|"));
}

} // namespace sfera
