#ifndef SFERA_CORE_HTTP_CLIENT_HPP
#define SFERA_CORE_HTTP_CLIENT_HPP

#include "json.hpp"
#include <string>
#include <map>
#include <curl/curl.h>

namespace sfera {

// HTTP response structure
struct HttpResponse {
    long status_code;
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error;
    
    HttpResponse() : status_code(0) {}
    
    bool ok() const { return status_code >= 200 && status_code < 300; }
    
    // Parsed body; throws std::runtime_error when the body is not JSON
    Json json() const { return Json::parse(body); }
};

// Blocking HTTP client using libcurl. One instance per thread.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();
    
    void set_timeout(long ms);
    long timeout() const { return timeout_ms_; }
    
    HttpResponse get(const std::string& url, 
                     const std::map<std::string, std::string>& headers = std::map<std::string, std::string>());

private:
    HttpClient(const HttpClient&);
    HttpClient& operator=(const HttpClient&);
    
    CURL* curl_;
    long timeout_ms_;
    
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace sfera

#endif // SFERA_CORE_HTTP_CLIENT_HPP
