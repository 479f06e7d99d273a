#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace rconbridge {

// Initialize libcurl (call once at startup, before any thread uses HTTP).
void http_init();

// Cleanup libcurl (call once at shutdown).
void http_cleanup();

// Global abort flag checked by in-flight transfers (~1s granularity).
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;  // 0 = transport failure, see error
    std::string body;
    std::string error;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 15) = 0;
    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 15) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 15) override;
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 15) override;
};

} // namespace rconbridge
