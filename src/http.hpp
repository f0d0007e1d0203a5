#pragma once
#include <string>
#include <vector>
#include <utility>

namespace rembed {

// Initialize HTTP subsystem (libcurl global state). Safe to call repeatedly;
// only the first call does work.
void http_init();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 = transport failure, see error
    std::string body;
    std::string error;      // curl error text when status_code is 0
};

// Abstract HTTP client interface (injectable for testing).
// Implementations must be callable from several worker threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;
};

// libcurl client. Each request uses its own easy handle.
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;
};

// Process-wide libcurl client. Outlives every Context so that abandoned
// worker tasks never call into a destroyed client.
HttpClient& shared_http_client();

// HTTP POST with JSON body
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 30);

// libcurl version string, for diagnostics
std::string http_backend_version();

} // namespace rembed
