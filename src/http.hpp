#pragma once
#include <string>
#include <vector>
#include <utility>

namespace minim {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;
using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    long status_code = 0;  // 0 = transport failure
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // method is one of GET, POST, PUT, DELETE. body is ignored for GET.
    virtual HttpResponse request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) = 0;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) {
        return request("GET", url, "", headers, timeout_seconds);
    }

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 60) {
        return request("POST", url, body, headers, timeout_seconds);
    }
};

// libcurl implementation
class CurlHttpClient : public HttpClient {
public:
    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds) override;
};

// ── URL helpers ──────────────────────────────────────────────────

// Percent-encode everything but RFC 3986 unreserved characters
std::string url_encode(const std::string& s);

// key=value&key=value with both sides encoded
std::string form_encode(const QueryParams& params);

// Append params to url as a query string ('?' or '&' as needed)
std::string with_query(const std::string& url, const QueryParams& params);

} // namespace minim
