#pragma once
#include "http.hpp"
#include <string>
#include <utility>
#include <vector>

namespace minim {

struct RecordedRequest {
    std::string method;
    std::string url;
    std::string body;
    std::vector<Header> headers;

    std::string header(const std::string& name) const {
        for (const auto& h : headers) {
            if (h.first == name) return h.second;
        }
        return "";
    }
};

// Replays canned responses. A route matches when its fragment occurs in the
// request URL; the first matching route with queued responses wins. Requests
// without a route fall back to response_queue, then next_response.
class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    std::vector<HttpResponse> response_queue;
    std::vector<RecordedRequest> requests;
    int call_count = 0;

    void route(const std::string& url_fragment, HttpResponse response) {
        routes_.push_back({url_fragment, std::move(response)});
    }

    int count(const std::string& url_fragment) const {
        int n = 0;
        for (const auto& r : requests) {
            if (r.url.find(url_fragment) != std::string::npos) n++;
        }
        return n;
    }

    const RecordedRequest& last() const { return requests.back(); }

    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long /*timeout_seconds*/) override {
        call_count++;
        requests.push_back({method, url, body, headers});

        for (auto it = routes_.begin(); it != routes_.end(); ++it) {
            if (url.find(it->first) != std::string::npos) {
                auto resp = it->second;
                // Keep the last response for a fragment so it repeats
                bool more = false;
                for (auto jt = it + 1; jt != routes_.end(); ++jt) {
                    if (jt->first == it->first) { more = true; break; }
                }
                if (more) routes_.erase(it);
                return resp;
            }
        }

        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }

private:
    std::vector<std::pair<std::string, HttpResponse>> routes_;
};

inline HttpResponse ok_json(const std::string& body) { return {200, body}; }

} // namespace minim
