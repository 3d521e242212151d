/**
 * @file FakeHttpClient.hpp
 * @brief Scripted HttpClient for tests
 *
 * Responses are matched by URL substring in the order they were added;
 * unmatched URLs get a transport error. Every requested URL is recorded.
 */

#pragma once

#include "HttpClient.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace locus {
namespace test {

class FakeHttpClient : public HttpClient {
public:
    void respond(const std::string& url_fragment, const std::string& body, long status = 200) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_.push_back(Route{url_fragment, HttpResponse{status, body, ""}});
    }

    void fail(const std::string& url_fragment, const std::string& error = "Could not resolve host") {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_.push_back(Route{url_fragment, HttpResponse{0, "", error}});
    }

    // Drops scripted responses; recorded requests are kept.
    void clear_routes() {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_.clear();
    }

    HttpResponse get(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(url);
        for (const auto& route : routes_) {
            if (url.find(route.fragment) != std::string::npos) {
                return route.response;
            }
        }
        return HttpResponse{0, "", "no scripted response for " + url};
    }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    size_t requests_matching(const std::string& fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& url : requests_) {
            if (url.find(fragment) != std::string::npos) {
                ++count;
            }
        }
        return count;
    }

private:
    struct Route {
        std::string fragment;
        HttpResponse response;
    };

    mutable std::mutex mutex_;
    std::vector<Route> routes_;
    std::vector<std::string> requests_;
};

} // namespace test
} // namespace locus
