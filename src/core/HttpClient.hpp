/**
 * @file HttpClient.hpp
 * @brief HTTP GET transport used by the external geocoder and index clients
 */

#pragma once

#include "Logger.hpp"

#include <string>
#include <utility>
#include <vector>

namespace locus {

struct HttpResponse {
    long status_code = 0;     // 0 when the request never reached the server
    std::string body;
    std::string error;        // Transport error text, empty on success

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

/**
 * @brief Blocking HTTP GET interface
 *
 * Implementations must be safe to call from several threads at once;
 * nearby search issues one request per country concurrently.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url) = 0;
};

/**
 * @brief libcurl-backed client, one easy handle per request
 */
class CurlHttpClient : public HttpClient {
public:
    struct Options {
        std::string user_agent;
        int timeout_seconds;
        bool follow_redirects;

        Options()
            : user_agent("LocusCore/1.0"),
              timeout_seconds(10),
              follow_redirects(true) {}
    };

    CurlHttpClient();
    explicit CurlHttpClient(const Options& options);

    HttpResponse get(const std::string& url) override;

private:
    Options options_;
    Logger logger_;
};

/**
 * @brief Builds "base/path?k=v&k=v" with encoded values
 */
class UrlBuilder {
public:
    UrlBuilder(const std::string& base, const std::string& path);

    UrlBuilder& param(const std::string& key, const std::string& value);
    UrlBuilder& param(const std::string& key, double value);
    UrlBuilder& param(const std::string& key, int value);

    std::string str() const;

private:
    std::string base_;
    std::vector<std::pair<std::string, std::string>> params_;
};

} // namespace locus
