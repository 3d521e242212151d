/**
 * @file HttpClient.cpp
 * @brief libcurl implementation of the HTTP transport
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"

#include <curl/curl.h>

#include <iomanip>
#include <mutex>
#include <sstream>

namespace locus {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// curl_global_init is not thread-safe; run it exactly once per process
void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

CurlHttpClient::CurlHttpClient()
    : CurlHttpClient(Options()) {
}

CurlHttpClient::CurlHttpClient(const Options& options)
    : options_(options), logger_("HttpClient") {
    ensure_curl_initialized();
}

HttpResponse CurlHttpClient::get(const std::string& url) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        logger_.error(response.error);
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    logger_.debug("GET " + url);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        logger_.warning("CURL request failed: " + response.error);
        curl_easy_cleanup(curl);
        return response;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    curl_easy_cleanup(curl);

    if (!response.ok()) {
        logger_.warning("HTTP error " + std::to_string(response.status_code) + " for " + url);
    }

    return response;
}

// ============================================================================
// UrlBuilder
// ============================================================================

UrlBuilder::UrlBuilder(const std::string& base, const std::string& path) {
    base_ = base;
    while (!base_.empty() && base_.back() == '/') {
        base_.pop_back();
    }
    if (!path.empty() && path.front() != '/') {
        base_ += '/';
    }
    base_ += path;
}

UrlBuilder& UrlBuilder::param(const std::string& key, const std::string& value) {
    params_.emplace_back(key, value);
    return *this;
}

UrlBuilder& UrlBuilder::param(const std::string& key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    params_.emplace_back(key, oss.str());
    return *this;
}

UrlBuilder& UrlBuilder::param(const std::string& key, int value) {
    params_.emplace_back(key, std::to_string(value));
    return *this;
}

std::string UrlBuilder::str() const {
    std::ostringstream url;
    url << base_;
    for (size_t i = 0; i < params_.size(); ++i) {
        url << (i == 0 ? '?' : '&') << params_[i].first << '=' << url_encode(params_[i].second);
    }
    return url.str();
}

} // namespace locus
