/**
 * HttpClient.cpp
 * 
 * HTTP client implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"

#include <cpr/cpr.h>
#include <curl/curl.h>

#include <mutex>

namespace soulsync::utils {

// -- HttpClient::Impl --

struct HttpClient::Impl {
    mutable std::mutex mutex;
    HttpOptions defaultOptions;

    HttpOptions snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return defaultOptions;
    }
};

// -- HttpClient --

HttpClient::HttpClient() : m_impl(std::make_unique<Impl>()) {
    m_impl->defaultOptions.timeoutSeconds = 15;
    m_impl->defaultOptions.connectTimeoutSeconds = 5;
    m_impl->defaultOptions.userAgent = "SoulSync-Queue/1.0";
}

HttpClient::~HttpClient() = default;

void HttpClient::setDefaultOptions(const HttpOptions& options) {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    m_impl->defaultOptions = options;
}

HttpResponse HttpClient::get(const std::string& url, const HttpOptions& options) {
    return performRequest("GET", url, options);
}

HttpResponse HttpClient::del(const std::string& url, const HttpOptions& options) {
    return performRequest("DELETE", url, options);
}

std::string HttpClient::urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) return str;
    char* output = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.size()));
    std::string result = output ? std::string(output) : str;
    curl_free(output);
    curl_easy_cleanup(curl);
    return result;
}

HttpResponse HttpClient::performRequest(const std::string& method, const std::string& url,
                                        const HttpOptions& options) {
    HttpResponse result;
    const HttpOptions defaults = m_impl->snapshot();

    try {
        cpr::Header headers;
        for (const auto& [key, value] : defaults.headers) headers[key] = value;
        for (const auto& [key, value] : options.headers) headers[key] = value;

        cpr::Parameters parameters;
        for (const auto& [key, value] : defaults.query) parameters.Add({key, value});
        for (const auto& [key, value] : options.query) parameters.Add({key, value});

        std::string ua = options.userAgent.empty() ? defaults.userAgent : options.userAgent;
        if (ua.empty()) ua = "SoulSync-Queue/1.0";

        int timeout = options.timeoutSeconds > 0 ? options.timeoutSeconds : defaults.timeoutSeconds;
        if (timeout <= 0) timeout = 15;

        int connectTimeout = options.connectTimeoutSeconds > 0
            ? options.connectTimeoutSeconds : defaults.connectTimeoutSeconds;
        if (connectTimeout <= 0) connectTimeout = 5;

        cpr::Response response;

        if (method == "GET") {
            response = cpr::Get(cpr::Url{url}, headers, parameters,
                                cpr::Timeout{timeout * 1000},
                                cpr::ConnectTimeout{connectTimeout * 1000},
                                cpr::UserAgent{ua});
        } else if (method == "DELETE") {
            response = cpr::Delete(cpr::Url{url}, headers, parameters,
                                   cpr::Timeout{timeout * 1000},
                                   cpr::ConnectTimeout{connectTimeout * 1000},
                                   cpr::UserAgent{ua});
        } else {
            result.error = "Unsupported method: " + method;
            return result;
        }

        result.statusCode = static_cast<int>(response.status_code);
        result.body = response.text;
        result.error = response.error.message;
        result.elapsed = response.elapsed;

    } catch (const std::exception& e) {
        result.statusCode = 0;
        result.error = e.what();
    }

    return result;
}

} // namespace soulsync::utils
