// SoulSync Queue - HTTP Client
// Blocking HTTP client using cpr (libcurl)

#pragma once

#include <map>
#include <memory>
#include <string>

namespace soulsync::utils {

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
    int statusCode{0};
    std::string body;
    std::string error;
    double elapsed{0.0};
    
    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }
    
    bool isNoContent() const { return statusCode == 204; }
    bool isNotFound() const { return statusCode == 404; }
    bool isUnauthorized() const { return statusCode == 401; }
    bool isServerError() const { return statusCode >= 500; }

    // statusCode 0 means the request never got an HTTP answer
    bool isTransportError() const { return statusCode == 0; }
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query;
    int timeoutSeconds{0};          // 0 = client default
    int connectTimeoutSeconds{0};   // 0 = client default
    std::string userAgent;
};

/**
 * @brief Blocking HTTP client with per-instance defaults
 *
 * Each method is safe to call from several threads at once; cpr creates
 * a fresh session per request.
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();
    
    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    
    // Set default options (merged under per-request options)
    void setDefaultOptions(const HttpOptions& options);
    
    // Synchronous requests
    HttpResponse get(const std::string& url, const HttpOptions& options = {});
    HttpResponse del(const std::string& url, const HttpOptions& options = {});
    
    // URL utilities
    static std::string urlEncode(const std::string& str);
    
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
    
    HttpResponse performRequest(const std::string& method, const std::string& url,
                                const HttpOptions& options);
};

} // namespace soulsync::utils
