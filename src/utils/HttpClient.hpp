// Collector - HTTP Client
// Blocking HTTP client over cpr/libcurl, with streamed downloads

#pragma once

#include <string>
#include <map>
#include <functional>
#include <memory>
#include <curl/curl.h>

namespace collector::utils {

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
    int statusCode{0};
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error;
    bool transportError{false};
    double elapsed{0.0};

    bool isSuccess() const {
        return !transportError && statusCode >= 200 && statusCode < 300;
    }

    bool isServerError() const { return statusCode >= 500; }

    /**
     * Failures worth another attempt: connection/timeout errors,
     * request timeout, throttling and server-side errors.
     */
    bool isRetryable() const {
        return transportError || statusCode == 408 || statusCode == 429 || isServerError();
    }
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    int timeoutMs{30000};
    int connectTimeoutMs{10000};
    bool verifySSL{true};
    std::string userAgent{"Collector/1.0"};
};

/**
 * Receives body bytes as they arrive. Returning false aborts the transfer.
 */
using ChunkCallback = std::function<bool(const char* data, size_t size)>;

class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    static HttpClient& instance();

    void setDefaultOptions(const HttpOptions& options);
    HttpOptions defaultOptions() const;

    HttpResponse get(const std::string& url, const HttpOptions& options);

    /**
     * GET without buffering the body; each chunk goes to onChunk.
     * An aborted transfer comes back as a transport error.
     */
    HttpResponse stream(const std::string& url, const ChunkCallback& onChunk,
                        const HttpOptions& options);

    // URL utilities
    static std::string urlEncode(const std::string& str);
    static std::string buildQueryString(const std::map<std::string, std::string>& params);

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Global CURL initialization
 */
class CurlGlobalInit {
public:
    static void init();
    static void cleanup();

private:
    static bool s_initialized;
};

} // namespace collector::utils
