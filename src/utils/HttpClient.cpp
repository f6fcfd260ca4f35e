/**
 * HttpClient.cpp
 *
 * HTTP client implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"

#include <cpr/cpr.h>
#include <mutex>
#include <string_view>

namespace collector::utils {

// -- CurlGlobalInit --

bool CurlGlobalInit::s_initialized = false;

void CurlGlobalInit::init() {
    if (!s_initialized) {
        curl_global_init(CURL_GLOBAL_ALL);
        s_initialized = true;
    }
}

void CurlGlobalInit::cleanup() {
    if (s_initialized) {
        curl_global_cleanup();
        s_initialized = false;
    }
}

// -- HttpClient::Impl --

struct HttpClient::Impl {
    mutable std::mutex mutex;
    HttpOptions defaultOptions;
};

namespace {

cpr::Header buildHeaders(const HttpOptions& options) {
    cpr::Header headers;
    for (const auto& [key, value] : options.headers) {
        headers[key] = value;
    }
    return headers;
}

void copyResponse(const cpr::Response& response, HttpResponse& result) {
    result.statusCode = static_cast<int>(response.status_code);
    result.elapsed = response.elapsed;
    for (const auto& [key, value] : response.header) {
        result.headers[key] = value;
    }
    if (response.error.code != cpr::ErrorCode::OK) {
        result.transportError = true;
        result.error = response.error.message;
    }
}

} // namespace

// -- HttpClient --

HttpClient::HttpClient() : m_impl(std::make_unique<Impl>()) {
    CurlGlobalInit::init();
}

HttpClient::~HttpClient() = default;

HttpClient& HttpClient::instance() {
    static HttpClient inst;
    return inst;
}

void HttpClient::setDefaultOptions(const HttpOptions& options) {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    m_impl->defaultOptions = options;
}

HttpOptions HttpClient::defaultOptions() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->defaultOptions;
}

HttpResponse HttpClient::get(const std::string& url, const HttpOptions& options) {
    HttpResponse result;

    cpr::Response response = cpr::Get(
        cpr::Url{url},
        buildHeaders(options),
        cpr::Timeout{options.timeoutMs},
        cpr::ConnectTimeout{options.connectTimeoutMs},
        cpr::VerifySsl{options.verifySSL},
        cpr::UserAgent{options.userAgent}
    );

    copyResponse(response, result);
    result.body = response.text;
    return result;
}

HttpResponse HttpClient::stream(const std::string& url, const ChunkCallback& onChunk,
                                const HttpOptions& options) {
    HttpResponse result;

    cpr::Response response = cpr::Get(
        cpr::Url{url},
        buildHeaders(options),
        cpr::Timeout{options.timeoutMs},
        cpr::ConnectTimeout{options.connectTimeoutMs},
        cpr::VerifySsl{options.verifySSL},
        cpr::UserAgent{options.userAgent},
        cpr::WriteCallback{[&onChunk](std::string_view data, intptr_t /*userdata*/) -> bool {
            return onChunk(data.data(), data.size());
        }}
    );

    copyResponse(response, result);
    return result;
}

std::string HttpClient::urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) return str;
    char* output = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.size()));
    std::string result(output ? output : "");
    curl_free(output);
    curl_easy_cleanup(curl);
    return result;
}

std::string HttpClient::buildQueryString(const std::map<std::string, std::string>& params) {
    std::string result;
    for (const auto& [key, value] : params) {
        if (!result.empty()) result += "&";
        result += urlEncode(key) + "=" + urlEncode(value);
    }
    return result;
}

} // namespace collector::utils
