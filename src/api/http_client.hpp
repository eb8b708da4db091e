#pragma once

#include "cancellation.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace deepdive {
namespace net {

/**
 * HTTP response structure
 *
 * Header names are lower-cased. Only headers of the final response are kept.
 */
struct HttpResponse {
    int status_code;
    std::string body;
    std::map<std::string, std::string> headers;
    std::string content_type;
    std::chrono::milliseconds duration;

    HttpResponse() : status_code(0), duration(0) {}

    /**
     * Header value by (case-insensitive) name, empty if absent
     */
    std::string header(const std::string& name) const;
};

/**
 * A single request for HttpClient::send
 */
struct HttpRequest {
    std::string method;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string user_agent;
    int timeout_ms;
    size_t max_body_bytes;                  ///< 0 = unlimited
    std::vector<std::string> resolve;       ///< CURLOPT_RESOLVE entries "host:port:addr[,addr]"
    const CancellationToken* cancel;

    HttpRequest() : method("GET"), timeout_ms(30000), max_body_bytes(0), cancel(nullptr) {}
};

/**
 * HTTP client error
 */
class HttpClientError : public std::runtime_error {
public:
    enum class Kind {
        TRANSPORT,   ///< DNS, connect, TLS or protocol failure
        STATUS,      ///< Server answered with an error status
        TIMEOUT,
        CANCELLED,
        TOO_LARGE    ///< Body exceeded max_body_bytes
    };

    HttpClientError(const std::string& message, int status_code = 0, Kind kind = Kind::TRANSPORT)
        : std::runtime_error(message), status_code_(status_code), kind_(kind) {}

    int status_code() const { return status_code_; }
    Kind kind() const { return kind_; }
    bool is_timeout() const { return kind_ == Kind::TIMEOUT; }

private:
    int status_code_;
    Kind kind_;
};

/**
 * HTTP client with retry logic and timeout support
 *
 * Features:
 * - get/post: exponential backoff retry (1s, 2s, 4s max 3 attempts) for API calls
 * - send: single attempt with size cap, DNS pinning and cancellation, never
 *   follows redirects and never throws on HTTP status
 * - Thread-safe: every request runs on its own curl handle
 */
class HttpClient {
public:
    /**
     * Constructor
     * @param base_url Base URL for get/post (e.g., "http://127.0.0.1:8080"), may be empty
     * @param timeout_ms Timeout in milliseconds for get/post (default: 30000)
     */
    explicit HttpClient(const std::string& base_url = "", int timeout_ms = 30000);

    ~HttpClient();

    /**
     * GET request with automatic retry
     * @param path Path relative to base_url (e.g., "/health")
     * @param headers Additional headers
     * @return HttpResponse
     * @throws HttpClientError on failure after retries
     */
    HttpResponse get(const std::string& path,
                     const std::map<std::string, std::string>& headers = {});

    /**
     * POST request with automatic retry
     * @param path Path relative to base_url
     * @param body Request body (JSON string)
     * @param headers Additional headers
     * @return HttpResponse
     * @throws HttpClientError on failure after retries
     */
    HttpResponse post(const std::string& path,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers = {});

    /**
     * Single request without retry or redirect following
     * @return HttpResponse for any HTTP status
     * @throws HttpClientError on transport failure, timeout, cancellation or oversize body
     */
    HttpResponse send(const HttpRequest& request);

    /**
     * Set debug mode (logs requests/responses, redacts tokens)
     */
    void set_debug(bool debug) { debug_ = debug; }

    /**
     * Cancellation observed by get/post, including retry waits
     */
    void set_cancellation(const CancellationToken* cancel) { cancel_ = cancel; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::string base_url_;
    int timeout_ms_;
    bool debug_;
    const CancellationToken* cancel_;

    // Retry logic
    static constexpr int MAX_RETRIES = 3;
    static constexpr int RETRY_DELAYS_MS[MAX_RETRIES] = {1000, 2000, 4000};

    bool should_retry(int status_code) const;
    HttpResponse execute_with_retry(
        const std::string& method,
        const std::string& path,
        const std::string& body,
        const std::map<std::string, std::string>& headers
    );
};

} // namespace net
} // namespace deepdive
