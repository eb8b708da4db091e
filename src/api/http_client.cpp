#include "api/http_client.hpp"
#include "logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>
#include <thread>

namespace deepdive {
namespace net {

// Static initialization
constexpr int HttpClient::RETRY_DELAYS_MS[];

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct WriteContext {
    std::string* body;
    size_t max_bytes;
    bool overflow;
};

// CURL write callback, aborts the transfer once max_bytes would be exceeded
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* ctx = static_cast<WriteContext*>(userp);
    if (ctx->max_bytes > 0 && ctx->body->size() + total_size > ctx->max_bytes) {
        ctx->overflow = true;
        return 0;
    }
    ctx->body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// CURL header callback
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header(buffer, total_size);

    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    // A new status line starts a new header block (100-continue, proxies)
    if (header.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total_size;
    }

    size_t colon_pos = header.find(':');
    if (colon_pos != std::string::npos) {
        std::string name = to_lower(header.substr(0, colon_pos));
        std::string value = header.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        (*headers)[name] = value;
    }

    return total_size;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancellationToken*>(clientp);
    return (cancel != nullptr && cancel->is_cancelled()) ? 1 : 0;
}

struct CurlHandle {
    CURL* handle;

    CurlHandle() : handle(curl_easy_init()) {}
    ~CurlHandle() {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct CurlList {
    curl_slist* list;

    CurlList() : list(nullptr) {}
    ~CurlList() {
        if (list) {
            curl_slist_free_all(list);
        }
    }

    void append(const std::string& entry) {
        list = curl_slist_append(list, entry.c_str());
    }

    CurlList(const CurlList&) = delete;
    CurlList& operator=(const CurlList&) = delete;
};

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

struct HttpClient::Impl {
    Impl() {
        ensure_curl_initialized();
    }

    HttpResponse perform(const HttpRequest& request, bool debug) {
        if (is_cancelled(request.cancel)) {
            throw HttpClientError("Request cancelled", 0, HttpClientError::Kind::CANCELLED);
        }

        CurlHandle curl;
        if (!curl.handle) {
            throw HttpClientError("Failed to initialize CURL");
        }

        auto start = std::chrono::steady_clock::now();

        curl_easy_setopt(curl.handle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
        curl_easy_setopt(curl.handle, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min(request.timeout_ms, 10000)));
        curl_easy_setopt(curl.handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.handle, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl.handle, CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(curl.handle, CURLOPT_PROTOCOLS,
                         static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));

        if (!request.user_agent.empty()) {
            curl_easy_setopt(curl.handle, CURLOPT_USERAGENT, request.user_agent.c_str());
        }

        if (request.method == "POST") {
            curl_easy_setopt(curl.handle, CURLOPT_POST, 1L);
            curl_easy_setopt(curl.handle, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl.handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        } else if (request.method == "GET") {
            curl_easy_setopt(curl.handle, CURLOPT_HTTPGET, 1L);
        } else {
            curl_easy_setopt(curl.handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }

        CurlList headers;
        bool has_content_type = false;
        for (const auto& [key, value] : request.headers) {
            if (to_lower(key) == "content-type") {
                has_content_type = true;
            }
            if (debug) {
                std::string lowered = to_lower(key);
                bool secret = lowered == "authorization" || lowered.find("key") != std::string::npos;
                Logger::get_instance().debug("HTTP header", {
                    {"name", key}, {"value", secret ? "[REDACTED]" : value}
                });
            }
            headers.append(key + ": " + value);
        }
        if (request.method == "POST" && !has_content_type) {
            headers.append("Content-Type: application/json");
        }
        if (headers.list) {
            curl_easy_setopt(curl.handle, CURLOPT_HTTPHEADER, headers.list);
        }

        CurlList resolve;
        for (const auto& entry : request.resolve) {
            resolve.append(entry);
        }
        if (resolve.list) {
            curl_easy_setopt(curl.handle, CURLOPT_RESOLVE, resolve.list);
        }

        HttpResponse response;
        WriteContext write_ctx{&response.body, request.max_body_bytes, false};

        curl_easy_setopt(curl.handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.handle, CURLOPT_WRITEDATA, &write_ctx);
        curl_easy_setopt(curl.handle, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.handle, CURLOPT_HEADERDATA, &response.headers);

        curl_easy_setopt(curl.handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.handle, CURLOPT_XFERINFODATA,
                         const_cast<void*>(static_cast<const void*>(request.cancel)));

        if (debug) {
            Logger::get_instance().debug("HTTP request", {
                {"method", request.method}, {"url", request.url}
            });
        }

        CURLcode res = curl_easy_perform(curl.handle);

        response.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (res != CURLE_OK) {
            std::string error_msg = "CURL error: ";
            error_msg += curl_easy_strerror(res);

            if (res == CURLE_OPERATION_TIMEDOUT) {
                throw HttpClientError(error_msg, 0, HttpClientError::Kind::TIMEOUT);
            }
            if (res == CURLE_ABORTED_BY_CALLBACK) {
                throw HttpClientError("Request cancelled", 0, HttpClientError::Kind::CANCELLED);
            }
            if (res == CURLE_WRITE_ERROR && write_ctx.overflow) {
                throw HttpClientError("Response body exceeds " +
                                      std::to_string(request.max_body_bytes) + " bytes",
                                      0, HttpClientError::Kind::TOO_LARGE);
            }
            throw HttpClientError(error_msg);
        }

        long status_code = 0;
        curl_easy_getinfo(curl.handle, CURLINFO_RESPONSE_CODE, &status_code);
        response.status_code = static_cast<int>(status_code);

        char* content_type = nullptr;
        curl_easy_getinfo(curl.handle, CURLINFO_CONTENT_TYPE, &content_type);
        if (content_type) {
            response.content_type = content_type;
        }

        if (debug) {
            Logger::get_instance().debug("HTTP response", {
                {"url", request.url},
                {"status", std::to_string(response.status_code)},
                {"duration_ms", std::to_string(response.duration.count())}
            });
        }

        return response;
    }
};

HttpClient::HttpClient(const std::string& base_url, int timeout_ms)
    : impl_(std::make_unique<Impl>())
    , base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , debug_(false)
    , cancel_(nullptr)
{
    // Remove trailing slash from base_url
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpClient::~HttpClient() = default;

bool HttpClient::should_retry(int status_code) const {
    // Retry on: timeout (408), rate limit (429), server errors (500-599)
    // Don't retry on: auth (401), forbidden (403), not found (404)
    if (status_code == 408 || status_code == 429) {
        return true;
    }
    if (status_code >= 500 && status_code < 600) {
        return true;
    }
    return false;
}

HttpResponse HttpClient::send(const HttpRequest& request) {
    return impl_->perform(request, debug_);
}

HttpResponse HttpClient::execute_with_retry(
    const std::string& method,
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    HttpRequest request;
    request.method = method;
    request.url = base_url_ + path;
    request.body = body;
    request.headers = headers;
    request.timeout_ms = timeout_ms_;
    request.cancel = cancel_;

    HttpClientError last_error("Unknown error");

    for (int attempt = 0; attempt < MAX_RETRIES; ++attempt) {
        bool retryable = false;

        try {
            HttpResponse response = impl_->perform(request, debug_);

            if (response.status_code < 400) {
                return response;
            }

            std::ostringstream oss;
            oss << "HTTP " << response.status_code;
            if (!response.body.empty()) {
                oss << ": " << response.body.substr(0, 200);
            }
            last_error = HttpClientError(oss.str(), response.status_code,
                                         HttpClientError::Kind::STATUS);
            retryable = should_retry(response.status_code);

        } catch (const HttpClientError& e) {
            last_error = e;
            // Transport failures and timeouts are retried, cancellation and oversize are not
            retryable = e.kind() == HttpClientError::Kind::TRANSPORT ||
                        e.kind() == HttpClientError::Kind::TIMEOUT;
        }

        if (!retryable || attempt == MAX_RETRIES - 1) {
            throw last_error;
        }

        if (debug_) {
            Logger::get_instance().debug("HTTP retry", {
                {"url", request.url},
                {"error", last_error.what()},
                {"delay_ms", std::to_string(RETRY_DELAYS_MS[attempt])}
            });
        }

        std::chrono::milliseconds delay(RETRY_DELAYS_MS[attempt]);
        if (cancel_ != nullptr) {
            if (!cancel_->wait_for(delay)) {
                throw HttpClientError("Request cancelled", 0, HttpClientError::Kind::CANCELLED);
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
    }

    throw last_error;
}

HttpResponse HttpClient::get(
    const std::string& path,
    const std::map<std::string, std::string>& headers)
{
    return execute_with_retry("GET", path, "", headers);
}

HttpResponse HttpClient::post(
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    return execute_with_retry("POST", path, body, headers);
}

} // namespace net
} // namespace deepdive
