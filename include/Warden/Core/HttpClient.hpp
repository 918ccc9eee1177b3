/**
 * @file HttpClient.hpp
 * @brief Outbound HTTPS client with allow-listing, rate limiting and size caps
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * SecureHttpClient is the only path from the gateway to the network. Every
 * URL is validated, every host is rate limited, caller headers are filtered
 * and response bodies are capped while they stream. The wire work is done
 * by an HttpTransport so that tests can script responses.
 */

#pragma once

#ifndef WARDEN_CORE_HTTP_CLIENT_HPP
#define WARDEN_CORE_HTTP_CLIENT_HPP

#include <Warden/Core/Types.hpp>
#include <Warden/Core/ErrorCodes.hpp>
#include <Warden/Core/InputValidator.hpp>
#include <Warden/Core/RateLimiter.hpp>
#include <Warden/Core/SecurityEventLog.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace Warden::Network {

// ============================================================================
// HTTP Types
// ============================================================================

/**
 * @brief HTTP methods
 */
enum class HttpMethod {
    GET,
    POST,
    HEAD
};

/**
 * @brief HTTP header map
 */
using HttpHeaders = std::map<std::string, std::string>;

/**
 * @brief A single validated transfer handed to the transport
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;                               ///< Validated absolute URL
    HttpHeaders headers;                           ///< Final, filtered header set
    std::string body;
    Milliseconds timeout{10000};                   ///< Whole-attempt deadline
    const std::atomic<bool>* cancel = nullptr;     ///< Set to abort the transfer
};

/**
 * @brief HTTP response
 */
struct HttpResponse {
    /// HTTP status code
    int statusCode = 0;

    /// Response headers, names lowercased
    HttpHeaders headers;

    /// Response body, never larger than the configured cap
    std::string body;

    /// Total time taken
    Milliseconds elapsed{0};

    /// Check if request was successful (2xx)
    [[nodiscard]] bool isSuccess() const noexcept {
        return statusCode >= 200 && statusCode < 300;
    }

    /// Check if request had client error (4xx)
    [[nodiscard]] bool isClientError() const noexcept {
        return statusCode >= 400 && statusCode < 500;
    }

    /// Check if request had server error (5xx)
    [[nodiscard]] bool isServerError() const noexcept {
        return statusCode >= 500 && statusCode < 600;
    }

    /// Get header value (case-insensitive), empty if absent
    [[nodiscard]] std::string getHeader(const std::string& name) const;
};

// ============================================================================
// Response Collector
// ============================================================================

/**
 * @brief Accumulates a response body under a byte cap
 *
 * Transports report the declared Content-Length (if any) before the body
 * and every received chunk afterwards. Once either exceeds the cap the
 * collector refuses further data and the transport must abort.
 */
class ResponseCollector {
public:
    explicit ResponseCollector(size_t maxBytes) : m_maxBytes(maxBytes) {}

    /**
     * @brief Check a declared Content-Length
     * @return false if the declared size exceeds the cap
     */
    bool onContentLength(uint64_t declared);

    /**
     * @brief Append a chunk
     * @return false once the running total exceeds the cap
     */
    bool onData(const char* data, size_t size);

    [[nodiscard]] bool exceeded() const noexcept { return m_exceeded; }
    [[nodiscard]] size_t received() const noexcept { return m_received; }
    [[nodiscard]] size_t maxBytes() const noexcept { return m_maxBytes; }

    /// Move the collected body out
    std::string takeBody() { return std::move(m_body); }

private:
    size_t m_maxBytes;
    size_t m_received = 0;
    bool m_exceeded = false;
    std::string m_body;
};

// ============================================================================
// Transport
// ============================================================================

/**
 * @brief Performs one HTTP attempt
 *
 * Implementations must feed the body through the collector, fail with
 * ResponseTooLarge when it refuses data, Timeout when the request deadline
 * passes, TransferAborted when the cancel flag is set, and a Network code
 * for other transport failures. Any received status code is a success at
 * this layer.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> perform(const HttpRequest& request,
                                         ResponseCollector& collector) = 0;
};

/**
 * @brief libcurl transport: https only, TLS 1.2 minimum, peer and host
 *        verification on, no redirects
 */
class CurlTransport final : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    Result<HttpResponse> perform(const HttpRequest& request,
                                 ResponseCollector& collector) override;
};

// ============================================================================
// Client Configuration
// ============================================================================

/**
 * @brief Client limits
 */
struct HttpClientConfig {
    Milliseconds timeout{10000};                       ///< Per attempt
    unsigned maxRetries = 3;                           ///< Total attempts
    Milliseconds retryBaseDelay{1000};
    size_t maxResponseBytes = 5 * 1024 * 1024;
    std::string userAgent = "warden/1.0.0";
};

/**
 * @brief Per-call options
 */
struct RequestOptions {
    HttpMethod method = HttpMethod::GET;
    HttpHeaders headers;                               ///< Filtered before use
    std::string body;
    std::optional<Milliseconds> timeout;               ///< Overrides the config
    const std::atomic<bool>* cancel = nullptr;
};

// ============================================================================
// SecureHttpClient
// ============================================================================

/**
 * @brief Validating, rate-limited, size-capped HTTPS client
 *
 * @example
 * ```cpp
 * SecureHttpClient client;
 * auto json = client.getJson("https://registry.npmjs.org/lodash");
 * if (json.isSuccess()) {
 *     std::string latest = json.value()["dist-tags"]["latest"];
 * }
 * ```
 */
class SecureHttpClient {
public:
    /**
     * @param config Timeouts, retries and caps
     * @param transport Wire implementation; CurlTransport when null
     * @param limiter Per-host limiter, shareable between clients; a
     *        private 10 requests / 60 s limiter when null
     * @param validator URL policy
     * @param events Sink for blocked requests
     */
    explicit SecureHttpClient(HttpClientConfig config = HttpClientConfig{},
                              std::unique_ptr<HttpTransport> transport = nullptr,
                              std::shared_ptr<Security::RateLimiter> limiter = nullptr,
                              Security::InputValidator validator =
                                  Security::InputValidator::defaultInstance(),
                              Security::SecurityEventLog& events =
                                  Security::SecurityEventLog::Instance());
    ~SecureHttpClient();

    // Non-copyable
    SecureHttpClient(const SecureHttpClient&) = delete;
    SecureHttpClient& operator=(const SecureHttpClient&) = delete;

    /**
     * @brief Perform a request
     *
     * 2xx and 3xx responses are returned (redirects are not followed).
     * 4xx fails with HttpStatusError immediately; 5xx and transport
     * failures are retried with exponential backoff and then surfaced.
     */
    Result<HttpResponse> request(std::string_view url,
                                 const RequestOptions& options = RequestOptions{});

    /**
     * @brief GET a JSON object or array
     *
     * Failures: HttpStatusError for non-2xx, JsonParseFailed for malformed
     * bodies, JsonInvalid for scalars; transport errors keep their codes.
     */
    Result<nlohmann::ordered_json> getJson(std::string_view url);

    [[nodiscard]] const HttpClientConfig& config() const noexcept;

    [[nodiscard]] const Security::InputValidator& validator() const noexcept;

    /**
     * @brief Default headers, then caller headers (overriding by name,
     *        case-insensitively), minus Authorization, Cookie,
     *        X-Forwarded-For and X-Real-IP
     */
    static HttpHeaders buildHeaders(const HttpHeaders& callerHeaders,
                                    const std::string& userAgent);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Warden::Network

#endif // WARDEN_CORE_HTTP_CLIENT_HPP
