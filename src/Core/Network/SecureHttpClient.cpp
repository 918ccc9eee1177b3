/**
 * @file SecureHttpClient.cpp
 * @brief Validating, rate-limited HTTPS client
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/HttpClient.hpp>
#include <Warden/Core/ErrorHandler.hpp>
#include <Warden/Core/Logger.hpp>
#include <Warden/Core/Retry.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <thread>

namespace Warden::Network {

namespace {

constexpr std::array<std::string_view, 4> kStrippedHeaders = {
    "authorization", "cookie", "x-forwarded-for", "x-real-ip",
};

std::string toLower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

/// Insert or replace a header, matching names case-insensitively
void setHeader(HttpHeaders& headers, const std::string& name, const std::string& value) {
    const std::string key = toLower(name);
    for (auto it = headers.begin(); it != headers.end();) {
        if (toLower(it->first) == key) {
            it = headers.erase(it);
        } else {
            ++it;
        }
    }
    headers[name] = value;
}

bool isSsrfRejection(ErrorCode code) {
    return code == ErrorCode::SchemeNotAllowed ||
           code == ErrorCode::HostNotAllowed ||
           code == ErrorCode::PrivateAddress;
}

} // anonymous namespace

// ============================================================================
// HttpResponse / ResponseCollector
// ============================================================================

std::string HttpResponse::getHeader(const std::string& name) const {
    const std::string key = toLower(name);
    for (const auto& [headerName, value] : headers) {
        if (toLower(headerName) == key) {
            return value;
        }
    }
    return {};
}

bool ResponseCollector::onContentLength(uint64_t declared) {
    if (declared > m_maxBytes) {
        m_exceeded = true;
        return false;
    }
    m_body.reserve(static_cast<size_t>(declared));
    return true;
}

bool ResponseCollector::onData(const char* data, size_t size) {
    if (m_exceeded) {
        return false;
    }
    m_received += size;
    if (m_received > m_maxBytes) {
        m_exceeded = true;
        return false;
    }
    m_body.append(data, size);
    return true;
}

// ============================================================================
// SecureHttpClient::Impl
// ============================================================================

class SecureHttpClient::Impl {
public:
    Impl(HttpClientConfig config,
         std::unique_ptr<HttpTransport> transport,
         std::shared_ptr<Security::RateLimiter> limiter,
         Security::InputValidator validator,
         Security::SecurityEventLog& events)
        : m_config(std::move(config))
        , m_transport(transport ? std::move(transport) : std::make_unique<CurlTransport>())
        , m_limiter(limiter ? std::move(limiter)
                            : std::make_shared<Security::RateLimiter>(
                                  Security::RateLimitConfig::http()))
        , m_validator(std::move(validator))
        , m_events(events) {}

    Result<HttpResponse> request(std::string_view url, const RequestOptions& options) {
        auto validated = m_validator.validateUrl(url);
        if (validated.isFailure()) {
            if (isSsrfRejection(validated.error())) {
                m_events.logEvent(Security::EventType::SsrfBlocked,
                                  {{"reason", validated.errorInfo().message}});
            }
            return validated.errorInfo();
        }
        const auto& target = validated.value();

        if (!m_limiter->isAllowed(target.host())) {
            const Milliseconds wait = m_limiter->getTimeUntilReset(target.host());
            const auto seconds = (wait.count() + 999) / 1000;
            m_events.logEvent(Security::EventType::RateLimit, {{"host", target.host()}});

            ErrorInfo error = makeError(ErrorCode::RateLimited,
                "Rate limit exceeded. Try again in " + std::to_string(seconds) + " seconds");
            error.retryAfter = wait;
            return error;
        }

        HttpRequest request;
        request.method = options.method;
        request.url = target.href();
        request.headers = buildHeaders(options.headers, m_config.userAgent);
        request.body = options.body;
        request.timeout = options.timeout.value_or(m_config.timeout);
        request.cancel = options.cancel;

        const unsigned attempts = std::max(m_config.maxRetries, 1u);
        ErrorInfo lastError(ErrorCode::HttpRequestFailed);

        for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
            ResponseCollector collector(m_config.maxResponseBytes);
            const TimePoint start = Clock::now();
            auto result = m_transport->perform(request, collector);

            if (result.isSuccess()) {
                HttpResponse response = std::move(result).value();
                response.elapsed = std::chrono::duration_cast<Milliseconds>(Clock::now() - start);

                if (response.isClientError()) {
                    return makeError(ErrorCode::HttpStatusError,
                                     "HTTP " + std::to_string(response.statusCode));
                }
                if (!response.isServerError()) {
                    return response;
                }
                lastError = makeError(ErrorCode::ServerError,
                                      "HTTP " + std::to_string(response.statusCode));
            } else {
                lastError = result.errorInfo();
                if (!isRetriable(lastError.code)) {
                    if (lastError.code == ErrorCode::ResponseTooLarge) {
                        WARDEN_LOG_WARNING_F("Response from %s exceeded %zu bytes",
                                             target.host().c_str(), m_config.maxResponseBytes);
                    }
                    return lastError;
                }
            }

            WARDEN_LOG_DEBUG_F("Attempt %u/%u to %s failed: %s", attempt, attempts,
                               target.host().c_str(), lastError.message.c_str());

            if (attempt < attempts) {
                std::this_thread::sleep_for(backoffDelay(m_config.retryBaseDelay, attempt));
            }
        }

        return lastError;
    }

    Result<nlohmann::ordered_json> getJson(std::string_view url) {
        RequestOptions options;
        options.headers["Accept"] = "application/json";

        auto response = request(url, options);
        if (response.isFailure()) {
            return response.errorInfo();
        }
        if (!response.value().isSuccess()) {
            return makeError(ErrorCode::HttpStatusError,
                             "Failed to fetch JSON: HTTP " +
                                 std::to_string(response.value().statusCode));
        }

        auto data = nlohmann::ordered_json::parse(response.value().body, nullptr, false);
        if (data.is_discarded()) {
            return makeError(ErrorCode::JsonParseFailed, "Invalid JSON response format");
        }
        if (!data.is_object() && !data.is_array()) {
            return makeError(ErrorCode::JsonInvalid, "Invalid JSON response structure");
        }
        return data;
    }

    HttpClientConfig m_config;
    std::unique_ptr<HttpTransport> m_transport;
    std::shared_ptr<Security::RateLimiter> m_limiter;
    Security::InputValidator m_validator;
    Security::SecurityEventLog& m_events;
};

// ============================================================================
// SecureHttpClient
// ============================================================================

SecureHttpClient::SecureHttpClient(HttpClientConfig config,
                                   std::unique_ptr<HttpTransport> transport,
                                   std::shared_ptr<Security::RateLimiter> limiter,
                                   Security::InputValidator validator,
                                   Security::SecurityEventLog& events)
    : m_impl(std::make_unique<Impl>(std::move(config), std::move(transport),
                                    std::move(limiter), std::move(validator), events)) {}

SecureHttpClient::~SecureHttpClient() = default;

Result<HttpResponse> SecureHttpClient::request(std::string_view url,
                                               const RequestOptions& options) {
    return m_impl->request(url, options);
}

Result<nlohmann::ordered_json> SecureHttpClient::getJson(std::string_view url) {
    return m_impl->getJson(url);
}

const HttpClientConfig& SecureHttpClient::config() const noexcept {
    return m_impl->m_config;
}

const Security::InputValidator& SecureHttpClient::validator() const noexcept {
    return m_impl->m_validator;
}

HttpHeaders SecureHttpClient::buildHeaders(const HttpHeaders& callerHeaders,
                                           const std::string& userAgent) {
    HttpHeaders headers{
        {"User-Agent", userAgent},
        {"Accept", "application/json"},
        {"Accept-Encoding", "gzip, deflate"},
        {"Cache-Control", "no-cache"},
        {"Connection", "close"},
    };

    for (const auto& [name, value] : callerHeaders) {
        setHeader(headers, name, value);
    }

    for (auto it = headers.begin(); it != headers.end();) {
        const std::string key = toLower(it->first);
        if (std::find(kStrippedHeaders.begin(), kStrippedHeaders.end(), key) !=
            kStrippedHeaders.end()) {
            it = headers.erase(it);
        } else {
            ++it;
        }
    }

    return headers;
}

} // namespace Warden::Network
