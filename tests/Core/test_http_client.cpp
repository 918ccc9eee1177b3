/**
 * @file test_http_client.cpp
 * @brief Unit tests for SecureHttpClient
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * Tests cover:
 * - URL validation and SSRF events before any transfer
 * - Per-host rate limiting
 * - Header filtering
 * - Retry of 5xx and transport failures, terminal 4xx and timeouts
 * - Response size cap
 * - JSON decoding
 */

#include <Warden/Core/HttpClient.hpp>
#include <Warden/Core/ErrorHandler.hpp>
#include "FakeTransport.hpp"
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Warden;
using namespace Warden::Network;
using namespace Warden::Security;
using namespace Warden::Testing;

class SecureHttpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeTransportState>();
        config_.retryBaseDelay = Milliseconds(1);
        config_.maxRetries = 3;
    }

    std::unique_ptr<SecureHttpClient> makeClient(RateLimitConfig limits = RateLimitConfig{100, Milliseconds(60000)}) {
        return std::make_unique<SecureHttpClient>(
            config_, std::make_unique<FakeTransport>(state_),
            std::make_shared<RateLimiter>(limits), InputValidator(), events_);
    }

    std::shared_ptr<FakeTransportState> state_;
    HttpClientConfig config_;
    SecurityEventLog events_;
};

// ============================================================================
// Unit Test 1: Successful Requests
// ============================================================================

TEST_F(SecureHttpClientTest, GetReturnsResponse) {
    state_->enqueue(makeResponse(200, R"({"name":"lodash"})"));
    auto client = makeClient();

    auto result = client->request("https://registry.npmjs.org/lodash");
    ASSERT_TRUE(result.isSuccess()) << result.errorInfo().message;
    EXPECT_EQ(result.value().statusCode, 200);
    EXPECT_EQ(result.value().body, R"({"name":"lodash"})");

    ASSERT_EQ(state_->requests.size(), 1u);
    const HttpRequest& sent = state_->requests[0];
    EXPECT_EQ(sent.method, HttpMethod::GET);
    EXPECT_EQ(sent.url, "https://registry.npmjs.org/lodash");
    EXPECT_EQ(sent.headers.at("User-Agent"), "warden/1.0.0");
    EXPECT_EQ(sent.timeout, Milliseconds(10000));
}

TEST_F(SecureHttpClientTest, PassesMethodBodyAndTimeout) {
    state_->enqueue(makeResponse(201));
    auto client = makeClient();

    RequestOptions options;
    options.method = HttpMethod::POST;
    options.body = R"({"query":"react"})";
    options.timeout = Milliseconds(500);

    auto result = client->request("https://api.github.com/graphql", options);
    ASSERT_TRUE(result.isSuccess());
    ASSERT_EQ(state_->requests.size(), 1u);
    EXPECT_EQ(state_->requests[0].method, HttpMethod::POST);
    EXPECT_EQ(state_->requests[0].body, R"({"query":"react"})");
    EXPECT_EQ(state_->requests[0].timeout, Milliseconds(500));
}

// ============================================================================
// Unit Test 2: Header Filtering
// ============================================================================

TEST(BuildHeaders, DefaultsOverridesAndStrippedNames) {
    HttpHeaders caller{
        {"accept", "application/octet-stream"},
        {"Authorization", "Bearer secret"},
        {"COOKIE", "session=1"},
        {"X-Forwarded-For", "10.0.0.1"},
        {"x-real-ip", "10.0.0.1"},
        {"X-Request-Id", "abc"},
    };

    HttpHeaders headers = SecureHttpClient::buildHeaders(caller, "warden/test");

    EXPECT_EQ(headers.at("User-Agent"), "warden/test");
    EXPECT_EQ(headers.count("Accept"), 0u);
    EXPECT_EQ(headers.at("accept"), "application/octet-stream");
    EXPECT_EQ(headers.at("Cache-Control"), "no-cache");
    EXPECT_EQ(headers.at("Connection"), "close");
    EXPECT_EQ(headers.at("X-Request-Id"), "abc");
    EXPECT_EQ(headers.count("Authorization"), 0u);
    EXPECT_EQ(headers.count("COOKIE"), 0u);
    EXPECT_EQ(headers.count("X-Forwarded-For"), 0u);
    EXPECT_EQ(headers.count("x-real-ip"), 0u);
}

TEST_F(SecureHttpClientTest, SentHeadersAreFiltered) {
    state_->enqueue(makeResponse(200));
    auto client = makeClient();

    RequestOptions options;
    options.headers["Authorization"] = "Bearer secret";
    ASSERT_TRUE(client->request("https://registry.npmjs.org/react", options).isSuccess());

    ASSERT_EQ(state_->requests.size(), 1u);
    EXPECT_EQ(state_->requests[0].headers.count("Authorization"), 0u);
}

TEST(HttpResponse, HeaderLookupIgnoresCase) {
    HttpResponse response;
    response.headers["content-type"] = "application/json";
    EXPECT_EQ(response.getHeader("Content-Type"), "application/json");
    EXPECT_TRUE(response.getHeader("ETag").empty());
}

// ============================================================================
// Unit Test 3: URL Policy and Rate Limiting
// ============================================================================

TEST_F(SecureHttpClientTest, RejectedUrlsNeverReachTransport) {
    auto client = makeClient();

    EXPECT_ERROR_CODE(client->request("http://registry.npmjs.org/lodash"),
                      ErrorCode::SchemeNotAllowed);
    EXPECT_ERROR_CODE(client->request("https://169.254.169.254/latest/meta-data"),
                      ErrorCode::HostNotAllowed);
    EXPECT_ERROR_CODE(client->request("not a url"), ErrorCode::InvalidUrl);

    EXPECT_TRUE(state_->requests.empty());
    EXPECT_EQ(events_.countEvents(EventType::SsrfBlocked), 2u);
}

TEST_F(SecureHttpClientTest, RateLimitPerHost) {
    for (int i = 0; i < 3; ++i) {
        state_->enqueue(makeResponse(200));
    }
    auto client = makeClient(RateLimitConfig{2, Milliseconds(60000)});

    EXPECT_TRUE(client->request("https://registry.npmjs.org/a").isSuccess());
    EXPECT_TRUE(client->request("https://registry.npmjs.org/b").isSuccess());

    auto limited = client->request("https://registry.npmjs.org/c");
    EXPECT_ERROR_CODE(limited, ErrorCode::RateLimited);
    if (limited.isFailure()) {
        EXPECT_GT(limited.errorInfo().retryAfter, Milliseconds(0));
        EXPECT_NE(limited.errorInfo().message.find("Rate limit exceeded. Try again in 60 seconds"),
                  std::string::npos);
    }
    EXPECT_EQ(events_.countEvents(EventType::RateLimit), 1u);

    EXPECT_TRUE(client->request("https://api.github.com/repos").isSuccess());
    EXPECT_EQ(state_->requests.size(), 3u);
}

// ============================================================================
// Unit Test 4: Retries
// ============================================================================

TEST_F(SecureHttpClientTest, ClientErrorsAreTerminal) {
    state_->enqueue(makeResponse(404, "Not Found"));
    state_->enqueue(makeResponse(200));
    auto client = makeClient();

    auto result = client->request("https://registry.npmjs.org/missing-package");
    EXPECT_ERROR_CODE(result, ErrorCode::HttpStatusError);
    if (result.isFailure()) {
        EXPECT_EQ(result.errorInfo().message, "HTTP 404");
    }
    EXPECT_EQ(state_->requests.size(), 1u);
}

TEST_F(SecureHttpClientTest, ServerErrorsAreRetried) {
    state_->enqueue(makeResponse(503));
    state_->enqueue(makeResponse(200, "ok"));
    auto client = makeClient();

    auto result = client->request("https://registry.npmjs.org/lodash");
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().body, "ok");
    EXPECT_EQ(state_->requests.size(), 2u);
}

TEST_F(SecureHttpClientTest, ServerErrorsExhaustAttempts) {
    for (int i = 0; i < 5; ++i) {
        state_->enqueue(makeResponse(500));
    }
    auto client = makeClient();

    EXPECT_ERROR_CODE(client->request("https://registry.npmjs.org/lodash"), ErrorCode::ServerError);
    EXPECT_EQ(state_->requests.size(), 3u);
}

TEST_F(SecureHttpClientTest, TransportFailuresAreRetried) {
    state_->enqueue(makeError(ErrorCode::ConnectionReset, "reset by peer"));
    state_->enqueue(makeError(ErrorCode::DnsResolutionFailed, "no such host"));
    state_->enqueue(makeResponse(200));
    auto client = makeClient();

    EXPECT_TRUE(client->request("https://registry.npmjs.org/lodash").isSuccess());
    EXPECT_EQ(state_->requests.size(), 3u);
}

TEST_F(SecureHttpClientTest, TimeoutIsNotRetried) {
    state_->enqueue(makeError(ErrorCode::Timeout, "Request timeout"));
    state_->enqueue(makeResponse(200));
    auto client = makeClient();

    EXPECT_ERROR_CODE(client->request("https://registry.npmjs.org/lodash"), ErrorCode::Timeout);
    EXPECT_EQ(state_->requests.size(), 1u);
}

// ============================================================================
// Unit Test 5: Response Size Cap
// ============================================================================

TEST_F(SecureHttpClientTest, StreamedBodyOverCapIsRejected) {
    config_.maxResponseBytes = 1024;
    state_->chunkSize = 100;
    state_->enqueue(makeResponse(200, std::string(4096, 'x')));
    auto client = makeClient();

    EXPECT_ERROR_CODE(client->request("https://registry.npmjs.org/huge"),
                      ErrorCode::ResponseTooLarge);
    EXPECT_EQ(state_->requests.size(), 1u);
}

TEST_F(SecureHttpClientTest, DeclaredLengthOverCapIsRejected) {
    config_.maxResponseBytes = 1024;
    HttpResponse response = makeResponse(200, "small");
    response.headers["content-length"] = "999999";
    state_->enqueue(response);
    auto client = makeClient();

    EXPECT_ERROR_CODE(client->request("https://registry.npmjs.org/huge"),
                      ErrorCode::ResponseTooLarge);
}

TEST_F(SecureHttpClientTest, BodyAtCapIsAccepted) {
    config_.maxResponseBytes = 1024;
    state_->enqueue(makeResponse(200, std::string(1024, 'x')));
    auto client = makeClient();

    auto result = client->request("https://registry.npmjs.org/exact");
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().body.size(), 1024u);
}

// ============================================================================
// Unit Test 6: JSON
// ============================================================================

TEST_F(SecureHttpClientTest, GetJsonParsesObjects) {
    state_->enqueue(makeResponse(200, R"({"name":"lodash","versions":{}})"));
    auto client = makeClient();

    auto result = client->getJson("https://registry.npmjs.org/lodash");
    ASSERT_TRUE(result.isSuccess()) << result.errorInfo().message;
    EXPECT_EQ(result.value()["name"], "lodash");
    EXPECT_EQ(state_->requests[0].headers.at("Accept"), "application/json");
}

TEST_F(SecureHttpClientTest, GetJsonRejectsMalformedBodies) {
    state_->enqueue(makeResponse(200, "<html>oops</html>"));
    state_->enqueue(makeResponse(200, "42"));
    auto client = makeClient();

    EXPECT_ERROR_CODE(client->getJson("https://registry.npmjs.org/a"), ErrorCode::JsonParseFailed);
    EXPECT_ERROR_CODE(client->getJson("https://registry.npmjs.org/b"), ErrorCode::JsonInvalid);
}

TEST_F(SecureHttpClientTest, GetJsonPropagatesStatusErrors) {
    state_->enqueue(makeResponse(404));
    auto client = makeClient();

    EXPECT_ERROR_CODE(client->getJson("https://registry.npmjs.org/missing"),
                      ErrorCode::HttpStatusError);
}
