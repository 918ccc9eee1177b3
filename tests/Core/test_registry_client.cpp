/**
 * @file test_registry_client.cpp
 * @brief Unit tests for registry metadata lookups
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/RegistryClient.hpp>
#include <Warden/Core/TimeUtils.hpp>
#include "FakeTransport.hpp"
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Warden;
using namespace Warden::Network;
using namespace Warden::Security;
using namespace Warden::Testing;

namespace {

const char* kLodashPackument = R"({
    "name": "lodash",
    "dist-tags": {"latest": "4.17.21"},
    "versions": {
        "4.17.20": {"description": "old"},
        "4.17.21": {
            "keywords": ["modules", "stdlib", "util"],
            "license": {"type": "MIT"},
            "homepage": "https://lodash.com/"
        }
    },
    "time": {
        "created": "2012-04-23T16:37:11.912Z",
        "4.17.20": "2020-08-13T16:53:54.152Z",
        "4.17.21": "2021-02-20T15:42:16.891Z"
    },
    "description": "Lodash modular utilities.",
    "repository": {"type": "git", "url": "git+https://github.com/lodash/lodash.git"}
})";

} // namespace

class RegistryClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeTransportState>();
        HttpClientConfig config;
        config.retryBaseDelay = Milliseconds(1);
        auto client = std::make_shared<SecureHttpClient>(
            config, std::make_unique<FakeTransport>(state_),
            std::make_shared<RateLimiter>(RateLimitConfig{100, Milliseconds(60000)}),
            InputValidator(), events_);
        registry_ = std::make_unique<RegistryClient>(client);
    }

    std::shared_ptr<FakeTransportState> state_;
    SecurityEventLog events_;
    std::unique_ptr<RegistryClient> registry_;
};

// ============================================================================
// Unit Test 1: Package Info
// ============================================================================

TEST_F(RegistryClientTest, FetchesPackument) {
    state_->route("https://registry.npmjs.org/lodash", makeResponse(200, kLodashPackument));

    auto info = registry_->getPackageInfo("lodash");
    ASSERT_TRUE(info.isSuccess()) << info.errorInfo().message;
    EXPECT_EQ(info.value()["name"], "lodash");
    ASSERT_EQ(state_->requests.size(), 1u);
    EXPECT_EQ(state_->requests[0].url, "https://registry.npmjs.org/lodash");
}

TEST_F(RegistryClientTest, EncodesScopedNames) {
    state_->enqueue(makeResponse(200, R"({"name":"@types/node"})"));

    ASSERT_TRUE(registry_->getPackageInfo("@types/node").isSuccess());
    ASSERT_EQ(state_->requests.size(), 1u);
    EXPECT_EQ(state_->requests[0].url, "https://registry.npmjs.org/%40types%2Fnode");
}

TEST_F(RegistryClientTest, RejectsInvalidNamesWithoutRequest) {
    EXPECT_ERROR_CODE(registry_->getPackageInfo("lodash; rm -rf /"), ErrorCode::DangerousPattern);
    EXPECT_ERROR_CODE(registry_->getPackageInfo(""), ErrorCode::EmptyInput);
    EXPECT_TRUE(state_->requests.empty());
}

TEST_F(RegistryClientTest, PropagatesHttpErrors) {
    state_->enqueue(makeResponse(404, R"({"error":"Not found"})"));
    EXPECT_ERROR_CODE(registry_->getPackageInfo("no-such-package"), ErrorCode::HttpStatusError);
}

// ============================================================================
// Unit Test 2: Last Published
// ============================================================================

TEST_F(RegistryClientTest, LastPublishedUsesLatestTag) {
    state_->enqueue(makeResponse(200, kLodashPackument));

    auto published = registry_->getLastPublished("lodash");
    ASSERT_TRUE(published.isSuccess()) << published.errorInfo().message;
    EXPECT_EQ(formatIso8601(published.value()), "2021-02-20T15:42:16.891Z");
}

TEST_F(RegistryClientTest, LastPublishedNeedsTimeAndVersions) {
    state_->enqueue(makeResponse(200, R"({"name":"x","versions":{"1.0.0":{}}})"));
    state_->enqueue(makeResponse(200, R"({"name":"x","versions":{},"time":{}})"));
    state_->enqueue(makeResponse(200, R"({"name":"x","versions":{"1.0.0":{}},"time":{}})"));
    state_->enqueue(makeResponse(200,
        R"({"name":"x","versions":{"1.0.0":{}},"time":{"1.0.0":"last tuesday"}})"));

    EXPECT_ERROR_CODE(registry_->getLastPublished("x"), ErrorCode::MissingField);
    EXPECT_ERROR_CODE(registry_->getLastPublished("x"), ErrorCode::MissingField);
    EXPECT_ERROR_CODE(registry_->getLastPublished("x"), ErrorCode::MissingField);
    EXPECT_ERROR_CODE(registry_->getLastPublished("x"), ErrorCode::InvalidTimestamp);
}

// ============================================================================
// Unit Test 3: Detailed Info
// ============================================================================

TEST_F(RegistryClientTest, DetailedInfoMergesPackumentAndLatestVersion) {
    state_->enqueue(makeResponse(200, kLodashPackument));

    PackageDetails details = registry_->getDetailedInfo("lodash");
    EXPECT_TRUE(details.error.empty());
    EXPECT_EQ(details.description, "Lodash modular utilities.");
    EXPECT_EQ(details.keywords, (std::vector<std::string>{"modules", "stdlib", "util"}));
    EXPECT_FALSE(details.deprecated);
    EXPECT_EQ(details.repository, "git+https://github.com/lodash/lodash.git");
    EXPECT_EQ(details.homepage, "https://lodash.com/");
    EXPECT_EQ(details.license, "MIT");
    EXPECT_EQ(details.version, "4.17.21");
    EXPECT_EQ(details.publishedAt, "2021-02-20T15:42:16.891Z");
}

TEST_F(RegistryClientTest, DetailedInfoReportsDeprecation) {
    state_->enqueue(makeResponse(200, R"({
        "name": "request",
        "dist-tags": {"latest": "2.88.2"},
        "versions": {"2.88.2": {"deprecated": "request has been deprecated", "license": "Apache-2.0"}}
    })"));

    PackageDetails details = registry_->getDetailedInfo("request");
    EXPECT_TRUE(details.deprecated);
    EXPECT_EQ(details.deprecationMessage, "request has been deprecated");
    EXPECT_EQ(details.description, "No description available");
    EXPECT_EQ(details.license, "Apache-2.0");
    EXPECT_TRUE(details.publishedAt.empty());
}

TEST_F(RegistryClientTest, DetailedInfoFailureIsReportedInline) {
    state_->enqueue(makeResponse(404));

    PackageDetails details = registry_->getDetailedInfo("missing");
    EXPECT_EQ(details.description, "Error fetching package info");
    EXPECT_FALSE(details.error.empty());
}

// ============================================================================
// Unit Test 4: Helpers
// ============================================================================

TEST(RegistryHelpers, EncodeComponent) {
    EXPECT_EQ(RegistryClient::encodeComponent("lodash"), "lodash");
    EXPECT_EQ(RegistryClient::encodeComponent("@types/node"), "%40types%2Fnode");
    EXPECT_EQ(RegistryClient::encodeComponent("author:alice smith"), "author%3Aalice%20smith");
    EXPECT_EQ(RegistryClient::encodeComponent("a~b*c"), "a~b*c");
}

TEST(RegistryHelpers, LatestVersionOf) {
    using Json = nlohmann::ordered_json;

    EXPECT_EQ(latestVersionOf(Json::parse(R"({"dist-tags":{"latest":"2.0.0"},"versions":{"1.0.0":{}}})")),
              "2.0.0");
    EXPECT_EQ(latestVersionOf(Json::parse(R"({"versions":{"1.0.0":{},"1.1.0":{},"1.0.5":{}}})")),
              "1.0.5");
    EXPECT_EQ(latestVersionOf(Json::parse(R"({"name":"x"})")), "");
    EXPECT_EQ(latestVersionOf(Json::array()), "");
}

TEST(RegistryHelpers, TrailingSlashIsTrimmed) {
    RegistryClient registry(nullptr, "https://registry.npmjs.org///");
    EXPECT_EQ(registry.registryBase(), "https://registry.npmjs.org");
}
