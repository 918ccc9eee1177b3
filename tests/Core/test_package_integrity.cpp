/**
 * @file test_package_integrity.cpp
 * @brief Unit tests for package trust scoring and supply chain scans
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * Tests cover:
 * - Name, metadata, publisher, age and download heuristics
 * - Known vulnerability entries
 * - Verification failures
 * - Tarball digest checks
 * - Manifest scans and recommendations
 */

#include <Warden/Core/PackageIntegrity.hpp>
#include <Warden/Core/Crypto.hpp>
#include <Warden/Core/TimeUtils.hpp>
#include "FakeTransport.hpp"
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace Warden;
using namespace Warden::Integrity;
using namespace Warden::Network;
using namespace Warden::Security;
using namespace Warden::Testing;
using Json = nlohmann::json;

namespace {

const char* kRegistry = "https://registry.npmjs.org";
const char* kDownloads = "https://api.npmjs.org/downloads/point/last-month";
const char* kSearch = "https://registry.npmjs.org/-/v1/search";

WallTime fixedNow() {
    return parseIso8601("2024-06-01T00:00:00.000Z").value();
}

std::string daysAgo(int days) {
    return formatIso8601(fixedNow() - std::chrono::hours(24 * days));
}

/// Metadata that passes every heuristic
Json healthyPackument(const std::string& name) {
    return Json{
        {"name", name},
        {"description", "A small and well documented helper"},
        {"repository", {{"type", "git"}, {"url", "git+https://github.com/example/" + name + ".git"}}},
        {"license", "MIT"},
        {"author", {{"name", "sindresorhus"}}},
        {"time", {{"created", "2020-01-01T00:00:00.000Z"}, {"1.0.0", "2020-01-01T00:00:00.000Z"}}},
        {"versions", {{"1.0.0", Json::object()}}},
    };
}

const IntegrityIssue* findIssue(const TrustAssessment& result, const std::string& type) {
    auto it = std::find_if(result.issues.begin(), result.issues.end(),
                           [&type](const IntegrityIssue& issue) { return issue.type == type; });
    return it == result.issues.end() ? nullptr : &*it;
}

} // namespace

class PackageIntegrityTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeTransportState>();
        HttpClientConfig config;
        config.retryBaseDelay = Milliseconds(1);
        config.maxRetries = 1;
        client_ = std::make_shared<SecureHttpClient>(
            config, std::make_unique<FakeTransport>(state_),
            std::make_shared<RateLimiter>(RateLimitConfig{1000, Milliseconds(60000)}),
            InputValidator(PackageIntegrityChecker::validatorPolicy()), events_);
    }

    std::shared_ptr<PackageIntegrityChecker> makeChecker(IntegrityConfig config = IntegrityConfig{}) {
        return std::make_shared<PackageIntegrityChecker>(std::move(config), client_, events_,
                                                         []() { return fixedNow(); });
    }

    void servePackument(const std::string& name, const Json& packument) {
        state_->route(std::string(kRegistry) + "/" + name, makeResponse(200, packument.dump()));
    }

    void serveDownloads(const std::string& name, uint64_t downloads) {
        state_->route(std::string(kDownloads) + "/" + name,
                      makeResponse(200, Json{{"downloads", downloads}}.dump()));
    }

    std::shared_ptr<FakeTransportState> state_;
    SecurityEventLog events_;
    std::shared_ptr<SecureHttpClient> client_;
};

// ============================================================================
// Unit Test 1: Package Names
// ============================================================================

TEST(PackageNameHeuristics, SuspiciousPatterns) {
    for (const char* name : {"hello", "foo-bar", "pkg12345", "a-b", "admin-tools", "SUDO-helper",
                             "node-eval", "payload-x", "crypto-miner", "cryptomining-kit"}) {
        EXPECT_TRUE(PackageIntegrityChecker::isSuspiciousPackageName(name)) << name;
    }
}

TEST(PackageNameHeuristics, OrdinaryNames) {
    for (const char* name : {"lodash", "react", "left-pad", "express", "ab-c", "vue", "pkg123"}) {
        EXPECT_FALSE(PackageIntegrityChecker::isSuspiciousPackageName(name)) << name;
    }
}

TEST(PackageHash, Sha256Hex) {
    auto hash = PackageIntegrityChecker::generatePackageHash(Crypto::asBytes("abc"));
    ASSERT_TRUE(hash.isSuccess());
    EXPECT_EQ(hash.value(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(PackageIntegrityPolicy, AdmitsDownloadsHost) {
    auto hosts = PackageIntegrityChecker::validatorPolicy().allowedHosts;
    EXPECT_NE(std::find(hosts.begin(), hosts.end(), "api.npmjs.org"), hosts.end());
    EXPECT_NE(std::find(hosts.begin(), hosts.end(), "registry.npmjs.org"), hosts.end());
}

// ============================================================================
// Unit Test 2: Metadata Heuristics
// ============================================================================

TEST_F(PackageIntegrityTest, HealthyPackageIsSafe) {
    servePackument("left-pad", healthyPackument("left-pad"));
    serveDownloads("left-pad", 5000);
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("left-pad");
    EXPECT_TRUE(result.safe);
    EXPECT_TRUE(result.issues.empty());
    EXPECT_EQ(result.packageName, "left-pad");
    EXPECT_EQ(result.version, "latest");
    EXPECT_DOUBLE_EQ(result.publisherScore, 1.0);
    EXPECT_EQ(state_->countRequests(kSearch), 0u);
    EXPECT_EQ(state_->countRequests(kDownloads), 1u);
    EXPECT_EQ(events_.countEvents(EventType::PackageIntegrityFailure), 0u);
}

TEST_F(PackageIntegrityTest, KnownVulnerabilityIsReported) {
    servePackument("left-pad", healthyPackument("left-pad"));
    auto checker = makeChecker();
    checker->addKnownVulnerability("left-pad", KnownVulnerability{
        Severity::Critical, "Prototype pollution", "CVE-2099-0001", "2024-01-15"});

    TrustAssessment result = checker->verifyPackage("left-pad", "1.3.0");
    EXPECT_FALSE(result.safe);
    EXPECT_TRUE(result.hasSeverity(Severity::Critical));
    EXPECT_EQ(result.version, "1.3.0");

    const IntegrityIssue* issue = findIssue(result, IssueType::KnownVulnerability);
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->message, "Prototype pollution");
    EXPECT_EQ(issue->cve, "CVE-2099-0001");
    EXPECT_EQ(issue->publishedDate, "2024-01-15");
    EXPECT_EQ(events_.countEvents(EventType::PackageIntegrityFailure), 1u);
}

TEST_F(PackageIntegrityTest, SuspiciousKeywordsAreHighSeverity) {
    Json packument = healthyPackument("toolkit");
    packument["keywords"] = {"utility", "Exploit-kit", 42, "hack"};
    servePackument("toolkit", packument);
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("toolkit");
    EXPECT_FALSE(result.safe);
    const IntegrityIssue* issue = findIssue(result, IssueType::SuspiciousKeywords);
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->severity, Severity::High);
    EXPECT_EQ(issue->message, "Package contains suspicious keywords: Exploit-kit, hack");
}

TEST_F(PackageIntegrityTest, SuspiciousNameIsMedium) {
    servePackument("crypto-miner", healthyPackument("crypto-miner"));
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("crypto-miner");
    const IntegrityIssue* issue = findIssue(result, IssueType::SuspiciousName);
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->severity, Severity::Medium);
    EXPECT_TRUE(result.safe);
}

TEST_F(PackageIntegrityTest, MissingMetadataIsLowSeverity) {
    servePackument("bare-pkg", Json{{"name", "bare-pkg"}, {"description", "short"},
                                    {"author", {{"name", "Google"}}}});
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("bare-pkg");
    EXPECT_TRUE(result.safe);
    ASSERT_EQ(result.issues.size(), 3u);
    EXPECT_EQ(result.issues[0].type, IssueType::MissingDescription);
    EXPECT_EQ(result.issues[1].type, IssueType::NoRepository);
    EXPECT_EQ(result.issues[2].type, IssueType::NoLicense);
    for (const auto& issue : result.issues) {
        EXPECT_EQ(issue.severity, Severity::Low);
    }
    EXPECT_DOUBLE_EQ(result.publisherScore, 1.0);
}

TEST_F(PackageIntegrityTest, StringRepositoryAndLicenseObjectAreAccepted) {
    Json packument = healthyPackument("alt-pkg");
    packument["repository"] = "github:example/alt-pkg";
    packument["license"] = {{"type", "ISC"}};
    servePackument("alt-pkg", packument);
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("alt-pkg");
    EXPECT_EQ(findIssue(result, IssueType::NoRepository), nullptr);
    EXPECT_EQ(findIssue(result, IssueType::NoLicense), nullptr);
}

// ============================================================================
// Unit Test 3: Publisher Trust
// ============================================================================

TEST_F(PackageIntegrityTest, MissingAuthorScoresZero) {
    Json packument = healthyPackument("anon-pkg");
    packument.erase("author");
    servePackument("anon-pkg", packument);
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("anon-pkg");
    EXPECT_DOUBLE_EQ(result.publisherScore, 0.0);
    const IntegrityIssue* issue = findIssue(result, IssueType::NoAuthor);
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->severity, Severity::Medium);
    EXPECT_TRUE(result.safe);
}

TEST_F(PackageIntegrityTest, MaintainerStandsInForAuthor) {
    Json packument = healthyPackument("maint-pkg");
    packument.erase("author");
    packument["maintainers"] = Json::array({Json{{"name", "facebook"}}});
    servePackument("maint-pkg", packument);
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("maint-pkg");
    EXPECT_EQ(findIssue(result, IssueType::NoAuthor), nullptr);
    EXPECT_DOUBLE_EQ(result.publisherScore, 1.0);
}

TEST_F(PackageIntegrityTest, UnknownPublisherWithoutHistory) {
    Json packument = healthyPackument("fresh-pkg");
    packument["author"] = {{"name", "someone new"}};
    servePackument("fresh-pkg", packument);
    state_->route(kSearch, makeResponse(200, R"({"objects":[]})"));
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("fresh-pkg");
    EXPECT_DOUBLE_EQ(result.publisherScore, 0.1);
    const IntegrityIssue* issue = findIssue(result, IssueType::UntrustedPublisher);
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->message, "Publisher \"someone new\" has low trust score");

    ASSERT_EQ(state_->countRequests(kSearch), 1u);
    auto search = std::find_if(state_->requests.begin(), state_->requests.end(),
        [](const HttpRequest& request) { return request.url.rfind(kSearch, 0) == 0; });
    EXPECT_EQ(search->url, std::string(kSearch) + "?text=author%3Asomeone%20new&size=20");
}

TEST_F(PackageIntegrityTest, PublisherScoreAveragesHistory) {
    state_->route(kSearch, makeResponse(200, Json{
        {"objects", Json::array({
            Json{{"package", {
                {"date", "2020-01-01T00:00:00.000Z"},
                {"links", {{"repository", "https://github.com/alice/one"}}},
                {"description", "A long enough description for credit"},
            }}},
            Json{{"package", {
                {"date", daysAgo(0)},
                {"description", "short"},
            }}},
        })},
    }.dump()));
    auto checker = makeChecker();

    EXPECT_NEAR(checker->calculatePublisherTrustScore("alice"), 0.175, 1e-9);
}

TEST_F(PackageIntegrityTest, PublisherLookupFailureScoresLow) {
    state_->route(kSearch, makeResponse(500));
    auto checker = makeChecker();

    EXPECT_DOUBLE_EQ(checker->calculatePublisherTrustScore("alice"), 0.2);
}

TEST_F(PackageIntegrityTest, TrustedPublishersIgnoreCase) {
    IntegrityConfig config;
    config.trustedPublishers = {"Acme"};
    Json packument = healthyPackument("acme-pkg");
    packument["author"] = {{"name", "ACME"}};
    servePackument("acme-pkg", packument);
    auto checker = makeChecker(config);

    TrustAssessment result = checker->verifyPackage("acme-pkg");
    EXPECT_DOUBLE_EQ(result.publisherScore, 1.0);
    EXPECT_EQ(state_->countRequests(kSearch), 0u);
}

// ============================================================================
// Unit Test 4: Age and Release Patterns
// ============================================================================

TEST_F(PackageIntegrityTest, VeryNewPackage) {
    Json packument = healthyPackument("new-pkg");
    packument["time"]["created"] = daysAgo(3);
    servePackument("new-pkg", packument);
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("new-pkg");
    const IntegrityIssue* issue = findIssue(result, IssueType::VeryNewPackage);
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->message, "Package is very new (3 days old)");
    EXPECT_EQ(issue->severity, Severity::Medium);
}

TEST_F(PackageIntegrityTest, InvalidCreationDateSkipsAgeCheck) {
    Json packument = healthyPackument("odd-pkg");
    packument["time"]["created"] = "yesterday";
    servePackument("odd-pkg", packument);
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("odd-pkg");
    EXPECT_EQ(findIssue(result, IssueType::VeryNewPackage), nullptr);
}

TEST_F(PackageIntegrityTest, VersionBombing) {
    Json packument = healthyPackument("busy-pkg");
    for (int i = 0; i < 60; ++i) {
        const std::string version = "1.0." + std::to_string(i);
        packument["versions"][version] = Json::object();
        packument["time"][version] = i < 15 ? daysAgo(10) : "2020-06-01T00:00:00.000Z";
    }
    servePackument("busy-pkg", packument);
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("busy-pkg");
    EXPECT_FALSE(result.safe);
    const IntegrityIssue* issue = findIssue(result, IssueType::VersionBombing);
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->severity, Severity::High);
    EXPECT_EQ(issue->message, "Too many versions published recently (15 in 30 days)");
}

TEST_F(PackageIntegrityTest, FewVersionsAreNotCounted) {
    Json packument = healthyPackument("small-pkg");
    for (int i = 0; i < 49; ++i) {
        const std::string version = "2.0." + std::to_string(i);
        packument["versions"][version] = Json::object();
        packument["time"][version] = daysAgo(1);
    }
    servePackument("small-pkg", packument);
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("small-pkg");
    EXPECT_EQ(findIssue(result, IssueType::VersionBombing), nullptr);
}

TEST_F(PackageIntegrityTest, DownloadSpikeOnNewPackage) {
    Json packument = healthyPackument("spiky-pkg");
    packument["time"]["created"] = daysAgo(10);
    servePackument("spiky-pkg", packument);
    serveDownloads("spiky-pkg", 500000);
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("spiky-pkg");
    const IntegrityIssue* issue = findIssue(result, IssueType::SuspiciousDownloadPattern);
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->severity, Severity::Medium);
    EXPECT_EQ(findIssue(result, IssueType::VeryNewPackage), nullptr);
}

TEST_F(PackageIntegrityTest, PopularOldPackageIsFine) {
    servePackument("react", healthyPackument("react"));
    serveDownloads("react", 90000000);
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("react");
    EXPECT_EQ(findIssue(result, IssueType::SuspiciousDownloadPattern), nullptr);
    EXPECT_TRUE(result.safe);
}

// ============================================================================
// Unit Test 5: Verification Failures
// ============================================================================

TEST_F(PackageIntegrityTest, FetchFailureIsUnsafe) {
    state_->route(std::string(kRegistry) + "/ghost-pkg", makeResponse(404));
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("ghost-pkg");
    EXPECT_FALSE(result.safe);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].type, IssueType::VerificationError);
    EXPECT_EQ(result.issues[0].severity, Severity::High);
    EXPECT_EQ(result.issues[0].message.rfind("Failed to verify package: ", 0), 0u);
    EXPECT_EQ(events_.countEvents(EventType::PackageIntegrityFailure), 1u);
}

TEST_F(PackageIntegrityTest, InvalidNameIsNotFetched) {
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("evil; rm -rf /");
    EXPECT_FALSE(result.safe);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].type, IssueType::VerificationError);
    EXPECT_TRUE(state_->requests.empty());
}

TEST_F(PackageIntegrityTest, MetadataWithoutNameIsRejected) {
    servePackument("nameless", Json{{"description", "no name field here"}});
    auto checker = makeChecker();

    TrustAssessment result = checker->verifyPackage("nameless");
    EXPECT_FALSE(result.safe);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].message,
              "Failed to verify package: Invalid package metadata received");
}

// ============================================================================
// Unit Test 6: Tarball Digests
// ============================================================================

class TarballIntegrityTest : public PackageIntegrityTest {
protected:
    void SetUp() override {
        PackageIntegrityTest::SetUp();
        state_->route(kTarballUrl, makeResponse(200, kTarball));
    }

    static std::string sriFor(const std::string& content) {
        auto digest = Crypto::HashEngine::sha512(Crypto::asBytes(content));
        return "sha512-" + Crypto::toBase64(ByteSpan(digest.value().data(), digest.value().size()));
    }

    static constexpr const char* kTarballUrl = "https://registry.npmjs.org/left-pad/-/left-pad-1.3.0.tgz";
    static constexpr const char* kTarball = "package/index.js contents";
};

TEST_F(TarballIntegrityTest, Sha512IntegrityMatches) {
    auto checker = makeChecker();

    auto result = checker->verifyTarballIntegrity("left-pad", "1.3.0", sriFor(kTarball));
    ASSERT_TRUE(result.isSuccess()) << result.errorInfo().message;
    ASSERT_EQ(state_->requests.size(), 1u);
    EXPECT_EQ(state_->requests[0].url, kTarballUrl);
    EXPECT_EQ(state_->requests[0].headers.at("Accept"), "application/octet-stream");
    EXPECT_EQ(events_.countEvents(EventType::TarballIntegrityFailure), 0u);
}

TEST_F(TarballIntegrityTest, Sha256HexMatches) {
    auto checker = makeChecker();
    auto hex = PackageIntegrityChecker::generatePackageHash(Crypto::asBytes(kTarball));
    ASSERT_TRUE(hex.isSuccess());

    EXPECT_TRUE(checker->verifyTarballIntegrity("left-pad", "1.3.0", hex.value()).isSuccess());
}

TEST_F(TarballIntegrityTest, MismatchIsRecorded) {
    auto checker = makeChecker();

    auto result = checker->verifyTarballIntegrity("left-pad", "1.3.0", sriFor("other contents"));
    EXPECT_ERROR_CODE(result, ErrorCode::HashMismatch);
    if (result.isFailure()) {
        EXPECT_EQ(result.errorInfo().message, "Package integrity check failed");
    }
    EXPECT_EQ(events_.countEvents(EventType::TarballIntegrityFailure), 1u);
}

TEST_F(TarballIntegrityTest, MalformedDigests) {
    auto checker = makeChecker();

    EXPECT_ERROR_CODE(checker->verifyTarballIntegrity("left-pad", "1.3.0", "sha512-!!!"),
                      ErrorCode::InvalidFormat);
    EXPECT_ERROR_CODE(checker->verifyTarballIntegrity("left-pad", "1.3.0", "sha512-YWJj"),
                      ErrorCode::InvalidFormat);
    EXPECT_ERROR_CODE(checker->verifyTarballIntegrity("left-pad", "1.3.0", "abc123"),
                      ErrorCode::InvalidFormat);
}

TEST_F(TarballIntegrityTest, InvalidVersionIsNotFetched) {
    auto checker = makeChecker();

    EXPECT_ERROR_CODE(checker->verifyTarballIntegrity("left-pad", "1.3.0/../../x", sriFor(kTarball)),
                      ErrorCode::InvalidFormat);
    EXPECT_ERROR_CODE(checker->verifyTarballIntegrity("left-pad", "", sriFor(kTarball)),
                      ErrorCode::InvalidFormat);
    EXPECT_TRUE(state_->requests.empty());
}

TEST_F(TarballIntegrityTest, DownloadFailureIsRecorded) {
    state_->route("https://registry.npmjs.org/left-pad/-/left-pad-9.9.9.tgz", makeResponse(404));
    auto checker = makeChecker();

    EXPECT_ERROR_CODE(checker->verifyTarballIntegrity("left-pad", "9.9.9", sriFor(kTarball)),
                      ErrorCode::HttpStatusError);
    EXPECT_EQ(events_.countEvents(EventType::TarballIntegrityFailure), 1u);
}

// ============================================================================
// Unit Test 7: Supply Chain Scan
// ============================================================================

TEST_F(PackageIntegrityTest, ScanReportsFlaggedDependencies) {
    Json shady = healthyPackument("shady");
    shady["keywords"] = Json::array({"malware"});
    servePackument("left-pad", healthyPackument("left-pad"));
    servePackument("shady", shady);
    servePackument("jest", healthyPackument("jest"));

    TempDirectory project;
    auto manifest = project.writeFile("package.json", R"({
        "name": "my-app",
        "dependencies": {"left-pad": "^1.3.0", "shady": "1.0.0"},
        "devDependencies": {"left-pad": "1.3.1", "jest": "^29.0.0"}
    })");

    SupplyChainScanner scanner(makeChecker());
    ScanReport report = scanner.scanProject(manifest);

    EXPECT_FALSE(report.safe);
    EXPECT_TRUE(report.error.empty());
    EXPECT_EQ(report.scannedPackages, 3u);
    ASSERT_EQ(report.packages.size(), 1u);
    EXPECT_EQ(report.packages[0].name, "shady");
    EXPECT_EQ(report.packages[0].version, "1.0.0");
    EXPECT_FALSE(report.packages[0].issues.empty());

    const std::vector<std::string> expected = {
        "HIGH: Update or replace packages with high-severity issues",
        "Regular security scans recommended",
        "Consider using package-lock.json for dependency integrity",
    };
    EXPECT_EQ(report.recommendations, expected);
}

TEST_F(PackageIntegrityTest, ScanWithoutDependencies) {
    TempDirectory project;
    auto manifest = project.writeFile("package.json", R"({"name": "empty-app"})");

    SupplyChainScanner scanner(makeChecker());
    ScanReport report = scanner.scanProject(manifest);

    EXPECT_TRUE(report.safe);
    EXPECT_EQ(report.scannedPackages, 0u);
    EXPECT_EQ(report.recommendations, std::vector<std::string>{"All scanned packages appear safe"});
    EXPECT_TRUE(state_->requests.empty());
}

TEST_F(PackageIntegrityTest, ScanRejectsBadManifests) {
    TempDirectory project;
    SupplyChainScanner scanner(makeChecker());

    auto invalid = project.writeFile("package.json", "{ \"dependencies\": ");
    ScanReport report = scanner.scanProject(invalid);
    EXPECT_FALSE(report.safe);
    EXPECT_EQ(report.error, "Failed to scan project: Invalid manifest format");

    ScanReport missing = scanner.scanProject(project / "absent.json");
    EXPECT_FALSE(missing.safe);
    EXPECT_EQ(missing.error.rfind("Failed to scan project: ", 0), 0u);

    IntegrityConfig config;
    config.maxManifestBytes = 16;
    SupplyChainScanner capped(makeChecker(config));
    auto large = project.writeFile("large.json", R"({"dependencies": {"left-pad": "1.0.0"}})");
    EXPECT_FALSE(capped.scanProject(large).safe);
}

TEST(ScanRecommendations, CriticalBeforeHigh) {
    ScanReport report;
    PackageReport critical{"a", "1.0.0", {}};
    critical.issues.push_back(IntegrityIssue{IssueType::KnownVulnerability, Severity::Critical,
                                             "bad", "", ""});
    PackageReport high{"b", "1.0.0", {}};
    high.issues.push_back(IntegrityIssue{IssueType::VersionBombing, Severity::High, "busy", "", ""});
    report.packages = {high, critical};

    SupplyChainScanner::generateRecommendations(report);
    ASSERT_EQ(report.recommendations.size(), 4u);
    EXPECT_EQ(report.recommendations[0],
              "CRITICAL: Review and replace packages with critical security issues");
    EXPECT_EQ(report.recommendations[1], "HIGH: Update or replace packages with high-severity issues");
}

TEST(ScanRecommendations, MediumOnlyGetsGeneralAdvice) {
    ScanReport report;
    PackageReport medium{"c", "2.0.0", {}};
    medium.issues.push_back(IntegrityIssue{IssueType::NoAuthor, Severity::Medium, "anon", "", ""});
    report.packages = {medium};

    SupplyChainScanner::generateRecommendations(report);
    ASSERT_EQ(report.recommendations.size(), 2u);
    EXPECT_EQ(report.recommendations[0], "Regular security scans recommended");
}
