/**
 * @file PackageIntegrityChecker.cpp
 * @brief Registry metadata heuristics and tarball verification
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/PackageIntegrity.hpp>
#include <Warden/Core/Crypto.hpp>
#include <Warden/Core/ErrorHandler.hpp>
#include <Warden/Core/Logger.hpp>
#include <Warden/Core/RegistryClient.hpp>
#include <Warden/Core/TimeUtils.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <map>
#include <mutex>
#include <optional>
#include <regex>

namespace Warden::Integrity {

namespace {

using Json = nlohmann::ordered_json;

constexpr std::array<std::string_view, 5> kSuspiciousKeywords = {
    "hack", "crack", "bypass", "exploit", "malware",
};

constexpr std::string_view kSriSha512Prefix = "sha512-";

std::string toLower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string stringField(const Json& object, const char* key) {
    if (object.is_object()) {
        auto it = object.find(key);
        if (it != object.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

IntegrityIssue makeIssue(const char* type, Severity severity, std::string message) {
    IntegrityIssue issue;
    issue.type = type;
    issue.severity = severity;
    issue.message = std::move(message);
    return issue;
}

/// Days from a registry timestamp to now; nullopt when absent or malformed
std::optional<double> ageInDays(const Json& timestamp, WallTime now) {
    if (!timestamp.is_string()) {
        return std::nullopt;
    }
    auto parsed = parseIso8601(timestamp.get<std::string>());
    if (parsed.isFailure()) {
        return std::nullopt;
    }
    return daysBetween(parsed.value(), now);
}

const Json* member(const Json& object, const char* key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    return it == object.end() ? nullptr : &*it;
}

/// author.name, else maintainers[0].name
std::string publisherOf(const Json& metadata) {
    if (const Json* author = member(metadata, "author")) {
        std::string name = stringField(*author, "name");
        if (!name.empty()) {
            return name;
        }
    }
    if (const Json* maintainers = member(metadata, "maintainers")) {
        if (maintainers->is_array() && !maintainers->empty()) {
            return stringField(maintainers->front(), "name");
        }
    }
    return {};
}

bool hasRepository(const Json& metadata) {
    const Json* repository = member(metadata, "repository");
    if (repository == nullptr) {
        return false;
    }
    if (repository->is_string()) {
        return !repository->get<std::string>().empty();
    }
    return !stringField(*repository, "url").empty();
}

bool hasLicense(const Json& metadata) {
    const Json* license = member(metadata, "license");
    if (license == nullptr) {
        return false;
    }
    if (license->is_string()) {
        return !license->get<std::string>().empty();
    }
    return license->is_object() && !license->empty();
}

/// Registry versions are semver strings; nothing else reaches a URL
bool isValidVersion(std::string_view version) {
    if (version.empty() || version.size() > 64) {
        return false;
    }
    if (!std::isalnum(static_cast<unsigned char>(version.front()))) {
        return false;
    }
    return std::all_of(version.begin(), version.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '-' || c == '+';
    });
}

} // anonymous namespace

bool TrustAssessment::hasSeverity(Severity severity) const noexcept {
    return std::any_of(issues.begin(), issues.end(),
                       [severity](const IntegrityIssue& issue) { return issue.severity == severity; });
}

// ============================================================================
// PackageIntegrityChecker::Impl
// ============================================================================

class PackageIntegrityChecker::Impl {
public:
    Impl(IntegrityConfig config,
         std::shared_ptr<Network::SecureHttpClient> client,
         Security::SecurityEventLog& events,
         WallClockFunction now)
        : m_config(std::move(config))
        , m_client(client ? std::move(client)
                          : std::make_shared<Network::SecureHttpClient>(
                                Network::HttpClientConfig{}, nullptr, nullptr,
                                Security::InputValidator(validatorPolicy()), events))
        , m_registry(m_client, m_config.registryBase)
        , m_events(events)
        , m_now(now ? std::move(now) : []() { return WallClock::now(); }) {
        for (auto& publisher : m_config.trustedPublishers) {
            publisher = toLower(publisher);
        }
        while (!m_config.downloadsBase.empty() && m_config.downloadsBase.back() == '/') {
            m_config.downloadsBase.pop_back();
        }
    }

    TrustAssessment verifyPackage(std::string_view packageName, std::string_view version) {
        TrustAssessment result;
        result.packageName = std::string(packageName);
        result.version = std::string(version);

        auto name = m_client->validator().sanitizePackageName(packageName);
        if (name.isFailure()) {
            addVerificationError(result, name.errorInfo().message);
            finish(result);
            return result;
        }

        auto metadata = m_registry.getPackageInfo(name.value().view());
        if (metadata.isFailure()) {
            addVerificationError(result, metadata.errorInfo().message);
            finish(result);
            return result;
        }
        const Json& packument = metadata.value();
        if (!packument.is_object() || stringField(packument, "name").empty()) {
            addVerificationError(result, "Invalid package metadata received");
            finish(result);
            return result;
        }

        const WallTime now = m_now();
        checkVulnerabilities(name.value().str(), result);
        checkMetadata(packument, result);
        checkPublisher(packument, result);
        checkAge(packument, now, result);
        checkDownloads(name.value().str(), packument, now, result);

        finish(result);
        return result;
    }

    void addKnownVulnerability(const std::string& packageName, KnownVulnerability vulnerability) {
        IntegrityIssue issue = makeIssue(IssueType::KnownVulnerability, vulnerability.severity,
                                         std::move(vulnerability.message));
        issue.cve = std::move(vulnerability.cve);
        issue.publishedDate = std::move(vulnerability.publishedDate);

        std::lock_guard<std::mutex> lock(m_mutex);
        m_vulnerabilities[packageName].push_back(std::move(issue));
    }

    double calculatePublisherTrustScore(std::string_view publisher) {
        const std::string url = m_registry.registryBase() + "/-/v1/search?text=" +
                                Network::RegistryClient::encodeComponent(
                                    "author:" + std::string(publisher)) +
                                "&size=" + std::to_string(m_config.publisherSearchSize);

        auto response = m_client->getJson(url);
        if (response.isFailure()) {
            WARDEN_LOG_DEBUG_F("Publisher lookup failed: %s",
                               response.errorInfo().message.c_str());
            return 0.2;
        }

        const Json* objects = member(response.value(), "objects");
        if (objects == nullptr || !objects->is_array() || objects->empty()) {
            return 0.1;
        }

        const WallTime now = m_now();
        const size_t count = std::min(objects->size(), m_config.publisherSearchSize);
        double score = 0.0;

        for (size_t i = 0; i < count; ++i) {
            const Json* package = member((*objects)[i], "package");
            if (package == nullptr) {
                continue;
            }

            if (const Json* date = member(*package, "date")) {
                if (auto days = ageInDays(*date, now)) {
                    score += std::clamp(*days / 365.0, 0.0, 2.0) * 0.1;
                }
            }

            if (const Json* links = member(*package, "links")) {
                if (!stringField(*links, "repository").empty()) {
                    score += 0.1;
                }
            }

            if (stringField(*package, "description").size() > 20) {
                score += 0.05;
            }
        }

        return std::min(score / static_cast<double>(count), 1.0);
    }

    Result<void> verifyTarballIntegrity(std::string_view packageName,
                                        std::string_view version,
                                        std::string_view expectedHash) {
        auto name = m_client->validator().sanitizePackageName(packageName);
        if (name.isFailure()) {
            return name.errorInfo();
        }
        if (!isValidVersion(version)) {
            return makeError(ErrorCode::InvalidFormat, "Invalid version format", "version");
        }

        const std::string& fullName = name.value().str();
        const size_t slash = fullName.rfind('/');
        const std::string baseName = slash == std::string::npos ? fullName : fullName.substr(slash + 1);
        const std::string url = m_registry.registryBase() + "/" + fullName + "/-/" + baseName +
                                "-" + std::string(version) + ".tgz";

        Network::RequestOptions options;
        options.headers["Accept"] = "application/octet-stream";

        auto response = m_client->request(url, options);
        if (response.isFailure()) {
            recordTarballFailure(fullName, version, response.errorInfo().message);
            return response.errorInfo();
        }
        if (!response.value().isSuccess()) {
            const std::string reason = "HTTP " + std::to_string(response.value().statusCode);
            recordTarballFailure(fullName, version, reason);
            return makeError(ErrorCode::HttpStatusError, "Failed to download tarball: " + reason);
        }

        // SRI strings carry base64 SHA-512; anything else is hex SHA-256
        const bool sri = expectedHash.rfind(kSriSha512Prefix, 0) == 0;
        const Crypto::HashAlgorithm algorithm =
            sri ? Crypto::HashAlgorithm::SHA512 : Crypto::HashAlgorithm::SHA256;

        auto expected = sri ? Crypto::fromBase64(expectedHash.substr(kSriSha512Prefix.size()))
                            : Crypto::fromHex(expectedHash);
        if (expected.isFailure() ||
            expected.value().size() != Crypto::HashEngine::getHashSize(algorithm)) {
            return makeError(ErrorCode::InvalidFormat, "Invalid integrity string", "expectedHash");
        }

        Crypto::HashEngine engine(algorithm);
        auto actual = engine.hash(Crypto::asBytes(response.value().body));
        if (actual.isFailure()) {
            return actual.errorInfo();
        }
        const bool matches = Crypto::constantTimeCompare(expected.value(), actual.value());

        if (!matches) {
            recordTarballFailure(fullName, version, "digest mismatch");
            return makeError(ErrorCode::HashMismatch, "Package integrity check failed");
        }

        WARDEN_LOG_DEBUG_F("Tarball digest verified for %s@%s", fullName.c_str(),
                           std::string(version).c_str());
        return {};
    }

    IntegrityConfig m_config;
    std::shared_ptr<Network::SecureHttpClient> m_client;
    Network::RegistryClient m_registry;
    Security::SecurityEventLog& m_events;
    WallClockFunction m_now;

    std::mutex m_mutex;
    std::map<std::string, std::vector<IntegrityIssue>> m_vulnerabilities;

private:
    static void addVerificationError(TrustAssessment& result, const std::string& reason) {
        result.issues.push_back(makeIssue(IssueType::VerificationError, Severity::High,
                                          "Failed to verify package: " + reason));
    }

    void finish(TrustAssessment& result) {
        result.safe = std::none_of(result.issues.begin(), result.issues.end(),
                                   [](const IntegrityIssue& issue) {
                                       return isBlockingSeverity(issue.severity);
                                   });
        if (!result.safe) {
            nlohmann::json severities = nlohmann::json::array();
            for (const auto& issue : result.issues) {
                severities.push_back(severityToString(issue.severity));
            }
            m_events.logEvent(Security::EventType::PackageIntegrityFailure,
                              {{"package", result.packageName},
                               {"issues", result.issues.size()},
                               {"severities", severities}});
            WARDEN_LOG_WARNING_F("Package %s flagged with %zu issues",
                                 result.packageName.c_str(), result.issues.size());
        }
    }

    void recordTarballFailure(const std::string& name, std::string_view version,
                              const std::string& reason) {
        m_events.logEvent(Security::EventType::TarballIntegrityFailure,
                          {{"package", name}, {"version", std::string(version)}, {"error", reason}});
    }

    void checkVulnerabilities(const std::string& name, TrustAssessment& result) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_vulnerabilities.find(name);
        if (it != m_vulnerabilities.end()) {
            result.issues.insert(result.issues.end(), it->second.begin(), it->second.end());
        }
    }

    void checkMetadata(const Json& metadata, TrustAssessment& result) {
        if (isSuspiciousPackageName(stringField(metadata, "name"))) {
            result.issues.push_back(makeIssue(IssueType::SuspiciousName, Severity::Medium,
                                              "Package name contains suspicious patterns"));
        }

        if (stringField(metadata, "description").size() < 10) {
            result.issues.push_back(makeIssue(IssueType::MissingDescription, Severity::Low,
                                              "Package lacks proper description"));
        }

        const Json* keywords = member(metadata, "keywords");
        if (keywords != nullptr && keywords->is_array()) {
            std::string found;
            for (const auto& keyword : *keywords) {
                if (!keyword.is_string()) {
                    continue;
                }
                const std::string lowered = toLower(keyword.get<std::string>());
                const bool suspicious = std::any_of(
                    kSuspiciousKeywords.begin(), kSuspiciousKeywords.end(),
                    [&lowered](std::string_view term) { return lowered.find(term) != std::string::npos; });
                if (suspicious) {
                    if (!found.empty()) {
                        found += ", ";
                    }
                    found += keyword.get<std::string>();
                }
            }
            if (!found.empty()) {
                result.issues.push_back(makeIssue(IssueType::SuspiciousKeywords, Severity::High,
                                                  "Package contains suspicious keywords: " + found));
            }
        }

        if (!hasRepository(metadata)) {
            result.issues.push_back(makeIssue(IssueType::NoRepository, Severity::Low,
                                              "Package has no repository information"));
        }

        if (!hasLicense(metadata)) {
            result.issues.push_back(makeIssue(IssueType::NoLicense, Severity::Low,
                                              "Package has no license information"));
        }
    }

    void checkPublisher(const Json& metadata, TrustAssessment& result) {
        const std::string publisher = publisherOf(metadata);
        if (publisher.empty()) {
            result.publisherScore = 0.0;
            result.issues.push_back(makeIssue(IssueType::NoAuthor, Severity::Medium,
                                              "Package has no identifiable author"));
            return;
        }

        const auto& trusted = m_config.trustedPublishers;
        if (std::find(trusted.begin(), trusted.end(), toLower(publisher)) != trusted.end()) {
            result.publisherScore = 1.0;
            return;
        }

        result.publisherScore = calculatePublisherTrustScore(publisher);
        if (result.publisherScore < m_config.untrustedScoreThreshold) {
            result.issues.push_back(makeIssue(IssueType::UntrustedPublisher, Severity::Medium,
                                              "Publisher \"" + publisher + "\" has low trust score"));
        }
    }

    void checkAge(const Json& metadata, WallTime now, TrustAssessment& result) {
        const Json* time = member(metadata, "time");
        if (time == nullptr) {
            return;
        }

        if (const Json* created = member(*time, "created")) {
            auto days = ageInDays(*created, now);
            if (days && *days < m_config.newPackageDays) {
                result.issues.push_back(makeIssue(
                    IssueType::VeryNewPackage, Severity::Medium,
                    "Package is very new (" + std::to_string(std::lround(*days)) + " days old)"));
            }
        }

        const Json* versions = member(metadata, "versions");
        if (versions == nullptr || !versions->is_object() ||
            versions->size() <= m_config.versionBombingMinVersions) {
            return;
        }

        size_t recent = 0;
        for (auto it = versions->begin(); it != versions->end(); ++it) {
            if (const Json* published = member(*time, it.key().c_str())) {
                auto days = ageInDays(*published, now);
                if (days && *days < m_config.versionBombingWindowDays) {
                    ++recent;
                }
            }
        }

        if (recent > m_config.versionBombingMaxRecent) {
            result.issues.push_back(makeIssue(
                IssueType::VersionBombing, Severity::High,
                "Too many versions published recently (" + std::to_string(recent) + " in " +
                    std::to_string(std::lround(m_config.versionBombingWindowDays)) + " days)"));
        }
    }

    void checkDownloads(const std::string& name, const Json& metadata, WallTime now,
                        TrustAssessment& result) {
        auto stats = m_client->getJson(m_config.downloadsBase + "/" + name);
        if (stats.isFailure()) {
            WARDEN_LOG_DEBUG("Could not fetch download stats");
            return;
        }

        const Json* downloads = member(stats.value(), "downloads");
        if (downloads == nullptr || !downloads->is_number_unsigned()) {
            return;
        }

        const Json* time = member(metadata, "time");
        const Json* created = time ? member(*time, "created") : nullptr;
        std::optional<double> days;
        if (created != nullptr) {
            days = ageInDays(*created, now);
        }

        if (days && *days < m_config.downloadWindowDays &&
            downloads->get<uint64_t>() > m_config.downloadSpikeThreshold) {
            result.issues.push_back(makeIssue(
                IssueType::SuspiciousDownloadPattern, Severity::Medium,
                "High download count for new package may indicate artificial inflation"));
        }
    }
};

// ============================================================================
// PackageIntegrityChecker
// ============================================================================

PackageIntegrityChecker::PackageIntegrityChecker(IntegrityConfig config,
                                                 std::shared_ptr<Network::SecureHttpClient> client,
                                                 Security::SecurityEventLog& events,
                                                 WallClockFunction now)
    : m_impl(std::make_unique<Impl>(std::move(config), std::move(client), events, std::move(now))) {}

PackageIntegrityChecker::~PackageIntegrityChecker() = default;

TrustAssessment PackageIntegrityChecker::verifyPackage(std::string_view packageName,
                                                       std::string_view version) {
    return m_impl->verifyPackage(packageName, version);
}

void PackageIntegrityChecker::addKnownVulnerability(const std::string& packageName,
                                                    KnownVulnerability vulnerability) {
    m_impl->addKnownVulnerability(packageName, std::move(vulnerability));
}

double PackageIntegrityChecker::calculatePublisherTrustScore(std::string_view publisher) {
    return m_impl->calculatePublisherTrustScore(publisher);
}

Result<void> PackageIntegrityChecker::verifyTarballIntegrity(std::string_view packageName,
                                                             std::string_view version,
                                                             std::string_view expectedHash) {
    return m_impl->verifyTarballIntegrity(packageName, version, expectedHash);
}

bool PackageIntegrityChecker::isSuspiciousPackageName(std::string_view name) {
    static const std::array<std::regex, 7> patterns = {
        std::regex("l{2,}"),
        std::regex("o{2,}"),
        std::regex("[0-9]{4,}"),
        std::regex("^[a-z]-[a-z]$"),
        std::regex("admin|root|sudo|exec|eval|system", std::regex::icase),
        std::regex("hack|crack|exploit|payload", std::regex::icase),
        std::regex("crypto.*(miner|mining)", std::regex::icase),
    };

    const std::string subject(name);
    return std::any_of(patterns.begin(), patterns.end(), [&subject](const std::regex& pattern) {
        return std::regex_search(subject, pattern);
    });
}

Result<std::string> PackageIntegrityChecker::generatePackageHash(ByteSpan content) {
    auto digest = Crypto::HashEngine::sha256(content);
    if (digest.isFailure()) {
        return digest.errorInfo();
    }
    return Crypto::toHex(digest.value());
}

Security::ValidatorPolicy PackageIntegrityChecker::validatorPolicy() {
    Security::ValidatorPolicy policy = Security::ValidatorPolicy::defaults();
    policy.allowedHosts.push_back("api.npmjs.org");
    return policy;
}

const IntegrityConfig& PackageIntegrityChecker::config() const noexcept {
    return m_impl->m_config;
}

} // namespace Warden::Integrity
