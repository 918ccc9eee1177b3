/**
 * @file PackageIntegrity.hpp
 * @brief Package trust scoring and supply chain scanning
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * The checker fetches registry metadata through SecureHttpClient and runs
 * independent heuristics over it. Each heuristic adds issues; a package is
 * safe unless one of them is high or critical. None of the heuristics can
 * prove a package benign.
 */

#pragma once

#ifndef WARDEN_CORE_PACKAGE_INTEGRITY_HPP
#define WARDEN_CORE_PACKAGE_INTEGRITY_HPP

#include <Warden/Core/Types.hpp>
#include <Warden/Core/ErrorCodes.hpp>
#include <Warden/Core/HttpClient.hpp>
#include <Warden/Core/InputValidator.hpp>
#include <Warden/Core/SecurityEventLog.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Warden::Integrity {

/// Issue type names reported in TrustAssessment::issues
namespace IssueType {
constexpr const char* VerificationError = "verification_error";
constexpr const char* KnownVulnerability = "known_vulnerability";
constexpr const char* SuspiciousName = "suspicious_name";
constexpr const char* MissingDescription = "missing_description";
constexpr const char* SuspiciousKeywords = "suspicious_keywords";
constexpr const char* NoRepository = "no_repository";
constexpr const char* NoLicense = "no_license";
constexpr const char* NoAuthor = "no_author";
constexpr const char* UntrustedPublisher = "untrusted_publisher";
constexpr const char* VeryNewPackage = "very_new_package";
constexpr const char* VersionBombing = "version_bombing";
constexpr const char* SuspiciousDownloadPattern = "suspicious_download_pattern";
} // namespace IssueType

// ============================================================================
// Results
// ============================================================================

/**
 * @brief One finding about a package
 */
struct IntegrityIssue {
    std::string type;
    Severity severity = Severity::Medium;
    std::string message;
    std::string cve;              ///< Known vulnerabilities only
    std::string publishedDate;    ///< Known vulnerabilities only
};

/**
 * @brief Entry of the local vulnerability database
 */
struct KnownVulnerability {
    Severity severity = Severity::Medium;
    std::string message;
    std::string cve;
    std::string publishedDate;
};

/**
 * @brief Outcome of verifyPackage()
 */
struct TrustAssessment {
    std::string packageName;
    std::string version;
    bool safe = true;                     ///< No high or critical issue
    std::vector<IntegrityIssue> issues;
    double publisherScore = 1.0;          ///< In [0, 1]

    [[nodiscard]] bool hasSeverity(Severity severity) const noexcept;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Thresholds and endpoints used by the checker
 */
struct IntegrityConfig {
    std::vector<std::string> trustedPublishers{
        "npm", "facebook", "google", "microsoft",
        "sindresorhus", "johnpapa", "angular", "typescript",
    };
    double untrustedScoreThreshold = 0.3;
    double newPackageDays = 7.0;
    size_t versionBombingMinVersions = 50;      ///< Only checked above this
    size_t versionBombingMaxRecent = 10;
    double versionBombingWindowDays = 30.0;
    double downloadWindowDays = 30.0;
    uint64_t downloadSpikeThreshold = 100000;
    size_t publisherSearchSize = 20;
    size_t maxManifestBytes = 1024 * 1024;
    std::string registryBase = "https://registry.npmjs.org";
    std::string downloadsBase = "https://api.npmjs.org/downloads/point/last-month";
};

// ============================================================================
// PackageIntegrityChecker
// ============================================================================

/**
 * @brief Heuristic trust scoring for registry packages
 *
 * @example
 * ```cpp
 * PackageIntegrityChecker checker;
 * TrustAssessment result = checker.verifyPackage("left-pad");
 * if (!result.safe) {
 *     for (const auto& issue : result.issues) { ... }
 * }
 * ```
 */
class PackageIntegrityChecker {
public:

    /**
     * @param config Thresholds and endpoints
     * @param client HTTP client; when null a client whose validator also
     *        admits the downloads API host
     * @param events Sink for integrity failures
     * @param now Wall clock used for package ages; system clock when null
     */
    explicit PackageIntegrityChecker(IntegrityConfig config = IntegrityConfig{},
                                     std::shared_ptr<Network::SecureHttpClient> client = nullptr,
                                     Security::SecurityEventLog& events =
                                         Security::SecurityEventLog::Instance(),
                                     WallClockFunction now = nullptr);
    ~PackageIntegrityChecker();

    PackageIntegrityChecker(const PackageIntegrityChecker&) = delete;
    PackageIntegrityChecker& operator=(const PackageIntegrityChecker&) = delete;

    /**
     * @brief Fetch metadata and run every heuristic
     *
     * Never fails: a metadata fetch failure becomes a verification_error
     * issue and an unsafe result.
     */
    TrustAssessment verifyPackage(std::string_view packageName,
                                  std::string_view version = "latest");

    /**
     * @brief Add an entry to the local vulnerability database
     */
    void addKnownVulnerability(const std::string& packageName, KnownVulnerability vulnerability);

    /**
     * @brief Score a publisher from up to publisherSearchSize of their packages
     *
     * Per package: min(ageDays / 365, 2) * 0.1, plus 0.1 for a repository
     * link and 0.05 for a description longer than 20 characters. The mean
     * is capped at 1.0. No history scores 0.1, a failed lookup 0.2.
     */
    double calculatePublisherTrustScore(std::string_view publisher);

    /**
     * @brief Verify a downloaded tarball against an expected digest
     *
     * The digest is either an SRI string ("sha512-<base64>") or a SHA-256
     * hex string. Mismatches are recorded as security events.
     */
    Result<void> verifyTarballIntegrity(std::string_view packageName,
                                        std::string_view version,
                                        std::string_view expectedHash);

    /**
     * @brief Repeated l/o runs, long digit runs, single-letter pairs and
     *        privileged, malicious or mining terms
     */
    static bool isSuspiciousPackageName(std::string_view name);

    /**
     * @brief SHA-256 hex digest of package content
     */
    static Result<std::string> generatePackageHash(ByteSpan content);

    /**
     * @brief Default validator policy plus the downloads API host
     */
    static Security::ValidatorPolicy validatorPolicy();

    [[nodiscard]] const IntegrityConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// SupplyChainScanner
// ============================================================================

/**
 * @brief Per-package part of a scan report
 */
struct PackageReport {
    std::string name;
    std::string version;
    std::vector<IntegrityIssue> issues;
};

/**
 * @brief Outcome of scanProject()
 */
struct ScanReport {
    bool safe = true;
    size_t scannedPackages = 0;
    std::vector<PackageReport> packages;       ///< Unsafe packages only
    std::vector<std::string> recommendations;  ///< Most severe first
    std::string error;                         ///< Set when the manifest could not be scanned
};

/**
 * @brief Verifies every declared dependency of a project manifest
 */
class SupplyChainScanner {
public:
    explicit SupplyChainScanner(std::shared_ptr<PackageIntegrityChecker> checker = nullptr);

    /**
     * @brief Verify dependencies and devDependencies of a package.json
     *
     * The manifest is read with the checker's size cap. When it cannot be
     * read or parsed the report is unsafe and error is set.
     */
    ScanReport scanProject(const std::filesystem::path& manifestPath);

    /**
     * @brief Fill recommendations: critical first, then high, then general
     *        advice; a single all-clear line when no package was flagged
     */
    static void generateRecommendations(ScanReport& report);

    [[nodiscard]] PackageIntegrityChecker& checker() noexcept { return *m_checker; }

private:
    std::shared_ptr<PackageIntegrityChecker> m_checker;
};

} // namespace Warden::Integrity

#endif // WARDEN_CORE_PACKAGE_INTEGRITY_HPP
