/**
 * @file SupplyChainScanner.cpp
 * @brief Project-wide dependency verification
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/PackageIntegrity.hpp>
#include <Warden/Core/FileUtils.hpp>
#include <Warden/Core/Logger.hpp>

#include <algorithm>

namespace Warden::Integrity {

namespace {

using Json = nlohmann::ordered_json;

/// Later maps override earlier ones; first-seen order is kept
void mergeDependencies(Json& merged, const Json& manifest, const char* key) {
    auto it = manifest.find(key);
    if (it == manifest.end() || !it->is_object()) {
        return;
    }
    for (auto entry = it->begin(); entry != it->end(); ++entry) {
        merged[entry.key()] = entry.value();
    }
}

bool anyIssueWith(const PackageReport& package, Severity severity) {
    return std::any_of(package.issues.begin(), package.issues.end(),
                       [severity](const IntegrityIssue& issue) { return issue.severity == severity; });
}

} // anonymous namespace

SupplyChainScanner::SupplyChainScanner(std::shared_ptr<PackageIntegrityChecker> checker)
    : m_checker(checker ? std::move(checker) : std::make_shared<PackageIntegrityChecker>()) {}

ScanReport SupplyChainScanner::scanProject(const std::filesystem::path& manifestPath) {
    ScanReport report;

    auto content = readFileSecure(manifestPath, m_checker->config().maxManifestBytes);
    if (content.isFailure()) {
        report.safe = false;
        report.error = "Failed to scan project: " + content.errorInfo().message;
        WARDEN_LOG_ERROR(report.error.c_str());
        return report;
    }

    Json manifest = Json::parse(content.value(), nullptr, false);
    if (manifest.is_discarded() || !manifest.is_object()) {
        report.safe = false;
        report.error = "Failed to scan project: Invalid manifest format";
        WARDEN_LOG_ERROR(report.error.c_str());
        return report;
    }

    Json dependencies = Json::object();
    mergeDependencies(dependencies, manifest, "dependencies");
    mergeDependencies(dependencies, manifest, "devDependencies");

    for (auto it = dependencies.begin(); it != dependencies.end(); ++it) {
        const std::string version = it->is_string() ? it->get<std::string>() : it->dump();

        TrustAssessment assessment = m_checker->verifyPackage(it.key(), version);
        ++report.scannedPackages;

        if (!assessment.safe) {
            report.safe = false;
            report.packages.push_back(PackageReport{it.key(), version, std::move(assessment.issues)});
        }
    }

    WARDEN_LOG_INFO_F("Scanned %zu packages, %zu flagged", report.scannedPackages,
                      report.packages.size());

    generateRecommendations(report);
    return report;
}

void SupplyChainScanner::generateRecommendations(ScanReport& report) {
    if (report.packages.empty()) {
        report.recommendations.push_back("All scanned packages appear safe");
        return;
    }

    const bool anyCritical = std::any_of(report.packages.begin(), report.packages.end(),
        [](const PackageReport& package) { return anyIssueWith(package, Severity::Critical); });
    const bool anyHigh = std::any_of(report.packages.begin(), report.packages.end(),
        [](const PackageReport& package) { return anyIssueWith(package, Severity::High); });

    if (anyCritical) {
        report.recommendations.push_back(
            "CRITICAL: Review and replace packages with critical security issues");
    }
    if (anyHigh) {
        report.recommendations.push_back(
            "HIGH: Update or replace packages with high-severity issues");
    }

    report.recommendations.push_back("Regular security scans recommended");
    report.recommendations.push_back("Consider using package-lock.json for dependency integrity");
}

} // namespace Warden::Integrity
