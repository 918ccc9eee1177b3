/**
 * @file main.cpp
 * @brief Supply chain scan of a project manifest or of single packages
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * Usage:
 *   warden_scan [--config <warden.json>] <package.json>
 *   warden_scan [--config <warden.json>] --package <name> [<name> ...]
 *
 * Exit status is 0 when nothing was flagged, 1 when a package was flagged
 * and 2 on usage or configuration errors.
 */

#include <Warden/Core/Config.hpp>
#include <Warden/Core/PackageIntegrity.hpp>
#include <Warden/Core/SecureConfig.hpp>
#include <Warden/Core/SecurityEventLog.hpp>

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace Warden;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <warden.json>] <package.json>\n"
              << "       " << program << " [--config <warden.json>] --package <name> [<name> ...]\n";
}

void printIssues(const std::vector<Integrity::IntegrityIssue>& issues) {
    for (const auto& issue : issues) {
        std::cout << "    [" << severityToString(issue.severity) << "] " << issue.type << ": "
                  << issue.message;
        if (!issue.cve.empty()) {
            std::cout << " (" << issue.cve << ")";
        }
        std::cout << "\n";
    }
}

std::shared_ptr<Integrity::PackageIntegrityChecker> makeChecker(const Config::GatewayConfig& config) {
    // The downloads API host is needed for the download heuristic
    Security::ValidatorPolicy policy = config.validator;
    for (const auto& host : Integrity::PackageIntegrityChecker::validatorPolicy().allowedHosts) {
        if (std::find(policy.allowedHosts.begin(), policy.allowedHosts.end(), host) ==
            policy.allowedHosts.end()) {
            policy.allowedHosts.push_back(host);
        }
    }

    auto client = std::make_shared<Network::SecureHttpClient>(
        config.http, nullptr, std::make_shared<Security::RateLimiter>(config.httpRateLimit),
        Security::InputValidator(policy));
    return std::make_shared<Integrity::PackageIntegrityChecker>(config.integrity, client);
}

int scanManifest(Integrity::SupplyChainScanner& scanner, const std::string& manifest) {
    Integrity::ScanReport report = scanner.scanProject(manifest);
    if (!report.error.empty()) {
        std::cerr << report.error << "\n";
        return 2;
    }

    std::cout << "Scanned " << report.scannedPackages << " packages\n";
    for (const auto& package : report.packages) {
        std::cout << "  " << package.name << "@" << package.version << "\n";
        printIssues(package.issues);
    }
    for (const auto& recommendation : report.recommendations) {
        std::cout << "- " << recommendation << "\n";
    }
    return report.safe ? 0 : 1;
}

int scanPackages(Integrity::PackageIntegrityChecker& checker, const std::vector<std::string>& names) {
    bool safe = true;
    for (const auto& name : names) {
        Integrity::TrustAssessment result = checker.verifyPackage(name);
        std::cout << result.packageName << ": " << (result.safe ? "ok" : "FLAGGED")
                  << " (publisher score " << result.publisherScore << ")\n";
        printIssues(result.issues);
        safe = safe && result.safe;
    }
    return safe ? 0 : 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    std::vector<std::string> packages;
    std::string manifest;
    bool packageMode = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--package") {
            packageMode = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (packageMode) {
            packages.push_back(arg);
        } else if (manifest.empty()) {
            manifest = arg;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    if (packageMode ? packages.empty() : manifest.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    Config::GatewayConfig config;
    if (!configPath.empty()) {
        Config::SecureConfigLoader loader;
        auto loaded = loader.load(configPath);
        if (loaded.isFailure()) {
            std::cerr << "Failed to load configuration: " << loaded.errorInfo().message << "\n";
            return 2;
        }
        config = std::move(loaded).value();
    }

    if (!Config::initializeLogging(config.logging)) {
        std::cerr << "Failed to initialize logging\n";
        return 2;
    }

    for (const auto& issue : Config::EnvironmentAudit::validate()) {
        WARDEN_LOG_WARNING_F("%s. %s", issue.message.c_str(), issue.fix.c_str());
    }
    if (auto sanitized = Config::EnvironmentAudit::sanitize(); sanitized.isFailure()) {
        WARDEN_LOG_ERROR_F("Environment sanitization failed: %s",
                           sanitized.errorInfo().message.c_str());
    }

    auto checker = makeChecker(config);
    int status = 0;
    if (packageMode) {
        status = scanPackages(*checker, packages);
    } else {
        Integrity::SupplyChainScanner scanner(checker);
        status = scanManifest(scanner, manifest);
    }

    const size_t events = Security::SecurityEventLog::Instance().getEvents().size();
    if (events > 0) {
        WARDEN_LOG_INFO_F("%zu security events recorded", events);
    }

    Core::Logger::Instance().Shutdown();
    return status;
}
