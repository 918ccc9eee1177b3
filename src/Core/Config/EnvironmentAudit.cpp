/**
 * @file EnvironmentAudit.cpp
 * @brief Production environment checks
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/SecureConfig.hpp>
#include <Warden/Core/ErrorHandler.hpp>
#include <Warden/Core/Logger.hpp>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace Warden::Config {

namespace {

constexpr std::array<const char*, 3> kRiskyVariables = {
    "NODE_TLS_REJECT_UNAUTHORIZED",
    "DEBUG",
    "NODE_DEBUG",
};

bool isSet(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr && *value != '\0';
}

} // anonymous namespace

EnvironmentInfo EnvironmentAudit::current() {
    EnvironmentInfo info;

    const char* mode = std::getenv("WARDEN_ENV");
    if (mode == nullptr || *mode == '\0') {
        mode = std::getenv("NODE_ENV");
    }
    if (mode != nullptr && *mode != '\0') {
        info.mode = mode;
    }

    info.isProduction = info.mode == "production";
    info.isDevelopment = info.mode == "development";
    info.isTest = info.mode == "test";
    return info;
}

std::vector<EnvironmentIssue> EnvironmentAudit::validate() {
    std::vector<EnvironmentIssue> issues;
    if (!current().isProduction) {
        return issues;
    }

    for (const char* name : kRiskyVariables) {
        if (isSet(name)) {
            issues.push_back({
                name,
                std::string("Dangerous environment variable ") + name + " is set in production",
                std::string("Unset ") + name + " in production environment",
            });
        }
    }
    return issues;
}

Result<void> EnvironmentAudit::sanitize() {
    if (!current().isProduction) {
        return {};
    }

    if (::unsetenv("DEBUG") != 0 || ::unsetenv("NODE_DEBUG") != 0) {
        return makeError(ErrorCode::SystemError, std::strerror(errno));
    }

    const char* tls = std::getenv("NODE_TLS_REJECT_UNAUTHORIZED");
    if (tls == nullptr || std::strcmp(tls, "1") != 0) {
        if (::setenv("NODE_TLS_REJECT_UNAUTHORIZED", "1", 1) != 0) {
            return makeError(ErrorCode::SystemError, std::strerror(errno));
        }
        WARDEN_LOG_INFO("Enforced TLS certificate verification for child processes");
    }
    return {};
}

} // namespace Warden::Config
