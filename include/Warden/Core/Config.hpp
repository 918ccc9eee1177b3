/**
 * @file Config.hpp
 * @brief Gateway settings and their secure loader
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * The settings file is a JSON document with one optional section per
 * component. This module provides secure configuration loading with
 * protection against:
 * - Path traversal attacks
 * - Symlink attacks
 * - File size DoS attacks
 */

#pragma once

#ifndef WARDEN_CORE_CONFIG_HPP
#define WARDEN_CORE_CONFIG_HPP

#include <Warden/Core/Types.hpp>
#include <Warden/Core/ErrorCodes.hpp>
#include <Warden/Core/HttpClient.hpp>
#include <Warden/Core/InputValidator.hpp>
#include <Warden/Core/Logger.hpp>
#include <Warden/Core/PackageIntegrity.hpp>
#include <Warden/Core/RateLimiter.hpp>
#include <Warden/Core/SecureExecutor.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace Warden::Config {

/**
 * @brief "logging" section
 */
struct LoggingConfig {
    Core::LogLevel level = Core::LogLevel::Info;
    bool console = true;
    std::string filePath;               ///< Rotating file sink when set
    size_t maxFileSizeMB = 10;
};

/**
 * @brief Settings for every gateway component
 *
 * Missing sections and keys keep the component defaults. Durations are
 * written in milliseconds ("timeoutMs", "windowMs", ...).
 */
struct GatewayConfig {
    LoggingConfig logging;
    Security::ValidatorPolicy validator = Security::ValidatorPolicy::defaults();
    Security::RateLimitConfig httpRateLimit = Security::RateLimitConfig::http();
    Exec::ExecutorConfig executor;
    Network::HttpClientConfig http;
    Integrity::IntegrityConfig integrity;
};

/**
 * @brief Start the Logger with a logging section
 * @return false if the logger could not be initialized
 */
bool initializeLogging(const LoggingConfig& config);

/**
 * @brief Secure settings loader
 *
 * Security features:
 * - Path canonicalization
 * - Optional directory restriction
 * - O_NOFOLLOW open and size limit
 */
class SecureConfigLoader {
public:
    struct Options {
        size_t maxFileSize = 1024 * 1024;          // 1MB default
        std::filesystem::path allowedDirectory;    // Restrict to directory
    };

    SecureConfigLoader();
    explicit SecureConfigLoader(const Options& options);
    ~SecureConfigLoader();

    /**
     * @brief Load settings from file
     * @param path Path to the settings file
     * @return Parsed settings, or ConfigFileNotFound, AccessDenied,
     *         FileTooLarge, ConfigParseFailed, ConfigInvalid
     */
    Result<GatewayConfig> load(const std::filesystem::path& path);

    /**
     * @brief Load settings from memory
     *
     * Unknown keys are ignored. A known key of the wrong type fails with
     * ConfigInvalid naming the key.
     */
    Result<GatewayConfig> loadFromMemory(std::string_view data);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Warden::Config

#endif // WARDEN_CORE_CONFIG_HPP
