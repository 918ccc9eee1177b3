/**
 * @file SecureConfigLoader.cpp
 * @brief Implementation of secure settings loading
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/Config.hpp>
#include <Warden/Core/ErrorHandler.hpp>
#include <Warden/Core/FileUtils.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <type_traits>

namespace Warden::Config {

namespace {

using Json = nlohmann::json;

ErrorInfo invalidField(const std::string& field, const char* expected) {
    return makeError(ErrorCode::ConfigInvalid,
                     "Expected " + std::string(expected) + " for " + field, field);
}

/**
 * @brief Copy one key of a section into a typed field
 *
 * Absent keys leave the field untouched.
 */
template<typename T>
Result<void> readValue(const Json& section, const std::string& sectionName,
                       const char* key, T& out) {
    auto it = section.find(key);
    if (it == section.end()) {
        return {};
    }
    const std::string field = sectionName + "." + key;

    if constexpr (std::is_same_v<T, std::string>) {
        if (!it->is_string()) {
            return invalidField(field, "a string");
        }
        out = it->template get<std::string>();
    } else if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean()) {
            return invalidField(field, "a boolean");
        }
        out = it->template get<bool>();
    } else if constexpr (std::is_same_v<T, double>) {
        if (!it->is_number()) {
            return invalidField(field, "a number");
        }
        out = it->template get<double>();
    } else if constexpr (std::is_same_v<T, Milliseconds>) {
        if (!it->is_number_unsigned()) {
            return invalidField(field, "a non-negative integer");
        }
        out = Milliseconds(it->template get<uint64_t>());
    } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
        if (!it->is_array()) {
            return invalidField(field, "an array of strings");
        }
        std::vector<std::string> values;
        for (const auto& entry : *it) {
            if (!entry.is_string()) {
                return invalidField(field, "an array of strings");
            }
            values.push_back(entry.template get<std::string>());
        }
        out = std::move(values);
    } else {
        static_assert(std::is_integral_v<T> && std::is_unsigned_v<T>,
                      "unsupported configuration field type");
        if (!it->is_number_unsigned()) {
            return invalidField(field, "a non-negative integer");
        }
        out = it->template get<T>();
    }
    return {};
}

/// Run a section parser when the section is present
template<typename Parser>
Result<void> applySection(const Json& root, const char* name, Parser&& parse) {
    auto it = root.find(name);
    if (it == root.end()) {
        return {};
    }
    if (!it->is_object()) {
        return makeError(ErrorCode::ConfigInvalid,
                         "Section " + std::string(name) + " must be an object", name);
    }
    return parse(*it);
}

Result<void> parseLogging(const Json& section, LoggingConfig& config) {
    std::string level;
    WARDEN_TRY(readValue(section, "logging", "level", level));
    if (!level.empty()) {
        config.level = Core::ParseLogLevel(level);
    }
    WARDEN_TRY(readValue(section, "logging", "console", config.console));
    WARDEN_TRY(readValue(section, "logging", "file", config.filePath));
    WARDEN_TRY(readValue(section, "logging", "maxFileSizeMB", config.maxFileSizeMB));
    return {};
}

Result<void> parseValidator(const Json& section, Security::ValidatorPolicy& policy) {
    WARDEN_TRY(readValue(section, "validator", "allowedHosts", policy.allowedHosts));
    WARDEN_TRY(readValue(section, "validator", "allowedExtensions", policy.allowedExtensions));
    WARDEN_TRY(readValue(section, "validator", "maxPackageNameLength", policy.maxPackageNameLength));
    WARDEN_TRY(readValue(section, "validator", "maxPathLength", policy.maxPathLength));
    WARDEN_TRY(readValue(section, "validator", "maxArgumentLength", policy.maxArgumentLength));
    return {};
}

Result<void> parseRateLimit(const Json& section, Security::RateLimitConfig& config) {
    WARDEN_TRY(readValue(section, "rateLimit", "maxRequests", config.maxRequests));
    WARDEN_TRY(readValue(section, "rateLimit", "windowMs", config.window));
    if (config.maxRequests == 0) {
        return makeError(ErrorCode::ConfigInvalid, "rateLimit.maxRequests must be positive",
                         "rateLimit.maxRequests");
    }
    if (config.window.count() == 0) {
        return makeError(ErrorCode::ConfigInvalid, "rateLimit.windowMs must be positive",
                         "rateLimit.windowMs");
    }
    return {};
}

Result<void> parseExecutor(const Json& section, Exec::ExecutorConfig& config) {
    WARDEN_TRY(readValue(section, "executor", "allowedCommands", config.allowedCommands));
    WARDEN_TRY(readValue(section, "executor", "timeoutMs", config.defaultTimeout));
    WARDEN_TRY(readValue(section, "executor", "killGraceMs", config.killGrace));
    WARDEN_TRY(readValue(section, "executor", "maxOutputBytes", config.maxOutputBytes));
    WARDEN_TRY(readValue(section, "executor", "strippedEnv", config.strippedEnv));
    return {};
}

Result<void> parseHttp(const Json& section, Network::HttpClientConfig& config) {
    WARDEN_TRY(readValue(section, "http", "timeoutMs", config.timeout));
    WARDEN_TRY(readValue(section, "http", "maxRetries", config.maxRetries));
    WARDEN_TRY(readValue(section, "http", "retryBaseDelayMs", config.retryBaseDelay));
    WARDEN_TRY(readValue(section, "http", "maxResponseBytes", config.maxResponseBytes));
    WARDEN_TRY(readValue(section, "http", "userAgent", config.userAgent));
    return {};
}

Result<void> parseIntegrity(const Json& section, Integrity::IntegrityConfig& config) {
    WARDEN_TRY(readValue(section, "integrity", "trustedPublishers", config.trustedPublishers));
    WARDEN_TRY(readValue(section, "integrity", "untrustedScoreThreshold", config.untrustedScoreThreshold));
    WARDEN_TRY(readValue(section, "integrity", "newPackageDays", config.newPackageDays));
    WARDEN_TRY(readValue(section, "integrity", "versionBombingMinVersions", config.versionBombingMinVersions));
    WARDEN_TRY(readValue(section, "integrity", "versionBombingMaxRecent", config.versionBombingMaxRecent));
    WARDEN_TRY(readValue(section, "integrity", "versionBombingWindowDays", config.versionBombingWindowDays));
    WARDEN_TRY(readValue(section, "integrity", "downloadWindowDays", config.downloadWindowDays));
    WARDEN_TRY(readValue(section, "integrity", "downloadSpikeThreshold", config.downloadSpikeThreshold));
    WARDEN_TRY(readValue(section, "integrity", "publisherSearchSize", config.publisherSearchSize));
    WARDEN_TRY(readValue(section, "integrity", "maxManifestBytes", config.maxManifestBytes));
    WARDEN_TRY(readValue(section, "integrity", "registryBase", config.registryBase));
    WARDEN_TRY(readValue(section, "integrity", "downloadsBase", config.downloadsBase));
    return {};
}

} // anonymous namespace

bool initializeLogging(const LoggingConfig& config) {
    Core::LogOutput outputs = Core::LogOutput::None;
    if (config.console) {
        outputs = outputs | Core::LogOutput::Console;
    }
    if (!config.filePath.empty()) {
        outputs = outputs | Core::LogOutput::File;
    }
    return Core::Logger::Instance().Initialize(config.level, outputs, config.filePath,
                                               config.maxFileSizeMB);
}

// ============================================================================
// SecureConfigLoader::Impl
// ============================================================================

class SecureConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::filesystem::path> canonicalizePath(const std::filesystem::path& path) {
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            if (errno == ENOENT) {
                return makeError(ErrorCode::ConfigFileNotFound);
            }
            return makeError(ErrorCode::InvalidPath);
        }
        std::filesystem::path result(resolved);
        free(resolved);
        return result;
    }

    Result<bool> isPathAllowed(const std::filesystem::path& canonicalPath) {
        if (options.allowedDirectory.empty()) {
            return true;  // No restriction
        }

        auto allowedResult = canonicalizePath(options.allowedDirectory);
        if (allowedResult.isFailure()) {
            return makeError(ErrorCode::AccessDenied, "Allowed directory is not accessible");
        }

        // The directory itself or something below it
        const std::string allowed = allowedResult.value().string();
        const std::string candidate = canonicalPath.string();
        if (candidate.compare(0, allowed.size(), allowed) != 0) {
            return false;
        }
        return candidate.size() > allowed.size() &&
               (allowed.back() == '/' || candidate[allowed.size()] == '/');
    }

    Result<std::string> readFileSecurely(const std::filesystem::path& path) {
        // Canonicalize path first
        std::filesystem::path canonPath;
        WARDEN_TRY_ASSIGN(canonPath, canonicalizePath(path));

        // Check path restriction
        bool allowed = false;
        WARDEN_TRY_ASSIGN(allowed, isPathAllowed(canonPath));
        if (!allowed) {
            return makeError(ErrorCode::AccessDenied, "Configuration outside allowed directory");
        }

        auto content = readFileSecure(canonPath, options.maxFileSize);
        if (content.isFailure() && content.error() == ErrorCode::FileNotFound) {
            return makeError(ErrorCode::ConfigFileNotFound);
        }
        return content;
    }

    Result<GatewayConfig> parseConfig(std::string_view data) {
        Json root = Json::parse(data, nullptr, false);
        if (root.is_discarded()) {
            return makeError(ErrorCode::ConfigParseFailed, "Invalid JSON in configuration");
        }
        if (!root.is_object()) {
            return makeError(ErrorCode::ConfigInvalid, "Configuration root must be an object");
        }

        GatewayConfig config;
        WARDEN_TRY(applySection(root, "logging",
            [&config](const Json& section) { return parseLogging(section, config.logging); }));
        WARDEN_TRY(applySection(root, "validator",
            [&config](const Json& section) { return parseValidator(section, config.validator); }));
        WARDEN_TRY(applySection(root, "rateLimit",
            [&config](const Json& section) { return parseRateLimit(section, config.httpRateLimit); }));
        WARDEN_TRY(applySection(root, "executor",
            [&config](const Json& section) { return parseExecutor(section, config.executor); }));
        WARDEN_TRY(applySection(root, "http",
            [&config](const Json& section) { return parseHttp(section, config.http); }));
        WARDEN_TRY(applySection(root, "integrity",
            [&config](const Json& section) { return parseIntegrity(section, config.integrity); }));

        return config;
    }
};

SecureConfigLoader::SecureConfigLoader() : SecureConfigLoader(Options{}) {}

SecureConfigLoader::SecureConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

SecureConfigLoader::~SecureConfigLoader() = default;

Result<GatewayConfig> SecureConfigLoader::load(const std::filesystem::path& path) {
    // Read file securely
    auto dataResult = m_impl->readFileSecurely(path);
    if (dataResult.isFailure()) {
        return dataResult.errorInfo();
    }

    return loadFromMemory(dataResult.value());
}

Result<GatewayConfig> SecureConfigLoader::loadFromMemory(std::string_view data) {
    return m_impl->parseConfig(data);
}

} // namespace Warden::Config
