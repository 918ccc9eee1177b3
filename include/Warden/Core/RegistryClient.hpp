/**
 * @file RegistryClient.hpp
 * @brief npm registry metadata lookups through SecureHttpClient
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#pragma once

#ifndef WARDEN_CORE_REGISTRY_CLIENT_HPP
#define WARDEN_CORE_REGISTRY_CLIENT_HPP

#include <Warden/Core/HttpClient.hpp>
#include <Warden/Core/InputValidator.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Warden::Network {

/**
 * @brief Best-effort projection of registry metadata
 *
 * When the lookup fails the defaults are kept and error holds a redacted
 * reason.
 */
struct PackageDetails {
    std::string description = "No description available";
    std::vector<std::string> keywords;
    bool deprecated = false;
    std::string deprecationMessage;
    std::string repository;
    std::string homepage;
    std::string license;
    std::string version;
    std::string publishedAt;     ///< ISO-8601 as published
    std::string error;
};

/**
 * @brief Reads package metadata from the npm registry
 */
class RegistryClient {
public:
    static constexpr const char* DEFAULT_REGISTRY = "https://registry.npmjs.org";

    /**
     * @param client Shared HTTP client; a default SecureHttpClient when null
     * @param registryBase Registry root without trailing slash; its host
     *        must be allow-listed by the client's validator
     */
    explicit RegistryClient(std::shared_ptr<SecureHttpClient> client = nullptr,
                            std::string registryBase = DEFAULT_REGISTRY);

    /**
     * @brief Full packument for a sanitized package name
     */
    Result<nlohmann::ordered_json> getPackageInfo(std::string_view packageName);

    /**
     * @brief Publish time of the latest version
     *
     * The latest version is dist-tags.latest, or the last key of versions
     * when no tag is published. Missing data fails with MissingField.
     */
    Result<WallTime> getLastPublished(std::string_view packageName);

    /**
     * @brief Description, keywords, deprecation, links and license; never fails
     */
    PackageDetails getDetailedInfo(std::string_view packageName);

    /**
     * @brief Percent-encode everything except A-Z a-z 0-9 - _ . ! ~ * ' ( )
     */
    static std::string encodeComponent(std::string_view value);

    [[nodiscard]] SecureHttpClient& httpClient() noexcept { return *m_client; }

    [[nodiscard]] const std::string& registryBase() const noexcept { return m_registryBase; }

private:
    std::shared_ptr<SecureHttpClient> m_client;
    std::string m_registryBase;
};

/**
 * @brief Latest version of a packument: dist-tags.latest, else the last
 *        key of versions, else empty
 */
std::string latestVersionOf(const nlohmann::ordered_json& packument);

} // namespace Warden::Network

#endif // WARDEN_CORE_REGISTRY_CLIENT_HPP
