/**
 * @file RegistryClient.cpp
 * @brief npm registry client implementation
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/RegistryClient.hpp>
#include <Warden/Core/ErrorHandler.hpp>
#include <Warden/Core/Logger.hpp>
#include <Warden/Core/TimeUtils.hpp>

#include <cctype>

namespace Warden::Network {

namespace {

using Json = nlohmann::ordered_json;

/// String member of an object, or empty
std::string stringField(const Json& object, const char* key) {
    if (object.is_object()) {
        auto it = object.find(key);
        if (it != object.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

/// repository may be "url" or {"type": ..., "url": ...}
std::string repositoryUrl(const Json& object) {
    if (!object.is_object()) {
        return {};
    }
    auto it = object.find("repository");
    if (it == object.end()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return stringField(*it, "url");
}

/// license may be "MIT" or {"type": "MIT"}
std::string licenseName(const Json& object) {
    if (!object.is_object()) {
        return {};
    }
    auto it = object.find("license");
    if (it == object.end()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return stringField(*it, "type");
}

std::vector<std::string> keywordList(const Json& object) {
    std::vector<std::string> keywords;
    if (!object.is_object()) {
        return keywords;
    }
    auto it = object.find("keywords");
    if (it != object.end() && it->is_array()) {
        for (const auto& entry : *it) {
            if (entry.is_string()) {
                keywords.push_back(entry.get<std::string>());
            }
        }
    }
    return keywords;
}

ErrorInfo missingData(std::string_view reason) {
    return makeError(ErrorCode::MissingField,
                     std::string("Could not fetch package info: ") + std::string(reason),
                     "packageName");
}

} // anonymous namespace

std::string latestVersionOf(const Json& packument) {
    if (!packument.is_object()) {
        return {};
    }
    auto tags = packument.find("dist-tags");
    if (tags != packument.end()) {
        std::string latest = stringField(*tags, "latest");
        if (!latest.empty()) {
            return latest;
        }
    }
    auto versions = packument.find("versions");
    if (versions != packument.end() && versions->is_object() && !versions->empty()) {
        std::string last;
        for (auto it = versions->begin(); it != versions->end(); ++it) {
            last = it.key();
        }
        return last;
    }
    return {};
}

RegistryClient::RegistryClient(std::shared_ptr<SecureHttpClient> client, std::string registryBase)
    : m_client(client ? std::move(client) : std::make_shared<SecureHttpClient>())
    , m_registryBase(std::move(registryBase)) {
    while (!m_registryBase.empty() && m_registryBase.back() == '/') {
        m_registryBase.pop_back();
    }
}

std::string RegistryClient::encodeComponent(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' ||
            c == '~' || c == '*' || c == '\'' || c == '(' || c == ')') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += kHex[c >> 4];
            encoded += kHex[c & 0x0F];
        }
    }
    return encoded;
}

Result<Json> RegistryClient::getPackageInfo(std::string_view packageName) {
    auto name = m_client->validator().sanitizePackageName(packageName);
    if (name.isFailure()) {
        return name.errorInfo();
    }

    const std::string url = m_registryBase + "/" + encodeComponent(name.value().view());
    return m_client->getJson(url);
}

Result<WallTime> RegistryClient::getLastPublished(std::string_view packageName) {
    auto info = getPackageInfo(packageName);
    if (info.isFailure()) {
        return info.errorInfo();
    }
    const Json& packument = info.value();

    if (!packument.is_object() || !packument.contains("time") || !packument.contains("versions")) {
        return missingData("Invalid package data structure");
    }

    const Json& versions = packument["versions"];
    if (!versions.is_object() || versions.empty()) {
        return missingData("No versions found for package");
    }

    const std::string latest = latestVersionOf(packument);
    const std::string published = stringField(packument["time"], latest.c_str());
    if (published.empty()) {
        return missingData("No publish time found for latest version");
    }

    auto parsed = parseIso8601(published);
    if (parsed.isFailure()) {
        return makeError(ErrorCode::InvalidTimestamp, "Invalid publish time", "time");
    }
    return parsed.value();
}

PackageDetails RegistryClient::getDetailedInfo(std::string_view packageName) {
    PackageDetails details;

    auto info = getPackageInfo(packageName);
    if (info.isFailure()) {
        details.description = "Error fetching package info";
        details.error = sanitizeForLogging(info.errorInfo().message);
        WARDEN_LOG_DEBUG_F("Detailed info lookup failed: %s", details.error.c_str());
        return details;
    }
    const Json& packument = info.value();

    const std::string latest = latestVersionOf(packument);
    Json versionInfo = Json::object();
    if (packument.contains("versions") && packument["versions"].is_object() &&
        packument["versions"].contains(latest)) {
        versionInfo = packument["versions"][latest];
    }

    std::string description = stringField(packument, "description");
    if (description.empty()) {
        description = stringField(versionInfo, "description");
    }
    if (!description.empty()) {
        details.description = description;
    }

    details.keywords = keywordList(packument);
    if (details.keywords.empty()) {
        details.keywords = keywordList(versionInfo);
    }

    if (versionInfo.contains("deprecated")) {
        const Json& deprecated = versionInfo["deprecated"];
        if (deprecated.is_string()) {
            details.deprecated = true;
            details.deprecationMessage = deprecated.get<std::string>();
        } else if (deprecated.is_boolean()) {
            details.deprecated = deprecated.get<bool>();
        }
    }

    details.repository = repositoryUrl(packument);
    if (details.repository.empty()) {
        details.repository = repositoryUrl(versionInfo);
    }
    details.homepage = stringField(packument, "homepage");
    if (details.homepage.empty()) {
        details.homepage = stringField(versionInfo, "homepage");
    }
    details.license = licenseName(packument);
    if (details.license.empty()) {
        details.license = licenseName(versionInfo);
    }
    details.version = latest;
    if (packument.contains("time")) {
        details.publishedAt = stringField(packument["time"], latest.c_str());
    }

    return details;
}

} // namespace Warden::Network
