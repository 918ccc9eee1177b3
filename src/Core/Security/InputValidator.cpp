/**
 * @file InputValidator.cpp
 * @brief Input validation implementation
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/InputValidator.hpp>
#include <Warden/Core/ErrorHandler.hpp>

#include <curl/curl.h>
#include <arpa/inet.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <regex>

namespace Warden::Security {

namespace {

// ============================================================================
// Deny-lists
// ============================================================================

constexpr std::array<std::string_view, 33> kPackageNameDenyList = {
    "|", ";", "&", "$", "`", "(", ")", "{",
    "../", "..\\", "/./", "\\.\\", "//", "\\\\",
    "file://", "http://", "https://", "ftp://", "data:",
    "curl", "wget", "bash", "powershell", "base64", "whoami",
    "rm ", "del ", "format",
    "&&", "||", "$(", "${", "\\",
};

constexpr std::array<std::string_view, 7> kReservedPrefixes = {
    "node_modules", ".git", ".env", "etc/", "usr/", "var/", "tmp/",
};

constexpr std::array<std::string_view, 37> kArgumentDenyList = {
    ";", "|", "&", "&&", "||", "`", "$(", "${", "(", ")",
    ">", ">>", "<", "<<", "\n", "\r", "\t", "\\",
    "rm ", "del ", "format ", "mkfs", "dd ", "wget ", "curl ",
    "nc ", "netcat", "telnet", "ssh", "ftp",
    "..", "~", "/etc/", "/tmp/", "eval", "exec", "system",
};

constexpr std::array<std::string_view, 6> kSensitiveSubstrings = {
    "node_modules", ".ssh", ".aws", ".docker", "/usr/bin", "/var/log",
};

constexpr std::array<std::string_view, 2> kSensitiveDirectories = {
    "/etc/", "/tmp/",
};

// ============================================================================
// Helpers
// ============================================================================

std::string toLower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string_view trim(std::string_view value) {
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!value.empty() && isSpace(value.front())) value.remove_prefix(1);
    while (!value.empty() && isSpace(value.back())) value.remove_suffix(1);
    return value;
}

bool startsWith(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.substr(0, prefix.size()) == prefix;
}

bool endsWith(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() &&
           value.substr(value.size() - suffix.size()) == suffix;
}

const std::regex& npmNamePattern() {
    static const std::regex pattern(
        R"(^(?:@[a-z0-9*~-][a-z0-9*._~-]*/)?[a-z0-9~-][a-z0-9._~-]*$)",
        std::regex::ECMAScript);
    return pattern;
}

const std::regex& shellWordPattern() {
    static const std::regex pattern(R"(\b(sh|cmd)\b)",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

const std::regex& driveLetterPattern() {
    static const std::regex pattern(R"(^[A-Za-z]:($|/))", std::regex::ECMAScript);
    return pattern;
}

/// Sensitive components checked on the base-relative path, prefixed with "/"
bool isSensitiveRelativePath(const std::string& relative) {
    const std::string lowered = toLower(relative);

    for (auto needle : kSensitiveSubstrings) {
        if (lowered.find(needle) != std::string::npos) {
            return true;
        }
    }

    for (auto directory : kSensitiveDirectories) {
        if (lowered.find(directory) != std::string::npos) {
            return true;
        }
    }

    if (endsWith(lowered, ".env")) {
        return true;
    }

    // .git directories are never reachable; .github only for workflows
    size_t pos = 0;
    while ((pos = lowered.find("/.git", pos)) != std::string::npos) {
        std::string_view rest = std::string_view(lowered).substr(pos + 5);
        if (rest.empty() || rest.front() == '/') {
            return true;
        }
        if (startsWith(rest, "hub")) {
            std::string_view afterHub = rest.substr(3);
            if (afterHub.empty() || afterHub == "/") {
                return true;
            }
            if (afterHub.front() == '/' && !startsWith(afterHub, "/workflows")) {
                return true;
            }
        }
        pos += 5;
    }

    return false;
}

bool isPrivateIPv4(const unsigned char* a) {
    return a[0] == 0 ||
           a[0] == 10 ||
           a[0] == 127 ||
           (a[0] == 169 && a[1] == 254) ||
           (a[0] == 172 && a[1] >= 16 && a[1] <= 31) ||
           (a[0] == 192 && a[1] == 168);
}

using CurlUrlPtr = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

/// Read one URL component; absent components yield an empty string
bool getUrlPart(CURLU* handle, CURLUPart part, std::string& out, unsigned int flags = 0) {
    char* value = nullptr;
    CURLUcode rc = curl_url_get(handle, part, &value, flags);
    if (rc != CURLUE_OK) {
        out.clear();
        return rc == CURLUE_NO_QUERY || rc == CURLUE_NO_PORT || rc == CURLUE_NO_USER ||
               rc == CURLUE_NO_PASSWORD || rc == CURLUE_NO_FRAGMENT;
    }
    out.assign(value);
    curl_free(value);
    return true;
}

} // anonymous namespace

// ============================================================================
// ValidatorPolicy
// ============================================================================

ValidatorPolicy ValidatorPolicy::defaults() {
    ValidatorPolicy policy;
    policy.allowedHosts = {
        "registry.npmjs.org",
        "api.github.com",
        "raw.githubusercontent.com",
    };
    policy.allowedExtensions = {
        ".js", ".json", ".md", ".txt", ".yml", ".yaml", ".ts", ".jsx", ".tsx",
        ".css", ".html", ".xml", ".gitignore", ".eslintrc", ".prettierrc",
    };
    return policy;
}

// ============================================================================
// InputValidator
// ============================================================================

InputValidator::InputValidator(ValidatorPolicy policy)
    : m_policy(std::move(policy)) {
    for (auto& host : m_policy.allowedHosts) {
        host = toLower(host);
    }
    for (auto& ext : m_policy.allowedExtensions) {
        ext = toLower(ext);
    }
}

const InputValidator& InputValidator::defaultInstance() {
    static const InputValidator instance;
    return instance;
}

Result<PackageName> InputValidator::sanitizePackageName(std::string_view raw) const {
    constexpr std::string_view field = "packageName";
    const std::string_view trimmed = trim(raw);

    if (trimmed.empty()) {
        return makeError(ErrorCode::EmptyInput, "Package name cannot be empty", field);
    }
    if (trimmed.size() > m_policy.maxPackageNameLength) {
        return makeError(ErrorCode::InputTooLong, "Package name too long", field);
    }

    const std::string lowered = toLower(trimmed);
    for (auto pattern : kPackageNameDenyList) {
        if (lowered.find(pattern) != std::string::npos) {
            return makeError(ErrorCode::DangerousPattern,
                             "Dangerous pattern detected in package name", field);
        }
    }

    const std::string name(trimmed);
    if (std::regex_search(name, shellWordPattern())) {
        return makeError(ErrorCode::DangerousPattern,
                         "Dangerous pattern detected in package name", field);
    }

    if (!std::regex_match(name, npmNamePattern())) {
        return makeError(ErrorCode::InvalidFormat, "Invalid package name format", field);
    }

    for (auto prefix : kReservedPrefixes) {
        if (startsWith(lowered, prefix)) {
            return makeError(ErrorCode::ReservedPrefix,
                             "Package name starts with a reserved prefix", field);
        }
    }

    return PackageName(name);
}

Result<SafePath> InputValidator::sanitizeFilePath(std::string_view raw,
                                                  const std::filesystem::path& baseDir) const {
    namespace fs = std::filesystem;
    constexpr std::string_view field = "filePath";
    const std::string_view trimmed = trim(raw);

    if (trimmed.empty()) {
        return makeError(ErrorCode::EmptyInput, "File path cannot be empty", field);
    }
    if (trimmed.size() > m_policy.maxPathLength) {
        return makeError(ErrorCode::InputTooLong, "File path too long", field);
    }
    if (trimmed.find('\0') != std::string_view::npos) {
        return makeError(ErrorCode::DangerousPattern, "File path contains a NUL byte", field);
    }

    std::string normalized(trimmed);
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    if (std::regex_search(normalized, driveLetterPattern())) {
        return makeError(ErrorCode::PathOutsideBase, "File path outside allowed directory", field);
    }
    std::error_code ec;
    fs::path base = fs::absolute(baseDir, ec);
    if (ec) {
        return makeError(ErrorCode::InvalidPath, "Base directory cannot be resolved", "baseDir");
    }
    base = base.lexically_normal();
    std::string baseStr = base.generic_string();
    while (baseStr.size() > 1 && baseStr.back() == '/') {
        baseStr.pop_back();
    }

    fs::path candidate(normalized);
    fs::path resolved = candidate.is_absolute()
        ? candidate.lexically_normal()
        : (fs::path(baseStr) / candidate).lexically_normal();
    std::string resolvedStr = resolved.generic_string();
    while (resolvedStr.size() > 1 && resolvedStr.back() == '/') {
        resolvedStr.pop_back();
    }

    // Traversal is judged on where the path lands, not how it is spelled
    const std::string basePrefix = baseStr == "/" ? baseStr : baseStr + "/";
    if (resolvedStr.find("../..") != std::string::npos ||
        (resolvedStr != baseStr && !startsWith(resolvedStr, basePrefix))) {
        return makeError(ErrorCode::PathOutsideBase, "File path outside allowed directory", field);
    }

    const std::string relative = "/" + resolvedStr.substr(std::min(resolvedStr.size(), basePrefix.size()));
    if (isSensitiveRelativePath(relative)) {
        return makeError(ErrorCode::SensitivePath, "Access to forbidden path", field);
    }

    const std::string extension = toLower(fs::path(resolvedStr).extension().string());
    if (!extension.empty() &&
        std::find(m_policy.allowedExtensions.begin(), m_policy.allowedExtensions.end(),
                  extension) == m_policy.allowedExtensions.end()) {
        return makeError(ErrorCode::ExtensionNotAllowed, "File extension not allowed", field);
    }

    return SafePath(resolvedStr);
}

Result<CommandArg> InputValidator::sanitizeCommandArg(std::string_view raw) const {
    constexpr std::string_view field = "commandArgs";

    // Embedded control characters are rejected before trimming removes them
    for (char c : raw) {
        if (c == '\n' || c == '\r' || c == '\t' || c == '\0') {
            return makeError(ErrorCode::DangerousPattern,
                             "Dangerous pattern detected in command argument", field);
        }
    }

    const std::string_view trimmed = trim(raw);
    const std::string lowered = toLower(trimmed);

    for (auto pattern : kArgumentDenyList) {
        if (lowered.find(pattern) != std::string::npos) {
            return makeError(ErrorCode::DangerousPattern,
                             "Dangerous pattern detected in command argument", field);
        }
    }

    if (trimmed.size() > m_policy.maxArgumentLength) {
        return makeError(ErrorCode::InputTooLong, "Command argument too long", field);
    }

    return CommandArg(std::string(trimmed));
}

Result<std::vector<CommandArg>> InputValidator::sanitizeCommandArgs(
    const std::vector<std::string>& args) const {
    std::vector<CommandArg> sanitized;
    sanitized.reserve(args.size());

    for (const auto& arg : args) {
        auto result = sanitizeCommandArg(arg);
        if (result.isFailure()) {
            return result.errorInfo();
        }
        sanitized.push_back(std::move(result).value());
    }

    return sanitized;
}

Result<ValidatedUrl> InputValidator::validateUrl(std::string_view raw) const {
    constexpr std::string_view field = "url";
    const std::string input(trim(raw));

    if (input.empty() || input.find('\0') != std::string::npos) {
        return makeError(ErrorCode::InvalidUrl, "Invalid URL format", field);
    }

    CurlUrlPtr handle(curl_url(), &curl_url_cleanup);
    if (!handle) {
        return makeError(ErrorCode::AllocationFailed, "URL parser unavailable", field);
    }

    if (curl_url_set(handle.get(), CURLUPART_URL, input.c_str(), 0) != CURLUE_OK) {
        return makeError(ErrorCode::InvalidUrl, "Invalid URL format", field);
    }

    ValidatedUrl url;
    std::string user;
    std::string port;
    if (!getUrlPart(handle.get(), CURLUPART_SCHEME, url.m_scheme) ||
        !getUrlPart(handle.get(), CURLUPART_HOST, url.m_host) ||
        !getUrlPart(handle.get(), CURLUPART_PORT, port) ||
        !getUrlPart(handle.get(), CURLUPART_PATH, url.m_path) ||
        !getUrlPart(handle.get(), CURLUPART_QUERY, url.m_query) ||
        !getUrlPart(handle.get(), CURLUPART_USER, user) ||
        !getUrlPart(handle.get(), CURLUPART_URL, url.m_href)) {
        return makeError(ErrorCode::InvalidUrl, "Invalid URL format", field);
    }

    url.m_scheme = toLower(url.m_scheme);
    url.m_host = toLower(url.m_host);

    if (url.m_scheme != "https") {
        return makeError(ErrorCode::SchemeNotAllowed, "Only HTTPS URLs are allowed", field);
    }

    if (!user.empty()) {
        return makeError(ErrorCode::InvalidUrl, "Credentials in URL are not allowed", field);
    }

    if (std::find(m_policy.allowedHosts.begin(), m_policy.allowedHosts.end(), url.m_host) ==
        m_policy.allowedHosts.end()) {
        return makeError(ErrorCode::HostNotAllowed, "Domain not in whitelist", field);
    }

    if (isPrivateAddress(url.m_host)) {
        return makeError(ErrorCode::PrivateAddress,
                         "Access to private IP ranges not allowed", field);
    }

    if (!port.empty()) {
        unsigned long value = 0;
        for (char c : port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return makeError(ErrorCode::InvalidUrl, "Invalid URL format", field);
            }
            value = value * 10 + static_cast<unsigned long>(c - '0');
            if (value > 65535) {
                return makeError(ErrorCode::InvalidUrl, "Invalid URL format", field);
            }
        }
        url.m_port = static_cast<uint16_t>(value);
    }

    return url;
}

bool InputValidator::isPrivateAddress(std::string_view host) {
    std::string literal(host);
    if (literal.size() >= 2 && literal.front() == '[' && literal.back() == ']') {
        literal = literal.substr(1, literal.size() - 2);
    }
    // Strip an IPv6 zone id
    if (auto zone = literal.find('%'); zone != std::string::npos) {
        literal.resize(zone);
    }

    unsigned char v4[4];
    if (inet_pton(AF_INET, literal.c_str(), v4) == 1) {
        return isPrivateIPv4(v4);
    }

    unsigned char v6[16];
    if (inet_pton(AF_INET6, literal.c_str(), v6) == 1) {
        static const unsigned char loopback[16] = {0,0,0,0, 0,0,0,0, 0,0,0,0, 0,0,0,1};
        static const unsigned char unspecified[16] = {};
        static const unsigned char mappedPrefix[12] = {0,0,0,0, 0,0,0,0, 0,0,0xff,0xff};

        if (std::equal(v6, v6 + 16, loopback) || std::equal(v6, v6 + 16, unspecified)) {
            return true;
        }
        if ((v6[0] & 0xfe) == 0xfc) {                      // fc00::/7
            return true;
        }
        if (v6[0] == 0xfe && (v6[1] & 0xc0) == 0x80) {     // fe80::/10
            return true;
        }
        if (std::equal(mappedPrefix, mappedPrefix + 12, v6)) {
            return isPrivateIPv4(v6 + 12);
        }
        return false;
    }

    return false;
}

} // namespace Warden::Security
