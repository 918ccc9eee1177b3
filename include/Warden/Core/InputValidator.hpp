/**
 * @file InputValidator.hpp
 * @brief Validation of untrusted package names, paths, arguments and URLs
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * Every untrusted string must pass through InputValidator before it reaches
 * a subprocess, the filesystem or the network. Successful validation yields
 * a distinct wrapper type that only the validator can construct, so a raw
 * string can never be passed where a sanitized one is required.
 *
 * The npm name grammar is the authoritative control. Deny-lists are a
 * second layer that rejects obviously hostile input early.
 */

#pragma once

#ifndef WARDEN_CORE_INPUT_VALIDATOR_HPP
#define WARDEN_CORE_INPUT_VALIDATOR_HPP

#include <Warden/Core/ErrorCodes.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace Warden::Security {

class InputValidator;

// ============================================================================
// Sanitized Value Types
// ============================================================================

/**
 * @brief String that has passed one of the validator's checks
 *
 * @tparam Tag Distinguishes package names, arguments and paths at compile time
 */
template<typename Tag>
class SanitizedString {
public:
    [[nodiscard]] const std::string& str() const noexcept { return m_value; }

    [[nodiscard]] std::string_view view() const noexcept { return m_value; }

    bool operator==(const SanitizedString& other) const { return m_value == other.m_value; }

private:
    explicit SanitizedString(std::string value) : m_value(std::move(value)) {}

    friend class InputValidator;

    std::string m_value;
};

struct PackageNameTag {};
struct CommandArgTag {};
struct SafePathTag {};

/// Registry package name accepted by sanitizePackageName()
using PackageName = SanitizedString<PackageNameTag>;

/// Subprocess argument accepted by sanitizeCommandArgs()
using CommandArg = SanitizedString<CommandArgTag>;

/// Absolute path inside the caller's base directory
using SafePath = SanitizedString<SafePathTag>;

/**
 * @brief URL accepted by validateUrl()
 */
class ValidatedUrl {
public:
    [[nodiscard]] const std::string& href() const noexcept { return m_href; }
    [[nodiscard]] const std::string& scheme() const noexcept { return m_scheme; }
    [[nodiscard]] const std::string& host() const noexcept { return m_host; }
    [[nodiscard]] uint16_t port() const noexcept { return m_port; }
    [[nodiscard]] const std::string& path() const noexcept { return m_path; }
    [[nodiscard]] const std::string& query() const noexcept { return m_query; }

private:
    ValidatedUrl() = default;

    friend class InputValidator;

    std::string m_href;
    std::string m_scheme;
    std::string m_host;
    uint16_t m_port = 443;
    std::string m_path;
    std::string m_query;
};

// ============================================================================
// Policy
// ============================================================================

/**
 * @brief Immutable allow-lists and limits used by the validator
 */
struct ValidatorPolicy {
    std::vector<std::string> allowedHosts;       ///< Exact, lowercase host names
    std::vector<std::string> allowedExtensions;  ///< Lowercase, with leading dot
    size_t maxPackageNameLength = 214;
    size_t maxPathLength = 260;
    size_t maxArgumentLength = 1000;

    /**
     * @brief Registry host, GitHub API hosts and the project file extensions
     */
    static ValidatorPolicy defaults();
};

// ============================================================================
// Validator
// ============================================================================

/**
 * @brief Stateless validator for untrusted strings
 *
 * All operations are pure and thread-safe. Rejections carry the rule class
 * in the message and never echo the rejected payload.
 */
class InputValidator {
public:
    explicit InputValidator(ValidatorPolicy policy = ValidatorPolicy::defaults());

    /**
     * @brief Process-wide validator built from ValidatorPolicy::defaults()
     */
    static const InputValidator& defaultInstance();

    /**
     * @brief Validate a registry package name
     * @return The trimmed name, unchanged
     */
    Result<PackageName> sanitizePackageName(std::string_view raw) const;

    /**
     * @brief Resolve a path against a base directory and confine it there
     * @param raw Untrusted relative or absolute path
     * @param baseDir Directory the result must stay within
     * @return Absolute, lexically normalized path
     */
    Result<SafePath> sanitizeFilePath(std::string_view raw,
                                      const std::filesystem::path& baseDir) const;

    /**
     * @brief Validate a single subprocess argument
     */
    Result<CommandArg> sanitizeCommandArg(std::string_view raw) const;

    /**
     * @brief Validate every argument; the first rejection fails the call
     */
    Result<std::vector<CommandArg>> sanitizeCommandArgs(const std::vector<std::string>& args) const;

    /**
     * @brief Parse and check an outbound URL (https, allow-listed host,
     *        no private address literals)
     */
    Result<ValidatedUrl> validateUrl(std::string_view raw) const;

    /**
     * @brief Whether a host is a private, loopback, link-local or
     *        unspecified IPv4/IPv6 literal (brackets allowed)
     */
    static bool isPrivateAddress(std::string_view host);

    [[nodiscard]] const ValidatorPolicy& policy() const noexcept { return m_policy; }

private:
    ValidatorPolicy m_policy;
};

} // namespace Warden::Security

#endif // WARDEN_CORE_INPUT_VALIDATOR_HPP
