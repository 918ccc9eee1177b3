/**
 * @file CommandWrappers.cpp
 * @brief npm, git and node wrappers around SecureExecutor
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/SecureExecutor.hpp>
#include <Warden/Core/ErrorHandler.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace Warden::Exec {

namespace {

constexpr std::array<std::string_view, 4> kNpmFlags = {
    "--no-fund",
    "--no-audit",
    "--prefer-offline",
    "--progress=false",
};

constexpr std::array<std::string_view, 2> kNodeFlags = {
    "--no-warnings",
    "--max-old-space-size=512",
};

constexpr std::array<std::string_view, 11> kForbiddenGitTokens = {
    "push", "pull", "clone", "remote", "submodule", "config",
    "hook", "filter-branch", "rebase", "reset", "--hard",
};

} // anonymous namespace

std::vector<std::string> withNpmFlags(std::vector<std::string> args) {
    args.insert(args.end(), kNpmFlags.begin(), kNpmFlags.end());
    return args;
}

std::vector<std::string> withNodeFlags(const std::vector<std::string>& args) {
    std::vector<std::string> result(kNodeFlags.begin(), kNodeFlags.end());
    result.insert(result.end(), args.begin(), args.end());
    return result;
}

Result<void> checkGitArgs(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    std::transform(joined.begin(), joined.end(), joined.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto token : kForbiddenGitTokens) {
        if (joined.find(token) != std::string::npos) {
            return makeError(ErrorCode::SubcommandNotAllowed,
                             "Git command not allowed for security reasons", "commandArgs");
        }
    }
    return {};
}

Result<ExecResult> SecureExecutor::execNpm(const std::vector<std::string>& args,
                                           const ExecOptions& options) const {
    return execute("npm", withNpmFlags(args), options);
}

Result<ExecResult> SecureExecutor::execGit(const std::vector<std::string>& args,
                                           const ExecOptions& options) const {
    auto check = checkGitArgs(args);
    if (check.isFailure()) {
        m_events.logEvent(Security::EventType::PolicyViolation,
                          {{"command", "git"}, {"reason", "subcommand not allowed"}});
        return check.errorInfo();
    }
    return execute("git", args, options);
}

Result<ExecResult> SecureExecutor::execNode(const std::vector<std::string>& args,
                                            const ExecOptions& options) const {
    return execute("node", withNodeFlags(args), options);
}

} // namespace Warden::Exec
