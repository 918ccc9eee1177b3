/**
 * @file SecureExecutor.hpp
 * @brief Whitelisted, shell-free subprocess execution
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * Commands are spawned directly (no shell) inside their own process group,
 * with stdin bound to /dev/null, a filtered environment, a wall-clock
 * deadline and a cap on combined output. A child is always reaped before
 * execute() returns.
 */

#pragma once

#ifndef WARDEN_CORE_SECURE_EXECUTOR_HPP
#define WARDEN_CORE_SECURE_EXECUTOR_HPP

#include <Warden/Core/ErrorCodes.hpp>
#include <Warden/Core/InputValidator.hpp>
#include <Warden/Core/Retry.hpp>
#include <Warden/Core/SecurityEventLog.hpp>
#include <Warden/Core/Types.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Warden::Exec {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Executor limits and whitelist
 */
struct ExecutorConfig {
    std::vector<std::string> allowedCommands{"npm", "node", "git", "yarn", "pnpm"};
    Milliseconds defaultTimeout{30000};
    Milliseconds killGrace{5000};                  ///< SIGTERM to SIGKILL delay
    size_t maxOutputBytes = 1024 * 1024;           ///< stdout + stderr
    std::vector<std::string> strippedEnv{"LD_PRELOAD", "LD_LIBRARY_PATH"};
};

/**
 * @brief Per-call options
 */
struct ExecOptions {
    std::optional<Milliseconds> timeout;   ///< Overrides ExecutorConfig::defaultTimeout
    std::filesystem::path cwd;             ///< Empty to inherit
};

/**
 * @brief Outcome of a process that exited on its own
 */
struct ExecResult {
    std::string stdOut;    ///< Trimmed standard output
    std::string stdErr;    ///< Trimmed standard error
    int exitCode = 0;
};

// ============================================================================
// SecureExecutor
// ============================================================================

class SecureExecutor {
public:
    /**
     * @param config Whitelist and limits
     * @param validator Validator used for argument sanitization
     * @param events Sink for rejected commands
     */
    explicit SecureExecutor(ExecutorConfig config = ExecutorConfig{},
                            const Security::InputValidator& validator =
                                Security::InputValidator::defaultInstance(),
                            Security::SecurityEventLog& events =
                                Security::SecurityEventLog::Instance());

    /**
     * @brief Run a whitelisted command
     *
     * Failures:
     * - CommandNotAllowed: command not whitelisted (nothing spawned)
     * - Validation errors: an argument was rejected (nothing spawned)
     * - SpawnFailed: fork or exec failed
     * - OutputTooLarge: combined output exceeded the cap; group killed
     * - Timeout: deadline passed; SIGTERM then SIGKILL after the grace period
     * - KilledBySignal: the child died from a signal it was not sent by us
     *
     * A non-zero exit status is not a failure; it is reported in exitCode.
     */
    Result<ExecResult> execute(std::string_view command,
                               const std::vector<std::string>& args,
                               const ExecOptions& options = ExecOptions{}) const;

    /// npm with non-interactive, offline-preferring flags appended
    Result<ExecResult> execNpm(const std::vector<std::string>& args,
                               const ExecOptions& options = ExecOptions{}) const;

    /// git with repository-mutating subcommands rejected up front
    Result<ExecResult> execGit(const std::vector<std::string>& args,
                               const ExecOptions& options = ExecOptions{}) const;

    /// node with warnings suppressed and the heap capped
    Result<ExecResult> execNode(const std::vector<std::string>& args,
                                const ExecOptions& options = ExecOptions{}) const;

    [[nodiscard]] bool isCommandAllowed(std::string_view command) const;

    [[nodiscard]] const ExecutorConfig& config() const noexcept { return m_config; }

private:
    Result<ExecResult> run(const std::string& command,
                           const std::vector<Security::CommandArg>& args,
                           const ExecOptions& options) const;

    ExecutorConfig m_config;
    const Security::InputValidator& m_validator;
    Security::SecurityEventLog& m_events;
};

// ============================================================================
// Wrapper Argument Policies
// ============================================================================

/// args followed by --no-fund --no-audit --prefer-offline --progress=false
std::vector<std::string> withNpmFlags(std::vector<std::string> args);

/// --no-warnings --max-old-space-size=512 followed by args
std::vector<std::string> withNodeFlags(const std::vector<std::string>& args);

/**
 * @brief Reject git invocations that touch remotes, hooks, config or history
 * @return SubcommandNotAllowed naming the rule class
 */
Result<void> checkGitArgs(const std::vector<std::string>& args);

} // namespace Warden::Exec

#endif // WARDEN_CORE_SECURE_EXECUTOR_HPP
