/**
 * @file FileUtils.hpp
 * @brief Symlink-refusing reads and atomic writes
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#pragma once

#ifndef WARDEN_CORE_FILE_UTILS_HPP
#define WARDEN_CORE_FILE_UTILS_HPP

#include <Warden/Core/ErrorCodes.hpp>
#include <filesystem>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace Warden {

/// Upper bound for configuration and manifest reads
constexpr size_t DEFAULT_MAX_FILE_SIZE = 10 * 1024 * 1024;

/**
 * @brief Read a regular file without following a final symlink
 *
 * The size is checked on the open descriptor, so the file cannot be
 * swapped between the check and the read.
 *
 * @return Contents, or FileNotFound, FileAccessDenied, AccessDenied
 *         (symlink), InvalidPath (not a regular file), FileTooLarge,
 *         FileReadError
 */
Result<std::string> readFileSecure(const std::filesystem::path& path,
                                   size_t maxBytes = DEFAULT_MAX_FILE_SIZE);

/**
 * @brief Replace a file atomically
 *
 * Data is written to a sibling temporary file, flushed, given the
 * requested mode and renamed over the target.
 */
Result<void> writeFileAtomic(const std::filesystem::path& path,
                             std::string_view data,
                             mode_t mode = 0600);

/**
 * @brief Whether a path exists (symlinks are not followed)
 */
[[nodiscard]] bool fileExists(const std::filesystem::path& path) noexcept;

} // namespace Warden

#endif // WARDEN_CORE_FILE_UTILS_HPP
