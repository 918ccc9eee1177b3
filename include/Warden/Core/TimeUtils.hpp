/**
 * @file TimeUtils.hpp
 * @brief ISO-8601 timestamp formatting and parsing
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#pragma once

#ifndef WARDEN_CORE_TIME_UTILS_HPP
#define WARDEN_CORE_TIME_UTILS_HPP

#include <Warden/Core/Types.hpp>
#include <Warden/Core/ErrorCodes.hpp>
#include <string>
#include <string_view>

namespace Warden {

/**
 * @brief Format a wall-clock time as "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC)
 */
std::string formatIso8601(WallTime time);

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS[.fff]Z" (registry timestamps)
 * @return Time point or InvalidTimestamp
 */
Result<WallTime> parseIso8601(std::string_view text);

/**
 * @brief Whole days elapsed between two wall-clock times (may be negative)
 */
[[nodiscard]] double daysBetween(WallTime earlier, WallTime later) noexcept;

} // namespace Warden

#endif // WARDEN_CORE_TIME_UTILS_HPP
