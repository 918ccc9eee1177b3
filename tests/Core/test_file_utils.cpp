/**
 * @file test_file_utils.cpp
 * @brief Unit tests for bounded file reads, atomic writes and timestamps
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/FileUtils.hpp>
#include <Warden/Core/TimeUtils.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <sys/stat.h>

using namespace Warden;
using namespace Warden::Testing;

// ============================================================================
// Unit Test 1: readFileSecure
// ============================================================================

TEST(ReadFileSecure, ReadsWholeFile) {
    TempDirectory dir;
    auto path = dir.writeFile("package.json", R"({"name":"demo"})");

    auto result = readFileSecure(path);
    ASSERT_TRUE(result.isSuccess()) << result.errorInfo().message;
    EXPECT_EQ(result.value(), R"({"name":"demo"})");
}

TEST(ReadFileSecure, MissingFile) {
    TempDirectory dir;
    EXPECT_ERROR_CODE(readFileSecure(dir / "missing.json"), ErrorCode::FileNotFound);
}

TEST(ReadFileSecure, RejectsDirectory) {
    TempDirectory dir;
    EXPECT_ERROR_CODE(readFileSecure(dir.path()), ErrorCode::InvalidPath);
}

TEST(ReadFileSecure, EnforcesSizeCap) {
    TempDirectory dir;
    auto path = dir.writeFile("big.json", std::string(2048, 'x'));

    EXPECT_ERROR_CODE(readFileSecure(path, 1024), ErrorCode::FileTooLarge);
    EXPECT_TRUE(readFileSecure(path, 2048).isSuccess());
}

TEST(ReadFileSecure, RefusesSymbolicLink) {
    TempDirectory dir;
    auto target = dir.writeFile("real.json", "{}");
    auto link = dir / "link.json";
    std::filesystem::create_symlink(target, link);

    EXPECT_ERROR_CODE(readFileSecure(link), ErrorCode::AccessDenied);
}

// ============================================================================
// Unit Test 2: writeFileAtomic
// ============================================================================

TEST(WriteFileAtomic, WritesWithRequestedMode) {
    TempDirectory dir;
    auto path = dir / "secrets.json";

    ASSERT_TRUE(writeFileAtomic(path, "first").isSuccess());
    EXPECT_EQ(readFile(path), "first");

    struct stat st;
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    ASSERT_TRUE(writeFileAtomic(path, "second", 0644).isSuccess());
    EXPECT_EQ(readFile(path), "second");
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0644u);
}

TEST(WriteFileAtomic, LeavesNoTemporaryFiles) {
    TempDirectory dir;
    ASSERT_TRUE(writeFileAtomic(dir / "a.json", "{}").isSuccess());

    size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        EXPECT_EQ(entry.path().filename().string(), "a.json");
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST(WriteFileAtomic, MissingDirectoryFails) {
    TempDirectory dir;
    EXPECT_ERROR_CODE(writeFileAtomic(dir / "no" / "such" / "file.json", "{}"),
                      ErrorCode::FileNotFound);
}

TEST(FileExists, SeesDanglingLinks) {
    TempDirectory dir;
    auto link = dir / "dangling";
    std::filesystem::create_symlink(dir / "nowhere", link);

    EXPECT_TRUE(fileExists(link));
    EXPECT_FALSE(fileExists(dir / "nowhere"));
}

// ============================================================================
// Unit Test 3: Timestamps
// ============================================================================

TEST(TimeUtils, FormatEpoch) {
    EXPECT_EQ(formatIso8601(WallClock::from_time_t(0)), "1970-01-01T00:00:00.000Z");
}

TEST(TimeUtils, ParseRegistryTimestamps) {
    auto withMillis = parseIso8601("2024-01-15T10:30:00.250Z");
    ASSERT_TRUE(withMillis.isSuccess());
    EXPECT_EQ(formatIso8601(withMillis.value()), "2024-01-15T10:30:00.250Z");

    auto plain = parseIso8601("2024-01-15T10:30:00Z");
    ASSERT_TRUE(plain.isSuccess());
    EXPECT_EQ(formatIso8601(plain.value()), "2024-01-15T10:30:00.000Z");
}

TEST(TimeUtils, RejectsMalformedTimestamps) {
    EXPECT_ERROR_CODE(parseIso8601("yesterday"), ErrorCode::InvalidTimestamp);
    EXPECT_ERROR_CODE(parseIso8601("2024-13-01T00:00:00Z"), ErrorCode::InvalidTimestamp);
    EXPECT_ERROR_CODE(parseIso8601("2024-01-01 00:00:00Z"), ErrorCode::InvalidTimestamp);
    EXPECT_ERROR_CODE(parseIso8601("2024-01-01T00:00:00+01:00"), ErrorCode::InvalidTimestamp);
}

TEST(TimeUtils, DaysBetween) {
    const WallTime start = WallClock::from_time_t(1700000000);
    EXPECT_DOUBLE_EQ(daysBetween(start, start + std::chrono::hours(36)), 1.5);
    EXPECT_DOUBLE_EQ(daysBetween(start + std::chrono::hours(24), start), -1.0);
}
