#include <gtest/gtest.h>
#include "backup_time.hpp"

using namespace std::chrono;

namespace {

// 2024-03-05T07:08:09Z
const system_clock::time_point kSample = system_clock::from_time_t(1709622489);

} // namespace

TEST(BackupTimeTest, ArchiveTimestampUsesDashedUtcTime) {
    EXPECT_EQ(archiveTimestamp(kSample), "2024-03-05T07-08-09");
}

TEST(BackupTimeTest, ArchiveFileName) {
    EXPECT_EQ(archiveFileName(kSample, "zip"), "backup_2024-03-05T07-08-09_GMT.zip");
}

TEST(BackupTimeTest, ArchiveFileNameHasNoColons) {
    EXPECT_EQ(archiveFileName(system_clock::now(), "zip").find(':'), std::string::npos);
}

TEST(BackupTimeTest, FormatIso8601IncludesMilliseconds) {
    EXPECT_EQ(formatIso8601(kSample), "2024-03-05T07:08:09.000Z");
    EXPECT_EQ(formatIso8601(kSample + milliseconds(42)), "2024-03-05T07:08:09.042Z");
}

TEST(BackupTimeTest, ParseUtcForms) {
    EXPECT_EQ(parseIso8601("2024-03-05T07:08:09Z"), kSample);
    EXPECT_EQ(parseIso8601("2024-03-05T07:08:09"), kSample);
    EXPECT_EQ(parseIso8601("2024-03-05 07:08:09"), kSample);
    EXPECT_EQ(parseIso8601("2024-03-05T07:08:09.250Z"), kSample + milliseconds(250));
}

TEST(BackupTimeTest, ParseMicrosecondsFromStorageService) {
    auto parsed = parseIso8601("2024-03-05T07:08:09.123456+00:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(duration_cast<microseconds>(*parsed - kSample).count(), 123456);
}

TEST(BackupTimeTest, ParseOffsets) {
    EXPECT_EQ(parseIso8601("2024-03-05T09:08:09+02:00"), kSample);
    EXPECT_EQ(parseIso8601("2024-03-05T02:38:09-0430"), kSample);
}

TEST(BackupTimeTest, ParseRejectsMalformedInput) {
    EXPECT_FALSE(parseIso8601(""));
    EXPECT_FALSE(parseIso8601("yesterday"));
    EXPECT_FALSE(parseIso8601("2024-13-05T07:08:09Z"));
    EXPECT_FALSE(parseIso8601("2024-03-05T07:08:09Zjunk"));
    EXPECT_FALSE(parseIso8601("2024-03-05T07:08:09."));
    EXPECT_FALSE(parseIso8601("2024-03-05T07:08:09+2"));
}

TEST(BackupTimeTest, FormatThenParseIsStable) {
    const auto instant = kSample + milliseconds(987);
    EXPECT_EQ(parseIso8601(formatIso8601(instant)), instant);
}
