#include "SavingWorkers/RecordingNaming.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <set>

TEST(RecordingNamingTest, NameEncodesCaptureTime) {
    test_utils::TempDir dir;
    const std::time_t now = std::time(nullptr);
    const std::string path = MakeRecordingPath(dir.Path(), now);

    EXPECT_EQ(std::filesystem::path(path).parent_path(), std::filesystem::path(dir.Path()));

    auto parsed = ParseRecordingTimestamp(path);
    ASSERT_TRUE(parsed.has_value());

    std::tm expected{};
    localtime_r(&now, &expected);
    EXPECT_EQ(parsed->tm_year, expected.tm_year);
    EXPECT_EQ(parsed->tm_mon, expected.tm_mon);
    EXPECT_EQ(parsed->tm_mday, expected.tm_mday);
    EXPECT_EQ(parsed->tm_hour, expected.tm_hour);
    EXPECT_EQ(parsed->tm_min, expected.tm_min);
    EXPECT_EQ(parsed->tm_sec, expected.tm_sec);
}

TEST(RecordingNamingTest, NamesAreUniqueWithinTheSameSecond) {
    test_utils::TempDir dir;
    const std::time_t now = std::time(nullptr);

    std::set<std::string> seen;
    for (int i = 0; i < 3; ++i) {
        const std::string path = MakeRecordingPath(dir.Path(), now);
        EXPECT_TRUE(seen.insert(path).second) << path;
        std::ofstream(path) << "x";
        EXPECT_TRUE(ParseRecordingTimestamp(path).has_value()) << path;
    }
}

TEST(RecordingNamingTest, RejectsForeignAndInvalidNames) {
    EXPECT_FALSE(ParseRecordingTimestamp("recordings/notes.wav").has_value());
    EXPECT_FALSE(ParseRecordingTimestamp("recording_2024_0101.wav").has_value());
    EXPECT_FALSE(ParseRecordingTimestamp("recording_20240231_120000.wav").has_value());
    EXPECT_FALSE(ParseRecordingTimestamp("recording_20241301_120000.wav").has_value());
    EXPECT_TRUE(ParseRecordingTimestamp("recordings/recording_20240229_235959.wav").has_value());
    EXPECT_TRUE(ParseRecordingTimestamp("recording_20240101_000000_2.wav").has_value());
}

TEST(RecordingNamingTest, KeepsWallClockFieldsFromName) {
    // 02:30 on the second Sunday of March does not exist in many DST zones.
    auto parsed = ParseRecordingTimestamp("recording_20240310_023015.wav");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->tm_year, 124);
    EXPECT_EQ(parsed->tm_mon, 2);
    EXPECT_EQ(parsed->tm_mday, 10);
    EXPECT_EQ(parsed->tm_hour, 2);
    EXPECT_EQ(parsed->tm_min, 30);
    EXPECT_EQ(parsed->tm_sec, 15);
}

TEST(RecordingNamingTest, EnsureOutputDirectoryCreatesParents) {
    test_utils::TempDir dir;
    const std::string nested = dir.File("a/b/recordings");
    EnsureOutputDirectory(nested);
    EXPECT_TRUE(std::filesystem::is_directory(nested));
    EXPECT_NO_THROW(EnsureOutputDirectory(nested));
}
