/**
 * @file TrashTableTest.cpp
 * @brief Unit tests for the trash list table
 */

#include "cli/TrashTable.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <optional>

using testing::HasSubstr;
using testing::Not;
using testing::StartsWith;

class TrashTableTest : public TrashServiceTestFixture {
protected:
    std::optional<std::string> saved_tz;

    void SetUp() override {
        TrashServiceTestFixture::SetUp();
        if (const char* tz = std::getenv("TZ")) {
            saved_tz = tz;
        }
        ::setenv("TZ", "UTC", 1);
        ::tzset();
    }

    void TearDown() override {
        if (saved_tz) {
            ::setenv("TZ", saved_tz->c_str(), 1);
        } else {
            ::unsetenv("TZ");
        }
        ::tzset();
        TrashServiceTestFixture::TearDown();
    }
};

TEST_F(TrashTableTest, FormatUnixDate_LocalTime) {
    EXPECT_EQ(cli::format_unix_date(0), "1970-01-01 00:00:00");
    EXPECT_EQ(cli::format_unix_date(1'700'000'000), "2023-11-14 22:13:20");
}

TEST_F(TrashTableTest, Render_FitsWidth_FullPathsAndHeaders) {
    std::vector<TrashItem> items{Item("/home/u/notes.txt", 0), Item("/srv/data/report.pdf", 60)};

    auto table = cli::render_trash_table(items, 200);

    EXPECT_THAT(table, StartsWith("┌"));
    EXPECT_THAT(table, HasSubstr("│ Name "));
    EXPECT_THAT(table, HasSubstr("│ Original path "));
    EXPECT_THAT(table, HasSubstr("│ Time deleted "));
    EXPECT_THAT(table, HasSubstr("│ /home/u/notes.txt "));
    EXPECT_THAT(table, HasSubstr("1970-01-01 00:01:00"));
    EXPECT_THAT(table, Not(HasSubstr("...")));
    // top, header, separator, two rows, bottom
    EXPECT_EQ(std::count(table.begin(), table.end(), '\n'), 6);
}

// Test: too narrow a terminal shortens paths from the left
TEST_F(TrashTableTest, Render_TooWide_PathShortenedWithEllipsis) {
    std::string path = "/home/user/projects/some/deeply/nested/directory/tree/file.txt";
    std::vector<TrashItem> items{Item(path)};

    auto table = cli::render_trash_table(items, 40);

    EXPECT_THAT(table, Not(HasSubstr(path)));
    EXPECT_THAT(table, HasSubstr("..." + path.substr(path.size() - 10)));
}

TEST_F(TrashTableTest, Render_Empty_HeaderOnly) {
    auto table = cli::render_trash_table({}, 80);

    EXPECT_THAT(table, HasSubstr("Original path"));
    EXPECT_EQ(std::count(table.begin(), table.end(), '\n'), 4);
}
