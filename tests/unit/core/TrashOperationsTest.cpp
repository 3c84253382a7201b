/**
 * @file TrashOperationsTest.cpp
 * @brief Unit tests for trash item selection and the trash/purge batches
 */

#include "core/TrashOperations.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace fs = std::filesystem;

using testing::_;
using testing::ElementsAre;
using testing::InSequence;
using testing::Return;

class TrashOperationsTest : public TrashServiceTestFixture {
protected:
    std::vector<std::string> missing;
    std::vector<std::string> chooser_names;

    std::function<void(const std::string&)> RecordMissing() {
        return [this](const std::string& name) { missing.push_back(name); };
    }

    // Chooser that always picks the candidate at `index`
    core::TrashChooser PickIndex(size_t index) {
        return [this, index](const std::string& name, const std::vector<TrashItem>& candidates)
                   -> std::optional<TrashItem> {
            chooser_names.push_back(name);
            return candidates.at(index);
        };
    }
};

TEST_F(TrashOperationsTest, ItemsNamed_ReturnsAllWithName) {
    std::vector<TrashItem> items{Item("/home/u/a.txt", 1), Item("/home/u/b.txt", 2),
                                 Item("/tmp/a.txt", 3)};

    auto named = core::items_named(items, "a.txt");

    EXPECT_THAT(named, ElementsAre(items[0], items[2]));
    EXPECT_TRUE(core::items_named(items, "c.txt").empty());
}

// Test: a unique name is selected without asking
TEST_F(TrashOperationsTest, SelectItems_UniqueName_NoChooser) {
    std::vector<TrashItem> items{Item("/home/u/a.txt"), Item("/home/u/b.txt")};

    auto selected = core::select_items(items, {"b.txt"}, PickIndex(0), RecordMissing());

    EXPECT_THAT(selected, ElementsAre(items[1]));
    EXPECT_TRUE(chooser_names.empty());
    EXPECT_TRUE(missing.empty());
}

TEST_F(TrashOperationsTest, SelectItems_Duplicates_ChooserDecides) {
    std::vector<TrashItem> items{Item("/a/x.txt", 1), Item("/b/x.txt", 2)};

    auto selected = core::select_items(items, {"x.txt"}, PickIndex(1), RecordMissing());

    EXPECT_THAT(selected, ElementsAre(items[1]));
    EXPECT_THAT(chooser_names, ElementsAre("x.txt"));
}

// Test: a missing name is reported and the rest are still selected
TEST_F(TrashOperationsTest, SelectItems_MissingName_ReportedAndSkipped) {
    std::vector<TrashItem> items{Item("/a/x.txt")};

    auto selected = core::select_items(items, {"ghost", "x.txt"}, PickIndex(0), RecordMissing());

    EXPECT_THAT(selected, ElementsAre(items[0]));
    EXPECT_THAT(missing, ElementsAre("ghost"));
}

// Test: repeating a name selects a different item each time
TEST_F(TrashOperationsTest, SelectItems_RepeatedName_DistinctItems) {
    std::vector<TrashItem> items{Item("/a/x.txt", 1), Item("/b/x.txt", 2)};

    auto selected =
        core::select_items(items, {"x.txt", "x.txt", "x.txt"}, PickIndex(0), RecordMissing());

    EXPECT_THAT(selected, ElementsAre(items[0], items[1]));
    EXPECT_THAT(missing, ElementsAre("x.txt"));
}

TEST_F(TrashOperationsTest, SelectItems_ChooserDeclines_NameSkipped) {
    std::vector<TrashItem> items{Item("/a/x.txt", 1), Item("/b/x.txt", 2)};
    core::TrashChooser decline = [](const std::string&, const std::vector<TrashItem>&) {
        return std::optional<TrashItem>{};
    };

    auto selected = core::select_items(items, {"x.txt"}, decline, RecordMissing());

    EXPECT_TRUE(selected.empty());
    EXPECT_TRUE(missing.empty());
}

TEST_F(TrashOperationsTest, FuzzyFilter_KeepsLooseMatches) {
    std::vector<TrashItem> items{Item("/a/Report-2024.pdf"), Item("/a/notes.txt"),
                                 Item("/a/photo.jpg")};

    auto matches = core::fuzzy_filter(items, "report");

    EXPECT_THAT(matches, ElementsAre(items[0]));
    EXPECT_THAT(core::fuzzy_filter(items, "notez.txt"), ElementsAre(items[1]));
}

TEST_F(TrashOperationsTest, TrashPaths_AllSucceed_CountsEach) {
    std::vector<fs::path> paths{"/tmp/one", "/tmp/two"};
    std::vector<ProgressEvent> events;
    {
        InSequence seq;
        EXPECT_CALL(*mock_trash, trash(fs::path{"/tmp/one"})).WillOnce(Return(util::Result<void>{}));
        EXPECT_CALL(*mock_trash, trash(fs::path{"/tmp/two"})).WillOnce(Return(util::Result<void>{}));
    }

    auto report = core::trash_paths(*mock_trash, paths,
                                     [&](const ProgressEvent& event) { events.push_back(event); });

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.processed_count, 2u);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, OperationKind::TRASH);
}

// Test: the first failure stops the batch and carries the path
TEST_F(TrashOperationsTest, TrashPaths_Failure_StopsBatch) {
    std::vector<fs::path> paths{"/tmp/one", "/tmp/two", "/tmp/three"};
    {
        InSequence seq;
        EXPECT_CALL(*mock_trash, trash(fs::path{"/tmp/one"})).WillOnce(Return(util::Result<void>{}));
        EXPECT_CALL(*mock_trash, trash(fs::path{"/tmp/two"}))
            .WillOnce(Return(MockTrashService::Failure("Unable to find or create trash directory")));
    }

    auto report = core::trash_paths(*mock_trash, paths, nullptr);

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.processed_count, 1u);
    EXPECT_EQ(report.error->path, "/tmp/two");
    EXPECT_EQ(report.error->kind, util::ErrorKind::TRASH);
}

TEST_F(TrashOperationsTest, PurgeItems_Failure_StopsBatch) {
    std::vector<TrashItem> items{Item("/a/one"), Item("/a/two"), Item("/a/three")};
    {
        InSequence seq;
        EXPECT_CALL(*mock_trash, purge(items[0])).WillOnce(Return(util::Result<void>{}));
        EXPECT_CALL(*mock_trash, purge(items[1])).WillOnce(Return(MockTrashService::Failure("I/O")));
    }

    auto report = core::purge_items(*mock_trash, items, nullptr);

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.processed_count, 1u);
    EXPECT_EQ(report.error->path, "two");
}

TEST_F(TrashOperationsTest, PurgeItems_AllSucceed_CountsEach) {
    std::vector<TrashItem> items{Item("/a/one"), Item("/a/two")};
    EXPECT_CALL(*mock_trash, purge(_)).Times(2).WillRepeatedly(Return(util::Result<void>{}));

    auto report = core::purge_items(*mock_trash, items, nullptr);

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.processed_count, 2u);
}
