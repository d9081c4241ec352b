#include <gtest/gtest.h>
#include "compare/Session.hpp"
#include "status/Sink.hpp"
#include "support/TempDir.hpp"

#include <chrono>

namespace fs = std::filesystem;
using namespace tc::compare;
using namespace tc::compare::model;
using tc::pane::Pane;
using tc::pane::Side;
using tc::test::TempDir;

class CompareSessionTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::shared_ptr<tc::status::Recorder> status = std::make_shared<tc::status::Recorder>();

    void SetUp() override {
        tmp.write("left/a.txt", "left only");
        tmp.write("left/changed", "v2 longer");
        tmp.write("right/changed", "v1");
        tmp.write("right/z.txt", "right only");

        const auto stamp = fs::file_time_type::clock::now() - std::chrono::hours(3);
        fs::last_write_time(tmp.write("left/same", "same"), stamp);
        fs::last_write_time(tmp.write("right/same", "same"), stamp);
    }

    [[nodiscard]] Pane leftPane() const { return Pane(tmp.path() / "left"); }
    [[nodiscard]] Pane rightPane() const { return Pane(tmp.path() / "right"); }
};

TEST_F(CompareSessionTest, Enter_BuildsSnapshotAndReportsSummary) {
    Session session(status);
    auto left = leftPane();
    auto right = rightPane();

    const auto& snap = session.enter(left, right);
    EXPECT_TRUE(session.isActive());
    EXPECT_EQ(snap.find("a.txt")->status, Status::LeftOnly);
    EXPECT_EQ(snap.find("z.txt")->status, Status::RightOnly);
    EXPECT_EQ(snap.find("changed")->status, Status::Different);
    EXPECT_EQ(snap.find("same")->status, Status::Identical);
    EXPECT_EQ(status->last(), "Compare: 4 files | Left only: 1 | Right only: 1 | Different: 1 | Identical: 1");
}

TEST_F(CompareSessionTest, Sync_OutsideCompareModeRejected) {
    Session session(status);
    auto left = leftPane();
    auto right = rightPane();

    EXPECT_FALSE(session.syncOneDirection(left, right, Direction::LeftToRight, Side::Left).has_value());
    EXPECT_EQ(status->last(), "Not in compare mode");
    EXPECT_FALSE(session.syncBothWays(left, right).has_value());
    EXPECT_FALSE(fs::exists(tmp.path() / "right" / "a.txt"));
}

TEST_F(CompareSessionTest, SyncOneDirection_UsesSelectionAndRebuilds) {
    Session session(status);
    auto left = leftPane();
    auto right = rightPane();
    session.enter(left, right);

    ASSERT_TRUE(left.select("a.txt"));
    ASSERT_TRUE(left.select("same"));

    const auto report = session.syncOneDirection(left, right, Direction::LeftToRight, Side::Left);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->copied, 1);
    EXPECT_EQ(status->last(), "Synced 1 file(s) left→right");

    EXPECT_FALSE(left.hasSelection());
    EXPECT_TRUE(fs::exists(tmp.path() / "right" / "a.txt"));
    EXPECT_NE(session.snapshot().find("a.txt")->status, Status::LeftOnly);
    EXPECT_TRUE(right.highlight("a.txt"));
}

TEST_F(CompareSessionTest, SyncOneDirection_HighlightUsedOnlyWhenSourceActive) {
    Session session(status);
    auto left = leftPane();
    auto right = rightPane();
    session.enter(left, right);

    ASSERT_TRUE(left.highlight("a.txt"));

    EXPECT_FALSE(session.syncOneDirection(left, right, Direction::LeftToRight, Side::Right).has_value());
    EXPECT_EQ(status->last(), "No files to sync (select left_only or different files)");

    const auto report = session.syncOneDirection(left, right, Direction::LeftToRight, Side::Left);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->copied, 1);
}

TEST_F(CompareSessionTest, SyncOneDirection_RightToLeftNothingCompatible) {
    Session session(status);
    auto left = leftPane();
    auto right = rightPane();
    session.enter(left, right);

    ASSERT_TRUE(right.select("same"));
    EXPECT_FALSE(session.syncOneDirection(left, right, Direction::RightToLeft, Side::Right).has_value());
    EXPECT_EQ(status->last(), "No files to sync (select right_only or different files)");
}

TEST_F(CompareSessionTest, SyncBothWays_ReportsCountersAndRefreshesPanes) {
    Session session(status);
    auto left = leftPane();
    auto right = rightPane();
    session.enter(left, right);

    fs::last_write_time(tmp.path() / "right" / "changed",
                        fs::file_time_type::clock::now() - std::chrono::hours(1));
    left.refresh();
    right.refresh();
    session.enter(left, right);

    const auto report = session.syncBothWays(left, right);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->leftToRight, 2);
    EXPECT_EQ(report->rightToLeft, 1);
    EXPECT_EQ(report->newerCopied, 1);
    EXPECT_EQ(status->last(), "Synced both ways: 2 left→right, 1 right→left, 1 newer copied");

    EXPECT_TRUE(left.highlight("z.txt"));
    EXPECT_TRUE(right.highlight("a.txt"));
    EXPECT_EQ(TempDir::read(tmp.path() / "right" / "changed"), "v2 longer");
    EXPECT_EQ(session.snapshot().count(Status::LeftOnly), 0u);
    EXPECT_EQ(session.snapshot().count(Status::RightOnly), 0u);
}

TEST_F(CompareSessionTest, Exit_ClearsSnapshot) {
    Session session(status);
    auto left = leftPane();
    auto right = rightPane();
    session.enter(left, right);

    session.exit(left, right);
    EXPECT_FALSE(session.isActive());
    EXPECT_TRUE(session.snapshot().empty());
    EXPECT_EQ(status->last(), "Compare mode exited");
}
