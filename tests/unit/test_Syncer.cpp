#include <gtest/gtest.h>
#include "compare/Syncer.hpp"
#include "compare/Comparator.hpp"
#include "fs/Listing.hpp"
#include "support/TempDir.hpp"

#include <chrono>

namespace fs = std::filesystem;
using namespace tc::compare;
using namespace tc::compare::model;
using tc::test::TempDir;

class SyncerTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path left, right;

    void SetUp() override {
        left = tmp.mkdir("left");
        right = tmp.mkdir("right");
    }

    [[nodiscard]] Snapshot snapshot() const {
        return Comparator::compare(tc::fs::list(left), tc::fs::list(right));
    }

    static void age(const fs::path& p, const std::chrono::seconds by) {
        fs::last_write_time(p, fs::last_write_time(p) - by);
    }
};

TEST_F(SyncerTest, BothWays_CopiesOneSidedAndNewer) {
    tmp.write("left/f1", "one");
    tmp.write("right/f2", "two");
    const auto leftF3 = tmp.write("left/f3", "newer left");
    const auto rightF3 = tmp.write("right/f3", "old");
    age(rightF3, std::chrono::hours(1));

    const auto snap = snapshot();
    ASSERT_EQ(snap.find("f1")->status, Status::LeftOnly);
    ASSERT_EQ(snap.find("f2")->status, Status::RightOnly);
    ASSERT_EQ(snap.find("f3")->status, Status::Different);

    const auto report = Syncer::syncBothWays(snap, left, right);
    EXPECT_EQ(report.leftToRight, 2);
    EXPECT_EQ(report.rightToLeft, 1);
    EXPECT_EQ(report.newerCopied, 1);
    EXPECT_EQ(report.copied, 3);
    EXPECT_FALSE(report.failed());

    EXPECT_EQ(TempDir::read(right / "f1"), "one");
    EXPECT_EQ(TempDir::read(left / "f2"), "two");
    EXPECT_EQ(TempDir::read(right / "f3"), "newer left");
    EXPECT_EQ(describeBothWays(report), "Synced both ways: 2 left→right, 1 right→left, 1 newer copied");
}

TEST_F(SyncerTest, BothWays_RightNewerWins) {
    const auto leftF = tmp.write("left/f", "stale");
    tmp.write("right/f", "fresh!");
    age(leftF, std::chrono::hours(2));

    const auto report = Syncer::syncBothWays(snapshot(), left, right);
    EXPECT_EQ(report.rightToLeft, 1);
    EXPECT_EQ(report.newerCopied, 1);
    EXPECT_EQ(TempDir::read(left / "f"), "fresh!");
}

TEST_F(SyncerTest, BothWays_SkipsFileAgainstDirectory) {
    tmp.write("left/x", "file");
    tmp.mkdir("right/x");

    const auto report = Syncer::syncBothWays(snapshot(), left, right);
    EXPECT_EQ(report.copied, 0);
    EXPECT_TRUE(fs::is_directory(right / "x"));
    EXPECT_TRUE(fs::is_regular_file(left / "x"));
}

TEST_F(SyncerTest, BothWays_CopiesDirectoriesRecursively) {
    tmp.write("left/tree/a/b.txt", "deep");

    const auto report = Syncer::syncBothWays(snapshot(), left, right);
    EXPECT_EQ(report.leftToRight, 1);
    EXPECT_EQ(TempDir::read(right / "tree" / "a" / "b.txt"), "deep");
}

TEST_F(SyncerTest, OneDirection_FiltersIncompatibleTargets) {
    tmp.write("left/new", "n");
    tmp.write("right/theirs", "t");

    const auto snap = snapshot();
    const std::vector targets{*snap.find("new"), *snap.find("theirs")};

    const auto report = Syncer::syncOneDirection(targets, Direction::LeftToRight, right);
    EXPECT_EQ(report.copied, 1);
    EXPECT_EQ(report.leftToRight, 1);
    EXPECT_FALSE(fs::exists(left / "theirs"));
    EXPECT_EQ(describe(report, Direction::LeftToRight), "Synced 1 file(s) left→right");
}

TEST_F(SyncerTest, OneDirection_ContinuesPastFailures) {
    tmp.write("left/a", "a");
    tmp.write("left/b", "b");
    tmp.write("left/c", "c");

    const auto snap = snapshot();
    fs::remove(left / "b");

    const std::vector targets{*snap.find("a"), *snap.find("b"), *snap.find("c")};
    const auto report = Syncer::syncOneDirection(targets, Direction::LeftToRight, right);

    EXPECT_EQ(report.copied, 2);
    ASSERT_TRUE(report.failed());
    EXPECT_TRUE(fs::exists(right / "a"));
    EXPECT_TRUE(fs::exists(right / "c"));
    EXPECT_EQ(describe(report, Direction::LeftToRight).rfind("Synced 2 file(s) left→right, last error: ", 0), 0u);
}

TEST(SyncerCompatibilityTest, DirectionFilters) {
    EXPECT_TRUE(Syncer::compatible(Status::LeftOnly, Direction::LeftToRight));
    EXPECT_TRUE(Syncer::compatible(Status::Different, Direction::LeftToRight));
    EXPECT_FALSE(Syncer::compatible(Status::RightOnly, Direction::LeftToRight));
    EXPECT_FALSE(Syncer::compatible(Status::Identical, Direction::LeftToRight));

    EXPECT_TRUE(Syncer::compatible(Status::RightOnly, Direction::RightToLeft));
    EXPECT_TRUE(Syncer::compatible(Status::Different, Direction::RightToLeft));
    EXPECT_FALSE(Syncer::compatible(Status::LeftOnly, Direction::RightToLeft));
}
