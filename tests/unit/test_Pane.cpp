#include <gtest/gtest.h>
#include "pane/Pane.hpp"
#include "fs/Listing.hpp"
#include "status/Sink.hpp"
#include "support/TempDir.hpp"

#include <algorithm>

namespace fs = std::filesystem;
using tc::pane::Pane;
using tc::test::TempDir;

class PaneTest : public ::testing::Test {
protected:
    TempDir tmp;
    tc::status::Recorder status;

    void SetUp() override {
        tmp.write("b.txt", "b");
        tmp.write("A.txt", "a");
        tmp.write(".hidden", "h");
        tmp.mkdir("zeta");
        tmp.mkdir("Alpha");
    }

    static std::vector<std::string> names(const std::vector<tc::fs::model::Entry>& entries) {
        std::vector<std::string> out;
        std::ranges::transform(entries, std::back_inserter(out), &tc::fs::model::Entry::name);
        return out;
    }
};

TEST_F(PaneTest, Listing_ParentThenDirectoriesThenFilesCaseInsensitive) {
    const auto entries = tc::fs::list(tmp.path());
    EXPECT_EQ(names(entries), (std::vector<std::string>{"..", "Alpha", "zeta", ".hidden", "A.txt", "b.txt"}));
    EXPECT_TRUE(entries[0].isParentLink());
    EXPECT_EQ(entries[0].path, tmp.path().parent_path());
}

TEST_F(PaneTest, Listing_HiddenEntriesCanBeSkipped) {
    const auto entries = tc::fs::list(tmp.path(), false);
    EXPECT_EQ(std::ranges::count(names(entries), std::string(".hidden")), 0);
}

TEST_F(PaneTest, Listing_RootHasNoParentLink) {
    const auto entries = tc::fs::list("/");
    EXPECT_TRUE(std::ranges::none_of(entries, [](const auto& e) { return e.isParentLink(); }));
}

TEST_F(PaneTest, Listing_CapturesFileMetadata) {
    const auto entries = tc::fs::list(tmp.path());
    const auto it = std::ranges::find(entries, std::string("b.txt"), &tc::fs::model::Entry::name);
    ASSERT_NE(it, entries.end());
    EXPECT_FALSE(it->is_directory);
    EXPECT_EQ(it->size_bytes, 1u);
    EXPECT_EQ(it->mod_time, fs::last_write_time(tmp.path() / "b.txt"));
}

TEST_F(PaneTest, ToggleSelection_ParentLinkRefused) {
    Pane pane(tmp.path());
    ASSERT_EQ(pane.highlighted(), 0);

    EXPECT_FALSE(pane.toggleSelection(status));
    EXPECT_EQ(status.last(), "Cannot select parent directory link");
    EXPECT_EQ(pane.highlighted(), 0);
}

TEST_F(PaneTest, ToggleSelection_SelectsThenDeselectsAndAdvances) {
    Pane pane(tmp.path());
    ASSERT_TRUE(pane.highlight("A.txt"));
    const auto row = pane.highlighted();

    EXPECT_TRUE(pane.toggleSelection(status));
    EXPECT_EQ(status.last(), "Selected: A.txt");
    EXPECT_EQ(pane.highlighted(), row + 1);
    EXPECT_TRUE(pane.isSelected("A.txt"));

    pane.highlight(row);
    EXPECT_TRUE(pane.toggleSelection(status));
    EXPECT_EQ(status.last(), "Deselected: A.txt");
    EXPECT_FALSE(pane.hasSelection());
}

TEST_F(PaneTest, ToggleSelection_LastRowKeepsHighlight) {
    Pane pane(tmp.path());
    const auto last = static_cast<int>(pane.entries().size()) - 1;
    pane.highlight(last);

    EXPECT_TRUE(pane.toggleSelection(status));
    EXPECT_EQ(pane.highlighted(), last);
}

TEST_F(PaneTest, SelectedEntries_InListingOrder) {
    Pane pane(tmp.path());
    ASSERT_TRUE(pane.select("b.txt"));
    ASSERT_TRUE(pane.select("zeta"));
    EXPECT_FALSE(pane.select(".."));
    EXPECT_FALSE(pane.select("missing"));

    EXPECT_EQ(names(pane.selectedEntries()), (std::vector<std::string>{"zeta", "b.txt"}));
}

TEST_F(PaneTest, Refresh_DropsVanishedSelectionAndClampsHighlight) {
    Pane pane(tmp.path());
    ASSERT_TRUE(pane.select("b.txt"));
    pane.highlight(static_cast<int>(pane.entries().size()) - 1);

    fs::remove(tmp.path() / "b.txt");
    pane.refresh();

    EXPECT_FALSE(pane.hasSelection());
    EXPECT_EQ(pane.highlighted(), static_cast<int>(pane.entries().size()) - 1);
    ASSERT_TRUE(pane.highlightedEntry().has_value());
    EXPECT_EQ(pane.highlightedEntry()->name, "A.txt");
}
