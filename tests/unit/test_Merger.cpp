#include <gtest/gtest.h>
#include "diff/Merger.hpp"
#include "diff/Navigator.hpp"
#include "status/Sink.hpp"

using namespace tc::diff;
using namespace tc::diff::model;

class MergerTest : public ::testing::Test {
protected:
    State state;
    tc::status::Recorder status;

    void load(LineBuffer left, LineBuffer right) {
        state.leftLines = std::move(left);
        state.rightLines = std::move(right);
        state.recompute(3);
    }
};

TEST_F(MergerTest, CopyRightToLeft_ReplacesModifiedLine) {
    load({"a", "b", "c"}, {"a", "x", "c"});
    ASSERT_TRUE(Navigator::next(state, status));

    EXPECT_TRUE(Merger::copyRightToLeft(state, status, 3));
    EXPECT_EQ(state.leftLines, (LineBuffer{"a", "x", "c"}));
    EXPECT_TRUE(state.leftModified);
    EXPECT_FALSE(state.rightModified);
    EXPECT_EQ(status.last(), "Copied right → left");

    ASSERT_EQ(state.blocks.size(), 1u);
    EXPECT_TRUE(state.blocks[0].isEqual());
    EXPECT_EQ(state.currentBlock, 0);
}

TEST_F(MergerTest, CopyLeftToRight_RegionMatchesAfterRecompute) {
    load({"a", "b", "c"}, {"a", "x", "y", "z", "c", "tail"});
    ASSERT_TRUE(Navigator::next(state, status));

    const auto block = state.blocks[state.currentBlock];
    ASSERT_EQ(block.kind, Block::Kind::Modify);
    ASSERT_EQ(block.right, (LineRange{1, 3}));

    EXPECT_TRUE(Merger::copyLeftToRight(state, status, 3));
    EXPECT_EQ(state.rightLines, (LineBuffer{"a", "b", "c", "tail"}));
    EXPECT_TRUE(state.rightModified);
    EXPECT_FALSE(state.leftModified);
}

TEST_F(MergerTest, CopyLeftToRight_AddBlockRemovesRightLines) {
    load({"a"}, {"a", "b", "c"});
    ASSERT_TRUE(Navigator::next(state, status));
    ASSERT_EQ(state.blocks[state.currentBlock].kind, Block::Kind::Add);

    EXPECT_TRUE(Merger::copyLeftToRight(state, status, 3));
    EXPECT_EQ(state.rightLines, (LineBuffer{"a"}));
}

TEST_F(MergerTest, CopyRightToLeft_AddBlockInsertsLines) {
    load({"a", "d"}, {"a", "b", "d"});
    ASSERT_TRUE(Navigator::next(state, status));

    EXPECT_TRUE(Merger::copyRightToLeft(state, status, 3));
    EXPECT_EQ(state.leftLines, (LineBuffer{"a", "b", "d"}));
}

TEST_F(MergerTest, EqualBlock_IsRejected) {
    load({"a", "b"}, {"a", "c"});
    state.currentBlock = 0;

    EXPECT_FALSE(Merger::copyLeftToRight(state, status, 3));
    EXPECT_EQ(status.last(), "No difference at current position");
    EXPECT_EQ(state.rightLines, (LineBuffer{"a", "c"}));
    EXPECT_FALSE(state.rightModified);
}

TEST_F(MergerTest, IndexOutOfRange_IsRejected) {
    load({"a"}, {"b"});
    state.currentBlock = 5;

    EXPECT_FALSE(Merger::copyRightToLeft(state, status, 3));
    EXPECT_EQ(status.last(), "No difference selected");
    EXPECT_FALSE(state.leftModified);
}

TEST_F(MergerTest, Splice_RangeOutsideBufferThrows) {
    LineBuffer dst{"a"};
    EXPECT_THROW(Merger::splice({"x"}, {0, 0}, dst, {1, 3}), std::out_of_range);
    EXPECT_THROW(Merger::splice({"x"}, {2, 2}, dst, {0, 0}), std::out_of_range);
    EXPECT_EQ(dst, (LineBuffer{"a"}));
}
