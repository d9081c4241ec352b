#include <gtest/gtest.h>
#include "compare/Comparator.hpp"

#include <chrono>

using namespace tc::compare;
using namespace tc::compare::model;
using namespace tc::fs::model;

namespace {

const auto T0 = std::filesystem::file_time_type::clock::now();

Entry file(const std::string& name, const uintmax_t size, const std::filesystem::file_time_type mtime = T0) {
    Entry e;
    e.name = name;
    e.path = "/l/" + name;
    e.size_bytes = size;
    e.mod_time = mtime;
    return e;
}

Entry dir(const std::string& name, const std::filesystem::file_time_type mtime = T0) {
    auto e = file(name, 0, mtime);
    e.is_directory = true;
    return e;
}

}

TEST(ComparatorTest, EmptyListings_EmptySnapshot) {
    const auto snap = Comparator::compare({}, {});
    EXPECT_TRUE(snap.empty());
    EXPECT_EQ(summary(snap), "Compare: 0 files | Left only: 0 | Right only: 0 | Different: 0 | Identical: 0");
}

TEST(ComparatorTest, SameSizeAndTime_Identical) {
    const auto snap = Comparator::compare({file("a", 10)}, {file("a", 10)});
    ASSERT_NE(snap.find("a"), nullptr);
    EXPECT_EQ(snap.find("a")->status, Status::Identical);
}

TEST(ComparatorTest, SizeChange_Different) {
    const auto snap = Comparator::compare({file("a", 10)}, {file("a", 11)});
    EXPECT_EQ(snap.find("a")->status, Status::Different);
}

TEST(ComparatorTest, TimeChange_Different) {
    const auto snap = Comparator::compare({file("a", 10)}, {file("a", 10, T0 + std::chrono::seconds(1))});
    EXPECT_EQ(snap.find("a")->status, Status::Different);
}

TEST(ComparatorTest, Directories_IdenticalByNameOnly) {
    const auto snap = Comparator::compare({dir("d")}, {dir("d", T0 - std::chrono::hours(5))});
    EXPECT_EQ(snap.find("d")->status, Status::Identical);
}

TEST(ComparatorTest, FileAgainstDirectory_Different) {
    const auto snap = Comparator::compare({file("x", 3)}, {dir("x")});
    const auto* entry = snap.find("x");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->status, Status::Different);
    EXPECT_FALSE(entry->bothFiles());
}

TEST(ComparatorTest, OneSided_CarriesOnlyThatSide) {
    const auto snap = Comparator::compare({file("only_l", 1), file("both", 2)}, {file("both", 2), file("only_r", 3)});

    ASSERT_EQ(snap.size(), 3u);
    EXPECT_EQ(snap.find("only_l")->status, Status::LeftOnly);
    EXPECT_TRUE(snap.find("only_l")->left.has_value());
    EXPECT_FALSE(snap.find("only_l")->right.has_value());

    EXPECT_EQ(snap.find("only_r")->status, Status::RightOnly);
    EXPECT_FALSE(snap.find("only_r")->left.has_value());
    EXPECT_TRUE(snap.find("only_r")->right.has_value());
}

TEST(ComparatorTest, ParentLink_Excluded) {
    const auto snap = Comparator::compare({Entry::parentLink("/"), file("a", 1)}, {Entry::parentLink("/")});
    EXPECT_EQ(snap.find(".."), nullptr);
    EXPECT_EQ(snap.size(), 1u);
}

TEST(ComparatorTest, Summary_CountsEveryStatus) {
    const auto snap = Comparator::compare(
        {file("l", 1), file("d", 1), file("same", 1), dir("sub")},
        {file("r", 1), file("d", 2), file("same", 1), dir("sub")});

    EXPECT_EQ(summary(snap), "Compare: 5 files | Left only: 1 | Right only: 1 | Different: 1 | Identical: 2");
}

TEST(CompareStatusTest, Strings_RoundTripAndRejectUnknown) {
    for (const auto s : {Status::LeftOnly, Status::RightOnly, Status::Different, Status::Identical})
        EXPECT_EQ(statusFromString(to_string(s)), s);
    EXPECT_THROW(statusFromString("newer"), std::invalid_argument);
    EXPECT_EQ(marker(Status::LeftOnly), "[L]");
    EXPECT_EQ(marker(Status::Identical), "[=]");
}
