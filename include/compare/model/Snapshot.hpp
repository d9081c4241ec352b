#pragma once

#include "fs/model/Entry.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace tc::compare::model {

enum class Status {
    LeftOnly,
    RightOnly,
    Different,
    Identical
};

struct CompareEntry {
    std::string name{};
    Status status{Status::Identical};
    std::optional<fs::model::Entry> left{};
    std::optional<fs::model::Entry> right{};

    [[nodiscard]] bool bothFiles() const {
        return left && right && !left->is_directory && !right->is_directory;
    }
};

// Per-name classification of two single-level listings, ordered by name.
struct Snapshot {
    std::map<std::string, CompareEntry> entries{};

    [[nodiscard]] std::size_t size() const { return entries.size(); }
    [[nodiscard]] bool empty() const { return entries.empty(); }
    [[nodiscard]] std::size_t count(Status status) const;
    [[nodiscard]] const CompareEntry* find(const std::string& name) const;
};

std::string to_string(const Status& status);
Status statusFromString(const std::string& str);

// "[L]", "[R]", "[D]" or "[=]"
std::string marker(const Status& status);

// "Compare: T files | Left only: a | Right only: b | Different: c | Identical: d"
std::string summary(const Snapshot& snapshot);

}
