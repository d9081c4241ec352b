#pragma once

#include <string>
#include <vector>

namespace tc::diff::model {

// Closed interval [start, end] of line indices. An empty range sits at the insertion
// point and has end == start - 1.
struct LineRange {
    int start{0};
    int end{-1};

    [[nodiscard]] int size() const { return end - start + 1; }
    [[nodiscard]] bool empty() const { return end < start; }

    [[nodiscard]] bool operator==(const LineRange&) const = default;
};

struct Block {
    enum class Kind { Equal, Add, Delete, Modify };

    LineRange left{}, right{};
    Kind kind{Kind::Equal};

    [[nodiscard]] bool isEqual() const { return kind == Kind::Equal; }

    [[nodiscard]] bool operator==(const Block&) const = default;
};

using BlockList = std::vector<Block>;

std::string to_string(const Block::Kind& kind);
Block::Kind blockKindFromString(const std::string& str);

std::string to_string(const Block& block);

}
