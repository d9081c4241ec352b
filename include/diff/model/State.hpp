#pragma once

#include "diff/model/Block.hpp"
#include "diff/model/LineBuffer.hpp"

#include <algorithm>
#include <filesystem>
#include <string>

namespace tc::diff::model {

enum class Side { Left, Right };

struct Cursor {
    int row{0}, col{0};

    [[nodiscard]] bool operator==(const Cursor&) const = default;
};

// Everything an open diff holds. Owned by diff::Session and handed by reference to
// the navigator, merger and editor.
struct State {
    std::filesystem::path leftPath{}, rightPath{};
    LineBuffer leftLines{}, rightLines{};
    std::string leftOnDisk{}, rightOnDisk{};  // bytes as last read or written
    BlockList blocks{};
    int currentBlock{0};
    int scrollLine{0};
    bool leftModified{false}, rightModified{false};
    Side activeSide{Side::Left};
    Cursor cursor{};

    [[nodiscard]] LineBuffer& lines(const Side side) { return side == Side::Left ? leftLines : rightLines; }
    [[nodiscard]] const LineBuffer& lines(const Side side) const { return side == Side::Left ? leftLines : rightLines; }

    [[nodiscard]] LineBuffer& activeLines() { return lines(activeSide); }
    [[nodiscard]] const LineBuffer& activeLines() const { return lines(activeSide); }

    [[nodiscard]] std::string& onDisk(const Side side) { return side == Side::Left ? leftOnDisk : rightOnDisk; }

    void markModified(const Side side) { (side == Side::Left ? leftModified : rightModified) = true; }
    [[nodiscard]] bool isModified() const { return leftModified || rightModified; }

    [[nodiscard]] int maxLines() const {
        return static_cast<int>(std::max(leftLines.size(), rightLines.size()));
    }

    // Re-derives blocks from the buffers and keeps currentBlock in range.
    void recompute(unsigned int lookahead);
};

std::string to_string(const Side& side);

}
