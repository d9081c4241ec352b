#include "diff/Calculator.hpp"

#include <stdexcept>

using namespace tc::diff;
using namespace tc::diff::model;

BlockList Calculator::calculate(const LineBuffer& left, const LineBuffer& right, const unsigned int lookahead) {
    if (lookahead == 0) throw std::invalid_argument("Diff lookahead must be at least 1");

    const auto leftLen = static_cast<int>(left.size());
    const auto rightLen = static_cast<int>(right.size());
    const auto K = static_cast<int>(lookahead);

    BlockList blocks;
    int i = 0, j = 0;

    const auto matchAt = [&](const int l, const int r) { return left[l] == right[r]; };

    // Smallest k in [1, K] with left[i+k] == right[j], or 0.
    const auto skipLeft = [&] {
        for (int k = 1; k <= K && i + k < leftLen; ++k)
            if (matchAt(i + k, j)) return k;
        return 0;
    };

    const auto skipRight = [&] {
        for (int k = 1; k <= K && j + k < rightLen; ++k)
            if (matchAt(i, j + k)) return k;
        return 0;
    };

    while (i < leftLen || j < rightLen) {
        const int leftStart = i, rightStart = j;

        if (i < leftLen && j < rightLen && matchAt(i, j)) {
            while (i < leftLen && j < rightLen && matchAt(i, j)) {
                ++i;
                ++j;
            }
            blocks.push_back({{leftStart, i - 1}, {rightStart, j - 1}, Block::Kind::Equal});
            continue;
        }

        while (i < leftLen || j < rightLen) {
            if (i < leftLen && j < rightLen) {
                if (matchAt(i, j)) break;

                if (const int k = skipLeft()) i += k;
                else if (const int k2 = skipRight()) j += k2;
                else {
                    ++i;
                    ++j;
                }
            } else if (i < leftLen) ++i;
            else ++j;
        }

        auto kind = Block::Kind::Modify;
        if (i == leftStart) kind = Block::Kind::Add;
        else if (j == rightStart) kind = Block::Kind::Delete;

        blocks.push_back({{leftStart, i - 1}, {rightStart, j - 1}, kind});
    }

    if (blocks.empty())
        blocks.push_back({{0, leftLen - 1}, {0, rightLen - 1}, Block::Kind::Equal});

    return blocks;
}

bool Calculator::isPartition(const BlockList& blocks, const std::size_t leftLen, const std::size_t rightLen) {
    if (blocks.empty()) return false;

    int nextLeft = 0, nextRight = 0;
    for (const auto& b : blocks) {
        if (b.left.start != nextLeft || b.right.start != nextRight) return false;
        if (b.left.size() < 0 || b.right.size() < 0) return false;
        nextLeft = b.left.end + 1;
        nextRight = b.right.end + 1;
    }

    return nextLeft == static_cast<int>(leftLen) && nextRight == static_cast<int>(rightLen);
}
