#pragma once

#include "diff/model/State.hpp"

namespace tc::status {
class Sink;
}

namespace tc::diff {

// Copies the current block's lines from one side over the other side's range and
// recomputes the diff. Block indices are not stable across the recompute; the caller
// picks a new current block (currentBlock is only clamped into range).
struct Merger {
    static bool copyLeftToRight(model::State& state, status::Sink& status, unsigned int lookahead);
    static bool copyRightToLeft(model::State& state, status::Sink& status, unsigned int lookahead);

    // Replaces dst[dstRange] with src[srcRange].
    static void splice(const model::LineBuffer& src, const model::LineRange& srcRange,
                       model::LineBuffer& dst, const model::LineRange& dstRange);

private:
    static bool copy(model::State& state, status::Sink& status, model::Side from, unsigned int lookahead);
};

}
