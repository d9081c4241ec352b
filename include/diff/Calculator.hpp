#pragma once

#include "diff/model/Block.hpp"
#include "diff/model/LineBuffer.hpp"

namespace tc::diff {

/**
 * Partitions two line buffers into an ordered list of equal/add/delete/modify blocks.
 *
 * Divergences are resynchronised with a bounded lookahead: up to `lookahead` lines are
 * scanned on the left side first, then on the right, before both sides are consumed
 * one line at a time. The result is not a minimal edit script; a run that needs more
 * than `lookahead` lines to resynchronise comes out as one modify block.
 *
 * The returned blocks always cover [0, left.size()) and [0, right.size()) without gaps,
 * and are never empty: two empty buffers give a single degenerate equal block.
 */
struct Calculator {
    constexpr static unsigned int DEFAULT_LOOKAHEAD = 3;

    static model::BlockList calculate(const model::LineBuffer& left,
                                      const model::LineBuffer& right,
                                      unsigned int lookahead = DEFAULT_LOOKAHEAD);

    // True when blocks partition both index spaces in order.
    static bool isPartition(const model::BlockList& blocks, std::size_t leftLen, std::size_t rightLen);
};

}
