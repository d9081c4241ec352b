#include "diff/Merger.hpp"
#include "status/Sink.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace tc::diff;
using namespace tc::diff::model;
using namespace tc::log;

void Merger::splice(const LineBuffer& src, const LineRange& srcRange, LineBuffer& dst, const LineRange& dstRange) {
    if (dstRange.start < 0 || dstRange.start > static_cast<int>(dst.size()) || dstRange.end >= static_cast<int>(dst.size()))
        throw std::out_of_range("Destination range outside of buffer");
    if (!srcRange.empty() && (srcRange.start < 0 || srcRange.end >= static_cast<int>(src.size())))
        throw std::out_of_range("Source range outside of buffer");

    LineBuffer incoming;
    if (!srcRange.empty()) incoming.assign(src.begin() + srcRange.start, src.begin() + srcRange.end + 1);

    const auto at = dst.begin() + dstRange.start;
    const auto pos = dst.erase(at, at + std::max(0, dstRange.size()));
    dst.insert(pos, incoming.begin(), incoming.end());
}

bool Merger::copy(State& state, status::Sink& status, const Side from, const unsigned int lookahead) {
    if (state.currentBlock < 0 || state.currentBlock >= static_cast<int>(state.blocks.size())) {
        status.set("No difference selected");
        return false;
    }

    const auto block = state.blocks[state.currentBlock];
    if (block.isEqual()) {
        status.set("No difference at current position");
        return false;
    }

    const auto to = from == Side::Left ? Side::Right : Side::Left;
    const auto& srcRange = from == Side::Left ? block.left : block.right;
    const auto& dstRange = from == Side::Left ? block.right : block.left;

    splice(state.lines(from), srcRange, state.lines(to), dstRange);
    state.markModified(to);
    state.recompute(lookahead);

    Registry::diff()->debug("[Merger] Copied {} {} line(s) over {} line(s) of {}",
                            to_string(block.kind), std::max(0, srcRange.size()), std::max(0, dstRange.size()),
                            to_string(to));

    status.set(from == Side::Left ? "Copied left → right" : "Copied right → left");
    return true;
}

bool Merger::copyLeftToRight(State& state, status::Sink& status, const unsigned int lookahead) {
    return copy(state, status, Side::Left, lookahead);
}

bool Merger::copyRightToLeft(State& state, status::Sink& status, const unsigned int lookahead) {
    return copy(state, status, Side::Right, lookahead);
}
