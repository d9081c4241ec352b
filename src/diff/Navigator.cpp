#include "diff/Navigator.hpp"
#include "status/Sink.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace tc::diff;
using namespace tc::diff::model;

static void land(State& state, tc::status::Sink& status, const int idx, const bool wrapped) {
    state.currentBlock = idx;
    state.scrollLine = std::max(0, state.blocks[idx].left.start);
    status.set(fmt::format("Difference {}/{}{}", idx + 1, state.blocks.size(), wrapped ? " (wrapped)" : ""));
}

bool Navigator::next(State& state, status::Sink& status) {
    const auto count = static_cast<int>(state.blocks.size());
    if (count == 0) {
        status.set("No differences found");
        return false;
    }

    for (int i = state.currentBlock + 1; i < count; ++i) {
        if (!state.blocks[i].isEqual()) {
            land(state, status, i, false);
            return true;
        }
    }

    for (int i = 0; i <= std::min(state.currentBlock, count - 1); ++i) {
        if (!state.blocks[i].isEqual()) {
            land(state, status, i, true);
            return true;
        }
    }

    status.set("No differences found");
    return false;
}

bool Navigator::previous(State& state, status::Sink& status) {
    const auto count = static_cast<int>(state.blocks.size());
    if (count == 0) {
        status.set("No differences found");
        return false;
    }

    for (int i = std::min(state.currentBlock, count) - 1; i >= 0; --i) {
        if (!state.blocks[i].isEqual()) {
            land(state, status, i, false);
            return true;
        }
    }

    for (int i = count - 1; i >= std::max(state.currentBlock, 0); --i) {
        if (!state.blocks[i].isEqual()) {
            land(state, status, i, true);
            return true;
        }
    }

    status.set("No differences found");
    return false;
}

int Navigator::differenceCount(const BlockList& blocks) {
    return static_cast<int>(std::ranges::count_if(blocks, [](const Block& b) { return !b.isEqual(); }));
}

void Navigator::scroll(State& state, const int delta) {
    state.scrollLine = std::clamp(state.scrollLine + delta, 0, std::max(0, state.maxLines() - 1));
}
