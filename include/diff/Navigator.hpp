#pragma once

#include "diff/model/State.hpp"

namespace tc::status {
class Sink;
}

namespace tc::diff {

struct Navigator {
    // Moves currentBlock to the next/previous non-equal block, wrapping around.
    // Returns false and leaves the state untouched when there is nothing to jump to.
    static bool next(model::State& state, status::Sink& status);
    static bool previous(model::State& state, status::Sink& status);

    static int differenceCount(const model::BlockList& blocks);

    static void scroll(model::State& state, int delta);
};

}
