#pragma once

#include "compare/model/Snapshot.hpp"
#include "fs/model/Entry.hpp"

#include <vector>

namespace tc::compare {

struct Comparator {
    // One pass over two name-indexed maps; ".." is ignored on both sides. Directories are
    // matched by name only, files by size and modification time.
    static model::Snapshot compare(const std::vector<fs::model::Entry>& left,
                                   const std::vector<fs::model::Entry>& right);

    static model::Status classify(const fs::model::Entry& left, const fs::model::Entry& right);
};

}
