#pragma once

#include "fs/model/Entry.hpp"

#include <filesystem>
#include <vector>

namespace tc::fs {

// Single directory level: ".." first (omitted at the root), then directories, then files,
// each group ordered case-insensitively. Throws std::filesystem::filesystem_error if dir can't be read.
std::vector<model::Entry> list(const std::filesystem::path& dir, bool showHidden = true);

void sortEntries(std::vector<model::Entry>& entries);

}
