#include "fs/model/Entry.hpp"

#include <fmt/format.h>

using namespace tc::fs::model;

Entry::Entry(const std::filesystem::directory_entry& dirEntry)
    : name(dirEntry.path().filename().string()),
      path(dirEntry.path()),
      is_directory(dirEntry.is_directory()),
      size_bytes(is_directory ? 0 : dirEntry.file_size()),
      mod_time(dirEntry.last_write_time()) {}

Entry Entry::parentLink(const std::filesystem::path& parent) {
    Entry e;
    e.name = PARENT_LINK;
    e.path = parent;
    e.is_directory = true;
    return e;
}

std::string tc::fs::model::to_string(const Entry& entry) {
    return fmt::format("{}{} ({} bytes) -> {}",
                       entry.name, entry.is_directory ? "/" : "", entry.size_bytes, entry.path.string());
}
