#include "fs/Listing.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <string>

using namespace tc::fs;
using namespace tc::fs::model;
using namespace tc::log;

static std::string lowered(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

void tc::fs::sortEntries(std::vector<Entry>& entries) {
    std::ranges::sort(entries, [](const Entry& a, const Entry& b) {
        if (a.isParentLink() != b.isParentLink()) return a.isParentLink();
        if (a.is_directory != b.is_directory) return a.is_directory;
        return lowered(a.name) < lowered(b.name);
    });
}

std::vector<Entry> tc::fs::list(const std::filesystem::path& dir, const bool showHidden) {
    namespace stdfs = std::filesystem;

    auto abs = stdfs::absolute(dir).lexically_normal();
    if (abs.has_relative_path() && abs.filename().empty()) abs = abs.parent_path();

    std::vector<Entry> entries;

    if (const auto parent = abs.parent_path(); abs.has_relative_path() && parent != abs)
        entries.push_back(Entry::parentLink(parent));

    for (const auto& dirEntry : stdfs::directory_iterator(abs)) {
        const auto name = dirEntry.path().filename().string();
        if (!showHidden && !name.empty() && name.front() == '.') continue;

        try {
            entries.emplace_back(dirEntry);
        } catch (const stdfs::filesystem_error& e) {
            Registry::fs()->warn("[Listing] Skipping {}: {}", dirEntry.path().string(), e.what());
        }
    }

    sortEntries(entries);
    Registry::fs()->debug("[Listing] {} entries in {}", entries.size(), abs.string());
    return entries;
}
