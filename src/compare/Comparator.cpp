#include "compare/Comparator.hpp"
#include "log/Registry.hpp"

#include <unordered_map>

using namespace tc::compare;
using namespace tc::compare::model;
using namespace tc::fs::model;
using namespace tc::log;

static std::unordered_map<std::string, const Entry*> indexByName(const std::vector<Entry>& entries) {
    std::unordered_map<std::string, const Entry*> map;
    map.reserve(entries.size());
    for (const auto& e : entries)
        if (!e.isParentLink()) map[e.name] = &e;
    return map;
}

Status Comparator::classify(const Entry& left, const Entry& right) {
    if (left.is_directory && right.is_directory) return Status::Identical;
    if (left.is_directory != right.is_directory) return Status::Different;
    if (left.size_bytes == right.size_bytes && left.mod_time == right.mod_time) return Status::Identical;
    return Status::Different;
}

Snapshot Comparator::compare(const std::vector<Entry>& left, const std::vector<Entry>& right) {
    const auto leftMap = indexByName(left);
    const auto rightMap = indexByName(right);

    Snapshot snapshot;

    for (const auto& [name, l] : leftMap) {
        CompareEntry entry{.name = name, .left = *l};

        if (const auto it = rightMap.find(name); it != rightMap.end()) {
            entry.right = *it->second;
            entry.status = classify(*l, *it->second);
        } else entry.status = Status::LeftOnly;

        snapshot.entries.emplace(name, std::move(entry));
    }

    for (const auto& [name, r] : rightMap) {
        if (leftMap.contains(name)) continue;
        snapshot.entries.emplace(name, CompareEntry{.name = name, .status = Status::RightOnly, .right = *r});
    }

    Registry::compare()->debug("[Comparator] {}", summary(snapshot));
    return snapshot;
}
