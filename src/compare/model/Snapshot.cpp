#include "compare/model/Snapshot.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

using namespace tc::compare::model;

std::size_t Snapshot::count(const Status status) const {
    return static_cast<std::size_t>(std::ranges::count_if(entries, [status](const auto& kv) {
        return kv.second.status == status;
    }));
}

const CompareEntry* Snapshot::find(const std::string& name) const {
    const auto it = entries.find(name);
    return it == entries.end() ? nullptr : &it->second;
}

std::string tc::compare::model::to_string(const Status& status) {
    switch (status) {
        case Status::LeftOnly: return "left_only";
        case Status::RightOnly: return "right_only";
        case Status::Different: return "different";
        case Status::Identical: return "identical";
        default: throw std::invalid_argument("Unknown compare status");
    }
}

Status tc::compare::model::statusFromString(const std::string& str) {
    if (str == "left_only") return Status::LeftOnly;
    if (str == "right_only") return Status::RightOnly;
    if (str == "different") return Status::Different;
    if (str == "identical") return Status::Identical;
    throw std::invalid_argument("Unknown compare status: " + str);
}

std::string tc::compare::model::marker(const Status& status) {
    switch (status) {
        case Status::LeftOnly: return "[L]";
        case Status::RightOnly: return "[R]";
        case Status::Different: return "[D]";
        case Status::Identical: return "[=]";
        default: throw std::invalid_argument("Unknown compare status");
    }
}

std::string tc::compare::model::summary(const Snapshot& snapshot) {
    return fmt::format("Compare: {} files | Left only: {} | Right only: {} | Different: {} | Identical: {}",
                       snapshot.size(),
                       snapshot.count(Status::LeftOnly),
                       snapshot.count(Status::RightOnly),
                       snapshot.count(Status::Different),
                       snapshot.count(Status::Identical));
}
