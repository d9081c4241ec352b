#include "pane/Pane.hpp"
#include "fs/Listing.hpp"
#include "status/Sink.hpp"

#include <algorithm>
#include <stdexcept>

using namespace tc::pane;
using namespace tc::fs::model;

Pane::Pane(std::filesystem::path path, const bool showHidden)
    : path_(std::filesystem::absolute(std::move(path)).lexically_normal()), show_hidden_(showHidden) {
    if (path_.has_relative_path() && path_.filename().empty()) path_ = path_.parent_path();
    refresh();
}

void Pane::refresh() {
    entries_ = fs::list(path_, show_hidden_);

    std::erase_if(selected_, [this](const std::string& name) { return findEntry(name) == nullptr; });

    if (entries_.empty()) highlighted_ = 0;
    else highlighted_ = std::clamp(highlighted_, 0, static_cast<int>(entries_.size()) - 1);
}

void Pane::highlight(const int index) {
    if (entries_.empty()) {
        highlighted_ = 0;
        return;
    }
    highlighted_ = std::clamp(index, 0, static_cast<int>(entries_.size()) - 1);
}

bool Pane::highlight(const std::string& name) {
    const auto it = std::ranges::find(entries_, name, &Entry::name);
    if (it == entries_.end()) return false;
    highlighted_ = static_cast<int>(it - entries_.begin());
    return true;
}

std::optional<Entry> Pane::highlightedEntry() const {
    if (entries_.empty()) return std::nullopt;
    return entries_[highlighted_];
}

bool Pane::toggleSelection(status::Sink& status) {
    if (entries_.empty()) return false;

    const auto& entry = entries_[highlighted_];
    if (entry.isParentLink()) {
        status.set("Cannot select parent directory link");
        return false;
    }

    if (selected_.erase(entry.name) > 0) status.set("Deselected: " + entry.name);
    else {
        selected_.insert(entry.name);
        status.set("Selected: " + entry.name);
    }

    if (highlighted_ < static_cast<int>(entries_.size()) - 1) ++highlighted_;
    return true;
}

bool Pane::select(const std::string& name) {
    if (name == PARENT_LINK || !findEntry(name)) return false;
    selected_.insert(name);
    return true;
}

std::vector<Entry> Pane::selectedEntries() const {
    std::vector<Entry> out;
    for (const auto& e : entries_)
        if (selected_.contains(e.name)) out.push_back(e);
    return out;
}

const Entry* Pane::findEntry(const std::string& name) const {
    const auto it = std::ranges::find(entries_, name, &Entry::name);
    return it == entries_.end() ? nullptr : &*it;
}

std::string tc::pane::to_string(const Side& side) {
    switch (side) {
        case Side::Left: return "left";
        case Side::Right: return "right";
        default: throw std::invalid_argument("Unknown pane side");
    }
}
