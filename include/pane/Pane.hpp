#pragma once

#include "fs/model/Entry.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tc::status {
class Sink;
}

namespace tc::pane {

enum class Side { Left, Right };

// One side of the dual-pane view: a listed directory, the highlighted row and the
// names marked for multi-selection.
class Pane {
public:
    explicit Pane(std::filesystem::path path, bool showHidden = true);

    // Relists the directory. The highlight is kept in range and selections of names
    // that disappeared are dropped.
    void refresh();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] const std::vector<fs::model::Entry>& entries() const { return entries_; }

    [[nodiscard]] int highlighted() const { return highlighted_; }
    void highlight(int index);
    bool highlight(const std::string& name);
    [[nodiscard]] std::optional<fs::model::Entry> highlightedEntry() const;

    // Toggles the highlighted entry and moves the highlight down one row.
    bool toggleSelection(status::Sink& status);
    bool select(const std::string& name);
    void clearSelection() { selected_.clear(); }

    [[nodiscard]] bool hasSelection() const { return !selected_.empty(); }
    [[nodiscard]] bool isSelected(const std::string& name) const { return selected_.contains(name); }
    [[nodiscard]] std::vector<fs::model::Entry> selectedEntries() const;

private:
    std::filesystem::path path_;
    bool show_hidden_;
    std::vector<fs::model::Entry> entries_{};
    int highlighted_{0};
    std::set<std::string> selected_{};

    [[nodiscard]] const fs::model::Entry* findEntry(const std::string& name) const;
};

std::string to_string(const Side& side);

}
