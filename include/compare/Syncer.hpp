#pragma once

#include "compare/model/Snapshot.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tc::compare {

enum class Direction { LeftToRight, RightToLeft };

struct SyncReport {
    int copied{0};
    int leftToRight{0};
    int rightToLeft{0};
    int newerCopied{0};
    std::optional<std::string> lastError{};

    [[nodiscard]] bool failed() const { return lastError.has_value(); }
};

// Copies snapshot entries between the two directories through fs::ops::copyFileOrDir.
// A failed copy is recorded in the report and the batch carries on.
struct Syncer {
    // left_only/different for left to right, right_only/different for right to left.
    static bool compatible(model::Status status, Direction direction);

    // Copies the source side of every compatible target into destDir/<name>.
    static SyncReport syncOneDirection(const std::vector<model::CompareEntry>& targets, Direction direction,
                                       const std::filesystem::path& destDir);

    // left_only entries go right, right_only entries go left, and for different file pairs the
    // strictly newer file replaces the older one. leftToRight and rightToLeft count every copy
    // made in that direction, newer-file copies included.
    static SyncReport syncBothWays(const model::Snapshot& snapshot,
                                   const std::filesystem::path& leftDir,
                                   const std::filesystem::path& rightDir);
};

std::string to_string(const Direction& direction);

// "Synced N file(s) left→right[, last error: …]"
std::string describe(const SyncReport& report, Direction direction);

// "Synced both ways: a left→right, b right→left, c newer copied[ | Error: …]"
std::string describeBothWays(const SyncReport& report);

}
