#include "compare/Syncer.hpp"
#include "fs/ops/file.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace tc::compare;
using namespace tc::compare::model;
using namespace tc::log;

namespace {

bool copyInto(const std::filesystem::path& src, const std::filesystem::path& destDir,
              const std::string& name, SyncReport& report) {
    const auto dst = destDir / name;
    try {
        tc::fs::ops::copyFileOrDir(src, dst);
    } catch (const std::exception& e) {
        Registry::sync()->error("[Syncer] Failed to copy {} -> {}: {}", src.string(), dst.string(), e.what());
        report.lastError = e.what();
        return false;
    }

    Registry::sync()->debug("[Syncer] Copied {} -> {}", src.string(), dst.string());
    ++report.copied;
    return true;
}

}

bool Syncer::compatible(const Status status, const Direction direction) {
    if (status == Status::Different) return true;
    return direction == Direction::LeftToRight ? status == Status::LeftOnly : status == Status::RightOnly;
}

SyncReport Syncer::syncOneDirection(const std::vector<CompareEntry>& targets, const Direction direction,
                                    const std::filesystem::path& destDir) {
    SyncReport report;

    for (const auto& target : targets) {
        if (!compatible(target.status, direction)) continue;

        const auto& src = direction == Direction::LeftToRight ? target.left : target.right;
        if (!src) continue;

        if (copyInto(src->path, destDir, target.name, report))
            ++(direction == Direction::LeftToRight ? report.leftToRight : report.rightToLeft);
    }

    Registry::sync()->info("[Syncer] {} copied {} entr{}{}", to_string(direction), report.copied,
                           report.copied == 1 ? "y" : "ies", report.failed() ? " with errors" : "");
    return report;
}

SyncReport Syncer::syncBothWays(const Snapshot& snapshot,
                                const std::filesystem::path& leftDir,
                                const std::filesystem::path& rightDir) {
    SyncReport report;

    for (const auto& [name, entry] : snapshot.entries) {
        switch (entry.status) {
            case Status::LeftOnly:
                if (copyInto(entry.left->path, rightDir, name, report)) ++report.leftToRight;
                break;
            case Status::RightOnly:
                if (copyInto(entry.right->path, leftDir, name, report)) ++report.rightToLeft;
                break;
            case Status::Different: {
                if (!entry.bothFiles()) break;
                const auto& l = *entry.left;
                const auto& r = *entry.right;
                if (l.mod_time > r.mod_time) {
                    if (copyInto(l.path, rightDir, name, report)) {
                        ++report.leftToRight;
                        ++report.newerCopied;
                    }
                } else if (r.mod_time > l.mod_time) {
                    if (copyInto(r.path, leftDir, name, report)) {
                        ++report.rightToLeft;
                        ++report.newerCopied;
                    }
                }
                break;
            }
            case Status::Identical:
                break;
        }
    }

    Registry::sync()->info("[Syncer] Both ways: {} left to right, {} right to left, {} newer{}",
                           report.leftToRight, report.rightToLeft, report.newerCopied,
                           report.failed() ? " (with errors)" : "");
    return report;
}

std::string tc::compare::to_string(const Direction& direction) {
    switch (direction) {
        case Direction::LeftToRight: return "left→right";
        case Direction::RightToLeft: return "right→left";
        default: throw std::invalid_argument("Unknown sync direction");
    }
}

std::string tc::compare::describe(const SyncReport& report, const Direction direction) {
    auto msg = fmt::format("Synced {} file(s) {}", report.copied, to_string(direction));
    if (report.lastError) msg += fmt::format(", last error: {}", *report.lastError);
    return msg;
}

std::string tc::compare::describeBothWays(const SyncReport& report) {
    auto msg = fmt::format("Synced both ways: {} left→right, {} right→left, {} newer copied",
                           report.leftToRight, report.rightToLeft, report.newerCopied);
    if (report.lastError) msg += fmt::format(" | Error: {}", *report.lastError);
    return msg;
}
