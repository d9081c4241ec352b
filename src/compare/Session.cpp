#include "compare/Session.hpp"
#include "compare/Comparator.hpp"
#include "status/Sink.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace tc::compare;
using namespace tc::compare::model;
using namespace tc::pane;
using namespace tc::log;

Session::Session(std::shared_ptr<status::Sink> status) : status_(std::move(status)) {
    if (!status_) throw std::invalid_argument("compare::Session requires a status sink");
}

void Session::rebuild(const Pane& left, const Pane& right) {
    snapshot_ = Comparator::compare(left.entries(), right.entries());
}

const Snapshot& Session::enter(const Pane& left, const Pane& right) {
    rebuild(left, right);
    active_ = true;

    const auto msg = summary(snapshot_);
    Registry::compare()->info("[Session] {} <-> {}: {}", left.path().string(), right.path().string(), msg);
    status_->set(msg);
    return snapshot_;
}

void Session::exit(Pane& left, Pane& right) {
    active_ = false;
    snapshot_ = {};
    left.refresh();
    right.refresh();
    status_->set("Compare mode exited");
}

bool Session::requireActive() const {
    if (active_) return true;
    status_->set("Not in compare mode");
    return false;
}

std::vector<CompareEntry> Session::collectTargets(const Pane& source, const Direction direction,
                                                  const bool sourceIsActive) const {
    std::vector<CompareEntry> targets;

    const auto consider = [&](const fs::model::Entry& e) {
        if (e.isParentLink()) return;
        if (const auto* entry = snapshot_.find(e.name); entry && Syncer::compatible(entry->status, direction))
            targets.push_back(*entry);
    };

    if (source.hasSelection()) {
        for (const auto& e : source.selectedEntries()) consider(e);
    } else if (sourceIsActive) {
        if (const auto e = source.highlightedEntry()) consider(*e);
    }

    return targets;
}

std::optional<SyncReport> Session::syncOneDirection(Pane& left, Pane& right, const Direction direction,
                                                    const Side activePane) {
    if (!requireActive()) return std::nullopt;

    const bool toRight = direction == Direction::LeftToRight;
    auto& source = toRight ? left : right;
    auto& dest = toRight ? right : left;

    const auto targets = collectTargets(source, direction, activePane == (toRight ? Side::Left : Side::Right));
    if (targets.empty()) {
        status_->set(toRight ? "No files to sync (select left_only or different files)"
                             : "No files to sync (select right_only or different files)");
        return std::nullopt;
    }

    const auto report = Syncer::syncOneDirection(targets, direction, dest.path());

    source.clearSelection();
    dest.refresh();
    rebuild(left, right);

    status_->set(describe(report, direction));
    return report;
}

std::optional<SyncReport> Session::syncBothWays(Pane& left, Pane& right) {
    if (!requireActive()) return std::nullopt;

    const auto report = Syncer::syncBothWays(snapshot_, left.path(), right.path());

    left.refresh();
    right.refresh();
    rebuild(left, right);

    status_->set(describeBothWays(report));
    return report;
}
