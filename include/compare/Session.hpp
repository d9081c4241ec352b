#pragma once

#include "compare/model/Snapshot.hpp"
#include "compare/Syncer.hpp"
#include "pane/Pane.hpp"

#include <memory>
#include <optional>

namespace tc::status {
class Sink;
}

namespace tc::compare {

/**
 * Compare mode over the two panes. The snapshot is built from the panes' current
 * listings on enter() and rebuilt from fresh listings after every sync; it is never
 * patched in place.
 */
class Session {
public:
    explicit Session(std::shared_ptr<status::Sink> status);

    const model::Snapshot& enter(const pane::Pane& left, const pane::Pane& right);
    void exit(pane::Pane& left, pane::Pane& right);

    [[nodiscard]] bool isActive() const { return active_; }
    [[nodiscard]] const model::Snapshot& snapshot() const { return snapshot_; }

    // Targets are the source pane's selection, or its highlighted entry when nothing is
    // selected and the source pane is the active one.
    std::optional<SyncReport> syncOneDirection(pane::Pane& left, pane::Pane& right, Direction direction,
                                               pane::Side activePane);

    std::optional<SyncReport> syncBothWays(pane::Pane& left, pane::Pane& right);

private:
    std::shared_ptr<status::Sink> status_;
    model::Snapshot snapshot_{};
    bool active_{false};

    bool requireActive() const;
    std::vector<model::CompareEntry> collectTargets(const pane::Pane& source, Direction direction,
                                                    bool sourceIsActive) const;
    void rebuild(const pane::Pane& left, const pane::Pane& right);
};

}
