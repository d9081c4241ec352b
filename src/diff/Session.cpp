#include "diff/Session.hpp"
#include "diff/Navigator.hpp"
#include "diff/Merger.hpp"
#include "diff/Editor.hpp"
#include "fs/ops/file.hpp"
#include "status/Sink.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace tc::diff;
using namespace tc::diff::model;
using namespace tc::fs::model;
using namespace tc::log;

Session::Session(std::shared_ptr<status::Sink> status, config::DiffConfig cfg)
    : status_(std::move(status)), cfg_(std::move(cfg)) {
    if (!status_) throw std::invalid_argument("diff::Session requires a status sink");
    if (cfg_.lookahead == 0) throw std::invalid_argument("diff::Session requires a lookahead of at least 1");
}

OpenResult Session::reject(const OpenResult::Rejection reason, const std::string& message) const {
    Registry::diff()->debug("[Session] Open rejected ({}): {}", to_string(reason), message);
    status_->set(message);
    return {reason, message};
}

OpenResult Session::open(const std::optional<Entry>& left, const std::optional<Entry>& right) {
    using R = OpenResult::Rejection;

    if (phase_ != Phase::Closed) return reject(R::AlreadyOpen, "A diff session is already open");
    if (!left || !right) return reject(R::NoSelection, "Both panes must have a file selected");
    if (left->isParentLink() || right->isParentLink()) return reject(R::ParentLink, "Cannot diff parent directory link");
    if (left->is_directory || right->is_directory)
        return reject(R::Directory, "Both selections must be files, not directories");

    std::string leftContent, rightContent;

    try {
        leftContent = fs::ops::readFile(left->path);
    } catch (const std::exception& e) {
        return reject(R::Unreadable, fmt::format("Error reading left file: {}", e.what()));
    }

    try {
        rightContent = fs::ops::readFile(right->path);
    } catch (const std::exception& e) {
        return reject(R::Unreadable, fmt::format("Error reading right file: {}", e.what()));
    }

    if (!looksLikeText(leftContent, cfg_.binary_sniff_bytes) || !looksLikeText(rightContent, cfg_.binary_sniff_bytes))
        return reject(R::Binary, "Both files must be readable text files");

    state_ = State{};
    state_.leftPath = left->path;
    state_.rightPath = right->path;
    state_.leftLines = parseLines(leftContent);
    state_.rightLines = parseLines(rightContent);
    state_.leftOnDisk = std::move(leftContent);
    state_.rightOnDisk = std::move(rightContent);
    state_.recompute(cfg_.lookahead);
    phase_ = Phase::Viewing;

    const auto count = differenceCount();
    Registry::diff()->info("[Session] Opened {} <-> {} ({} differences)",
                           state_.leftPath.string(), state_.rightPath.string(), count);
    status_->set(fmt::format("Diff mode: {} differences", count));
    return {};
}

bool Session::requireViewing() {
    switch (phase_) {
        case Phase::Viewing: return true;
        case Phase::Closed: status_->set("Diff mode is not active"); return false;
        case Phase::Editing: status_->set("Not available in edit mode"); return false;
        case Phase::ClosePending: status_->set("Unsaved changes: choose save, discard or cancel"); return false;
        default: throw std::logic_error("Unknown diff session phase");
    }
}

bool Session::navigate(const bool forward) {
    if (!requireViewing()) return false;
    return forward ? Navigator::next(state_, *status_) : Navigator::previous(state_, *status_);
}

bool Session::merge(const Direction direction) {
    if (!requireViewing()) return false;
    if (direction == Direction::LeftToRight) return Merger::copyLeftToRight(state_, *status_, cfg_.lookahead);
    return Merger::copyRightToLeft(state_, *status_, cfg_.lookahead);
}

bool Session::enterEdit() {
    if (!requireViewing()) return false;
    Editor::begin(state_);
    phase_ = Phase::Editing;
    status_->set(fmt::format("Edit mode ({} side): ESC to exit", to_string(state_.activeSide)));
    return true;
}

bool Session::edit(const EditOp& op) {
    if (phase_ != Phase::Editing) {
        status_->set("Not in edit mode");
        return false;
    }
    return Editor::apply(state_, op);
}

bool Session::exitEdit() {
    if (phase_ != Phase::Editing) {
        status_->set("Not in edit mode");
        return false;
    }
    state_.recompute(cfg_.lookahead);
    phase_ = Phase::Viewing;
    status_->set("Edit mode exited");
    return true;
}

bool Session::switchSide() {
    if (!requireViewing()) return false;
    state_.activeSide = state_.activeSide == Side::Left ? Side::Right : Side::Left;
    status_->set(fmt::format("Active side: {}", to_string(state_.activeSide)));
    return true;
}

void Session::scroll(const int delta) {
    if (phase_ == Phase::Closed) return;
    Navigator::scroll(state_, delta);
}

bool Session::writeSide(const Side side) {
    const auto& path = side == Side::Left ? state_.leftPath : state_.rightPath;
    auto content = serializeLines(state_.lines(side));
    try {
        fs::ops::writeFile(path, content);
    } catch (const std::exception& e) {
        Registry::diff()->error("[Session] Failed to save {} file {}: {}", to_string(side), path.string(), e.what());
        status_->set(fmt::format("Error saving {} file: {}", to_string(side), e.what()));
        return false;
    }

    (side == Side::Left ? state_.leftModified : state_.rightModified) = false;
    state_.onDisk(side) = std::move(content);
    Registry::diff()->info("[Session] Saved {}", path.string());
    return true;
}

int Session::saveModified(bool& allWritten) {
    int saved = 0;
    allWritten = true;

    for (const auto side : {Side::Left, Side::Right}) {
        // an unedited side is still rewritten when its serialised form differs from disk
        const bool modified = side == Side::Left ? state_.leftModified : state_.rightModified;
        if (!modified && serializeLines(state_.lines(side)) == state_.onDisk(side)) continue;
        if (!writeSide(side)) {
            allWritten = false;
            return saved;
        }
        ++saved;
    }

    if (saved == 0) status_->set("No changes to save");
    else if (saved == 1) status_->set("Saved 1 file");
    else status_->set("Saved both files");

    return saved;
}

int Session::save() {
    if (!requireViewing()) return 0;
    bool allWritten = true;
    return saveModified(allWritten);
}

void Session::reset() {
    state_ = State{};
    phase_ = Phase::Closed;
}

CloseResult Session::close() {
    switch (phase_) {
        case Phase::Closed:
            status_->set("Diff mode is not active");
            return CloseResult::Rejected;
        case Phase::Editing:
            status_->set("Exit edit mode first");
            return CloseResult::Rejected;
        case Phase::ClosePending:
            status_->set("Unsaved changes: choose save, discard or cancel");
            return CloseResult::Warned;
        case Phase::Viewing:
            break;
    }

    if (state_.isModified()) {
        if (cfg_.close_guard == config::CloseGuard::Prompt) {
            phase_ = Phase::ClosePending;
            status_->set("Unsaved changes! Save, discard or cancel?");
            return CloseResult::Warned;
        }

        // Two-step guard: the flags are cleared here, so the next close goes through
        // without anything having been written.
        status_->set("Unsaved changes! Press Ctrl+S to save, ESC again to discard");
        state_.leftModified = false;
        state_.rightModified = false;
        return CloseResult::Warned;
    }

    Registry::diff()->info("[Session] Closed {} <-> {}", state_.leftPath.string(), state_.rightPath.string());
    reset();
    status_->set("Diff mode exited");
    return CloseResult::Closed;
}

CloseResult Session::resolveClose(const CloseChoice choice) {
    if (phase_ != Phase::ClosePending) {
        status_->set("No close pending");
        return CloseResult::Rejected;
    }

    switch (choice) {
        case CloseChoice::Save: {
            bool allWritten = true;
            saveModified(allWritten);
            if (!allWritten) {
                phase_ = Phase::Viewing;
                return CloseResult::Rejected;
            }
            Registry::diff()->info("[Session] Saved and closed {} <-> {}", state_.leftPath.string(), state_.rightPath.string());
            reset();
            status_->set("Saved, diff mode exited");
            return CloseResult::Closed;
        }
        case CloseChoice::Discard:
            Registry::diff()->info("[Session] Discarded changes to {} <-> {}", state_.leftPath.string(), state_.rightPath.string());
            reset();
            status_->set("Changes discarded, diff mode exited");
            return CloseResult::Closed;
        case CloseChoice::Cancel:
            phase_ = Phase::Viewing;
            status_->set("Close cancelled");
            return CloseResult::Cancelled;
        default:
            throw std::invalid_argument("Unknown close choice");
    }
}

int Session::differenceCount() const { return Navigator::differenceCount(state_.blocks); }

std::string tc::diff::to_string(const Session::Phase& phase) {
    switch (phase) {
        case Session::Phase::Closed: return "closed";
        case Session::Phase::Viewing: return "viewing";
        case Session::Phase::Editing: return "editing";
        case Session::Phase::ClosePending: return "close_pending";
        default: throw std::invalid_argument("Unknown diff session phase");
    }
}

std::string tc::diff::to_string(const OpenResult::Rejection& reason) {
    switch (reason) {
        case OpenResult::Rejection::None: return "none";
        case OpenResult::Rejection::AlreadyOpen: return "already_open";
        case OpenResult::Rejection::NoSelection: return "no_selection";
        case OpenResult::Rejection::ParentLink: return "parent_link";
        case OpenResult::Rejection::Directory: return "directory";
        case OpenResult::Rejection::Unreadable: return "unreadable";
        case OpenResult::Rejection::Binary: return "binary";
        default: throw std::invalid_argument("Unknown open rejection");
    }
}
