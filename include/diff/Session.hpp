#pragma once

#include "diff/model/State.hpp"
#include "diff/Editor.hpp"
#include "config/Config.hpp"
#include "fs/model/Entry.hpp"

#include <memory>
#include <optional>
#include <string>

namespace tc::status {
class Sink;
}

namespace tc::diff {

struct OpenResult {
    enum class Rejection {
        None,
        AlreadyOpen,
        NoSelection,
        ParentLink,
        Directory,
        Unreadable,
        Binary
    };

    Rejection reason{Rejection::None};
    std::string message{};

    [[nodiscard]] bool ok() const { return reason == Rejection::None; }
};

enum class CloseResult { Closed, Warned, Cancelled, Rejected };

enum class CloseChoice { Save, Discard, Cancel };

enum class Direction { LeftToRight, RightToLeft };

/**
 * Lifecycle of one side-by-side diff.
 *
 *   Closed --open--> Viewing --enterEdit--> Editing --exitEdit--> Viewing --close--> Closed
 *
 * With the prompt close guard a close on unsaved changes parks the session in
 * ClosePending until resolveClose() is called. Every operation reports its outcome to
 * the status sink; failed preconditions leave the state untouched.
 */
class Session {
public:
    enum class Phase { Closed, Viewing, Editing, ClosePending };

    explicit Session(std::shared_ptr<status::Sink> status, config::DiffConfig cfg = {});

    OpenResult open(const std::optional<fs::model::Entry>& left, const std::optional<fs::model::Entry>& right);

    bool navigate(bool forward);
    bool next() { return navigate(true); }
    bool previous() { return navigate(false); }

    bool merge(Direction direction);

    bool enterEdit();
    bool edit(const EditOp& op);
    bool exitEdit();

    bool switchSide();
    void scroll(int delta);

    int save();

    CloseResult close();
    CloseResult resolveClose(CloseChoice choice);

    [[nodiscard]] Phase phase() const { return phase_; }
    [[nodiscard]] bool isOpen() const { return phase_ != Phase::Closed; }
    [[nodiscard]] const model::State& state() const { return state_; }
    [[nodiscard]] const model::BlockList& blocks() const { return state_.blocks; }
    [[nodiscard]] int differenceCount() const;
    [[nodiscard]] const config::DiffConfig& config() const { return cfg_; }

private:
    std::shared_ptr<status::Sink> status_;
    config::DiffConfig cfg_;
    model::State state_{};
    Phase phase_{Phase::Closed};

    OpenResult reject(OpenResult::Rejection reason, const std::string& message) const;
    bool requireViewing();
    bool writeSide(model::Side side);
    int saveModified(bool& allWritten);
    void reset();
};

std::string to_string(const Session::Phase& phase);
std::string to_string(const OpenResult::Rejection& reason);

}
