#include "cli/App.hpp"
#include "cli/Parser.hpp"
#include "diff/Session.hpp"
#include "compare/Session.hpp"
#include "pane/Pane.hpp"
#include "status/Sink.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <filesystem>
#include <system_error>

using namespace tc::cli;
using namespace tc::fs::model;
using namespace tc::log;

namespace {

Entry entryFor(const std::filesystem::path& p) {
    namespace stdfs = std::filesystem;
    if (std::error_code ec; stdfs::exists(p, ec)) return Entry(stdfs::directory_entry(p));

    // Missing paths still go through open() so the read error is reported there.
    Entry e;
    e.name = p.filename().string();
    e.path = p;
    return e;
}

int blockIndexOfDifference(const tc::diff::model::BlockList& blocks, const unsigned int n) {
    unsigned int seen = 0;
    for (size_t i = 0; i < blocks.size(); ++i)
        if (!blocks[i].isEqual() && ++seen == n) return static_cast<int>(i);
    return -1;
}

}

App::App(config::Config cfg)
    : cfg_(std::move(cfg)),
      recorder_(std::make_shared<status::Recorder>()),
      status_(std::make_shared<status::Logged>(recorder_)) {}

std::string App::usage() {
    return "usage: tcmd [--config FILE] <command> [args...]\n"
           "\n"
           "  diff LEFT RIGHT                               show the difference blocks of two text files\n"
           "  merge LEFT RIGHT --to-right|--to-left [--block N]\n"
           "                                                copy the N-th difference across and save\n"
           "  compare LEFT_DIR RIGHT_DIR                    classify the entries of two directories\n"
           "  sync LEFT_DIR RIGHT_DIR --to-right|--to-left|--both [NAME...]\n"
           "                                                copy entries between two directories\n"
           "  config                                        print the effective configuration\n";
}

CommandResult App::run(const CommandCall& call) {
    Registry::cli()->debug("[App] Running '{}' with {} argument(s)", call.name, call.positionals.size());

    if (call.name.empty() || call.name == "help" || hasFlag(call, "help")) {
        auto res = ok(usage());
        if (call.name.empty()) res.exit_code = 2;
        return res;
    }

    if (call.name == "diff") return diff(call);
    if (call.name == "merge") return merge(call);
    if (call.name == "compare") return compare(call);
    if (call.name == "sync") return sync(call);
    if (call.name == "config") return showConfig();

    return invalid(fmt::format("Unknown command: {}\n{}", call.name, usage()));
}

CommandResult App::diff(const CommandCall& call) {
    if (call.positionals.size() != 2) return invalid("usage: tcmd diff LEFT RIGHT");

    diff::Session session(status_, cfg_.diff);
    if (const auto res = session.open(entryFor(call.positionals[0]), entryFor(call.positionals[1])); !res.ok())
        return invalid(res.message);

    std::string out;
    for (const auto& block : session.blocks()) out += to_string(block) + '\n';

    const auto count = session.differenceCount();
    out += fmt::format("{} difference(s)\n", count);

    session.close();
    return {count > 0 ? 1 : 0, std::move(out), ""};
}

CommandResult App::merge(const CommandCall& call) {
    if (call.positionals.size() != 2) return invalid("usage: tcmd merge LEFT RIGHT --to-right|--to-left [--block N]");

    const bool toRight = hasFlag(call, "to-right");
    const bool toLeft = hasFlag(call, "to-left");
    if (toRight == toLeft) return invalid("Exactly one of --to-right or --to-left is required");

    unsigned int n = 1;
    if (const auto block = optVal(call, "block")) {
        const auto parsed = parseUInt(*block);
        if (!parsed || *parsed == 0) return invalid(fmt::format("Invalid --block value: {}", *block));
        n = *parsed;
    }

    diff::Session session(status_, cfg_.diff);
    if (const auto res = session.open(entryFor(call.positionals[0]), entryFor(call.positionals[1])); !res.ok())
        return invalid(res.message);

    if (session.differenceCount() == 0) {
        session.close();
        return ok("No differences found\n");
    }

    const auto target = blockIndexOfDifference(session.blocks(), n);
    if (target < 0) {
        session.close();
        return invalid(fmt::format("Block {} out of range, {} difference(s)", n, session.differenceCount()));
    }

    while (session.state().currentBlock != target)
        if (!session.next()) break;

    if (!session.merge(toRight ? diff::Direction::LeftToRight : diff::Direction::RightToLeft))
        return invalid(recorder_->last());

    const auto mergeMsg = recorder_->last();
    const auto saved = session.save();
    const auto saveMsg = recorder_->last();
    if (session.state().isModified()) return {1, mergeMsg + '\n', saveMsg};

    session.close();
    Registry::cli()->info("[App] Merged difference {} {} and saved {} file(s)", n, toRight ? "to right" : "to left", saved);
    return ok(fmt::format("{}\n{}\n", mergeMsg, saveMsg));
}

CommandResult App::compare(const CommandCall& call) {
    if (call.positionals.size() != 2) return invalid("usage: tcmd compare LEFT_DIR RIGHT_DIR");

    pane::Pane left(call.positionals[0], cfg_.listing.show_hidden);
    pane::Pane right(call.positionals[1], cfg_.listing.show_hidden);

    compare::Session session(status_);
    const auto& snapshot = session.enter(left, right);

    std::string out;
    for (const auto& [name, entry] : snapshot.entries) {
        const bool dir = (entry.left && entry.left->is_directory) || (entry.right && entry.right->is_directory);
        out += fmt::format("{} {}{}\n", compare::model::marker(entry.status), name, dir ? "/" : "");
    }
    out += recorder_->last() + '\n';

    session.exit(left, right);
    return ok(std::move(out));
}

CommandResult App::sync(const CommandCall& call) {
    if (call.positionals.size() < 2)
        return invalid("usage: tcmd sync LEFT_DIR RIGHT_DIR --to-right|--to-left|--both [NAME...]");

    const int modes = hasFlag(call, "to-right") + hasFlag(call, "to-left") + hasFlag(call, "both");
    if (modes != 1) return invalid("Exactly one of --to-right, --to-left or --both is required");

    pane::Pane left(call.positionals[0], cfg_.listing.show_hidden);
    pane::Pane right(call.positionals[1], cfg_.listing.show_hidden);

    compare::Session session(status_);
    const auto& snapshot = session.enter(left, right);

    std::optional<compare::SyncReport> report;

    if (hasFlag(call, "both")) {
        if (call.positionals.size() > 2) return invalid("--both syncs every entry and takes no names");
        report = session.syncBothWays(left, right);
    } else {
        const auto direction = hasFlag(call, "to-right") ? compare::Direction::LeftToRight
                                                         : compare::Direction::RightToLeft;
        auto& source = direction == compare::Direction::LeftToRight ? left : right;

        if (call.positionals.size() > 2) {
            for (size_t i = 2; i < call.positionals.size(); ++i)
                if (!source.select(call.positionals[i]))
                    return invalid(fmt::format("No such entry in {}: {}", source.path().string(), call.positionals[i]));
        } else {
            for (const auto& [name, entry] : snapshot.entries)
                if (compare::Syncer::compatible(entry.status, direction)) source.select(name);
        }

        // Destination pane active, so only the selection is synced.
        report = session.syncOneDirection(left, right, direction,
                                          direction == compare::Direction::LeftToRight ? pane::Side::Right
                                                                                       : pane::Side::Left);
    }

    const auto msg = recorder_->last();
    session.exit(left, right);

    if (report && report->failed()) return {1, "", msg};
    return ok(msg + '\n');
}

CommandResult App::showConfig() const {
    return ok(config::dumpConfig(cfg_));
}
