#include "cli/Parser.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <string_view>

using namespace tc::cli;

namespace {

constexpr std::array<std::string_view, 2> VALUE_FLAGS{"config", "block"};

bool takesValue(const std::string& key) {
    return std::ranges::find(VALUE_FLAGS, key) != VALUE_FLAGS.end();
}

// Upsert, last wins
void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

}

CommandCall tc::cli::parseArgs(const std::vector<std::string>& args) {
    CommandCall call;
    bool stopFlags = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        if (!stopFlags && a == "--") {
            stopFlags = true;
            continue;
        }

        if (!stopFlags && a.size() > 2 && a.starts_with("--")) {
            auto key = a.substr(2);
            if (const auto eq = key.find('='); eq != std::string::npos) {
                setOpt(call, key.substr(0, eq), key.substr(eq + 1));
            } else if (takesValue(key) && i + 1 < args.size()) {
                setOpt(call, key, args[i + 1]);
                ++i;
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        if (call.name.empty()) call.name = a;
        else call.positionals.push_back(a);
    }

    return call;
}

std::optional<std::string> tc::cli::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

bool tc::cli::hasFlag(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

std::optional<unsigned int> tc::cli::parseUInt(const std::string& s) {
    if (s.empty()) return std::nullopt;

    unsigned long long v = 0;
    for (const char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }

    return static_cast<unsigned int>(v);
}

CommandResult tc::cli::invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult tc::cli::ok(std::string out) { return {0, std::move(out), ""}; }
