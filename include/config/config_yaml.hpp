#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace tc::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<DiffConfig> {
    static Node encode(const DiffConfig& rhs) {
        Node node;
        node["lookahead"] = rhs.lookahead;
        node["binary_sniff_bytes"] = rhs.binary_sniff_bytes;
        node["close_guard"] = to_string(rhs.close_guard);
        return node;
    }

    static bool decode(const Node& node, DiffConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.lookahead = node["lookahead"].as<unsigned int>(DEFAULT_DIFF_LOOKAHEAD);
        rhs.binary_sniff_bytes = node["binary_sniff_bytes"].as<std::size_t>(DEFAULT_BINARY_SNIFF_BYTES);
        rhs.close_guard = closeGuardFromString(node["close_guard"].as<std::string>("two_step"));
        return true;
    }
};

template<>
struct convert<ListingConfig> {
    static Node encode(const ListingConfig& rhs) {
        Node node;
        node["show_hidden"] = rhs.show_hidden;
        return node;
    }

    static bool decode(const Node& node, ListingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.show_hidden = node["show_hidden"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["tcommander"] = to_std_string(spdlog::level::to_string_view(rhs.tcommander));
        node["diff"]       = to_std_string(spdlog::level::to_string_view(rhs.diff));
        node["compare"]    = to_std_string(spdlog::level::to_string_view(rhs.compare));
        node["sync"]       = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["fs"]         = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["status"]     = to_std_string(spdlog::level::to_string_view(rhs.status));
        node["cli"]        = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tcommander = spdlog::level::from_str(node["tcommander"].as<std::string>("info"));
        rhs.diff = spdlog::level::from_str(node["diff"].as<std::string>("info"));
        rhs.compare = spdlog::level::from_str(node["compare"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("warning"));
        rhs.status = spdlog::level::from_str(node["status"].as<std::string>("info"));
        rhs.cli = spdlog::level::from_str(node["cli"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warning"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

// LoggingConfig
template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        const Node levels = convert<LogLevelsConfig>::encode(rhs.levels);
        for (const auto& kv : levels) node[kv.first.as<std::string>()] = kv.second;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(defaultLogDir().string());
        return convert<LogLevelsConfig>::decode(node, rhs.levels);
    }
};

}
