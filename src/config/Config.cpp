#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace tc::config {

static std::filesystem::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    return std::filesystem::temp_directory_path();
}

std::filesystem::path defaultConfigPath() {
    if (const char* explicitPath = std::getenv("TCOMMANDER_CONFIG"); explicitPath && *explicitPath)
        return explicitPath;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "tcommander" / "config.yaml";
    return homeDir() / ".config" / "tcommander" / "config.yaml";
}

std::filesystem::path defaultLogDir() {
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "tcommander";
    return homeDir() / ".local" / "state" / "tcommander";
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    cfg.logging.log_dir = defaultLogDir();

    if (!std::filesystem::exists(path)) return cfg;

    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["diff"]) YAML::convert<DiffConfig>::decode(node, cfg.diff);
    if (auto node = root["listing"]) YAML::convert<ListingConfig>::decode(node, cfg.listing);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.diff.lookahead == 0) throw std::invalid_argument("diff.lookahead must be at least 1");

    return cfg;
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["diff"] = YAML::convert<DiffConfig>::encode(cfg.diff);
    root["listing"] = YAML::convert<ListingConfig>::encode(cfg.listing);
    root["logging"] = YAML::convert<LoggingConfig>::encode(cfg.logging);

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

void Config::save(const std::filesystem::path& path) const {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("Failed to write config file: " + path.string());

    out << "# tcommander configuration\n" << dumpConfig(*this) << "\n";
}

std::string to_string(const CloseGuard& guard) {
    switch (guard) {
        case CloseGuard::TwoStep: return "two_step";
        case CloseGuard::Prompt: return "prompt";
        default: throw std::invalid_argument("Unknown close guard");
    }
}

CloseGuard closeGuardFromString(const std::string& str) {
    if (str == "two_step") return CloseGuard::TwoStep;
    if (str == "prompt") return CloseGuard::Prompt;
    throw std::invalid_argument("Unknown close guard: " + str);
}

} // namespace tc::config
