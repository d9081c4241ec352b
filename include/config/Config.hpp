#pragma once

#include "diff/Calculator.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace tc::config {

constexpr static unsigned int DEFAULT_DIFF_LOOKAHEAD = diff::Calculator::DEFAULT_LOOKAHEAD;
constexpr static std::size_t DEFAULT_BINARY_SNIFF_BYTES = 8 * 1024; // 8KiB

enum class CloseGuard {
    TwoStep,   // first close warns and clears the modified flags, second close exits
    Prompt     // close with unsaved changes waits for save / discard / cancel
};

struct DiffConfig {
    unsigned int lookahead = DEFAULT_DIFF_LOOKAHEAD;
    std::size_t binary_sniff_bytes = DEFAULT_BINARY_SNIFF_BYTES;
    CloseGuard close_guard = CloseGuard::TwoStep;
};

struct ListingConfig {
    bool show_hidden = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum tcommander = spdlog::level::info;  // start-up, shutdown, config problems
    spdlog::level::level_enum diff       = spdlog::level::info;  // open/save/close of diff sessions
    spdlog::level::level_enum compare    = spdlog::level::info;  // snapshot rebuilds
    spdlog::level::level_enum sync       = spdlog::level::info;  // per-entry copy failures
    spdlog::level::level_enum fs         = spdlog::level::warn;  // listing and copy I/O errors
    spdlog::level::level_enum status     = spdlog::level::info;  // every status line shown to the user
    spdlog::level::level_enum cli        = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;
    LogLevelsConfig levels;
};

struct Config {
    DiffConfig diff;
    ListingConfig listing;
    LoggingConfig logging;

    void save(const std::filesystem::path& path) const;
};

// Missing file yields the defaults; malformed YAML throws YAML::Exception.
Config loadConfig(const std::filesystem::path& path);

std::string dumpConfig(const Config& cfg);

std::filesystem::path defaultConfigPath();
std::filesystem::path defaultLogDir();

std::string to_string(const CloseGuard& guard);
CloseGuard closeGuardFromString(const std::string& str);

} // namespace tc::config
