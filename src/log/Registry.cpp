#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace tc::log {

void Registry::makeLogger(const std::string& name, const spdlog::level::level_enum lvl,
                          const std::vector<spdlog::sink_ptr>& sinks) {
    spdlog::drop(name);
    const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_ = log_dir_ / "tcommander.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    const auto& cnf = config::ConfigRegistry::get().logging;

    // console goes to stderr so CLI output on stdout stays clean
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    const std::vector<spdlog::sink_ptr> sinks{console_sink_, main_file_sink_};

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("tcommander", sub_levels.tcommander, sinks);
    makeLogger("diff",       sub_levels.diff, sinks);
    makeLogger("compare",    sub_levels.compare, sinks);
    makeLogger("sync",       sub_levels.sync, sinks);
    makeLogger("fs",         sub_levels.fs, sinks);
    makeLogger("status",     sub_levels.status, sinks);
    makeLogger("cli",        sub_levels.cli, sinks);

    initialized_ = true;
    tcommander()->debug("[log::Registry] Initialized, writing to {}", main_log_path_.string());
}

void Registry::initForTesting() {
    if (initialized_) return;

    auto level = spdlog::level::off;
    if (const char* env = std::getenv("TC_TEST_LOG_LEVEL"); env && *env) level = spdlog::level::from_str(env);

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(level);
    console_sink_->set_pattern(LOG_FORMAT);

    const std::vector<spdlog::sink_ptr> sinks{console_sink_};
    for (const auto* name : {"tcommander", "diff", "compare", "sync", "fs", "status", "cli"})
        makeLogger(name, level, sinks);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

}
