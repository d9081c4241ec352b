#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <vector>

namespace tc::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels taken from ConfigRegistry.
    static void init(const std::filesystem::path& logDir);

    // Console-only loggers, everything off unless TC_TEST_LOG_LEVEL is set.
    static void initForTesting();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> tcommander() { return get("tcommander"); }
    static std::shared_ptr<spdlog::logger> diff()       { return get("diff"); }
    static std::shared_ptr<spdlog::logger> compare()    { return get("compare"); }
    static std::shared_ptr<spdlog::logger> sync()       { return get("sync"); }
    static std::shared_ptr<spdlog::logger> fs()         { return get("fs"); }
    static std::shared_ptr<spdlog::logger> status()     { return get("status"); }
    static std::shared_ptr<spdlog::logger> cli()        { return get("cli"); }

    [[nodiscard]] static bool isInitialized();

    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void makeLogger(const std::string& name, spdlog::level::level_enum lvl,
                           const std::vector<spdlog::sink_ptr>& sinks);
};

}
