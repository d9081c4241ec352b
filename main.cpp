// Config
#include "config/ConfigRegistry.hpp"

// Logging
#include "log/Registry.hpp"

// CLI
#include "cli/App.hpp"
#include "cli/Parser.hpp"

// Libraries
#include <fmt/core.h>
#include <yaml-cpp/exceptions.h>

#include <string>
#include <vector>

using namespace tc::config;
using namespace tc::log;
using namespace tc::cli;

int main(int argc, char** argv) {
    const auto call = parseArgs(std::vector<std::string>(argv + 1, argv + argc));

    try {
        if (const auto path = optVal(call, "config")) ConfigRegistry::init(std::filesystem::path(*path));
        else ConfigRegistry::init();

        const auto& cfg = ConfigRegistry::get();
        Registry::init(cfg.logging.log_dir);
        Registry::tcommander()->debug("[*] tcmd starting: {}", call.name.empty() ? "<none>" : call.name);

        App app(cfg);
        const auto res = app.run(call);

        if (!res.stdout_text.empty()) fmt::print("{}", res.stdout_text);
        if (!res.stderr_text.empty()) fmt::print(stderr, "{}\n", res.stderr_text);

        Registry::tcommander()->debug("[*] tcmd '{}' finished with exit code {}", call.name, res.exit_code);
        Registry::shutdown();
        return res.exit_code;
    } catch (const YAML::Exception& e) {
        fmt::print(stderr, "Invalid configuration: {}\n", e.what());
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::tcommander()->error("[!] Fatal: {}", e.what());
        fmt::print(stderr, "Error: {}\n", e.what());
    }

    if (Registry::isInitialized()) Registry::shutdown();
    return 1;
}
