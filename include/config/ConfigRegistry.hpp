#pragma once

#include "config/Config.hpp"

#include <filesystem>

namespace tc::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = defaultConfigPath());
    static void init(Config config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
};

} // namespace tc::config
