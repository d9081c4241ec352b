#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tc::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;        // 0 = success
    std::string stdout_text;
    std::string stderr_text;
};

}
