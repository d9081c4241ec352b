#pragma once

#include "cli/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tc::cli {

// Splits argv (without the program name) into a CommandCall. "--key value" is only
// read as a pair for keys that take a value; every other "--key" is a bare flag.
// A lone "--" ends flag parsing.
CommandCall parseArgs(const std::vector<std::string>& args);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
bool hasFlag(const CommandCall& c, const std::string& key);

std::optional<unsigned int> parseUInt(const std::string& s);

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

}
