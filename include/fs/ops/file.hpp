#pragma once

#include <filesystem>
#include <string>

namespace tc::fs::ops {

// Whole-file reads and writes. Both throw std::runtime_error on failure.
std::string readFile(const std::filesystem::path& path);
void writeFile(const std::filesystem::path& path, const std::string& content);

// Copies a file (overwriting, permission bits mirrored) or a directory tree.
// Throws std::filesystem::filesystem_error on failure.
void copyFileOrDir(const std::filesystem::path& src, const std::filesystem::path& dst);
void copyFile(const std::filesystem::path& src, const std::filesystem::path& dst);
void copyDir(const std::filesystem::path& src, const std::filesystem::path& dst);

}
