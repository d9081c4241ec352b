#include "fs/ops/file.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace stdfs = std::filesystem;
using namespace tc::log;

std::string tc::fs::ops::readFile(const stdfs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    if (size < 0) throw std::runtime_error("Failed to read file: " + path.string());
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<std::size_t>(size), '\0');
    if (size > 0 && !in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

void tc::fs::ops::writeFile(const stdfs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + path.string());
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}

void tc::fs::ops::copyFile(const stdfs::path& src, const stdfs::path& dst) {
    stdfs::copy_file(src, dst, stdfs::copy_options::overwrite_existing);
    stdfs::permissions(dst, stdfs::status(src).permissions(), stdfs::perm_options::replace);
}

static bool isWithin(const stdfs::path& inner, const stdfs::path& outer) {
    const auto in = stdfs::weakly_canonical(inner);
    const auto out = stdfs::weakly_canonical(outer);
    auto outEnd = out.end();
    if (!out.empty() && out.filename().empty()) --outEnd;  // trailing separator
    return std::mismatch(out.begin(), outEnd, in.begin(), in.end()).first == outEnd;
}

void tc::fs::ops::copyDir(const stdfs::path& src, const stdfs::path& dst) {
    if (isWithin(dst, src))
        throw stdfs::filesystem_error("Cannot copy a directory into itself", src, dst,
                                      std::make_error_code(std::errc::invalid_argument));

    stdfs::create_directories(dst);
    stdfs::permissions(dst, stdfs::status(src).permissions(), stdfs::perm_options::replace);

    for (const auto& entry : stdfs::recursive_directory_iterator(src)) {
        const auto target = dst / stdfs::relative(entry.path(), src);
        if (entry.is_directory()) {
            stdfs::create_directories(target);
            stdfs::permissions(target, entry.status().permissions(), stdfs::perm_options::replace);
        } else {
            copyFile(entry.path(), target);
        }
    }
}

void tc::fs::ops::copyFileOrDir(const stdfs::path& src, const stdfs::path& dst) {
    Registry::fs()->debug("[copyFileOrDir] {} -> {}", src.string(), dst.string());

    if (!stdfs::exists(src))
        throw stdfs::filesystem_error("Source does not exist", src,
                                      std::make_error_code(std::errc::no_such_file_or_directory));

    if (stdfs::is_directory(src)) copyDir(src, dst);
    else copyFile(src, dst);
}
