#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace tc::fs::model {

inline constexpr const char* PARENT_LINK = "..";

// One row of a single-level directory listing.
struct Entry {
    std::string name{};
    std::filesystem::path path{};
    bool is_directory{false};
    uintmax_t size_bytes{0};
    std::filesystem::file_time_type mod_time{};

    Entry() = default;
    explicit Entry(const std::filesystem::directory_entry& dirEntry);

    [[nodiscard]] bool isParentLink() const { return name == PARENT_LINK; }

    [[nodiscard]] bool operator==(const Entry& other) const = default;

    static Entry parentLink(const std::filesystem::path& parent);
};

std::string to_string(const Entry& entry);

}
