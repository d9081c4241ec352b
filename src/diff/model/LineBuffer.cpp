#include "diff/model/LineBuffer.hpp"

#include <algorithm>

namespace tc::diff::model {

LineBuffer parseLines(const std::string_view content) {
    LineBuffer lines;

    std::size_t start = 0;
    while (true) {
        const auto nl = content.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.emplace_back(content.substr(start));
            break;
        }
        lines.emplace_back(content.substr(start, nl - start));
        start = nl + 1;
    }

    if (!lines.empty() && lines.back().empty()) lines.pop_back();
    if (lines.empty()) lines.emplace_back();

    return lines;
}

std::string serializeLines(const LineBuffer& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    if (lines.empty()) out += '\n';
    return out;
}

bool looksLikeText(const std::string_view content, const std::size_t sniffBytes) {
    const auto window = content.substr(0, std::min(content.size(), sniffBytes));
    return window.find('\0') == std::string_view::npos;
}

}
