#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tc::diff::model {

using LineBuffer = std::vector<std::string>;

// Splits on '\n'. A trailing newline does not produce a trailing empty line and
// empty content becomes a single empty line, so the result is never empty.
LineBuffer parseLines(std::string_view content);

// Lines joined with '\n' plus exactly one trailing '\n'.
std::string serializeLines(const LineBuffer& lines);

// NUL byte within the first sniffBytes bytes means binary.
bool looksLikeText(std::string_view content, std::size_t sniffBytes);

}
