#pragma once

#include <cstddef>
#include <string_view>

namespace doccat::util {

// Number of code points in a UTF-8 string (continuation bytes are skipped).
std::size_t Utf8Length(std::string_view text);

// Longest prefix holding at most max_code_points code points.
std::string_view Utf8Prefix(std::string_view text, std::size_t max_code_points);

} // namespace doccat::util
