#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docqa_core::text_utils {

// ASCII-only case folding; bytes of multi-byte UTF-8 sequences are left untouched.
std::string to_lower_ascii(std::string_view text);

std::vector<std::string> split_whitespace(std::string_view text);

std::string trim(std::string_view text);

// Number of Unicode code points. Invalid UTF-8 sequences count one per replacement.
size_t count_code_points(std::string_view text);

// Returns a copy with invalid UTF-8 sequences replaced by U+FFFD.
std::string sanitize_utf8(std::string_view text);

}  // namespace docqa_core::text_utils
