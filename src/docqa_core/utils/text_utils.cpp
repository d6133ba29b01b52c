#include "docqa_core/utils/text_utils.hpp"

#include <utf8.h>

#include <cctype>
#include <iterator>

namespace docqa_core::text_utils {

std::string to_lower_ascii(std::string_view text) {
  std::string lowered(text);
  for (char& c : lowered) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x80) {
      c = static_cast<char>(std::tolower(uc));
    }
  }
  return lowered;
}

std::vector<std::string> split_whitespace(std::string_view text) {
  std::vector<std::string> words;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
      ++i;
    }
    size_t start = i;
    while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
      ++i;
    }
    if (i > start) {
      words.emplace_back(text.substr(start, i - start));
    }
  }
  return words;
}

std::string trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::string sanitize_utf8(std::string_view text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return std::string(text);
  }
  std::string cleaned;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(cleaned));
  return cleaned;
}

size_t count_code_points(std::string_view text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
  }
  std::string cleaned = sanitize_utf8(text);
  return static_cast<size_t>(utf8::distance(cleaned.begin(), cleaned.end()));
}

}  // namespace docqa_core::text_utils
