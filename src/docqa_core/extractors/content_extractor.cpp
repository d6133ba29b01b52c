#include "docqa_core/extractors/content_extractor.hpp"

#include <utf8.h>

#include <fstream>
#include <sstream>

namespace docqa_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  const std::string content = buffer.str();

  if (!utf8::is_valid(content.begin(), content.end())) {
    throw ContentExtractorError("File is not valid UTF-8: " + file_path.string());
  }
  return content;
}

}  // namespace docqa_core
