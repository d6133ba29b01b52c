#include "docqa_core/extractors/plaintext_extractor.hpp"

namespace docqa_core {

bool PlainTextExtractor::can_handle(const std::filesystem::path& file_path) const {
  const std::string extension = file_path.extension().string();
  return extension == ".txt";
}

std::string PlainTextExtractor::extract_text(const std::filesystem::path& file_path) const {
  return get_string_content(file_path);
}

}  // namespace docqa_core
