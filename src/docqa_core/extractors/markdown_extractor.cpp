#include "docqa_core/extractors/markdown_extractor.hpp"

namespace docqa_core {

bool MarkdownExtractor::can_handle(const std::filesystem::path& file_path) const {
  return file_path.extension() == ".md";
}

std::string MarkdownExtractor::extract_text(const std::filesystem::path& file_path) const {
  return get_string_content(file_path);
}

}  // namespace docqa_core
