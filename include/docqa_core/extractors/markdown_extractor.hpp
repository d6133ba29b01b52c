#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

// Markdown is indexed as raw source text, markup included
class MarkdownExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;

  FileType get_file_type() const override {
    return FileType::Markdown;
  }
};

}  // namespace docqa_core
