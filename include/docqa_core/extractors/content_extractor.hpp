#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "docqa_core/types/file.hpp"

namespace fs = std::filesystem;

namespace docqa_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Reads the file and returns its text. Throws ContentExtractorError on unreadable or
  // non UTF-8 input.
  virtual std::string extract_text(const fs::path& file_path) const = 0;

  virtual FileType get_file_type() const = 0;

 protected:
  std::string get_string_content(const fs::path& file_path) const;
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace docqa_core
