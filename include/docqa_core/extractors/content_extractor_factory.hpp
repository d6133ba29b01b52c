#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

/**
 * @class ContentExtractorFactory
 * @brief Provides the ContentExtractor for a given file.
 *
 * Holds one instance of every available extractor and selects the first one that accepts the
 * file's extension. PDF text extraction is not available in-process.
 */
namespace docqa_core {
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();

  /**
   * @brief Finds the extractor for the given file.
   *
   * @param file_path The path to the file that needs to be processed.
   * @return A constant reference to the matching ContentExtractor.
   * @throw ContentExtractorError if no extractor handles the file.
   */
  const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  bool is_supported(const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<ContentExtractor>> extractors;
};
}  // namespace docqa_core
