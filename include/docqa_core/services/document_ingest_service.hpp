#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "docqa_core/chunking/text_chunker.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/index/keyword_index.hpp"
#include "docqa_core/llm/embedding_provider.hpp"
#include "docqa_core/store/document_store.hpp"
#include "docqa_core/vector/vector_store.hpp"

namespace docqa_core {

struct IngestResult {
  bool success;
  std::string error_message;
  std::string doc_id;
  std::string filename;
  FileType file_type;
  size_t chunk_count;
  // False when embedding failed and the chunks are only searchable by keyword
  bool embedded;
  bool duplicate;

  static IngestResult success_response(const std::string& doc_id,
                                       const std::string& filename,
                                       FileType type,
                                       size_t chunk_count,
                                       bool embedded,
                                       bool duplicate = false) {
    return {true, "", doc_id, filename, type, chunk_count, embedded, duplicate};
  }

  static IngestResult failure_response(const std::string& error,
                                       const std::string& filename = "") {
    return {false, error, "", filename, FileType::Unknown, 0, false, false};
  }
};

class DocumentIngestService {
 public:
  static constexpr size_t DEFAULT_MAX_FILE_SIZE_BYTES = 10 * 1024 * 1024;

  DocumentIngestService(std::shared_ptr<DocumentStore> document_store,
                        std::shared_ptr<TextChunker> text_chunker,
                        std::shared_ptr<KeywordIndex> keyword_index,
                        std::shared_ptr<VectorStore> vector_store,
                        std::shared_ptr<EmbeddingProvider> embedding_provider,
                        std::shared_ptr<ContentExtractorFactory> content_extractor_factory,
                        size_t max_file_size_bytes = DEFAULT_MAX_FILE_SIZE_BYTES);

  virtual ~DocumentIngestService() = default;

  // Validates, extracts and indexes a file. Failures are reported in the result.
  virtual IngestResult ingest_file(const std::filesystem::path& file_path);

  // Stores, chunks, embeds and indexes already extracted text
  virtual IngestResult ingest_text(const std::string& filename,
                                   FileType file_type,
                                   const std::string& text);

 private:
  std::shared_ptr<DocumentStore> document_store_;
  std::shared_ptr<TextChunker> text_chunker_;
  std::shared_ptr<KeywordIndex> keyword_index_;
  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<ContentExtractorFactory> content_extractor_factory_;
  size_t max_file_size_bytes_;
};

}  // namespace docqa_core
