#include "docqa_core/services/document_ingest_service.hpp"

#include <iostream>
#include <stdexcept>

namespace docqa_core {

DocumentIngestService::DocumentIngestService(
    std::shared_ptr<DocumentStore> document_store,
    std::shared_ptr<TextChunker> text_chunker,
    std::shared_ptr<KeywordIndex> keyword_index,
    std::shared_ptr<VectorStore> vector_store,
    std::shared_ptr<EmbeddingProvider> embedding_provider,
    std::shared_ptr<ContentExtractorFactory> content_extractor_factory,
    size_t max_file_size_bytes)
    : document_store_(document_store),
      text_chunker_(text_chunker),
      keyword_index_(keyword_index),
      vector_store_(vector_store),
      embedding_provider_(embedding_provider),
      content_extractor_factory_(content_extractor_factory),
      max_file_size_bytes_(max_file_size_bytes) {
  if (!document_store_ || !text_chunker_ || !keyword_index_ || !vector_store_ ||
      !embedding_provider_ || !content_extractor_factory_) {
    throw std::invalid_argument("DocumentIngestService requires all collaborators");
  }
}

IngestResult DocumentIngestService::ingest_file(const std::filesystem::path& file_path) {
  const std::string filename = file_path.filename().string();

  // Preflight: the path must be a regular file within the size limit
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    return IngestResult::failure_response("File not found: " + file_path.string(), filename);
  }
  const auto file_size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    return IngestResult::failure_response("Could not read file size: " + ec.message(), filename);
  }
  if (file_size > max_file_size_bytes_) {
    return IngestResult::failure_response("File too large: " + std::to_string(file_size) +
                                              " bytes (limit " +
                                              std::to_string(max_file_size_bytes_) + ")",
                                          filename);
  }

  try {
    const ContentExtractor& extractor = content_extractor_factory_->get_extractor_for(file_path);
    std::string text = extractor.extract_text(file_path);
    return ingest_text(filename, extractor.get_file_type(), text);
  } catch (const ContentExtractorError& e) {
    std::cerr << "[Ingest] Error processing document " << file_path << ": " << e.what()
              << std::endl;
    return IngestResult::failure_response(e.what(), filename);
  }
}

IngestResult DocumentIngestService::ingest_text(const std::string& filename,
                                                FileType file_type,
                                                const std::string& text) {
  AddDocumentResult added;
  try {
    added = document_store_->add(filename, file_type, text);
  } catch (const DocumentStoreError& e) {
    return IngestResult::failure_response(e.what(), filename);
  }

  const Document& document = added.document;
  if (added.duplicate) {
    return IngestResult::success_response(document.doc_id, document.filename, document.file_type,
                                          0, false, true);
  }

  std::vector<Chunk> chunks = text_chunker_->chunk_document(
      {.doc_id = document.doc_id, .filename = document.filename, .file_type = file_type},
      document.text);
  if (chunks.empty()) {
    document_store_->remove(document.doc_id);
    return IngestResult::failure_response("No text content to index", filename);
  }

  // Without embeddings the document is still searchable by keyword
  bool embedded = false;
  try {
    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (const auto& chunk : chunks) {
      texts.push_back(chunk.text);
    }
    std::vector<std::vector<float>> embeddings = embedding_provider_->get_embeddings(texts);
    vector_store_->upsert(chunks, embeddings);
    embedded = true;
  } catch (const std::exception& e) {
    std::cerr << "[Ingest] Embedding failed for " << filename
              << ", indexing by keyword only: " << e.what() << std::endl;
  }

  keyword_index_->add(chunks);

  std::cout << "[Ingest] Indexed " << filename << ": " << chunks.size() << " chunks"
            << (embedded ? "" : " (keyword only)") << std::endl;
  return IngestResult::success_response(document.doc_id, document.filename, file_type,
                                        chunks.size(), embedded);
}

}  // namespace docqa_core
