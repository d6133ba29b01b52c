#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docqa_core/types/file.hpp"

namespace docqa_core {

class DocumentStoreError : public std::exception {
 public:
  explicit DocumentStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct Document {
  std::string doc_id;
  std::string filename;
  FileType file_type = FileType::Unknown;
  std::string content_hash;
  std::string text;
  size_t file_size = 0;
  size_t word_count = 0;
  size_t character_count = 0;
  std::chrono::system_clock::time_point upload_time;
};

// Summary without the text body
void to_json(nlohmann::json &j, const Document &document);

struct AddDocumentResult {
  Document document;
  // True when a document with the same content was already stored and is returned instead
  bool duplicate = false;
};

/**
 * @class DocumentStore
 * @brief In-memory registry of ingested documents, keyed by a generated UUID.
 *
 * Documents with identical content (same SHA-256) are stored once.
 */
class DocumentStore {
 public:
  DocumentStore();

  // Disable copy constructor and assignment
  DocumentStore(const DocumentStore &) = delete;
  DocumentStore &operator=(const DocumentStore &) = delete;

  // Throws DocumentStoreError if the text is blank
  AddDocumentResult add(const std::string &filename, FileType file_type, const std::string &text);

  std::optional<Document> get(const std::string &doc_id) const;

  // Newest first
  std::vector<Document> list() const;

  // Returns false if the document is unknown
  bool remove(const std::string &doc_id);

  size_t size() const;

 private:
  std::string generate_doc_id();

  mutable std::mutex mutex_;
  std::map<std::string, Document> documents_;
  // doc ids in insertion order
  std::vector<std::string> order_;
  std::mt19937_64 rng_;
};

}  // namespace docqa_core
