#pragma once

#include <optional>
#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"
#include "docqa_core/types/search_result.hpp"

namespace docqa_core {

class VectorStoreError : public std::exception {
 public:
  explicit VectorStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Optional restrictions applied to a similarity query
struct VectorFilter {
  std::optional<std::string> doc_id;
  std::optional<FileType> file_type;

  bool matches(const Chunk &chunk) const {
    if (doc_id && chunk.doc_id != *doc_id)
      return false;
    if (file_type && chunk.file_type != *file_type)
      return false;
    return true;
  }
};

/**
 * @class VectorStore
 * @brief Similarity backend holding one embedding per chunk.
 *
 * Points are keyed by (doc_id, chunk_id); upserting the same key replaces the stored point.
 */
class VectorStore {
 public:
  virtual ~VectorStore() = default;

  // chunks and embeddings are parallel. Throws VectorStoreError on size or dimension mismatch.
  virtual void upsert(const std::vector<Chunk> &chunks,
                      const std::vector<std::vector<float>> &embeddings) = 0;

  // Results have ResultSource::Semantic, score >= min_score, ordered by score descending.
  virtual std::vector<SearchResult> query(const std::vector<float> &query_vector,
                                          int top_k,
                                          float min_score = 0.0f,
                                          const VectorFilter &filter = {}) const = 0;

  // Returns the number of points removed. Unknown doc ids are not an error.
  virtual size_t remove_document(const std::string &doc_id) = 0;

  virtual size_t size() const = 0;
};

}  // namespace docqa_core
