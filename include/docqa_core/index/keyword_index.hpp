#pragma once

#include <shared_mutex>
#include <string>
#include <vector>

#include "docqa_core/index/bm25_index.hpp"
#include "docqa_core/types/chunk.hpp"
#include "docqa_core/types/search_result.hpp"

namespace docqa_core {

/**
 * @class KeywordIndex
 * @brief Thread-safe BM25 index over chunk texts.
 *
 * Owns a copy of every indexed chunk. Chunks are added and removed per document without a full
 * refit. Writers take an exclusive lock, readers a shared one.
 */
class KeywordIndex {
 public:
  explicit KeywordIndex(double k1 = Bm25Index::DEFAULT_K1, double b = Bm25Index::DEFAULT_B);

  // Disable copy constructor and assignment
  KeywordIndex(const KeywordIndex &) = delete;
  KeywordIndex &operator=(const KeywordIndex &) = delete;

  // Replaces the indexed corpus. Equivalent to clear() followed by add(chunks).
  void fit(const std::vector<Chunk> &chunks);

  // Throws std::invalid_argument if any chunk has empty text or doc_id; nothing is added then.
  void add(const std::vector<Chunk> &chunks);

  // Returns the number of chunks removed. Unknown doc ids remove nothing.
  size_t remove(const std::string &doc_id);

  void clear();

  // Results carry ResultSource::Keyword and the raw BM25 score. Chunks scoring 0 are still
  // ranked when fewer than top_k chunks match.
  std::vector<SearchResult> search(const std::string &query, int top_k) const;

  size_t size() const;
  size_t document_count() const;
  bool empty() const;

 private:
  void add_unlocked(const std::vector<Chunk> &chunks);

  mutable std::shared_mutex mutex_;
  Bm25Index bm25_;
  std::vector<Chunk> chunks_;
};

}  // namespace docqa_core
