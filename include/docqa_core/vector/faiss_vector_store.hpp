#pragma once

#include <faiss/IndexIDMap.h>

#include <map>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "docqa_core/vector/vector_store.hpp"

namespace docqa_core {

/**
 * @class FaissVectorStore
 * @brief In-memory VectorStore backed by a faiss inner-product index.
 *
 * Vectors are L2-normalized on the way in, so scores are cosine similarities. Filtered queries
 * are answered from a temporary index built over the matching points only.
 */
class FaissVectorStore : public VectorStore {
 public:
  explicit FaissVectorStore(int dimension);
  ~FaissVectorStore() override;

  // Disable copy constructor and assignment
  FaissVectorStore(const FaissVectorStore &) = delete;
  FaissVectorStore &operator=(const FaissVectorStore &) = delete;

  void upsert(const std::vector<Chunk> &chunks,
              const std::vector<std::vector<float>> &embeddings) override;

  std::vector<SearchResult> query(const std::vector<float> &query_vector,
                                  int top_k,
                                  float min_score = 0.0f,
                                  const VectorFilter &filter = {}) const override;

  size_t remove_document(const std::string &doc_id) override;

  size_t size() const override;

  int dimension() const {
    return dimension_;
  }

 private:
  struct StoredPoint {
    Chunk chunk;
    std::vector<float> vector;
  };

  using PointKey = std::pair<std::string, int>;

  static std::unique_ptr<faiss::IndexIDMap> create_base_index(int dimension);
  void validate_dimension(const std::vector<float> &vector, const std::string &context) const;
  std::vector<float> normalized(const std::vector<float> &vector) const;
  void remove_ids_unlocked(const std::vector<faiss::idx_t> &ids);

  int dimension_;
  std::unique_ptr<faiss::IndexIDMap> index_;
  std::unordered_map<faiss::idx_t, StoredPoint> points_;
  std::map<PointKey, faiss::idx_t> ids_by_key_;
  faiss::idx_t next_id_ = 0;
  mutable std::shared_mutex mutex_;
};

}  // namespace docqa_core
