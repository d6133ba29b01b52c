#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docqa_core/index/keyword_index.hpp"
#include "docqa_core/llm/embedding_provider.hpp"
#include "docqa_core/types/search_result.hpp"
#include "docqa_core/vector/vector_store.hpp"

namespace docqa_core {

struct SearchStats {
  size_t total_chunks = 0;
  size_t total_documents = 0;
  float alpha = 0.0f;
  size_t vector_points = 0;
};

void to_json(nlohmann::json &j, const SearchStats &stats);

/**
 * @class HybridSearchEngine
 * @brief Fuses semantic and keyword rankings with Reciprocal Rank Fusion.
 *
 * Each ranker is asked for twice the requested number of candidates. A ranker that fails is
 * logged and treated as having returned nothing, so the other ranker's results still come
 * through. The engine does not keep the keyword index and the vector store in sync; the
 * ingest and delete services do.
 */
class HybridSearchEngine {
 public:
  static constexpr int RRF_K = 60;
  static constexpr float DEFAULT_ALPHA = 0.5f;
  static constexpr float DEFAULT_SEMANTIC_MIN_SCORE = 0.1f;

  // alpha weights the semantic ranker, 1 - alpha the keyword ranker.
  // Throws std::invalid_argument if alpha is outside [0, 1] or a collaborator is null.
  HybridSearchEngine(std::shared_ptr<KeywordIndex> keyword_index,
                     std::shared_ptr<VectorStore> vector_store,
                     std::shared_ptr<EmbeddingProvider> embedding_provider,
                     float alpha = DEFAULT_ALPHA,
                     float semantic_min_score = DEFAULT_SEMANTIC_MIN_SCORE);

  // At most top_k results by combined score descending. Empty for blank queries or top_k <= 0.
  std::vector<FusedResult> search(const std::string &query, int top_k) const;

  std::vector<SearchResult> semantic_search(const std::string &query,
                                            int top_k,
                                            const VectorFilter &filter = {}) const;
  std::vector<SearchResult> keyword_search(const std::string &query, int top_k) const;

  // Ranks start at 1. Results are keyed by (doc_id, chunk_id) and keep the semantic payload
  // when both rankers returned the same chunk. Ties keep first-seen order.
  static std::vector<FusedResult> reciprocal_rank_fusion(const std::vector<SearchResult> &semantic,
                                                         const std::vector<SearchResult> &keyword,
                                                         float alpha,
                                                         int k = RRF_K);

  SearchStats get_search_stats() const;

  float alpha() const {
    return alpha_;
  }

 private:
  std::shared_ptr<KeywordIndex> keyword_index_;
  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  float alpha_;
  float semantic_min_score_;
};

}  // namespace docqa_core
