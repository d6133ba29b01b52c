#include "docqa_core/search/hybrid_search_engine.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>

#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

void to_json(nlohmann::json &j, const SearchStats &stats) {
  j = nlohmann::json{{"total_chunks", stats.total_chunks},
                     {"total_documents", stats.total_documents},
                     {"alpha", stats.alpha},
                     {"vector_points", stats.vector_points}};
}

HybridSearchEngine::HybridSearchEngine(std::shared_ptr<KeywordIndex> keyword_index,
                                       std::shared_ptr<VectorStore> vector_store,
                                       std::shared_ptr<EmbeddingProvider> embedding_provider,
                                       float alpha,
                                       float semantic_min_score)
    : keyword_index_(std::move(keyword_index)),
      vector_store_(std::move(vector_store)),
      embedding_provider_(std::move(embedding_provider)),
      alpha_(alpha),
      semantic_min_score_(semantic_min_score) {
  if (!keyword_index_ || !vector_store_ || !embedding_provider_) {
    throw std::invalid_argument("HybridSearchEngine requires a keyword index, a vector store and "
                                "an embedding provider");
  }
  if (!(alpha_ >= 0.0f && alpha_ <= 1.0f)) {
    throw std::invalid_argument("alpha must be within [0, 1], got " + std::to_string(alpha_));
  }
  std::cout << "[HybridSearch] Initialized with alpha=" << alpha_ << std::endl;
}

std::vector<SearchResult> HybridSearchEngine::semantic_search(const std::string &query,
                                                              int top_k,
                                                              const VectorFilter &filter) const {
  if (top_k <= 0 || text_utils::trim(query).empty()) {
    return {};
  }
  try {
    std::vector<float> query_vector = embedding_provider_->get_embedding(query);
    return vector_store_->query(query_vector, top_k, semantic_min_score_, filter);
  } catch (const std::exception &e) {
    std::cerr << "[HybridSearch] Semantic search failed: " << e.what() << std::endl;
    return {};
  }
}

std::vector<SearchResult> HybridSearchEngine::keyword_search(const std::string &query,
                                                             int top_k) const {
  try {
    return keyword_index_->search(query, top_k);
  } catch (const std::exception &e) {
    std::cerr << "[HybridSearch] Keyword search failed: " << e.what() << std::endl;
    return {};
  }
}

std::vector<FusedResult> HybridSearchEngine::reciprocal_rank_fusion(
    const std::vector<SearchResult> &semantic,
    const std::vector<SearchResult> &keyword,
    float alpha,
    int k) {
  std::vector<FusedResult> fused;
  std::map<std::pair<std::string, int>, size_t> positions;

  auto accumulate = [&](const std::vector<SearchResult> &ranking, float weight) {
    for (size_t i = 0; i < ranking.size(); ++i) {
      const SearchResult &result = ranking[i];
      const float contribution = weight / static_cast<float>(k + static_cast<int>(i) + 1);
      auto [it, inserted] = positions.try_emplace({result.doc_id, result.chunk_id}, fused.size());
      if (inserted) {
        FusedResult entry;
        static_cast<SearchResult &>(entry) = result;
        entry.combined_score = contribution;
        fused.push_back(std::move(entry));
      } else {
        FusedResult &entry = fused[it->second];
        entry.combined_score += contribution;
        if (entry.source != result.source) {
          entry.source = ResultSource::Fused;
        }
      }
    }
  };

  // Semantic first so its payload is kept for chunks found by both
  accumulate(semantic, alpha);
  accumulate(keyword, 1.0f - alpha);

  std::stable_sort(fused.begin(), fused.end(), [](const FusedResult &a, const FusedResult &b) {
    return a.combined_score > b.combined_score;
  });
  return fused;
}

std::vector<FusedResult> HybridSearchEngine::search(const std::string &query, int top_k) const {
  if (top_k <= 0 || text_utils::trim(query).empty()) {
    return {};
  }

  const int candidates =
      top_k > std::numeric_limits<int>::max() / 2 ? std::numeric_limits<int>::max() : top_k * 2;
  std::vector<SearchResult> semantic = semantic_search(query, candidates);
  std::vector<SearchResult> keyword = keyword_search(query, candidates);

  std::vector<FusedResult> fused = reciprocal_rank_fusion(semantic, keyword, alpha_);
  if (fused.size() > static_cast<size_t>(top_k)) {
    fused.resize(static_cast<size_t>(top_k));
  }

  std::cout << "[HybridSearch] '" << query << "': " << semantic.size() << " semantic, "
            << keyword.size() << " keyword, " << fused.size() << " fused results" << std::endl;
  return fused;
}

SearchStats HybridSearchEngine::get_search_stats() const {
  SearchStats stats;
  stats.total_chunks = keyword_index_->size();
  stats.total_documents = keyword_index_->document_count();
  stats.alpha = alpha_;
  stats.vector_points = vector_store_->size();
  return stats;
}

}  // namespace docqa_core
