#include "docqa_core/vector/faiss_vector_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <iostream>
#include <mutex>

namespace docqa_core {

FaissVectorStore::FaissVectorStore(int dimension)
    : dimension_(dimension), index_(nullptr) {
  if (dimension_ <= 0) {
    throw VectorStoreError("Vector dimension must be positive, got " +
                           std::to_string(dimension_));
  }
  index_ = create_base_index(dimension_);
}

FaissVectorStore::~FaissVectorStore() = default;

std::unique_ptr<faiss::IndexIDMap> FaissVectorStore::create_base_index(int dimension) {
  auto base_index = new faiss::IndexFlatIP(dimension);
  // Wrap with IDMap to enable add_with_ids
  auto index = std::make_unique<faiss::IndexIDMap>(base_index);
  index->own_fields = true;
  return index;
}

void FaissVectorStore::validate_dimension(const std::vector<float> &vector,
                                          const std::string &context) const {
  if (vector.size() != static_cast<size_t>(dimension_)) {
    throw VectorStoreError(context + " vector dimension mismatch. Expected " +
                           std::to_string(dimension_) + ", got " +
                           std::to_string(vector.size()));
  }
}

std::vector<float> FaissVectorStore::normalized(const std::vector<float> &vector) const {
  std::vector<float> copy = vector;
  faiss::fvec_renorm_L2(static_cast<size_t>(dimension_), 1, copy.data());
  return copy;
}

void FaissVectorStore::upsert(const std::vector<Chunk> &chunks,
                              const std::vector<std::vector<float>> &embeddings) {
  if (chunks.size() != embeddings.size()) {
    throw VectorStoreError("Upsert received " + std::to_string(chunks.size()) + " chunks but " +
                           std::to_string(embeddings.size()) + " embeddings");
  }
  for (size_t i = 0; i < chunks.size(); ++i) {
    validate_chunk(chunks[i]);
    validate_dimension(embeddings[i], "Upsert");
  }
  if (chunks.empty()) {
    return;
  }

  // Within one batch the last occurrence of a key wins
  std::map<PointKey, size_t> last_position;
  for (size_t i = 0; i < chunks.size(); ++i) {
    last_position[{chunks[i].doc_id, chunks[i].chunk_id}] = i;
  }

  std::unique_lock lock(mutex_);

  // Replace existing points with the same (doc_id, chunk_id)
  std::vector<faiss::idx_t> replaced;
  for (const auto &[key, position] : last_position) {
    auto it = ids_by_key_.find(key);
    if (it != ids_by_key_.end()) {
      replaced.push_back(it->second);
    }
  }
  remove_ids_unlocked(replaced);

  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> all_vectors_flat;
  faiss_ids.reserve(last_position.size());
  all_vectors_flat.reserve(last_position.size() * static_cast<size_t>(dimension_));

  for (size_t i = 0; i < chunks.size(); ++i) {
    const PointKey key{chunks[i].doc_id, chunks[i].chunk_id};
    if (last_position[key] != i) {
      continue;
    }
    const faiss::idx_t id = next_id_++;
    std::vector<float> vector = normalized(embeddings[i]);
    all_vectors_flat.insert(all_vectors_flat.end(), vector.begin(), vector.end());
    faiss_ids.push_back(id);
    points_[id] = StoredPoint{chunks[i], std::move(vector)};
    ids_by_key_[key] = id;
  }

  // Add all vectors to the Faiss index in one go
  index_->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()), all_vectors_flat.data(),
                       faiss_ids.data());
  std::cout << "[VectorStore] Upserted " << faiss_ids.size() << " points, " << points_.size()
            << " total" << std::endl;
}

void FaissVectorStore::remove_ids_unlocked(const std::vector<faiss::idx_t> &ids) {
  if (ids.empty()) {
    return;
  }
  std::vector<faiss::idx_t> present;
  for (auto id : ids) {
    auto it = points_.find(id);
    if (it == points_.end()) {
      continue;
    }
    ids_by_key_.erase({it->second.chunk.doc_id, it->second.chunk.chunk_id});
    points_.erase(it);
    present.push_back(id);
  }
  if (present.empty()) {
    return;
  }
  faiss::IDSelectorBatch selector(present.size(), present.data());
  index_->remove_ids(selector);
}

std::vector<SearchResult> FaissVectorStore::query(const std::vector<float> &query_vector,
                                                  int top_k,
                                                  float min_score,
                                                  const VectorFilter &filter) const {
  validate_dimension(query_vector, "Query");
  if (top_k <= 0) {
    return {};
  }

  std::shared_lock lock(mutex_);
  if (index_->ntotal == 0) {
    return {};
  }

  const std::vector<float> query = normalized(query_vector);
  const bool filtered = filter.doc_id.has_value() || filter.file_type.has_value();

  // Filtered queries search a temporary index over the matching points only
  std::unique_ptr<faiss::IndexIDMap> filtered_index;
  faiss::IndexIDMap *search_index = index_.get();
  if (filtered) {
    std::vector<faiss::idx_t> faiss_ids;
    std::vector<float> all_vectors_flat;
    for (const auto &[id, point] : points_) {
      if (filter.matches(point.chunk)) {
        faiss_ids.push_back(id);
        all_vectors_flat.insert(all_vectors_flat.end(), point.vector.begin(),
                                point.vector.end());
      }
    }
    if (faiss_ids.empty()) {
      return {};
    }
    filtered_index = create_base_index(dimension_);
    filtered_index->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()),
                                 all_vectors_flat.data(), faiss_ids.data());
    search_index = filtered_index.get();
  }

  const faiss::idx_t actual_k = std::min<faiss::idx_t>(top_k, search_index->ntotal);
  std::vector<float> distances(static_cast<size_t>(actual_k));
  std::vector<faiss::idx_t> labels(static_cast<size_t>(actual_k));
  search_index->search(1, query.data(), actual_k, distances.data(), labels.data());

  std::vector<SearchResult> results;
  results.reserve(labels.size());
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] < 0 || distances[i] < min_score) {
      continue;
    }
    auto it = points_.find(labels[i]);
    if (it == points_.end()) {
      continue;
    }
    const Chunk &chunk = it->second.chunk;
    SearchResult result;
    result.chunk_id = chunk.chunk_id;
    result.doc_id = chunk.doc_id;
    result.text = chunk.text;
    result.filename = chunk.filename;
    result.file_type = chunk.file_type;
    result.score = distances[i];
    result.source = ResultSource::Semantic;
    results.push_back(std::move(result));
  }
  return results;
}

size_t FaissVectorStore::remove_document(const std::string &doc_id) {
  std::unique_lock lock(mutex_);
  std::vector<faiss::idx_t> ids;
  for (const auto &[key, id] : ids_by_key_) {
    if (key.first == doc_id) {
      ids.push_back(id);
    }
  }
  remove_ids_unlocked(ids);
  if (!ids.empty()) {
    std::cout << "[VectorStore] Removed " << ids.size() << " points of document " << doc_id
              << std::endl;
  }
  return ids.size();
}

size_t FaissVectorStore::size() const {
  std::shared_lock lock(mutex_);
  return points_.size();
}

}  // namespace docqa_core
