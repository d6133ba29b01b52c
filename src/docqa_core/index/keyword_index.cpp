#include "docqa_core/index/keyword_index.hpp"

#include <iostream>
#include <mutex>
#include <unordered_set>

#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

KeywordIndex::KeywordIndex(double k1, double b) : bm25_(k1, b) {}

void KeywordIndex::fit(const std::vector<Chunk> &chunks) {
  for (const auto &chunk : chunks) {
    validate_chunk(chunk);
  }
  std::unique_lock lock(mutex_);
  bm25_.clear();
  chunks_.clear();
  add_unlocked(chunks);
}

void KeywordIndex::add(const std::vector<Chunk> &chunks) {
  for (const auto &chunk : chunks) {
    validate_chunk(chunk);
  }
  std::unique_lock lock(mutex_);
  add_unlocked(chunks);
}

void KeywordIndex::add_unlocked(const std::vector<Chunk> &chunks) {
  chunks_.reserve(chunks_.size() + chunks.size());
  for (const auto &chunk : chunks) {
    bm25_.add_document(chunk.text);
    chunks_.push_back(chunk);
  }
  std::cout << "[KeywordIndex] Indexed " << chunks.size() << " chunks, " << chunks_.size()
            << " total" << std::endl;
}

size_t KeywordIndex::remove(const std::string &doc_id) {
  std::unique_lock lock(mutex_);
  std::vector<size_t> positions;
  for (size_t i = 0; i < chunks_.size(); ++i) {
    if (chunks_[i].doc_id == doc_id) {
      positions.push_back(i);
    }
  }
  if (positions.empty()) {
    return 0;
  }

  bm25_.remove_documents(positions);
  std::vector<Chunk> kept;
  kept.reserve(chunks_.size() - positions.size());
  for (auto &chunk : chunks_) {
    if (chunk.doc_id != doc_id) {
      kept.push_back(std::move(chunk));
    }
  }
  chunks_ = std::move(kept);

  std::cout << "[KeywordIndex] Removed " << positions.size() << " chunks of document " << doc_id
            << std::endl;
  return positions.size();
}

void KeywordIndex::clear() {
  std::unique_lock lock(mutex_);
  bm25_.clear();
  chunks_.clear();
}

std::vector<SearchResult> KeywordIndex::search(const std::string &query, int top_k) const {
  if (top_k <= 0 || text_utils::trim(query).empty()) {
    return {};
  }

  std::shared_lock lock(mutex_);
  if (chunks_.empty()) {
    std::cerr << "[KeywordIndex] Search requested on an empty index" << std::endl;
    return {};
  }

  std::vector<SearchResult> results;
  for (const auto &[position, score] : bm25_.search(query, static_cast<size_t>(top_k))) {
    const Chunk &chunk = chunks_[position];
    SearchResult result;
    result.chunk_id = chunk.chunk_id;
    result.doc_id = chunk.doc_id;
    result.text = chunk.text;
    result.filename = chunk.filename;
    result.file_type = chunk.file_type;
    result.score = static_cast<float>(score);
    result.source = ResultSource::Keyword;
    results.push_back(std::move(result));
  }
  return results;
}

size_t KeywordIndex::size() const {
  std::shared_lock lock(mutex_);
  return chunks_.size();
}

size_t KeywordIndex::document_count() const {
  std::shared_lock lock(mutex_);
  std::unordered_set<std::string> doc_ids;
  for (const auto &chunk : chunks_) {
    doc_ids.insert(chunk.doc_id);
  }
  return doc_ids.size();
}

bool KeywordIndex::empty() const {
  return size() == 0;
}

}  // namespace docqa_core
