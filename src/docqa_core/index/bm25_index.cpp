#include "docqa_core/index/bm25_index.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

Bm25Index::Bm25Index(double k1, double b) : k1_(k1), b_(b) {
  if (k1_ < 0.0) {
    throw std::invalid_argument("BM25 k1 must be non-negative");
  }
  if (b_ < 0.0 || b_ > 1.0) {
    throw std::invalid_argument("BM25 b must be within [0, 1]");
  }
}

std::vector<std::string> Bm25Index::tokenize(const std::string& text) {
  return text_utils::split_whitespace(text_utils::to_lower_ascii(text));
}

void Bm25Index::fit(const std::vector<std::string>& documents) {
  clear();
  documents_.reserve(documents.size());
  for (const auto& document : documents) {
    add_document(document);
  }
}

void Bm25Index::add_document(const std::string& document) {
  DocumentStats stats;
  for (auto& token : tokenize(document)) {
    stats.term_freqs[token]++;
    stats.length++;
  }
  for (const auto& [term, freq] : stats.term_freqs) {
    doc_freqs_[term]++;
  }
  total_length_ += stats.length;
  documents_.push_back(std::move(stats));
}

void Bm25Index::remove_documents(std::vector<size_t> doc_indices) {
  std::sort(doc_indices.begin(), doc_indices.end());
  doc_indices.erase(std::unique(doc_indices.begin(), doc_indices.end()), doc_indices.end());

  // Walk from the back so earlier positions stay valid while erasing
  for (auto it = doc_indices.rbegin(); it != doc_indices.rend(); ++it) {
    size_t index = *it;
    if (index >= documents_.size()) {
      continue;
    }
    const DocumentStats& stats = documents_[index];
    for (const auto& [term, freq] : stats.term_freqs) {
      auto df = doc_freqs_.find(term);
      if (df != doc_freqs_.end() && --df->second == 0) {
        doc_freqs_.erase(df);
      }
    }
    total_length_ -= stats.length;
    documents_.erase(documents_.begin() + static_cast<std::ptrdiff_t>(index));
  }
}

void Bm25Index::clear() {
  documents_.clear();
  doc_freqs_.clear();
  total_length_ = 0;
}

double Bm25Index::average_document_length() const {
  if (documents_.empty()) {
    return 0.0;
  }
  return static_cast<double>(total_length_) / static_cast<double>(documents_.size());
}

size_t Bm25Index::document_frequency(const std::string& term) const {
  auto it = doc_freqs_.find(term);
  return it == doc_freqs_.end() ? 0 : it->second;
}

double Bm25Index::idf(const std::string& term) const {
  const size_t df = document_frequency(term);
  if (df == 0) {
    return 0.0;
  }
  const double n = static_cast<double>(documents_.size());
  const double d = static_cast<double>(df);
  return std::log((n - d + 0.5) / (d + 0.5) + 1.0);
}

double Bm25Index::score(const std::string& query, size_t doc_index) const {
  if (doc_index >= documents_.size()) {
    return 0.0;
  }
  return score_tokens(tokenize(query), doc_index);
}

double Bm25Index::score_tokens(const std::vector<std::string>& query_tokens,
                               size_t doc_index) const {
  const double avgdl = average_document_length();
  if (avgdl <= 0.0) {
    return 0.0;
  }

  const DocumentStats& doc = documents_[doc_index];
  const double length_norm =
      1.0 - b_ + b_ * static_cast<double>(doc.length) / avgdl;

  double total = 0.0;
  // Repeated query tokens contribute once per occurrence
  for (const auto& token : query_tokens) {
    auto it = doc.term_freqs.find(token);
    if (it == doc.term_freqs.end()) {
      continue;
    }
    const double freq = static_cast<double>(it->second);
    total += idf(token) * (freq * (k1_ + 1.0)) / (freq + k1_ * length_norm);
  }
  return total;
}

std::vector<std::pair<size_t, double>> Bm25Index::search(const std::string& query,
                                                         size_t top_k) const {
  const std::vector<std::string> query_tokens = tokenize(query);

  std::vector<std::pair<size_t, double>> scores;
  scores.reserve(documents_.size());
  for (size_t i = 0; i < documents_.size(); ++i) {
    scores.emplace_back(i, score_tokens(query_tokens, i));
  }

  std::stable_sort(scores.begin(), scores.end(),
                   [](const auto& a, const auto& b) { return a.second > b.second; });
  if (scores.size() > top_k) {
    scores.resize(top_k);
  }
  return scores;
}

}  // namespace docqa_core
