#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace docqa_core {

/**
 * @class Bm25Index
 * @brief Okapi BM25 relevance scoring over an ordered corpus of documents.
 *
 * Documents are addressed by their position in the corpus. The index keeps per-document term
 * frequencies together with the corpus aggregates (document frequencies, total length), so
 * documents can be appended or removed without refitting. Not thread-safe; KeywordIndex
 * provides the locking.
 */
class Bm25Index {
 public:
  static constexpr double DEFAULT_K1 = 1.5;
  static constexpr double DEFAULT_B = 0.75;

  explicit Bm25Index(double k1 = DEFAULT_K1, double b = DEFAULT_B);

  // Replaces the corpus
  void fit(const std::vector<std::string>& documents);

  // Appends one document at position size()
  void add_document(const std::string& document);

  // Removes the documents at the given positions; later documents shift down
  void remove_documents(std::vector<size_t> doc_indices);

  void clear();

  // BM25 score of a query against one document. 0 for out-of-range indices.
  double score(const std::string& query, size_t doc_index) const;

  // Every document scored, sorted by score descending with ties kept in corpus order,
  // truncated to top_k.
  std::vector<std::pair<size_t, double>> search(const std::string& query, size_t top_k) const;

  size_t size() const {
    return documents_.size();
  }
  double average_document_length() const;
  size_t document_frequency(const std::string& term) const;
  double idf(const std::string& term) const;

  // Case-folded whitespace split used for both documents and queries
  static std::vector<std::string> tokenize(const std::string& text);

 private:
  struct DocumentStats {
    std::unordered_map<std::string, int> term_freqs;
    size_t length = 0;
  };

  double score_tokens(const std::vector<std::string>& query_tokens, size_t doc_index) const;

  double k1_;
  double b_;
  std::vector<DocumentStats> documents_;
  std::unordered_map<std::string, size_t> doc_freqs_;
  size_t total_length_ = 0;
};

}  // namespace docqa_core
