#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/chunking/tokenizer.hpp"
#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

// Document metadata stamped onto every chunk produced for that document
struct ChunkSource {
  std::string doc_id;
  std::string filename;
  FileType file_type = FileType::Unknown;
};

/**
 * @class TextChunker
 * @brief Splits text into overlapping, token-bounded chunks along sentence boundaries.
 *
 * Sentences are never split. A chunk only exceeds max_tokens when it consists of a single
 * sentence that is longer than the cap on its own. Consecutive chunks share an overlap of
 * trailing whole words taken from the previous chunk.
 */
class TextChunker {
 public:
  static constexpr size_t DEFAULT_MAX_TOKENS = 1000;
  static constexpr size_t DEFAULT_OVERLAP_TOKENS = 200;

  explicit TextChunker(std::shared_ptr<const Tokenizer> tokenizer,
                       size_t max_tokens = DEFAULT_MAX_TOKENS,
                       size_t overlap_tokens = DEFAULT_OVERLAP_TOKENS);

  // Chunks with the configured limits; chunk ids are assigned from 0, document fields are empty.
  std::vector<Chunk> chunk(const std::string& text) const;
  std::vector<Chunk> chunk(const std::string& text, size_t max_tokens, size_t overlap_tokens) const;

  // Same as chunk(text) with doc_id, filename and file_type set on every chunk
  std::vector<Chunk> chunk_document(const ChunkSource& source, const std::string& text) const;

  size_t max_tokens() const {
    return max_tokens_;
  }
  size_t overlap_tokens() const {
    return overlap_tokens_;
  }
  const Tokenizer& tokenizer() const {
    return *tokenizer_;
  }

  // Collapses whitespace, drops "[Page N]" markers and straightens curly quotes
  static std::string clean_text(const std::string& text);

  // Splits on runs of . ! ? followed by whitespace or end of text. Terminators are dropped.
  static std::vector<std::string> split_into_sentences(const std::string& text);

  // Longest suffix of whole words from text whose token count is <= max_tokens
  std::string get_overlap_text(const std::string& text, size_t max_tokens) const;

  // Index of the closest sentence before current_index sharing a word with the overlap,
  // or current_index when there is none.
  static int find_overlap_start_sentence(const std::string& overlap_text,
                                         const std::vector<std::string>& sentences,
                                         int current_index);

 private:
  Chunk make_chunk(const std::string& text,
                   int chunk_id,
                   int start_sentence,
                   int end_sentence,
                   size_t token_count) const;

  std::shared_ptr<const Tokenizer> tokenizer_;
  size_t max_tokens_;
  size_t overlap_tokens_;
};

}  // namespace docqa_core
