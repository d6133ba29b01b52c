#include "docqa_core/chunking/text_chunker.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>
#include <string_view>
#include <unordered_set>

#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.length(), to);
    pos += to.length();
  }
}

std::string join_words(const std::vector<std::string>& words, size_t first) {
  std::string joined;
  for (size_t i = first; i < words.size(); ++i) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += words[i];
  }
  return joined;
}

}  // namespace

TextChunker::TextChunker(std::shared_ptr<const Tokenizer> tokenizer,
                         size_t max_tokens,
                         size_t overlap_tokens)
    : tokenizer_(std::move(tokenizer)), max_tokens_(max_tokens), overlap_tokens_(overlap_tokens) {
  if (!tokenizer_) {
    throw std::invalid_argument("TextChunker requires a tokenizer");
  }
  if (max_tokens_ == 0) {
    throw std::invalid_argument("TextChunker max_tokens must be greater than 0");
  }
}

std::vector<Chunk> TextChunker::chunk(const std::string& text) const {
  return chunk(text, max_tokens_, overlap_tokens_);
}

std::vector<Chunk> TextChunker::chunk_document(const ChunkSource& source,
                                               const std::string& text) const {
  std::vector<Chunk> chunks = chunk(text);
  for (auto& c : chunks) {
    c.doc_id = source.doc_id;
    c.filename = source.filename;
    c.file_type = source.file_type;
  }
  return chunks;
}

/**
 * @brief Greedy sentence packing with word-level overlap between chunks.
 *
 * Sentences are appended to the current chunk while the running token count stays within
 * max_tokens. When the next sentence does not fit, the current chunk is closed and the next
 * one is seeded with the trailing words of the closed chunk. The overlap budget is the smaller
 * of overlap_tokens and the room the incoming sentence leaves under the cap.
 */
std::vector<Chunk> TextChunker::chunk(const std::string& text,
                                      size_t max_tokens,
                                      size_t overlap_tokens) const {
  if (text_utils::trim(text).empty()) {
    return {};
  }
  if (max_tokens == 0) {
    throw std::invalid_argument("max_tokens must be greater than 0");
  }

  const std::string cleaned = clean_text(text);
  const std::vector<std::string> sentences = split_into_sentences(cleaned);

  std::vector<Chunk> chunks;
  std::string current_chunk;
  size_t current_token_count = 0;
  int sentence_start_idx = 0;

  for (size_t i = 0; i < sentences.size(); ++i) {
    const std::string& sentence = sentences[i];
    const size_t sentence_tokens = tokenizer_->count_tokens(sentence);
    const int index = static_cast<int>(i);

    if (current_token_count + sentence_tokens > max_tokens && !current_chunk.empty()) {
      chunks.push_back(make_chunk(current_chunk, static_cast<int>(chunks.size()),
                                  sentence_start_idx, index - 1, current_token_count));

      size_t overlap_budget = 0;
      if (sentence_tokens < max_tokens) {
        overlap_budget = std::min(overlap_tokens, max_tokens - sentence_tokens);
      }
      std::string overlap_text = get_overlap_text(current_chunk, overlap_budget);

      current_chunk = overlap_text.empty() ? sentence : overlap_text + " " + sentence;
      current_token_count = tokenizer_->count_tokens(current_chunk);
      sentence_start_idx = find_overlap_start_sentence(overlap_text, sentences, index);
    } else {
      if (!current_chunk.empty()) {
        current_chunk += " ";
      }
      current_chunk += sentence;
      current_token_count += sentence_tokens;
    }
  }

  if (!text_utils::trim(current_chunk).empty()) {
    chunks.push_back(make_chunk(current_chunk, static_cast<int>(chunks.size()), sentence_start_idx,
                                static_cast<int>(sentences.size()) - 1, current_token_count));
  }

  return chunks;
}

std::string TextChunker::clean_text(const std::string& text) {
  static const std::regex page_marker_regex(R"(\[Page \d+\] ?)");

  // Whitespace runs collapse to a single space before any regex sees the text
  std::string cleaned = join_words(text_utils::split_whitespace(text), 0);
  cleaned = std::regex_replace(cleaned, page_marker_regex, "");

  replace_all(cleaned, "\xE2\x80\x9C", "\"");
  replace_all(cleaned, "\xE2\x80\x9D", "\"");
  replace_all(cleaned, "\xE2\x80\x98", "'");
  replace_all(cleaned, "\xE2\x80\x99", "'");

  return text_utils::trim(cleaned);
}

std::vector<std::string> TextChunker::split_into_sentences(const std::string& text) {
  auto is_terminator = [](char c) { return c == '.' || c == '!' || c == '?'; };
  auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

  std::vector<std::string> sentences;
  auto emit = [&sentences](std::string_view piece) {
    std::string sentence = text_utils::trim(piece);
    if (!sentence.empty()) {
      sentences.push_back(std::move(sentence));
    }
  };

  // A terminator run ends a sentence only when followed by whitespace or the end of text
  size_t start = 0;
  size_t i = 0;
  while (i < text.size()) {
    if (!is_terminator(text[i])) {
      ++i;
      continue;
    }
    size_t run_end = i;
    while (run_end < text.size() && is_terminator(text[run_end])) {
      ++run_end;
    }
    if (run_end == text.size() || is_space(text[run_end])) {
      emit(std::string_view(text).substr(start, i - start));
      while (run_end < text.size() && is_space(text[run_end])) {
        ++run_end;
      }
      start = run_end;
    }
    i = run_end;
  }
  if (start < text.size()) {
    emit(std::string_view(text).substr(start));
  }
  return sentences;
}

std::string TextChunker::get_overlap_text(const std::string& text, size_t max_tokens) const {
  if (max_tokens == 0) {
    return "";
  }

  const std::vector<std::string> words = text_utils::split_whitespace(text);
  std::string overlap_text;

  // Grow the suffix one word at a time from the end until it no longer fits
  for (size_t i = words.size(); i-- > 0;) {
    std::string candidate = join_words(words, i);
    if (tokenizer_->count_tokens(candidate) <= max_tokens) {
      overlap_text = std::move(candidate);
    } else {
      break;
    }
  }
  return overlap_text;
}

int TextChunker::find_overlap_start_sentence(const std::string& overlap_text,
                                             const std::vector<std::string>& sentences,
                                             int current_index) {
  if (overlap_text.empty() || current_index <= 0) {
    return current_index;
  }

  const std::vector<std::string> overlap_list =
      text_utils::split_whitespace(text_utils::to_lower_ascii(overlap_text));
  const std::unordered_set<std::string> overlap_words(overlap_list.begin(), overlap_list.end());

  const int last = std::min(current_index, static_cast<int>(sentences.size()));
  for (int i = last - 1; i >= 0; --i) {
    for (const auto& word :
         text_utils::split_whitespace(text_utils::to_lower_ascii(sentences[i]))) {
      if (overlap_words.count(word) > 0) {
        return i;
      }
    }
  }
  return current_index;
}

Chunk TextChunker::make_chunk(const std::string& text,
                              int chunk_id,
                              int start_sentence,
                              int end_sentence,
                              size_t token_count) const {
  Chunk chunk;
  chunk.chunk_id = chunk_id;
  chunk.text = text_utils::trim(text);
  chunk.token_count = static_cast<int>(token_count);
  chunk.char_count = static_cast<int>(text_utils::count_code_points(chunk.text));
  chunk.start_sentence = start_sentence;
  chunk.end_sentence = end_sentence;
  return chunk;
}

}  // namespace docqa_core
