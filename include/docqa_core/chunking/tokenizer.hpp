#pragma once

#include <cstddef>
#include <string_view>

namespace docqa_core {

/**
 * @class Tokenizer
 * @brief Counts model tokens in a piece of text.
 *
 * The same tokenizer instance must be used when chunking documents and when budgeting
 * answer context, otherwise chunk sizes and context limits disagree.
 */
class Tokenizer {
 public:
  virtual ~Tokenizer() = default;

  virtual size_t count_tokens(std::string_view text) const = 0;
};

/**
 * @class HeuristicTokenizer
 * @brief Deterministic approximation of a BPE tokenizer for mostly-English text.
 *
 * Text is scanned code point by code point and grouped into runs of letters, digits,
 * punctuation and whitespace. Letter runs cost one token per LETTERS_PER_TOKEN code points
 * (rounded up), digit runs one per DIGITS_PER_TOKEN, every punctuation code point is a token
 * and whitespace is free. Counts are additive over space-joined text.
 */
class HeuristicTokenizer : public Tokenizer {
 public:
  size_t count_tokens(std::string_view text) const override;

  static constexpr size_t LETTERS_PER_TOKEN = 4;
  static constexpr size_t DIGITS_PER_TOKEN = 3;
};

}  // namespace docqa_core
