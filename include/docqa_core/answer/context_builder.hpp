#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/chunking/tokenizer.hpp"
#include "docqa_core/types/citation.hpp"
#include "docqa_core/types/search_result.hpp"

namespace docqa_core {

struct BuiltContext {
  std::string context;
  std::vector<Citation> citations;
  size_t token_count = 0;
};

/**
 * @class ContextBuilder
 * @brief Renders ranked results as numbered "[Source i]" passages for the prompt.
 *
 * Results are taken in rank order until the next passage would push the token count past
 * max_context_tokens. Every included passage gets a Citation with the same number.
 */
class ContextBuilder {
 public:
  static constexpr size_t DEFAULT_MAX_CONTEXT_TOKENS = 3000;

  explicit ContextBuilder(std::shared_ptr<const Tokenizer> tokenizer,
                          size_t max_context_tokens = DEFAULT_MAX_CONTEXT_TOKENS);

  BuiltContext build(const std::vector<FusedResult> &search_results) const;

  size_t max_context_tokens() const {
    return max_context_tokens_;
  }

 private:
  std::shared_ptr<const Tokenizer> tokenizer_;
  size_t max_context_tokens_;
};

}  // namespace docqa_core
