#include "docqa_core/answer/context_builder.hpp"

#include <iostream>
#include <stdexcept>

namespace docqa_core {

ContextBuilder::ContextBuilder(std::shared_ptr<const Tokenizer> tokenizer,
                               size_t max_context_tokens)
    : tokenizer_(std::move(tokenizer)), max_context_tokens_(max_context_tokens) {
  if (!tokenizer_) {
    throw std::invalid_argument("ContextBuilder requires a tokenizer");
  }
}

BuiltContext ContextBuilder::build(const std::vector<FusedResult> &search_results) const {
  BuiltContext built;

  for (size_t i = 0; i < search_results.size(); ++i) {
    const FusedResult &result = search_results[i];
    const size_t tokens = tokenizer_->count_tokens(result.text);
    if (built.token_count + tokens > max_context_tokens_) {
      break;
    }

    const int citation_id = static_cast<int>(i) + 1;
    if (!built.context.empty()) {
      built.context += "\n\n";
    }
    built.context += "[Source " + std::to_string(citation_id) + "] " + result.text;

    Citation citation;
    citation.id = citation_id;
    citation.doc_id = result.doc_id;
    citation.chunk_id = result.chunk_id;
    citation.filename = result.filename;
    citation.file_type = result.file_type;
    citation.text = result.text;
    citation.score = result.score;
    built.citations.push_back(std::move(citation));

    built.token_count += tokens;
  }

  std::cout << "[ContextBuilder] Built context with " << built.citations.size() << " sources ("
            << built.token_count << " tokens)" << std::endl;
  return built;
}

}  // namespace docqa_core
