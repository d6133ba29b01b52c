#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/answer/citation_processor.hpp"
#include "docqa_core/answer/confidence_scorer.hpp"
#include "docqa_core/answer/context_builder.hpp"
#include "docqa_core/llm/completion_provider.hpp"
#include "docqa_core/types/citation.hpp"
#include "docqa_core/types/search_result.hpp"

namespace docqa_core {

/**
 * @class AnswerGenerator
 * @brief Turns ranked search results into a cited answer.
 *
 * Builds the numbered context, asks the completion provider for an answer, then scores it and
 * resolves its citation markers. A failing completion provider produces a GenerationFailed
 * record instead of an exception.
 */
class AnswerGenerator {
 public:
  static constexpr float DEFAULT_CONFIDENCE_THRESHOLD = 0.3f;
  static constexpr size_t MAX_FOLLOW_UPS = 3;

  static constexpr const char *NO_RESULTS_MESSAGE =
      "I couldn't find relevant information in the uploaded documents to answer your question.";
  static constexpr const char *NO_CONTEXT_MESSAGE =
      "I couldn't extract enough relevant information from the documents to answer your "
      "question.";
  static constexpr const char *GENERATION_FAILED_MESSAGE =
      "I could not generate an answer because the language model request failed. Please try "
      "again.";

  AnswerGenerator(std::shared_ptr<CompletionProvider> completion_provider,
                  std::shared_ptr<ContextBuilder> context_builder,
                  float confidence_threshold = DEFAULT_CONFIDENCE_THRESHOLD);

  // Disable copy constructor and assignment
  AnswerGenerator(const AnswerGenerator &) = delete;
  AnswerGenerator &operator=(const AnswerGenerator &) = delete;

  AnswerRecord generate(const std::string &question,
                        const std::vector<FusedResult> &search_results) const;

  static std::string create_system_prompt();
  static std::string create_user_prompt(const std::string &question, const std::string &context);

  static std::vector<std::string> generate_follow_up_questions(
      const std::string &answer, const std::vector<Citation> &citations);

 private:
  std::shared_ptr<CompletionProvider> completion_provider_;
  std::shared_ptr<ContextBuilder> context_builder_;
  ConfidenceScorer confidence_scorer_;
  CitationProcessor citation_processor_;
  float confidence_threshold_;
};

}  // namespace docqa_core
