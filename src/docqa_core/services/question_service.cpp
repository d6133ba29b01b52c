#include "docqa_core/services/question_service.hpp"

#include <stdexcept>

#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

QuestionService::QuestionService(std::shared_ptr<HybridSearchEngine> search_engine,
                                 std::shared_ptr<AnswerGenerator> answer_generator,
                                 int default_top_k)
    : search_engine_(search_engine),
      answer_generator_(answer_generator),
      default_top_k_(default_top_k) {
  if (!search_engine_ || !answer_generator_) {
    throw std::invalid_argument("QuestionService requires a search engine and an answer generator");
  }
}

AnswerRecord QuestionService::ask(const std::string &question) {
  return ask(question, default_top_k_);
}

AnswerRecord QuestionService::ask(const std::string &question, int top_k) {
  if (text_utils::trim(question).empty()) {
    throw std::invalid_argument("Question must not be empty");
  }
  if (top_k <= 0) {
    throw std::invalid_argument("top_k must be greater than 0");
  }

  std::vector<FusedResult> results = search_engine_->search(question, top_k);
  return answer_generator_->generate(question, results);
}

std::vector<FusedResult> QuestionService::search(const std::string &query, int top_k) const {
  return search_engine_->search(query, top_k);
}

SearchStats QuestionService::get_search_stats() const {
  return search_engine_->get_search_stats();
}

}  // namespace docqa_core
