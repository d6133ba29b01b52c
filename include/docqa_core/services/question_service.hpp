#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/answer/answer_generator.hpp"
#include "docqa_core/search/hybrid_search_engine.hpp"

namespace docqa_core {

class QuestionService {
 public:
  static constexpr int DEFAULT_TOP_K = 5;

  QuestionService(std::shared_ptr<HybridSearchEngine> search_engine,
                  std::shared_ptr<AnswerGenerator> answer_generator,
                  int default_top_k = DEFAULT_TOP_K);

  virtual ~QuestionService() = default;

  // Throws std::invalid_argument for a blank question or top_k <= 0
  virtual AnswerRecord ask(const std::string &question);
  virtual AnswerRecord ask(const std::string &question, int top_k);

  std::vector<FusedResult> search(const std::string &query, int top_k) const;

  SearchStats get_search_stats() const;

 private:
  std::shared_ptr<HybridSearchEngine> search_engine_;
  std::shared_ptr<AnswerGenerator> answer_generator_;
  int default_top_k_;
};

}  // namespace docqa_core
