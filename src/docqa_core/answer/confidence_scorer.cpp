#include "docqa_core/answer/confidence_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <regex>

#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

const std::vector<std::string> &ConfidenceScorer::uncertainty_phrases() {
  static const std::vector<std::string> phrases = {
      "i don't know", "i'm not sure", "unclear",  "might be",
      "possibly",     "perhaps",      "could be", "not enough information"};
  return phrases;
}

size_t ConfidenceScorer::count_source_markers(const std::string &answer) {
  static const std::regex marker_regex(R"(\[Source \d+\])");
  return static_cast<size_t>(
      std::distance(std::sregex_iterator(answer.begin(), answer.end(), marker_regex),
                    std::sregex_iterator()));
}

ConfidenceOutcome ConfidenceScorer::score(const std::string &question,
                                          const std::string &answer,
                                          const std::vector<FusedResult> &search_results) const {
  try {
    return ConfidenceOutcome::scored(compute(answer, search_results));
  } catch (const std::exception &e) {
    std::cerr << "[ConfidenceScorer] Scoring failed for question '" << question
              << "': " << e.what() << std::endl;
    return ConfidenceOutcome::fallback(e.what());
  }
}

float ConfidenceScorer::compute(const std::string &answer,
                                const std::vector<FusedResult> &search_results) const {
  const float source_factor =
      std::min(static_cast<float>(search_results.size()) / FULL_SOURCE_COUNT, 1.0f);

  float quality_factor = 0.0f;
  if (!search_results.empty()) {
    float total = 0.0f;
    for (const auto &result : search_results) {
      if (std::isfinite(result.score)) {
        total += result.score;
      }
    }
    quality_factor =
        std::clamp(total / static_cast<float>(search_results.size()), 0.0f, 1.0f);
  }

  const float length_factor = std::min(
      static_cast<float>(text_utils::count_code_points(answer)) / FULL_ANSWER_LENGTH, 1.0f);

  const float citation_factor =
      std::min(static_cast<float>(count_source_markers(answer)) / FULL_CITATION_COUNT, 1.0f);

  const float base = (source_factor + quality_factor + length_factor + citation_factor) / 4.0f;

  const std::string answer_lower = text_utils::to_lower_ascii(answer);
  float penalty = 0.0f;
  for (const auto &phrase : uncertainty_phrases()) {
    if (answer_lower.find(phrase) != std::string::npos) {
      penalty += UNCERTAINTY_PENALTY;
    }
  }

  return std::clamp(base - penalty, 0.0f, 1.0f);
}

}  // namespace docqa_core
