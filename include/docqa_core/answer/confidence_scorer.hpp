#pragma once

#include <string>
#include <vector>

#include "docqa_core/types/search_result.hpp"

namespace docqa_core {

struct ConfidenceOutcome {
  float confidence = 0.0f;
  // Set when scoring failed and confidence holds the fallback value
  bool degraded = false;
  std::string error;

  static ConfidenceOutcome scored(float confidence) {
    return {.confidence = confidence, .degraded = false, .error = ""};
  }

  static ConfidenceOutcome fallback(const std::string &error) {
    return {.confidence = FALLBACK_CONFIDENCE, .degraded = true, .error = error};
  }

  static constexpr float FALLBACK_CONFIDENCE = 0.5f;
};

/**
 * @class ConfidenceScorer
 * @brief Heuristic confidence in [0, 1] for a generated answer.
 *
 * The mean of four factors (source count, average retrieval score, answer length and citation
 * count) minus 0.2 for every distinct uncertainty phrase found in the answer, clamped to [0, 1].
 */
class ConfidenceScorer {
 public:
  static constexpr float UNCERTAINTY_PENALTY = 0.2f;
  static constexpr float FULL_SOURCE_COUNT = 3.0f;
  static constexpr float FULL_ANSWER_LENGTH = 200.0f;
  static constexpr float FULL_CITATION_COUNT = 2.0f;

  static const std::vector<std::string> &uncertainty_phrases();

  // Never throws. Internal failures produce ConfidenceOutcome::fallback.
  ConfidenceOutcome score(const std::string &question,
                          const std::string &answer,
                          const std::vector<FusedResult> &search_results) const;

  static size_t count_source_markers(const std::string &answer);

 private:
  float compute(const std::string &answer, const std::vector<FusedResult> &search_results) const;
};

}  // namespace docqa_core
