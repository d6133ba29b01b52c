#include <gtest/gtest.h>

#include <limits>

#include "common/mocks_test.hpp"
#include "docqa_core/answer/confidence_scorer.hpp"

namespace docqa_tests {

using docqa_core::FusedResult;

class ConfidenceScorerTest : public ::testing::Test {
 protected:
  std::vector<FusedResult> results_with_scores(const std::vector<float>& scores) {
    std::vector<FusedResult> results;
    for (size_t i = 0; i < scores.size(); ++i) {
      results.push_back(MockUtilities::create_fused_result("doc", static_cast<int>(i), scores[i]));
    }
    return results;
  }

  // 200 characters with two distinct markers and no uncertainty phrases
  std::string full_answer() {
    std::string answer = "[Source 1] [Source 2] ";
    answer += std::string(200 - answer.size(), 'x');
    return answer;
  }

  docqa_core::ConfidenceScorer scorer_;
};

TEST_F(ConfidenceScorerTest, Score_EmptyEverythingIsZero) {
  auto outcome = scorer_.score("question", "", {});
  EXPECT_FLOAT_EQ(outcome.confidence, 0.0f);
  EXPECT_FALSE(outcome.degraded);
}

TEST_F(ConfidenceScorerTest, Score_AllFactorsSaturated) {
  auto outcome = scorer_.score("question", full_answer(), results_with_scores({1.0f, 1.0f, 1.0f}));
  EXPECT_NEAR(outcome.confidence, 1.0f, 1e-6);
}

TEST_F(ConfidenceScorerTest, Score_AveragesFourFactors) {
  // sources 3/3, quality 0.5, length 100/200, citations 1/2
  std::string answer = "[Source 1]" + std::string(90, 'a');
  ASSERT_EQ(answer.size(), 100u);

  auto outcome = scorer_.score("question", answer, results_with_scores({0.5f, 0.5f, 0.5f}));
  EXPECT_NEAR(outcome.confidence, 0.625f, 1e-6);
}

TEST_F(ConfidenceScorerTest, Score_ClampsMeanRetrievalScore) {
  // Keyword-scale and cosine scores are averaged raw: (2.4 + 0.3 + 0.3) / 3 = 1.0
  auto mixed = scorer_.score("q", full_answer(), results_with_scores({2.4f, 0.3f, 0.3f}));
  EXPECT_NEAR(mixed.confidence, 1.0f, 1e-6);

  // Mean 0.5 even though one score alone exceeds 1
  auto uneven = scorer_.score("q", full_answer(), results_with_scores({1.5f, 0.0f, 0.0f}));
  EXPECT_NEAR(uneven.confidence, (1.0f + 0.5f + 1.0f + 1.0f) / 4.0f, 1e-6);

  auto keyword_scale = scorer_.score("q", full_answer(), results_with_scores({5.0f, 8.0f, 12.0f}));
  EXPECT_NEAR(keyword_scale.confidence, 1.0f, 1e-6);

  // NaN counts as 0: quality 2/3
  const float nan = std::numeric_limits<float>::quiet_NaN();
  auto with_nan = scorer_.score("q", full_answer(), results_with_scores({nan, 1.0f, 1.0f}));
  EXPECT_NEAR(with_nan.confidence, (1.0f + 2.0f / 3.0f + 1.0f + 1.0f) / 4.0f, 1e-6);
  EXPECT_FALSE(with_nan.degraded);
}

TEST_F(ConfidenceScorerTest, Score_PenalizesUncertaintyPhrasesOnce) {
  auto results = results_with_scores({1.0f, 1.0f, 1.0f});
  std::string base = full_answer();

  std::string hedged = base;
  hedged.replace(30, 7, "Perhaps");
  auto outcome = scorer_.score("q", hedged, results);
  EXPECT_NEAR(outcome.confidence, 0.8f, 1e-6);

  std::string twice = base;
  twice.replace(30, 15, "perhaps perhaps");
  EXPECT_NEAR(scorer_.score("q", twice, results).confidence, 0.8f, 1e-6);

  std::string two_phrases = base;
  two_phrases.replace(30, 16, "unclear possibly");
  EXPECT_NEAR(scorer_.score("q", two_phrases, results).confidence, 0.6f, 1e-6);
}

TEST_F(ConfidenceScorerTest, Score_NeverBelowZero) {
  std::string answer = "I don't know. I'm not sure, it might be unclear and perhaps possibly wrong.";
  auto outcome = scorer_.score("q", answer, results_with_scores({0.2f}));
  EXPECT_FLOAT_EQ(outcome.confidence, 0.0f);
}

TEST_F(ConfidenceScorerTest, Score_LengthCountsCodePoints) {
  // 100 two-byte characters are 100 code points, not 200
  std::string answer;
  for (int i = 0; i < 100; ++i) {
    answer += "\xC3\xA9";
  }
  auto outcome = scorer_.score("q", answer, {});
  EXPECT_NEAR(outcome.confidence, 0.5f / 4.0f, 1e-6);
}

TEST_F(ConfidenceScorerTest, CountSourceMarkers_MatchesExactFormat) {
  EXPECT_EQ(docqa_core::ConfidenceScorer::count_source_markers("[Source 1] and [Source 1]"), 2u);
  EXPECT_EQ(docqa_core::ConfidenceScorer::count_source_markers("[source 1] [Source x] [Source]"),
            0u);
  EXPECT_EQ(docqa_core::ConfidenceScorer::count_source_markers("[Source 12]"), 1u);
}

TEST(ConfidenceOutcomeTest, FallbackCarriesError) {
  auto outcome = docqa_core::ConfidenceOutcome::fallback("boom");
  EXPECT_FLOAT_EQ(outcome.confidence, docqa_core::ConfidenceOutcome::FALLBACK_CONFIDENCE);
  EXPECT_TRUE(outcome.degraded);
  EXPECT_EQ(outcome.error, "boom");
}

}  // namespace docqa_tests
