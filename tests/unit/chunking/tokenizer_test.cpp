#include <gtest/gtest.h>

#include "docqa_core/chunking/tokenizer.hpp"

namespace docqa_tests {

class HeuristicTokenizerTest : public ::testing::Test {
 protected:
  docqa_core::HeuristicTokenizer tokenizer_;
};

TEST_F(HeuristicTokenizerTest, EmptyTextHasNoTokens) {
  EXPECT_EQ(tokenizer_.count_tokens(""), 0u);
  EXPECT_EQ(tokenizer_.count_tokens("   \n\t"), 0u);
}

TEST_F(HeuristicTokenizerTest, LetterRunsCostOneTokenPerFourCharacters) {
  EXPECT_EQ(tokenizer_.count_tokens("cat"), 1u);
  EXPECT_EQ(tokenizer_.count_tokens("word"), 1u);
  EXPECT_EQ(tokenizer_.count_tokens("hello"), 2u);
  EXPECT_EQ(tokenizer_.count_tokens("hello world"), 4u);
}

TEST_F(HeuristicTokenizerTest, DigitsAndPunctuationAreCountedSeparately) {
  EXPECT_EQ(tokenizer_.count_tokens("12345"), 2u);
  // "Hi" + "," + "there" + "!"
  EXPECT_EQ(tokenizer_.count_tokens("Hi, there!"), 5u);
  // "abc" and "123" are separate runs
  EXPECT_EQ(tokenizer_.count_tokens("abc123"), 2u);
}

TEST_F(HeuristicTokenizerTest, NonAsciiCodePointsCountAsLetters) {
  EXPECT_EQ(tokenizer_.count_tokens("\xC3\xA9"), 1u);
  EXPECT_EQ(tokenizer_.count_tokens("caf\xC3\xA9s"), 2u);
}

TEST_F(HeuristicTokenizerTest, CountsAreAdditiveOverSpaceJoinedText) {
  const std::string first = "The quarterly report, revised.";
  const std::string second = "Totals rose 12% in 2023!";
  EXPECT_EQ(tokenizer_.count_tokens(first + " " + second),
            tokenizer_.count_tokens(first) + tokenizer_.count_tokens(second));
}

TEST_F(HeuristicTokenizerTest, InvalidUtf8DoesNotThrow) {
  EXPECT_NO_THROW(tokenizer_.count_tokens("bad \xFF\xFE bytes"));
  EXPECT_GT(tokenizer_.count_tokens("bad \xFF\xFE bytes"), 0u);
}

}  // namespace docqa_tests
