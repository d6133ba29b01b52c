#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "common/mocks_test.hpp"
#include "docqa_core/index/keyword_index.hpp"

namespace docqa_tests {

using docqa_core::ResultSource;

class KeywordIndexTest : public ::testing::Test {
 protected:
  void SetUp() override {
    index_.fit(MockUtilities::create_test_chunks(
        "doc-a", {"the cat sat", "the dog sat"}, "animals.txt"));
    index_.add(MockUtilities::create_test_chunks("doc-b", {"cats and dogs"}, "pets.md"));
  }

  docqa_core::KeywordIndex index_;
};

TEST_F(KeywordIndexTest, Search_ReturnsChunkPayloadWithKeywordSource) {
  auto results = index_.search("dog", 1);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].doc_id, "doc-a");
  EXPECT_EQ(results[0].chunk_id, 1);
  EXPECT_EQ(results[0].text, "the dog sat");
  EXPECT_EQ(results[0].filename, "animals.txt");
  EXPECT_EQ(results[0].source, ResultSource::Keyword);
  EXPECT_GT(results[0].score, 0.0f);
}

TEST_F(KeywordIndexTest, Search_RanksZeroScoreChunksLast) {
  auto results = index_.search("cat", 10);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].text, "the cat sat");
  EXPECT_FLOAT_EQ(results[1].score, 0.0f);
  EXPECT_FLOAT_EQ(results[2].score, 0.0f);
}

TEST_F(KeywordIndexTest, Search_BlankQueryOrNonPositiveTopKReturnsNothing) {
  EXPECT_TRUE(index_.search("", 5).empty());
  EXPECT_TRUE(index_.search("   ", 5).empty());
  EXPECT_TRUE(index_.search("cat", 0).empty());
  EXPECT_TRUE(index_.search("cat", -3).empty());
}

TEST_F(KeywordIndexTest, Search_EmptyIndexReturnsNothing) {
  docqa_core::KeywordIndex empty;
  EXPECT_TRUE(empty.empty());
  EXPECT_TRUE(empty.search("cat", 5).empty());
}

TEST_F(KeywordIndexTest, Add_RejectsInvalidChunksAtomically) {
  auto chunks = MockUtilities::create_test_chunks("doc-c", {"valid text", ""});

  EXPECT_THROW(index_.add(chunks), std::invalid_argument);
  EXPECT_EQ(index_.size(), 3u);

  auto no_doc = MockUtilities::create_test_chunks("", {"orphan text"});
  EXPECT_THROW(index_.add(no_doc), std::invalid_argument);
  EXPECT_EQ(index_.size(), 3u);
}

TEST_F(KeywordIndexTest, Remove_DropsOnlyThatDocument) {
  EXPECT_EQ(index_.document_count(), 2u);

  EXPECT_EQ(index_.remove("doc-a"), 2u);
  EXPECT_EQ(index_.size(), 1u);
  EXPECT_EQ(index_.document_count(), 1u);

  auto results = index_.search("dogs", 5);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].doc_id, "doc-b");

  EXPECT_EQ(index_.remove("unknown"), 0u);
  EXPECT_EQ(index_.size(), 1u);
}

TEST_F(KeywordIndexTest, Remove_ScoresMatchFreshIndex) {
  index_.remove("doc-b");

  docqa_core::KeywordIndex fresh;
  fresh.fit(MockUtilities::create_test_chunks("doc-a", {"the cat sat", "the dog sat"}));

  auto after_remove = index_.search("cat sat", 2);
  auto rebuilt = fresh.search("cat sat", 2);
  ASSERT_EQ(after_remove.size(), rebuilt.size());
  for (size_t i = 0; i < rebuilt.size(); ++i) {
    EXPECT_EQ(after_remove[i].chunk_id, rebuilt[i].chunk_id);
    EXPECT_FLOAT_EQ(after_remove[i].score, rebuilt[i].score);
  }
}

TEST_F(KeywordIndexTest, Fit_ReplacesCorpus) {
  index_.fit(MockUtilities::create_test_chunks("doc-z", {"zebra"}));
  EXPECT_EQ(index_.size(), 1u);
  EXPECT_EQ(index_.document_count(), 1u);

  index_.clear();
  EXPECT_TRUE(index_.empty());
}

TEST_F(KeywordIndexTest, Search_ConsistentWhileDocumentIsAddedAndRemoved) {
  const std::map<std::pair<std::string, int>, std::string> expected_text{
      {{"doc-a", 0}, "the cat sat"},
      {{"doc-a", 1}, "the dog sat"},
      {{"doc-b", 0}, "cats and dogs"},
      {{"doc-c", 0}, "dog walking schedule"},
      {{"doc-c", 1}, "dog food and dog toys"},
  };
  const auto churn = MockUtilities::create_test_chunks(
      "doc-c", {"dog walking schedule", "dog food and dog toys"}, "dogs.txt");

  std::atomic<bool> stop{false};
  std::atomic<int> inconsistent{0};
  std::atomic<int> searches{0};

  std::thread writer([&]() {
    for (int i = 0; i < 500; ++i) {
      index_.add(churn);
      index_.remove("doc-c");
    }
    stop.store(true);
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&]() {
      while (!stop.load()) {
        auto results = index_.search("dog", 10);
        searches.fetch_add(1);
        // Either doc-c is fully indexed or not at all
        if (results.size() != 3u && results.size() != 5u) {
          inconsistent.fetch_add(1);
        }
        for (const auto& result : results) {
          auto it = expected_text.find({result.doc_id, result.chunk_id});
          if (it == expected_text.end() || it->second != result.text) {
            inconsistent.fetch_add(1);
          }
        }
      }
    });
  }

  writer.join();
  for (auto& reader : readers) {
    reader.join();
  }

  EXPECT_EQ(inconsistent.load(), 0);
  EXPECT_GT(searches.load(), 0);
  EXPECT_EQ(index_.size(), 3u);
  EXPECT_EQ(index_.document_count(), 2u);
}

}  // namespace docqa_tests
